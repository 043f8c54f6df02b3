#include <tst/set.hpp>
#include <tst/check.hpp>

#include "../../src/pdfren/util.hxx"

namespace{
const tst::set set("util", [](tst::suite& suite){
	suite.add(
		"format_number_omits_trailing_zeros",
		[](){
			tst::check_eq(pdfren::format_number(10), std::string("10"), SL);
			tst::check_eq(pdfren::format_number(20.5), std::string("20.5"), SL);
			tst::check_eq(pdfren::format_number(0), std::string("0"), SL);
			tst::check_eq(pdfren::format_number(-3.25), std::string("-3.25"), SL);
		}
	);

	suite.add(
		"format_number_rounds_to_three_decimals",
		[](){
			tst::check_eq(pdfren::format_number(1.23456), std::string("1.235"), SL);
			tst::check_eq(pdfren::format_number(-0.0001), std::string("0"), SL);
		}
	);

	suite.add(
		"escape_string",
		[](){
			tst::check_eq(pdfren::escape_string("a(b)\\c"), std::string("a\\(b\\)\\\\c"), SL);
			tst::check_eq(pdfren::escape_string("x\ny"), std::string("x\\ny"), SL);
			tst::check_eq(pdfren::escape_string("plain"), std::string("plain"), SL);
		}
	);

	suite.add(
		"split_value_list",
		[](){
			auto v = pdfren::split_value_list(" 10, 20 30,,40 ");
			tst::check_eq(v.size(), size_t(4), SL);
			tst::check_eq(v[0], std::string("10"), SL);
			tst::check_eq(v[1], std::string("20"), SL);
			tst::check_eq(v[2], std::string("30"), SL);
			tst::check_eq(v[3], std::string("40"), SL);

			tst::check(pdfren::split_value_list("").empty(), SL);
			tst::check(pdfren::split_value_list(" , ").empty(), SL);
		}
	);

	suite.add(
		"trim_and_compare",
		[](){
			tst::check(pdfren::trim(" \tabc \n") == "abc", SL);
			tst::check(pdfren::equals_ignore_case("BoLd", "bold"), SL);
			tst::check(!pdfren::equals_ignore_case("bold", "bolder"), SL);
		}
	);
});
}
