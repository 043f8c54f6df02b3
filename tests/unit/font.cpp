#include <tst/set.hpp>
#include <tst/check.hpp>

#include <cmath>

#include "../../src/pdfren/font.hpp"

namespace{
bool is_near(pdfren::real a, pdfren::real b){
	return std::abs(a - b) < 1e-3;
}
}

namespace{
const tst::set set("font", [](tst::suite& suite){
	suite.add(
		"standard_font_names",
		[](){
			using pdfren::standard_font;
			tst::check_eq(standard_font(standard_font::variant::regular).get_name(), std::string("Helvetica"), SL);
			tst::check_eq(standard_font(standard_font::variant::bold).get_name(), std::string("Helvetica-Bold"), SL);
			tst::check_eq(standard_font(standard_font::variant::oblique).get_name(), std::string("Helvetica-Oblique"), SL);
			tst::check_eq(
				standard_font(standard_font::variant::bold_oblique).get_name(),
				std::string("Helvetica-BoldOblique"),
				SL
			);
		}
	);

	suite.add(
		"text_width",
		[](){
			auto f = pdfren::create_default_font();
			tst::check(f, SL);

			tst::check(is_near(f->get_width("ab", 10), 11.12), SL) << "width = " << f->get_width("ab", 10);
			tst::check(is_near(f->get_width("Hello", 1000), 2278), SL) << "width = " << f->get_width("Hello", 1000);
			tst::check(is_near(f->get_width("", 10), 0), SL);
		}
	);

	suite.add(
		"non_ascii_glyphs_have_default_width",
		[](){
			pdfren::standard_font f(pdfren::standard_font::variant::regular);

			// two-byte UTF-8 character is one glyph
			tst::check(is_near(f.get_width("\xc3\xa9", 1000), 556), SL) << "width = " << f.get_width("\xc3\xa9", 1000);
		}
	);

	suite.add(
		"best_match_prefers_family_over_style",
		[](){
			auto regular = std::make_shared<pdfren::standard_font>(pdfren::standard_font::variant::regular);
			auto bold = std::make_shared<pdfren::standard_font>(pdfren::standard_font::variant::bold);
			auto other = std::make_shared<pdfren::standard_font>(pdfren::standard_font::variant::bold_oblique);

			pdfren::font_provider p;
			p.fonts.add("Sans", {false, false}, regular);
			p.fonts.add("Sans", {true, false}, bold);
			p.fonts.add("Serif", {true, true}, other);

			tst::check(p.get_best_match({"sans"}, {true, false}, nullptr) == bold, SL);
			tst::check(p.get_best_match({"Sans"}, {true, true}, nullptr) == bold, SL);
			tst::check(p.get_best_match({"Sans"}, {false, false}, nullptr) == regular, SL);
			tst::check(p.get_best_match({"Mono", "Serif"}, {false, false}, nullptr) == other, SL);
		}
	);

	suite.add(
		"temporary_fonts_take_precedence",
		[](){
			auto regular = std::make_shared<pdfren::standard_font>(pdfren::standard_font::variant::regular);
			auto temp = std::make_shared<pdfren::standard_font>(pdfren::standard_font::variant::oblique);

			pdfren::font_provider p;
			p.fonts.add("Sans", {}, regular);

			pdfren::font_set temp_fonts;
			temp_fonts.add("Sans", {}, temp);

			tst::check(p.get_best_match({"Sans"}, {}, &temp_fonts) == temp, SL);
		}
	);

	suite.add(
		"no_fonts_no_match",
		[](){
			pdfren::font_provider p;
			tst::check(!p.get_best_match({"Sans"}, {}, nullptr), SL);
		}
	);
});
}
