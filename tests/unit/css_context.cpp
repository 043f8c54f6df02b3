#include <tst/set.hpp>
#include <tst/check.hpp>

#include <cmath>

#include "../../src/pdfren/svg_css_context.hpp"

namespace{
bool is_near(pdfren::real a, pdfren::real b){
	return std::abs(a - b) < 1e-3;
}
}

namespace{
const tst::set set("css_context", [](tst::suite& suite){
	suite.add(
		"default_root_font_size",
		[](){
			pdfren::svg_css_context c;
			tst::check(is_near(c.get_root_font_size(), 12), SL);
		}
	);

	suite.add<std::pair<std::string, pdfren::real>>(
		"absolute_root_font_size",
		{
			{"14pt", 14},
			{"20px", 20},
			{"16", 16},
			{"1in", 72},
			{"2.54cm", 72},
			{"1pc", 12},
			{" 10pt ", 10},
			{"xx-small", 6.75},
			{"small", 10},
			{"medium", 12},
			{"large", 13.5},
			{"xx-large", 24}
		},
		[](const auto& p){
			pdfren::svg_css_context c;
			c.set_root_font_size(p.first);
			tst::check(is_near(c.get_root_font_size(), p.second), SL) << "value = " << p.first << ", got " << c.get_root_font_size();
		}
	);

	suite.add<std::string>(
		"unparsable_root_font_size_yields_0",
		{
			"abc",
			"",
			"2em",
			"150%"
		},
		[](const auto& p){
			pdfren::svg_css_context c;
			c.set_root_font_size(p);
			tst::check(is_near(c.get_root_font_size(), 0), SL) << "value = " << p << ", got " << c.get_root_font_size();
		}
	);
});
}
