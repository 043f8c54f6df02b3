/*
The MIT License (MIT)

Copyright (c) 2015-2024 Ivan Gagis <igagis@gmail.com>

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.

*/

/* ================ LICENSE END ================ */

#include "svg_length.hxx"

#include <ratio>
#include <stdexcept>

#include "util.hxx"

using namespace pdfren;

namespace {
// ex is taken as half of em
constexpr real ex_to_em = real(0.5);
} // namespace

real pdfren::absolute_length_to_pt(const svgdom::length& l) noexcept
{
	switch (l.unit) {
		case svgdom::length_unit::number:
		case svgdom::length_unit::px:
		case svgdom::length_unit::pt:
		case svgdom::length_unit::pc:
		case svgdom::length_unit::in:
		case svgdom::length_unit::cm:
		case svgdom::length_unit::mm:
			return real(l.to_px(real(default_dpi)));
		default:
			return 0;
	}
}

real pdfren::parse_absolute_length(std::string_view str)
{
	svgdom::length l;
	try {
		l = svgdom::length::parse(trim(str));
	} catch (std::invalid_argument&) {
		// not a number
		return 0;
	}
	if (!l.is_valid()) {
		return 0;
	}
	return absolute_length_to_pt(l);
}

real pdfren::length_to_pt(const svgdom::length& l, real percent_base, real font_size) noexcept
{
	if (l.is_percent()) {
		return percent_base * (l.value / real(std::centi::den));
	}
	switch (l.unit) {
		case svgdom::length_unit::em:
			return l.value * font_size;
		case svgdom::length_unit::ex:
			return l.value * font_size * ex_to_em;
		default:
			return absolute_length_to_pt(l);
	}
}
