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

#include "svg_css_context.hpp"

#include <array>
#include <utility>

#include "svg_length.hxx"
#include "util.hxx"

using namespace pdfren;

namespace {
const std::array<std::pair<std::string_view, std::string_view>, 7> font_size_keywords = {
	{
     {"xx-small", "6.75pt"},
     {"x-small", "7.5pt"},
     {"small", "10pt"},
     {"medium", "12pt"},
     {"large", "13.5pt"},
     {"x-large", "18pt"},
     {"xx-large", "24pt"},
	 }
};
} // namespace

real pdfren::parse_absolute_font_size(std::string_view font_size)
{
	font_size = trim(font_size);

	for (const auto& k : font_size_keywords) {
		if (k.first == font_size) {
			font_size = k.second;
			break;
		}
	}

	return parse_absolute_length(font_size);
}

void svg_css_context::set_root_font_size(std::string_view font_size)
{
	this->root_font_size = parse_absolute_font_size(font_size);
}
