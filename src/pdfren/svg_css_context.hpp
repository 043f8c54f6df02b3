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

#pragma once

#include <string_view>

#include "config.hpp"

namespace pdfren {

/**
 * @brief Default font size.
 */
constexpr real default_font_size = 12;

/**
 * @brief Context for evaluating CSS values which depend on other values,
 * e.g. relative font sizes.
 */
class svg_css_context
{
	real root_font_size = default_font_size;

public:
	/**
	 * @brief Get root font size.
	 * @return Root font size in points.
	 */
	real get_root_font_size() const noexcept
	{
		return this->root_font_size;
	}

	/**
	 * @brief Set root font size.
	 * @param font_size - absolute font size value, e.g. "14pt", "20px" or "large".
	 *        Unparsable values set the font size to 0.
	 */
	void set_root_font_size(std::string_view font_size);
};

/**
 * @brief Parse absolute font size.
 * Understands lengths in absolute units and font size keywords from xx-small to xx-large.
 * @param font_size - font size value.
 * @return Font size in points or 0 if the value cannot be parsed.
 */
real parse_absolute_font_size(std::string_view font_size);

} // namespace pdfren
