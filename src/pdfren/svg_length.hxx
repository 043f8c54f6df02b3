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

#include <svgdom/length.hpp>

#include "config.hpp"

namespace pdfren {

/**
 * @brief Convert length in absolute units to points.
 * Unitless lengths are user units, which are equal to points.
 * @param l - length to convert.
 * @return Length in points, 0 for relative units.
 */
real absolute_length_to_pt(const svgdom::length& l) noexcept;

/**
 * @brief Parse absolute length.
 * @param str - length value.
 * @return Length in points or 0 if the value is not a valid absolute length.
 */
real parse_absolute_length(std::string_view str);

/**
 * @brief Convert length to points, resolving relative units.
 * @param l - length to convert.
 * @param percent_base - length which corresponds to 100%.
 * @param font_size - current font size, used for em and ex units.
 * @return Length in points.
 */
real length_to_pt(const svgdom::length& l, real percent_base, real font_size) noexcept;

} // namespace pdfren
