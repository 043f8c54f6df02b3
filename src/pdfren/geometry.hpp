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

#include <optional>

#include <r4/matrix.hpp>
#include <r4/rectangle.hpp>
#include <r4/vector.hpp>

#include "config.hpp"

namespace pdfren {

/**
 * @brief Page size.
 * Rectangle in PDF user space, the position is the lower left corner.
 */
typedef r4::rectangle<real> page_size;

/**
 * @brief A4 page size in points.
 */
const page_size a4 = {{0, 0}, {595, 842}};

/**
 * @brief Transformation which flips the y-axis.
 * SVG text is positioned in y-down space, while glyphs are drawn in y-up space,
 * the flip keeps the glyphs from being mirrored.
 */
r4::matrix2<real> text_flip();

/**
 * @brief Apply translation before the transformation.
 * @param m - transformation matrix.
 * @param t - translation.
 * @return m * translate(t).
 */
r4::matrix2<real> translated(const r4::matrix2<real>& m, const r4::vector2<real>& t);

inline real get_translate_x(const r4::matrix2<real>& m) noexcept
{
	return m[0][2];
}

inline real get_translate_y(const r4::matrix2<real>& m) noexcept
{
	return m[1][2];
}

/**
 * @brief Unite two rectangles.
 * @param a - rectangle, if empty then the result is just b.
 * @param b - rectangle.
 * @return The smallest rectangle which contains both.
 */
r4::rectangle<real> unite(const std::optional<r4::rectangle<real>>& a, const r4::rectangle<real>& b);

/**
 * @brief Bounding box of a piece of text.
 */
struct text_rectangle {
	r4::rectangle<real> rect;

	/**
	 * @brief Y coordinate of the text baseline.
	 */
	real baseline_y = 0;

	/**
	 * @brief Point where the next piece of text continues the line.
	 */
	r4::vector2<real> baseline_right_point() const noexcept
	{
		return {this->rect.p.x() + this->rect.d.x(), this->baseline_y};
	}
};

} // namespace pdfren
