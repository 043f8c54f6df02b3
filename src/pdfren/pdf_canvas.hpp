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

#include <string>
#include <string_view>

#include <r4/matrix.hpp>
#include <r4/vector.hpp>
#include <utki/span.hpp>

#include "config.hpp"
#include "document.hpp"

namespace pdfren {

class font;
class shading;

/**
 * @brief Text rendering mode, values are as defined by PDF.
 */
enum class text_rendering_mode {
	fill = 0,
	stroke = 1,
	fill_stroke = 2
};

/**
 * @brief Writer of PDF content stream operators.
 */
class pdf_canvas
{
	std::string& stream;
	pdfren::resources& res;

	void write_matrix(const r4::matrix2<real>& m);

public:
	/**
	 * @brief Create canvas writing to a stream.
	 * @param stream - stream to append operators to.
	 * @param res - resources where fonts and shadings are registered.
	 */
	pdf_canvas(std::string& stream, pdfren::resources& res);

	/**
	 * @brief Create canvas writing to a page.
	 * @param p - page to draw on.
	 * @param wrap_old_content - wrap existing page content into q/Q operators
	 *        so that its graphics state changes do not affect new content.
	 * @throw illegal_page_state_error - if the page is flushed.
	 */
	pdf_canvas(page& p, bool wrap_old_content = false);

	pdf_canvas(const pdf_canvas&) = delete;
	pdf_canvas& operator=(const pdf_canvas&) = delete;

	pdf_canvas(pdf_canvas&&) = delete;
	pdf_canvas& operator=(pdf_canvas&&) = delete;

	~pdf_canvas() = default;

	const std::string& get_content() const noexcept
	{
		return this->stream;
	}

	pdfren::resources& get_resources() noexcept
	{
		return this->res;
	}

	void save_state();
	void restore_state();

	void concat_matrix(const r4::matrix2<real>& m);

	void move_to(real x, real y);
	void line_to(real x, real y);
	void close_path();

	void stroke();
	void fill();

	void begin_text();
	void end_text();

	void set_font_and_size(const font& f, real size);
	void set_text_rendering_mode(text_rendering_mode mode);
	void set_text_matrix(const r4::matrix2<real>& m);
	void show_text(std::string_view text);

	void set_fill_color_rgb(const r4::vector3<real>& rgb);
	void set_stroke_color_rgb(const r4::vector3<real>& rgb);

	void set_line_width(real width);
	void set_line_dash(utki::span<const real> dash_array, real phase);

	/**
	 * @brief Paint shading over the current clipping area.
	 * @param s - shading to paint. Must outlive the canvas resources.
	 */
	void paint_shading(const shading& s);
};

} // namespace pdfren
