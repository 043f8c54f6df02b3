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

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <r4/matrix.hpp>
#include <r4/rectangle.hpp>
#include <r4/vector.hpp>

#include "config.hpp"
#include "font.hpp"
#include "geometry.hpp"
#include "pdf_canvas.hpp"
#include "svg_css_context.hpp"

namespace pdfren {

/**
 * @brief Fill and stroke properties of SVG text.
 */
struct svg_text_properties {
	r4::vector3<real> fill_color = 0;

	/**
	 * @brief Stroke colour, not set means no stroke.
	 */
	std::optional<r4::vector3<real>> stroke_color;

	real line_width = 1;

	std::vector<real> dash_array;
	real dash_phase = 0;
};

/**
 * @brief State of drawing an SVG image.
 */
class svg_draw_context
{
	std::vector<pdf_canvas*> canvases;

public:
	/**
	 * @brief Font provider, can be nullptr.
	 */
	const font_provider* provider;

	/**
	 * @brief Fonts available only for this drawing, can be nullptr.
	 */
	const font_set* temp_fonts;

	/**
	 * @brief Creates the font to use when no font is found by the provider.
	 */
	std::function<std::shared_ptr<font>()> default_font_factory = &create_default_font;

	svg_css_context css_context;

	/**
	 * @brief Current viewport, percentage lengths are resolved against it.
	 */
	r4::rectangle<real> viewport{{0, 0}, {0, 0}};

	/**
	 * @brief Transformation of the current text chunk.
	 */
	r4::matrix2<real> root_transform = text_flip();

	/**
	 * @brief Offset of the text position from the current text chunk origin.
	 */
	r4::vector2<real> text_move = 0;

	/**
	 * @brief Relative shift applied to the next added piece of text.
	 */
	r4::vector2<real> relative_position = 0;

	svg_text_properties text_properties;

	svg_draw_context(const font_provider* provider = nullptr, const font_set* temp_fonts = nullptr);

	void push_canvas(pdf_canvas& canvas);
	void pop_canvas();

	/**
	 * @brief Get canvas to draw on.
	 * @throw std::logic_error - if there is no canvas.
	 */
	pdf_canvas& get_current_canvas();

	void add_text_move(real dx, real dy);
	void reset_text_move();

	void move_relative_position(real dx, real dy);
	void reset_relative_position();
};

class svg_canvas_push
{
	svg_draw_context& ctx;

public:
	svg_canvas_push(svg_draw_context& ctx, pdf_canvas& canvas);

	svg_canvas_push(const svg_canvas_push&) = delete;
	svg_canvas_push& operator=(const svg_canvas_push&) = delete;

	svg_canvas_push(svg_canvas_push&&) = delete;
	svg_canvas_push& operator=(svg_canvas_push&&) = delete;

	~svg_canvas_push() noexcept;
};

} // namespace pdfren
