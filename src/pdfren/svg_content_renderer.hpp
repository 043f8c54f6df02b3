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

#include <memory>

#include <r4/vector.hpp>

#include "font.hpp"
#include "layout.hpp"
#include "svg_css_context.hpp"
#include "svg_text.hpp"

namespace pdfren {

/**
 * @brief Laid out content which is an SVG text.
 * The text is drawn into the occupied area, the area's top left corner is the SVG origin.
 */
class svg_content_renderer : public content_renderer
{
	std::unique_ptr<text_branch> root;

	r4::vector2<real> viewport_dims;

	const font_provider* provider;
	const font_set* temp_fonts;

public:
	svg_css_context css_context;

	/**
	 * @brief Constructor.
	 * @param root - root text element.
	 * @param viewport_dims - dimensions of the SVG viewport, percentage lengths are resolved against it.
	 * @param provider - font provider, can be nullptr.
	 * @param temp_fonts - additional fonts, can be nullptr.
	 * @throw std::invalid_argument - if root is nullptr.
	 */
	svg_content_renderer(
		std::unique_ptr<text_branch> root,
		r4::vector2<real> viewport_dims,
		const font_provider* provider = nullptr,
		const font_set* temp_fonts = nullptr
	);

	text_branch& get_root() noexcept
	{
		return *this->root;
	}

	void draw(draw_context& ctx) override;
};

} // namespace pdfren
