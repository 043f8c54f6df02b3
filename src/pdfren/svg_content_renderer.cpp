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

#include "svg_content_renderer.hpp"

#include <stdexcept>

#include <utki/debug.hpp>

using namespace pdfren;

svg_content_renderer::svg_content_renderer(
	std::unique_ptr<text_branch> root,
	r4::vector2<real> viewport_dims,
	const font_provider* provider,
	const font_set* temp_fonts
) :
	root(std::move(root)),
	viewport_dims(viewport_dims),
	provider(provider),
	temp_fonts(temp_fonts)
{
	if (!this->root) {
		throw std::invalid_argument("svg_content_renderer(): root text element is null");
	}
}

void svg_content_renderer::draw(draw_context& ctx)
{
	const auto& area = this->get_occupied_area();
	ASSERT(area)

	svg_draw_context svg_ctx(this->provider, this->temp_fonts);
	svg_ctx.css_context = this->css_context;
	svg_ctx.viewport = {{0, 0}, this->viewport_dims};

	svg_canvas_push canvas_push(svg_ctx, ctx.canvas);

	const auto& bb = area->bbox;

	ctx.canvas.save_state();

	// SVG y-axis points down
	ctx.canvas.concat_matrix({
		{1, 0, bb.p.x()},
		{0, -1, bb.p.y() + bb.d.y()}
	});

	this->root->draw(svg_ctx);

	ctx.canvas.restore_state();
}
