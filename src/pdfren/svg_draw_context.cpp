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

#include "svg_draw_context.hpp"

#include <stdexcept>

#include <utki/debug.hpp>

using namespace pdfren;

svg_draw_context::svg_draw_context(const font_provider* provider, const font_set* temp_fonts) :
	provider(provider),
	temp_fonts(temp_fonts)
{}

void svg_draw_context::push_canvas(pdf_canvas& canvas)
{
	this->canvases.push_back(&canvas);
}

void svg_draw_context::pop_canvas()
{
	ASSERT(!this->canvases.empty())
	this->canvases.pop_back();
}

pdf_canvas& svg_draw_context::get_current_canvas()
{
	if (this->canvases.empty()) {
		throw std::logic_error("svg_draw_context::get_current_canvas(): no canvas to draw on");
	}
	return *this->canvases.back();
}

void svg_draw_context::add_text_move(real dx, real dy)
{
	this->text_move += r4::vector2<real>{dx, dy};
}

void svg_draw_context::reset_text_move()
{
	this->text_move.set(0);
}

void svg_draw_context::move_relative_position(real dx, real dy)
{
	this->relative_position += r4::vector2<real>{dx, dy};
}

void svg_draw_context::reset_relative_position()
{
	this->relative_position.set(0);
}

svg_canvas_push::svg_canvas_push(svg_draw_context& ctx, pdf_canvas& canvas) :
	ctx(ctx)
{
	this->ctx.push_canvas(canvas);
}

svg_canvas_push::~svg_canvas_push() noexcept
{
	this->ctx.pop_canvas();
}
