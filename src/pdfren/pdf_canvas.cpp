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

#include "pdf_canvas.hpp"

#include "font.hpp"
#include "shading.hpp"
#include "util.hxx"

using namespace pdfren;

namespace {
std::string& get_page_stream(page& p, bool wrap_old_content)
{
	// get writable stream before wrapping, otherwise the opening q may be taken as the stream to write to
	auto& s = p.get_writable_stream();

	if (wrap_old_content) {
		p.new_content_stream_before().data.append("q\n");
		s.data.append("Q\n");
	}

	return s.data;
}
} // namespace

pdf_canvas::pdf_canvas(std::string& stream, pdfren::resources& res) :
	stream(stream),
	res(res)
{}

pdf_canvas::pdf_canvas(page& p, bool wrap_old_content) :
	stream(get_page_stream(p, wrap_old_content)),
	res(p.get_resources())
{}

void pdf_canvas::write_matrix(const r4::matrix2<real>& m)
{
	this->stream.append(format_number(m[0][0])).append(" ");
	this->stream.append(format_number(m[1][0])).append(" ");
	this->stream.append(format_number(m[0][1])).append(" ");
	this->stream.append(format_number(m[1][1])).append(" ");
	this->stream.append(format_number(m[0][2])).append(" ");
	this->stream.append(format_number(m[1][2]));
}

void pdf_canvas::save_state()
{
	this->stream.append("q\n");
}

void pdf_canvas::restore_state()
{
	this->stream.append("Q\n");
}

void pdf_canvas::concat_matrix(const r4::matrix2<real>& m)
{
	this->write_matrix(m);
	this->stream.append(" cm\n");
}

void pdf_canvas::move_to(real x, real y)
{
	this->stream.append(format_number(x)).append(" ").append(format_number(y)).append(" m\n");
}

void pdf_canvas::line_to(real x, real y)
{
	this->stream.append(format_number(x)).append(" ").append(format_number(y)).append(" l\n");
}

void pdf_canvas::close_path()
{
	this->stream.append("h\n");
}

void pdf_canvas::stroke()
{
	this->stream.append("S\n");
}

void pdf_canvas::fill()
{
	this->stream.append("f\n");
}

void pdf_canvas::begin_text()
{
	this->stream.append("BT\n");
}

void pdf_canvas::end_text()
{
	this->stream.append("ET\n");
}

void pdf_canvas::set_font_and_size(const font& f, real size)
{
	const auto& name = this->res.add_font(f);
	this->stream.append("/").append(name).append(" ").append(format_number(size)).append(" Tf\n");
}

void pdf_canvas::set_text_rendering_mode(text_rendering_mode mode)
{
	this->stream.append(std::to_string(unsigned(mode))).append(" Tr\n");
}

void pdf_canvas::set_text_matrix(const r4::matrix2<real>& m)
{
	this->write_matrix(m);
	this->stream.append(" Tm\n");
}

void pdf_canvas::show_text(std::string_view text)
{
	this->stream.append("(").append(escape_string(text)).append(") Tj\n");
}

void pdf_canvas::set_fill_color_rgb(const r4::vector3<real>& rgb)
{
	this->stream.append(format_number(rgb.x()))
		.append(" ")
		.append(format_number(rgb.y()))
		.append(" ")
		.append(format_number(rgb.z()))
		.append(" rg\n");
}

void pdf_canvas::set_stroke_color_rgb(const r4::vector3<real>& rgb)
{
	this->stream.append(format_number(rgb.x()))
		.append(" ")
		.append(format_number(rgb.y()))
		.append(" ")
		.append(format_number(rgb.z()))
		.append(" RG\n");
}

void pdf_canvas::set_line_width(real width)
{
	this->stream.append(format_number(width)).append(" w\n");
}

void pdf_canvas::set_line_dash(utki::span<const real> dash_array, real phase)
{
	this->stream.append("[");
	for (auto i = dash_array.begin(); i != dash_array.end(); ++i) {
		if (i != dash_array.begin()) {
			this->stream.append(" ");
		}
		this->stream.append(format_number(*i));
	}
	this->stream.append("] ").append(format_number(phase)).append(" d\n");
}

void pdf_canvas::paint_shading(const shading& s)
{
	const auto& name = this->res.add_shading(s);
	this->stream.append("/").append(name).append(" sh\n");
}
