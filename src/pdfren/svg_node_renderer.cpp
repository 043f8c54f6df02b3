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

#include "svg_node_renderer.hpp"

#include <stdexcept>

#include <svgdom/length.hpp>

#include "svg_length.hxx"
#include "util.hxx"

using namespace pdfren;

namespace {
const std::string fill_attribute = "fill";
const std::string stroke_attribute = "stroke";
const std::string font_size_attribute = "font-size";
const std::string none_value = "none";
} // namespace

void svg_node_renderer::set_attributes_and_styles(attributes_map attributes)
{
	this->attributes_and_styles = std::move(attributes);
}

void svg_node_renderer::set_attribute(const std::string& name, std::string value)
{
	if (!this->attributes_and_styles) {
		this->attributes_and_styles.emplace();
	}
	(*this->attributes_and_styles)[name] = std::move(value);
}

const std::string* svg_node_renderer::find_attribute(std::string_view name) const
{
	if (!this->attributes_and_styles) {
		return nullptr;
	}
	auto i = this->attributes_and_styles->find(name);
	if (i == this->attributes_and_styles->end()) {
		return nullptr;
	}
	return &i->second;
}

std::string svg_node_renderer::get_attribute(std::string_view name) const
{
	if (auto v = this->find_attribute(name)) {
		return *v;
	}
	return {};
}

const std::string* svg_node_renderer::find_style(std::string_view name) const
{
	return this->find_attribute(name);
}

real svg_node_renderer::get_inherited_font_size(const svg_draw_context& ctx) const
{
	return ctx.css_context.get_root_font_size();
}

real svg_node_renderer::get_current_font_size(const svg_draw_context& ctx) const
{
	auto inherited = this->get_inherited_font_size(ctx);

	auto value = this->find_attribute(font_size_attribute);
	if (!value) {
		return inherited;
	}

	auto size = parse_absolute_font_size(*value);
	if (size != 0) {
		return size;
	}

	// relative font size
	try {
		auto l = svgdom::length::parse(trim(*value));
		return length_to_pt(l, inherited, inherited);
	} catch (std::invalid_argument&) {
		// unparsable font size is ignored
		return inherited;
	}
}

namespace {
real parse_length(std::string_view value, real percent_base, real font_size)
{
	svgdom::length l;
	try {
		l = svgdom::length::parse(trim(value));
	} catch (std::invalid_argument&) {
		// not a number
		return 0;
	}
	if (!l.is_valid()) {
		return 0;
	}
	return length_to_pt(l, percent_base, font_size);
}
} // namespace

real svg_node_renderer::parse_horizontal_length(std::string_view value, const svg_draw_context& ctx) const
{
	return parse_length(value, ctx.viewport.d.x(), this->get_current_font_size(ctx));
}

real svg_node_renderer::parse_vertical_length(std::string_view value, const svg_draw_context& ctx) const
{
	return parse_length(value, ctx.viewport.d.y(), this->get_current_font_size(ctx));
}

void svg_node_renderer::draw(svg_draw_context& ctx)
{
	if (this->attributes_and_styles) {
		auto fill = this->find_style(fill_attribute);
		// fill is black by default
		this->do_fill = !fill || trim(*fill) != none_value;

		auto stroke = this->find_style(stroke_attribute);
		this->do_stroke = stroke && trim(*stroke) != none_value;

		this->apply_fill_and_stroke_properties(ctx);
	}

	this->do_draw(ctx);
}
