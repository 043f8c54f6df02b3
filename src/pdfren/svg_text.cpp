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

#include "svg_text.hpp"

#include <array>
#include <cmath>
#include <stdexcept>

#include <svgdom/elements/styles.hpp>
#include <utki/debug.hpp>

#include "errors.hpp"
#include "svg_length.hxx"
#include "util.hxx"

using namespace pdfren;

namespace {
constexpr real epsilon = real(1e-4);

bool is_zero(real v) noexcept
{
	return std::abs(v) < epsilon;
}

const std::string font_family_attribute = "font-family";
const std::string font_weight_attribute = "font-weight";
const std::string font_style_attribute = "font-style";
const std::string text_anchor_attribute = "text-anchor";

const std::array<std::string_view, 8> inherited_properties = {
	{"fill",
	 "stroke",
	 "stroke-width",
	 "stroke-dasharray",
	 "stroke-dashoffset",
	 "font-family",
	 "font-weight",
	 "font-style"}
};

std::vector<real> parse_positions(const std::string& str)
{
	std::vector<real> ret;
	for (const auto& v : split_value_list(str)) {
		ret.push_back(parse_absolute_length(v));
	}
	return ret;
}

// newlines are removed, tabs become spaces, contiguous spaces are collapsed
std::string collapse_white_space(std::string_view text)
{
	std::string ret;
	bool prev_space = false;
	for (auto c : text) {
		if (c == '\n' || c == '\r') {
			continue;
		}
		if (c == '\t') {
			c = ' ';
		}
		if (c == ' ') {
			if (prev_space) {
				continue;
			}
			prev_space = true;
		} else {
			prev_space = false;
		}
		ret.push_back(c);
	}
	return ret;
}

// returns whether leading spaces of the following text are to be trimmed
bool collapse_white_space(text_branch& branch, bool trim_leading)
{
	for (auto& c : branch.get_children()) {
		switch (c->get_kind()) {
			case text_node::kind::branch:
				{
					auto& b = static_cast<text_branch&>(*c);
					trim_leading = collapse_white_space(b, trim_leading || b.contains_absolute_position_change());
					b.mark_white_space_processed();
				}
				break;
			case text_node::kind::leaf:
				{
					auto& l = static_cast<text_leaf&>(*c);
					auto text = collapse_white_space(l.get_text());
					if (trim_leading) {
						text.erase(0, text.find_first_not_of(' '));
					}
					if (!text.empty()) {
						trim_leading = text.back() == ' ';
					}
					l.set_text(std::move(text));
				}
				break;
		}
	}
	return trim_leading;
}

// returns true if non-space text was found
bool trim_trailing_white_space(text_branch& branch)
{
	const auto& children = branch.get_children();
	for (auto i = children.rbegin(); i != children.rend(); ++i) {
		switch ((*i)->get_kind()) {
			case text_node::kind::branch:
				if (trim_trailing_white_space(static_cast<text_branch&>(**i))) {
					return true;
				}
				break;
			case text_node::kind::leaf:
				{
					auto& l = static_cast<text_leaf&>(**i);
					auto text = l.get_text();
					auto end = text.find_last_not_of(' ');
					if (end == std::string::npos) {
						text.clear();
					} else {
						text.erase(end + 1);
					}
					l.set_text(std::move(text));
					if (!l.get_text().empty()) {
						return true;
					}
				}
				break;
		}
	}
	return false;
}
} // namespace

void text_branch::process_white_space()
{
	collapse_white_space(*this, true);
	trim_trailing_white_space(*this);
	this->white_space_processed = true;
}

const std::string* text_node::find_style(std::string_view name) const
{
	if (auto v = this->find_attribute(name)) {
		return v;
	}

	if (!this->parent) {
		return nullptr;
	}

	for (const auto& p : inherited_properties) {
		if (p == name) {
			return static_cast<const text_node*>(this->parent)->find_style(name);
		}
	}

	return nullptr;
}

real text_node::get_inherited_font_size(const svg_draw_context& ctx) const
{
	if (this->parent) {
		return this->parent->get_current_font_size(ctx);
	}
	return this->svg_node_renderer::get_inherited_font_size(ctx);
}

void text_chunk::add(text_run run)
{
	ASSERT(run.font)
	this->runs.push_back(std::move(run));
}

void text_chunk::draw(pdf_canvas& canvas, const r4::matrix2<real>& transform) const
{
	if (this->runs.empty()) {
		return;
	}

	canvas.save_state();
	canvas.begin_text();

	// position of the current run start in the text flow
	real advance = 0;

	for (const auto& r : this->runs) {
		canvas.set_font_and_size(*r.font, r.font_size);
		canvas.set_text_rendering_mode(r.rendering_mode);
		canvas.set_fill_color_rgb(r.properties.fill_color);

		if (r.properties.stroke_color) {
			canvas.set_stroke_color_rgb(*r.properties.stroke_color);
			canvas.set_line_width(r.properties.line_width);
			// solid line resets the dash pattern of the previous run
			canvas.set_line_dash(utki::make_span(r.properties.dash_array), r.properties.dash_phase);
		}

		// relative position is in y-down space, while the text matrix is flipped
		canvas.set_text_matrix(
			translated(transform, {advance + r.relative_position.x(), -r.relative_position.y()})
		);
		canvas.show_text(r.text);

		advance += r.font->get_width(r.text, r.font_size);
	}

	canvas.end_text();
	canvas.restore_state();
}

real text_leaf::get_text_content_length(real parent_font_size, const font* f) const
{
	if (!f) {
		return 0;
	}
	return f->get_width(this->text, parent_font_size);
}

std::optional<text_rectangle> text_leaf::get_text_rectangle(
	svg_draw_context& ctx,
	const std::optional<r4::vector2<real>>& base_point
)
{
	auto p = this->get_parent();
	if (!p || !p->get_font()) {
		return {};
	}

	const auto& f = *p->get_font();
	auto font_size = p->get_current_font_size(ctx);

	auto ascent = f.get_ascender() * font_size / real(text_space_to_glyph_space);
	auto descent = f.get_descender() * font_size / real(text_space_to_glyph_space);

	r4::vector2<real> start = base_point ? *base_point : r4::vector2<real>(0);

	return text_rectangle{
		{{start.x(), start.y() - ascent}, {this->get_text_content_length(font_size, &f), ascent - descent}},
		start.y()
	};
}

void text_leaf::do_draw(svg_draw_context& ctx)
{
	auto p = this->get_parent();
	if (!p) {
		LOG([](auto& o) {
			o << "text_leaf::do_draw(): text outside of text element is not drawn" << std::endl;
		})
		return;
	}

	if (this->text.empty()) {
		return;
	}

	ASSERT(p->get_font())

	text_run run;
	run.text = this->text;
	run.font = p->get_font();
	run.font_size = p->get_current_font_size(ctx);
	run.rendering_mode = p->get_text_rendering_mode();
	run.properties = ctx.text_properties;

	p->add_text_child(std::move(run), ctx);
}

void text_branch::add_child(std::unique_ptr<text_node> child)
{
	if (!child) {
		return;
	}
	child->set_parent(this);
	this->children.push_back(std::move(child));
}

void text_branch::resolve_text_move(const svg_draw_context& ctx)
{
	if (!this->has_attributes_and_styles()) {
		return;
	}

	auto dx = split_value_list(this->get_attribute("dx"));
	auto dy = split_value_list(this->get_attribute("dy"));

	this->move.set(0);

	if (!dx.empty()) {
		this->move.x() = this->parse_horizontal_length(dx.front(), ctx);
	}
	if (!dy.empty()) {
		this->move.y() = this->parse_vertical_length(dy.front(), ctx);
	}

	this->move_state = resolution_state::resolved;
}

void text_branch::resolve_text_position()
{
	if (!this->has_attributes_and_styles()) {
		return;
	}

	this->positions.x = parse_positions(this->get_attribute("x"));
	this->positions.y = parse_positions(this->get_attribute("y"));

	this->position_state = resolution_state::resolved;
}

r4::vector2<real> text_branch::get_relative_translation(const svg_draw_context& ctx)
{
	if (this->move_state == resolution_state::unresolved) {
		this->resolve_text_move(ctx);
	}
	return this->move;
}

bool text_branch::contains_relative_move(const svg_draw_context& ctx)
{
	auto m = this->get_relative_translation(ctx);
	return !is_zero(m.x()) || !is_zero(m.y());
}

const text_branch::absolute_positions& text_branch::get_absolute_position_changes()
{
	if (this->position_state == resolution_state::unresolved) {
		this->resolve_text_position();
	}
	return this->positions;
}

bool text_branch::contains_absolute_position_change()
{
	const auto& p = this->get_absolute_position_changes();
	return !p.x.empty() || !p.y.empty();
}

void text_branch::resolve_font(const svg_draw_context& ctx)
{
	this->font.reset();

	bool has_fonts = (ctx.provider && !ctx.provider->fonts.empty()) || (ctx.temp_fonts && !ctx.temp_fonts->empty());

	if (has_fonts) {
		std::vector<std::string> families;
		if (auto family = this->find_style(font_family_attribute)) {
			// family names may contain spaces, so the list is split by commas only
			std::string_view list = *family;
			for (;;) {
				auto comma = list.find(',');
				auto name = trim(list.substr(0, comma));
				if (name.size() >= 2 && (name.front() == '\'' || name.front() == '"') && name.back() == name.front()) {
					name = name.substr(1, name.size() - 2);
				}
				if (!name.empty()) {
					families.emplace_back(name);
				}
				if (comma == std::string_view::npos) {
					break;
				}
				list.remove_prefix(comma + 1);
			}
		}
		if (families.empty()) {
			families.emplace_back();
		}

		font_characteristics characteristics;
		if (auto weight = this->find_style(font_weight_attribute)) {
			characteristics.bold = equals_ignore_case(trim(*weight), "bold");
		}
		if (auto style = this->find_style(font_style_attribute)) {
			characteristics.italic = equals_ignore_case(trim(*style), "italic");
		}

		if (ctx.provider) {
			this->font = ctx.provider->get_best_match(families, characteristics, ctx.temp_fonts);
		} else {
			this->font = font_provider().get_best_match(families, characteristics, ctx.temp_fonts);
		}
	}

	if (this->font) {
		return;
	}

	if (!ctx.default_font_factory) {
		throw font_resolution_error("font not found: no fonts available and no default font");
	}

	try {
		this->font = ctx.default_font_factory();
	} catch (std::runtime_error& e) {
		throw font_resolution_error(std::string("font not found: ") + e.what());
	}

	if (!this->font) {
		throw font_resolution_error("font not found: default font could not be created");
	}
}

real text_branch::get_text_anchor_alignment_correction(real text_length) const
{
	auto anchor = this->find_attribute(text_anchor_attribute);
	if (!anchor) {
		return 0;
	}

	// anchor is applied only when the branch sets its own x position
	if (this->positions.x.empty()) {
		return 0;
	}

	auto value = trim(*anchor);
	if (value == "middle") {
		return -text_length / 2;
	} else if (value == "end") {
		return -text_length;
	}
	return 0;
}

void text_branch::start_new_text_chunk(svg_draw_context& ctx, const r4::matrix2<real>& transform)
{
	ctx.root_transform = transform;
	ctx.reset_text_move();
	ctx.reset_relative_position();
}

r4::matrix2<real> text_branch::get_text_transform(const svg_draw_context& ctx) const
{
	real x;
	if (!this->positions.x.empty()) {
		x = this->positions.x.front();
	} else {
		// continue after the preceding text
		x = get_translate_x(ctx.root_transform) + ctx.text_move.x();
	}

	real y;
	if (!this->positions.y.empty()) {
		y = this->positions.y.front();
	} else {
		y = get_translate_y(ctx.root_transform) + ctx.text_move.y();
	}

	return translated(text_flip(), {x, -y});
}

void text_branch::add_text_child(text_run run, svg_draw_context& ctx)
{
	if (auto p = this->get_parent()) {
		p->add_text_child(std::move(run), ctx);
		return;
	}

	run.relative_position = ctx.relative_position;
	this->chunk.add(std::move(run));
}

void text_branch::draw_last_text_chunk(svg_draw_context& ctx)
{
	if (auto p = this->get_parent()) {
		p->draw_last_text_chunk(ctx);
		return;
	}

	if (this->chunk.empty()) {
		return;
	}

	this->chunk.draw(ctx.get_current_canvas(), ctx.root_transform);
	this->chunk.clear();
}

void text_branch::apply_fill_and_stroke_properties(svg_draw_context& ctx)
{
	auto& props = ctx.text_properties;

	if (this->do_fill) {
		if (auto fill = this->find_style("fill")) {
			auto paint = svgdom::parse_paint(trim(*fill));
			if (!svgdom::is_none(paint)) {
				props.fill_color = svgdom::get_rgb(paint).to<real>();
			}
		} else {
			props.fill_color.set(0);
		}
	}

	if (this->do_stroke) {
		if (auto stroke = this->find_style("stroke")) {
			auto paint = svgdom::parse_paint(trim(*stroke));
			if (!svgdom::is_none(paint)) {
				props.stroke_color = svgdom::get_rgb(paint).to<real>();
			}
		}

		if (auto width = this->find_style("stroke-width")) {
			props.line_width = parse_absolute_length(*width);
		}

		if (auto dashes = this->find_style("stroke-dasharray")) {
			props.dash_array.clear();
			if (trim(*dashes) != "none") {
				for (const auto& d : split_value_list(*dashes)) {
					props.dash_array.push_back(parse_absolute_length(d));
				}
				// odd number of values is repeated to yield even number
				if (props.dash_array.size() % 2 != 0) {
					auto size = props.dash_array.size();
					for (size_t i = 0; i != size; ++i) {
						props.dash_array.push_back(props.dash_array[i]);
					}
				}
			}
		}

		if (auto offset = this->find_style("stroke-dashoffset")) {
			props.dash_phase = parse_absolute_length(*offset);
		}
	} else {
		props.stroke_color.reset();
	}
}

void text_branch::process_child(svg_draw_context& ctx, text_node& child)
{
	auto child_length = child.get_text_content_length(this->get_current_font_size(ctx), this->font.get());

	auto correction = this->get_text_anchor_alignment_correction(child_length);
	if (!is_zero(correction)) {
		ctx.add_text_move(correction, 0);
		ctx.move_relative_position(correction, 0);
	}

	// child's styles do not affect its siblings
	auto saved_properties = ctx.text_properties;
	child.draw(ctx);
	ctx.text_properties = std::move(saved_properties);

	ctx.add_text_move(child_length, 0);
}

void text_branch::perform_drawing(svg_draw_context& ctx)
{
	this->resolve_font(ctx);

	if (this->contains_absolute_position_change()) {
		this->draw_last_text_chunk(ctx);
		start_new_text_chunk(ctx, this->get_text_transform(ctx));
	}

	if (this->contains_relative_move(ctx)) {
		auto m = this->get_relative_translation(ctx);
		ctx.add_text_move(m.x(), m.y());
		ctx.move_relative_position(m.x(), m.y());
	}

	for (auto& c : this->children) {
		this->process_child(ctx, *c);
	}
}

void text_branch::do_draw(svg_draw_context& ctx)
{
	if (this->children.empty() || !this->has_attributes_and_styles()) {
		return;
	}

	if (this->do_fill && this->do_stroke) {
		this->rendering_mode = text_rendering_mode::fill_stroke;
	} else if (this->do_stroke) {
		this->rendering_mode = text_rendering_mode::stroke;
	} else {
		this->rendering_mode = text_rendering_mode::fill;
	}

	if (!this->is_root()) {
		// the root text element collects the text into chunks
		this->perform_drawing(ctx);
		return;
	}

	if (!this->white_space_processed) {
		this->process_white_space();
	}

	this->chunk.clear();
	start_new_text_chunk(ctx, text_flip());
	this->perform_drawing(ctx);
	this->draw_last_text_chunk(ctx);
}

std::optional<text_rectangle> text_branch::get_text_rectangle(
	svg_draw_context& ctx,
	const std::optional<r4::vector2<real>>& base_point
)
{
	if (!this->has_attributes_and_styles()) {
		return {};
	}

	this->resolve_font(ctx);

	const auto& p = this->get_absolute_position_changes();

	r4::vector2<real> start = base_point ? *base_point : r4::vector2<real>(0);
	if (!p.x.empty()) {
		start.x() = p.x.front();
	}
	if (!p.y.empty()) {
		start.y() = p.y.front();
	}

	auto point = start + this->get_relative_translation(ctx);

	std::optional<r4::rectangle<real>> common;
	for (auto& c : this->children) {
		auto r = c->get_text_rectangle(ctx, point);
		if (!r) {
			continue;
		}
		point = r->baseline_right_point();
		common = unite(common, r->rect);
	}

	if (!common) {
		return {};
	}

	if (!base_point) {
		// root text element starts at its own x
		common->p.x() = start.x();
	}

	return text_rectangle{*common, point.y()};
}

std::optional<r4::rectangle<real>> text_branch::get_object_bounding_box(svg_draw_context& ctx)
{
	auto r = this->get_text_rectangle(ctx, std::nullopt);
	if (!r) {
		return {};
	}
	return r->rect;
}
