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
#include <optional>
#include <string>
#include <vector>

#include <r4/matrix.hpp>
#include <r4/vector.hpp>

#include "config.hpp"
#include "font.hpp"
#include "geometry.hpp"
#include "pdf_canvas.hpp"
#include "svg_draw_context.hpp"
#include "svg_node_renderer.hpp"

namespace pdfren {

class text_branch;

/**
 * @brief Node of SVG text tree.
 * Either a text branch (text or tspan element) or a text leaf (character data).
 */
class text_node : public svg_node_renderer
{
public:
	enum class kind {
		branch,
		leaf
	};

private:
	kind node_kind;

	// non-owning, parent owns its children
	text_branch* parent = nullptr;

protected:
	text_node(kind node_kind) :
		node_kind(node_kind)
	{}

	/**
	 * @brief Find style property.
	 * Inherited properties which are not set on the node are taken from the ancestors.
	 */
	const std::string* find_style(std::string_view name) const override;

	real get_inherited_font_size(const svg_draw_context& ctx) const override;

public:
	kind get_kind() const noexcept
	{
		return this->node_kind;
	}

	text_branch* get_parent() const noexcept
	{
		return this->parent;
	}

	void set_parent(text_branch* parent) noexcept
	{
		this->parent = parent;
	}

	/**
	 * @brief Get length of the node's text.
	 * @param parent_font_size - font size of the parent node.
	 * @param f - font of the parent node.
	 * @return Text length in points.
	 */
	virtual real get_text_content_length(real parent_font_size, const font* f) const = 0;

	/**
	 * @brief Get text bounding box.
	 * @param ctx - draw context.
	 * @param base_point - point where the text starts, not set for the root text element.
	 * @return Bounding box of the node's text, or nothing if the node has no text.
	 */
	virtual std::optional<text_rectangle> get_text_rectangle(
		svg_draw_context& ctx,
		const std::optional<r4::vector2<real>>& base_point
	) = 0;
};

/**
 * @brief Piece of text with its resolved drawing properties.
 */
struct text_run {
	std::string text;
	std::shared_ptr<const pdfren::font> font;
	real font_size = 0;
	text_rendering_mode rendering_mode = text_rendering_mode::fill;
	svg_text_properties properties;

	/**
	 * @brief Shift of the text relative to the current text flow position.
	 */
	r4::vector2<real> relative_position = 0;
};

/**
 * @brief Sequence of text runs drawn as one text object.
 */
class text_chunk
{
	std::vector<text_run> runs;

public:
	void add(text_run run);

	bool empty() const noexcept
	{
		return this->runs.empty();
	}

	const std::vector<text_run>& get_runs() const noexcept
	{
		return this->runs;
	}

	/**
	 * @brief Draw the runs.
	 * Every next run continues where the previous one ends.
	 * @param canvas - canvas to draw to.
	 * @param transform - text matrix of the chunk start.
	 */
	void draw(pdf_canvas& canvas, const r4::matrix2<real>& transform) const;

	void clear() noexcept
	{
		this->runs.clear();
	}
};

/**
 * @brief Character data of SVG text.
 */
class text_leaf : public text_node
{
	std::string text;

protected:
	void do_draw(svg_draw_context& ctx) override;

public:
	text_leaf(std::string text = std::string()) :
		text_node(kind::leaf),
		text(std::move(text))
	{}

	const std::string& get_text() const noexcept
	{
		return this->text;
	}

	void set_text(std::string text)
	{
		this->text = std::move(text);
	}

	real get_text_content_length(real parent_font_size, const font* f) const override;

	std::optional<text_rectangle> get_text_rectangle(
		svg_draw_context& ctx,
		const std::optional<r4::vector2<real>>& base_point
	) override;
};

/**
 * @brief SVG text or tspan element.
 * The branch which has no parent is the root text element, it collects the text
 * of the whole subtree into text chunks and draws them.
 */
class text_branch : public text_node
{
public:
	struct absolute_positions {
		std::vector<real> x;
		std::vector<real> y;
	};

private:
	std::vector<std::unique_ptr<text_node>> children;

	std::shared_ptr<pdfren::font> font;

	text_rendering_mode rendering_mode = text_rendering_mode::fill;

	enum class resolution_state {
		unresolved,
		resolved
	};

	resolution_state move_state = resolution_state::unresolved;
	r4::vector2<real> move = 0;

	resolution_state position_state = resolution_state::unresolved;
	absolute_positions positions;

	bool white_space_processed = false;

	text_chunk chunk;

	void resolve_text_move(const svg_draw_context& ctx);
	void resolve_text_position();

	void resolve_font(const svg_draw_context& ctx);

	void perform_drawing(svg_draw_context& ctx);
	void process_child(svg_draw_context& ctx, text_node& child);

	real get_text_anchor_alignment_correction(real text_length) const;

	static void start_new_text_chunk(svg_draw_context& ctx, const r4::matrix2<real>& transform);

	r4::matrix2<real> get_text_transform(const svg_draw_context& ctx) const;

	void process_white_space();

protected:
	void apply_fill_and_stroke_properties(svg_draw_context& ctx) override;

	void do_draw(svg_draw_context& ctx) override;

public:
	text_branch() :
		text_node(kind::branch)
	{}

	/**
	 * @brief Add child node.
	 * The branch becomes parent of the child.
	 * @param child - child node, nullptr is ignored.
	 */
	void add_child(std::unique_ptr<text_node> child);

	const std::vector<std::unique_ptr<text_node>>& get_children() const noexcept
	{
		return this->children;
	}

	bool is_root() const noexcept
	{
		return !this->get_parent();
	}

	real get_text_content_length(real parent_font_size, const pdfren::font* f) const override
	{
		return 0;
	}

	std::optional<text_rectangle> get_text_rectangle(
		svg_draw_context& ctx,
		const std::optional<r4::vector2<real>>& base_point
	) override;

	/**
	 * @brief Get bounding box of the whole text.
	 * @return Bounding box or nothing if there is no text.
	 */
	std::optional<r4::rectangle<real>> get_object_bounding_box(svg_draw_context& ctx);

	/**
	 * @brief Relative move given by dx and dy attributes.
	 * Only the first value of each list is used.
	 */
	r4::vector2<real> get_relative_translation(const svg_draw_context& ctx);

	bool contains_relative_move(const svg_draw_context& ctx);

	bool contains_absolute_position_change();

	/**
	 * @brief Absolute positions given by x and y attributes.
	 */
	const absolute_positions& get_absolute_position_changes();

	/**
	 * @brief Font resolved during drawing or text measuring.
	 */
	const std::shared_ptr<pdfren::font>& get_font() const noexcept
	{
		return this->font;
	}

	text_rendering_mode get_text_rendering_mode() const noexcept
	{
		return this->rendering_mode;
	}

	bool is_white_space_processed() const noexcept
	{
		return this->white_space_processed;
	}

	void mark_white_space_processed() noexcept
	{
		this->white_space_processed = true;
	}

	/**
	 * @brief Add text to the current text chunk.
	 * Non-root branches pass the text up to the root.
	 */
	void add_text_child(text_run run, svg_draw_context& ctx);

	/**
	 * @brief Draw the current text chunk.
	 * Non-root branches delegate to the root.
	 */
	void draw_last_text_chunk(svg_draw_context& ctx);
};

} // namespace pdfren
