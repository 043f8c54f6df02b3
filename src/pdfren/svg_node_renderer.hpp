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
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "svg_draw_context.hpp"

namespace pdfren {

/**
 * @brief Base class of SVG node renderers.
 * Holds attributes and resolved styles of the node.
 */
class svg_node_renderer
{
public:
	typedef std::map<std::string, std::string, std::less<>> attributes_map;

private:
	std::optional<attributes_map> attributes_and_styles;

protected:
	bool do_fill = false;
	bool do_stroke = false;

	/**
	 * @brief Find value of a style property.
	 * By default only the node's own attributes are looked up.
	 * @param name - property name.
	 * @return Pointer to the value or nullptr if the property is not set.
	 */
	virtual const std::string* find_style(std::string_view name) const;

	/**
	 * @brief Font size against which relative font size of this node is resolved.
	 */
	virtual real get_inherited_font_size(const svg_draw_context& ctx) const;

	/**
	 * @brief Apply fill and stroke styles to the draw context.
	 * Called before do_draw(), when do_fill and do_stroke are already resolved.
	 */
	virtual void apply_fill_and_stroke_properties(svg_draw_context& ctx) {}

	virtual void do_draw(svg_draw_context& ctx) = 0;

	real parse_horizontal_length(std::string_view value, const svg_draw_context& ctx) const;
	real parse_vertical_length(std::string_view value, const svg_draw_context& ctx) const;

public:
	svg_node_renderer() = default;

	svg_node_renderer(const svg_node_renderer&) = delete;
	svg_node_renderer& operator=(const svg_node_renderer&) = delete;

	svg_node_renderer(svg_node_renderer&&) = delete;
	svg_node_renderer& operator=(svg_node_renderer&&) = delete;

	virtual ~svg_node_renderer() = default;

	void set_attributes_and_styles(attributes_map attributes);

	bool has_attributes_and_styles() const noexcept
	{
		return this->attributes_and_styles.has_value();
	}

	void set_attribute(const std::string& name, std::string value);

	/**
	 * @brief Find attribute.
	 * @param name - attribute name.
	 * @return Pointer to attribute value or nullptr if there is no such attribute.
	 */
	const std::string* find_attribute(std::string_view name) const;

	/**
	 * @brief Get attribute value.
	 * @param name - attribute name.
	 * @return Attribute value or empty string if there is no such attribute.
	 */
	std::string get_attribute(std::string_view name) const;

	/**
	 * @brief Font size of this node.
	 * Resolved from font-size style against the inherited font size.
	 */
	real get_current_font_size(const svg_draw_context& ctx) const;

	/**
	 * @brief Draw the node.
	 * Resolves fill and stroke styles and draws the node.
	 */
	void draw(svg_draw_context& ctx);
};

} // namespace pdfren
