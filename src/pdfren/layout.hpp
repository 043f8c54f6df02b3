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

#include <optional>

#include <r4/rectangle.hpp>

#include "config.hpp"
#include "document.hpp"
#include "geometry.hpp"
#include "pdf_canvas.hpp"

namespace pdfren {

/**
 * @brief Area where layout content is placed.
 */
struct layout_area {
	unsigned page_number = 0;

	/**
	 * @brief Content rectangle in page space.
	 */
	r4::rectangle<real> bbox;
};

/**
 * @brief Request to start new content area.
 */
struct area_break {
	enum class type {
		/**
		 * @brief Continue on the next page.
		 */
		next_page,

		/**
		 * @brief Jump to the last page of the document.
		 */
		last_page
	};

	type break_type = type::next_page;

	/**
	 * @brief Size of the new page, if new page is created.
	 * If not set then document default page size is used.
	 */
	std::optional<page_size> page_size_override;
};

/**
 * @brief Document layout parameters.
 */
struct layout_parameters {
	constexpr static real default_margin = 36;

	real margin_left = default_margin;
	real margin_right = default_margin;
	real margin_top = default_margin;
	real margin_bottom = default_margin;

	/**
	 * @brief Flush pages as soon as layout leaves them.
	 * The page which is being laid out can still receive content,
	 * so only the page before it is flushed.
	 */
	bool immediate_flush = true;
};

/**
 * @brief Context of drawing laid out content to a page.
 */
struct draw_context {
	pdfren::document& document;
	pdf_canvas& canvas;
};

/**
 * @brief Unit of laid out content.
 */
class content_renderer
{
	std::optional<layout_area> occupied_area;

	pdfren::document* document = nullptr;

	bool flushed = false;

public:
	content_renderer() = default;

	content_renderer(const content_renderer&) = delete;
	content_renderer& operator=(const content_renderer&) = delete;

	content_renderer(content_renderer&&) = delete;
	content_renderer& operator=(content_renderer&&) = delete;

	virtual ~content_renderer() = default;

	const std::optional<layout_area>& get_occupied_area() const noexcept
	{
		return this->occupied_area;
	}

	void set_occupied_area(const layout_area& area)
	{
		this->occupied_area = area;
	}

	/**
	 * @brief Whether the content has a pending transformation.
	 * Transformed content is drawn after the rest of the content of its page.
	 */
	virtual bool has_transform() const
	{
		return false;
	}

	/**
	 * @brief Whether the content belongs to a floating layout flow.
	 * Floating content is drawn after the rest of the content of its page.
	 */
	virtual bool is_floating() const
	{
		return false;
	}

	bool is_flushed() const noexcept
	{
		return this->flushed;
	}

	void mark_flushed() noexcept
	{
		this->flushed = true;
	}

	void link_to_document(pdfren::document& doc) noexcept
	{
		this->document = &doc;
	}

	pdfren::document* get_document() const noexcept
	{
		return this->document;
	}

	virtual void draw(draw_context& ctx) = 0;
};

} // namespace pdfren
