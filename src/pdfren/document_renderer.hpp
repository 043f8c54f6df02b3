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
#include <set>
#include <vector>

#include "document.hpp"
#include "layout.hpp"

namespace pdfren {

/**
 * @brief Lays out content onto the pages of a document.
 *
 * The renderer hands out content areas page by page and draws finished content to its page.
 * Pages are flushed in increasing order, one page behind the page which is being laid out.
 */
class document_renderer
{
	pdfren::document& document;

	layout_parameters params;

	std::optional<layout_area> current_area;

	// pages whose existing content was wrapped into q/Q
	std::set<unsigned> wrapped_content_pages;

	// content which is drawn after the rest of the content of its page, not owned
	std::vector<content_renderer*> waiting_drawing_elements;

	r4::rectangle<real> get_current_page_effective_area(const page_size& size) const;

	void possibly_flush_previous_page(unsigned current_page_number);

	void flush_waiting_drawing_elements(bool force);

	void flush_single_renderer(content_renderer& r);

	bool is_waiting(const content_renderer& r) const;

protected:
	/**
	 * @brief Add new page to the document.
	 * @param custom_page_size - size of the new page, if not set then document default page size is used.
	 * @return Size of the created page.
	 */
	virtual page_size add_new_page(const std::optional<page_size>& custom_page_size);

	/**
	 * @brief Ensure the document has at least n pages.
	 * Adds pages by calling add_new_page() while the document has less than n pages.
	 * @param n - required number of pages.
	 * @param custom_page_size - size of created pages, if not set then document default page size is used.
	 * @return Size of the last created page or nothing if no pages were created.
	 */
	std::optional<page_size> ensure_document_has_n_pages(unsigned n, const std::optional<page_size>& custom_page_size);

public:
	document_renderer(pdfren::document& document, const layout_parameters& params = layout_parameters());

	document_renderer(const document_renderer&) = delete;
	document_renderer& operator=(const document_renderer&) = delete;

	document_renderer(document_renderer&&) = delete;
	document_renderer& operator=(document_renderer&&) = delete;

	virtual ~document_renderer() = default;

	const layout_parameters& get_parameters() const noexcept
	{
		return this->params;
	}

	const std::optional<layout_area>& get_current_area() const noexcept
	{
		return this->current_area;
	}

	/**
	 * @brief Move to the next content area.
	 * Draws waiting content of the pages left behind, possibly flushes previous pages
	 * and creates new pages as needed.
	 * @param brk - area break request, can be nullptr.
	 * @return The new current area.
	 */
	const layout_area& advance_to_next_area(const area_break* brk = nullptr);

	/**
	 * @brief Draw finished content to its page.
	 * Transformed and floating content is put to the waiting list and drawn later.
	 * @param r - laid out content. In case it is put to the waiting list,
	 *        it must stay alive until it is drawn or until close() is called.
	 * @throw illegal_page_state_error - if the content's page is already flushed.
	 */
	void deliver_finished_content(content_renderer& r);

	/**
	 * @brief Finish layout.
	 * Draws all waiting content and, in immediate flush mode, flushes all pages.
	 */
	void close();

	/**
	 * @brief Check if existing content of the page was wrapped.
	 * @param page_number - page number.
	 * @return true if the page was marked as wrapped.
	 */
	bool is_content_wrapped(unsigned page_number) const noexcept
	{
		return this->wrapped_content_pages.find(page_number) != this->wrapped_content_pages.end();
	}
};

} // namespace pdfren
