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

#include "document_renderer.hpp"

#include <algorithm>

#include <utki/debug.hpp>

#include "errors.hpp"

using namespace pdfren;

document_renderer::document_renderer(pdfren::document& document, const layout_parameters& params) :
	document(document),
	params(params)
{}

const layout_area& document_renderer::advance_to_next_area(const area_break* brk)
{
	this->flush_waiting_drawing_elements(false);

	if (auto tagging = this->document.get_tagging_context()) {
		tagging->release_finished_hints();
	}

	unsigned current_page_number = this->current_area ? this->current_area->page_number : 0;

	if (brk && brk->break_type == area_break::type::last_page) {
		while (current_page_number < this->document.get_number_of_pages()) {
			this->possibly_flush_previous_page(current_page_number);
			++current_page_number;
		}
	} else {
		this->possibly_flush_previous_page(current_page_number);
		++current_page_number;
	}

	// jumping to the last page of an empty document
	current_page_number = std::max(current_page_number, 1u);

	std::optional<page_size> custom_page_size;
	if (brk) {
		custom_page_size = brk->page_size_override;
	}

	// skip pages flushed by somebody else
	while (this->document.get_number_of_pages() >= current_page_number &&
		   this->document.get_page(current_page_number).is_flushed())
	{
		++current_page_number;
	}

	auto last_page_size = this->ensure_document_has_n_pages(current_page_number, custom_page_size);
	if (!last_page_size) {
		last_page_size = this->document.get_page(current_page_number).get_trim_box();
	}

	this->current_area = layout_area{current_page_number, this->get_current_page_effective_area(*last_page_size)};

	return *this->current_area;
}

void document_renderer::deliver_finished_content(content_renderer& r)
{
	r.link_to_document(this->document);

	if (!this->is_waiting(r) && (r.is_floating() || r.has_transform())) {
		this->waiting_drawing_elements.push_back(&r);
		return;
	}

	this->flush_single_renderer(r);
}

void document_renderer::flush_single_renderer(content_renderer& r)
{
	if (r.is_flushed() || !r.get_occupied_area()) {
		return;
	}

	auto page_number = r.get_occupied_area()->page_number;

	this->ensure_document_has_n_pages(page_number, std::nullopt);

	auto& page = this->document.get_page(page_number);
	if (page.is_flushed()) {
		throw illegal_page_state_error(
			"cannot draw elements on already flushed pages, page number = " + std::to_string(page_number)
		);
	}

	const auto* last_stream = page.get_last_content_stream();

	bool wrap_old_content = this->document.is_incremental_update() && last_stream && !last_stream->data.empty() &&
		!this->is_content_wrapped(page_number);

	this->wrapped_content_pages.insert(page_number);

	if (auto tagging = this->document.get_tagging_context()) {
		tagging->set_page_for_tagging(page);
	}

	pdf_canvas canvas(page, wrap_old_content);

	draw_context ctx{this->document, canvas};

	r.draw(ctx);

	r.mark_flushed();
}

void document_renderer::close()
{
	this->flush_waiting_drawing_elements(true);

	if (!this->params.immediate_flush) {
		return;
	}

	for (unsigned i = 1; i <= this->document.get_number_of_pages(); ++i) {
		this->document.get_page(i).flush();
	}
}

page_size document_renderer::add_new_page(const std::optional<page_size>& custom_page_size)
{
	this->document.add_new_page(custom_page_size);
	return custom_page_size ? *custom_page_size : this->document.get_default_page_size();
}

std::optional<page_size> document_renderer::ensure_document_has_n_pages(
	unsigned n,
	const std::optional<page_size>& custom_page_size
)
{
	std::optional<page_size> last_page_size;
	while (this->document.get_number_of_pages() < n) {
		last_page_size = this->add_new_page(custom_page_size);
	}
	return last_page_size;
}

r4::rectangle<real> document_renderer::get_current_page_effective_area(const page_size& size) const
{
	return {
		{size.p.x() + this->params.margin_left, size.p.y() + this->params.margin_bottom},
		{size.d.x() - this->params.margin_left - this->params.margin_right,
		 size.d.y() - this->params.margin_bottom - this->params.margin_top}
	};
}

void document_renderer::possibly_flush_previous_page(unsigned current_page_number)
{
	// the current page is not flushed, because content can still be moved to it,
	// e.g. when keeping content together, so only flush the previous one
	if (this->params.immediate_flush && current_page_number > 1) {
		this->document.get_page(current_page_number - 1).flush();
	}
}

bool document_renderer::is_waiting(const content_renderer& r) const
{
	return std::find(this->waiting_drawing_elements.begin(), this->waiting_drawing_elements.end(), &r) !=
		this->waiting_drawing_elements.end();
}

void document_renderer::flush_waiting_drawing_elements(bool force)
{
	unsigned current_page_number = this->current_area ? this->current_area->page_number : 0;

	// drawing may throw, so the element is removed from the list before it is drawn
	for (auto i = this->waiting_drawing_elements.begin(); i != this->waiting_drawing_elements.end();) {
		auto& e = **i;
		const auto& area = e.get_occupied_area();

		if (!area) {
			LOG([&](auto& o) {
				o << "waiting element has no occupied area, dropping it" << std::endl;
			})
			i = this->waiting_drawing_elements.erase(i);
			continue;
		}

		if (force || area->page_number < current_page_number) {
			i = this->waiting_drawing_elements.erase(i);
			this->flush_single_renderer(e);
			continue;
		}

		++i;
	}
}
