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

#include "document.hpp"

#include <utki/debug.hpp>

#include "errors.hpp"
#include "font.hpp"
#include "shading.hpp"

using namespace pdfren;

const std::string& resources::add_font(const font& f)
{
	auto i = this->fonts.find(f.get_name());
	if (i != this->fonts.end()) {
		return i->second;
	}

	auto name = "F" + std::to_string(this->fonts.size() + 1);
	return this->fonts.insert(std::make_pair(f.get_name(), std::move(name))).first->second;
}

const std::string& resources::add_shading(const shading& s)
{
	for (const auto& sh : this->shadings) {
		if (sh.first == &s) {
			return sh.second;
		}
	}

	this->shadings.emplace_back(&s, "Sh" + std::to_string(this->shadings.size() + 1));
	return this->shadings.back().second;
}

page::page(unsigned number, const page_size& size) :
	number(number),
	media_box(size)
{}

void page::throw_if_flushed() const
{
	if (this->flushed) {
		throw illegal_page_state_error(
			"page " + std::to_string(this->number) + " is already flushed, cannot modify its content"
		);
	}
}

const page_size& page::get_trim_box() const noexcept
{
	if (this->trim_box) {
		return *this->trim_box;
	}
	return this->media_box;
}

void page::set_trim_box(const page_size& box)
{
	this->throw_if_flushed();
	this->trim_box = box;
}

const content_stream* page::get_last_content_stream() const noexcept
{
	if (this->content_streams.empty()) {
		return nullptr;
	}
	return &this->content_streams.back();
}

std::string page::get_content() const
{
	std::string ret;
	for (const auto& s : this->content_streams) {
		ret.append(s.data);
	}
	return ret;
}

void page::add_original_content(std::string data)
{
	this->throw_if_flushed();
	this->content_streams.push_back(content_stream{std::move(data), true});
}

content_stream& page::new_content_stream_before()
{
	this->throw_if_flushed();
	this->content_streams.emplace_front();
	return this->content_streams.front();
}

content_stream& page::new_content_stream_after()
{
	this->throw_if_flushed();
	this->content_streams.emplace_back();
	return this->content_streams.back();
}

content_stream& page::get_writable_stream()
{
	this->throw_if_flushed();
	if (this->content_streams.empty() || this->content_streams.back().is_original) {
		return this->new_content_stream_after();
	}
	return this->content_streams.back();
}

resources& page::get_resources()
{
	this->throw_if_flushed();
	return this->res;
}

void page::flush()
{
	if (this->flushed) {
		return;
	}
	this->flushed = true;

	LOG([&](auto& o) {
		o << "page " << this->number << " flushed, " << this->content_streams.size() << " content streams" << std::endl;
	})
}

document::document(mode open_mode, const page_size& default_page_size) :
	open_mode(open_mode),
	default_page_size(default_page_size)
{}

void document::set_default_page_size(const page_size& size)
{
	this->default_page_size = size;
}

page& document::get_page(unsigned number)
{
	if (number < 1 || number > this->pages.size()) {
		throw std::out_of_range(
			"document::get_page(): requested page number " + std::to_string(number) + " is out of bounds [1, " +
			std::to_string(this->pages.size()) + "]"
		);
	}
	ASSERT(this->pages[number - 1])
	return *this->pages[number - 1];
}

const page& document::get_page(unsigned number) const
{
	// NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
	return const_cast<document*>(this)->get_page(number);
}

page& document::get_last_page()
{
	return this->get_page(this->get_number_of_pages());
}

page& document::add_new_page(const std::optional<page_size>& size)
{
	// pages cannot be constructed via std::make_unique() because of private constructor
	this->pages.push_back(std::unique_ptr<page>(
		new page(unsigned(this->pages.size() + 1), size ? *size : this->default_page_size)
	));

	LOG([&](auto& o) {
		o << "page " << this->pages.size() << " added" << std::endl;
	})

	return *this->pages.back();
}
