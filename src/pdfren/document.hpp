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

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geometry.hpp"

namespace pdfren {

class font;
class shading;
class page;

/**
 * @brief Named resources referenced from content streams.
 */
class resources
{
	std::map<std::string, std::string> fonts;
	std::vector<std::pair<const shading*, std::string>> shadings;

public:
	/**
	 * @brief Register font.
	 * @param f - font to register.
	 * @return Resource name of the font, e.g. "F1". Same font gets same name.
	 */
	const std::string& add_font(const font& f);

	/**
	 * @brief Register shading.
	 * @param s - shading to register. Must outlive the resources.
	 * @return Resource name of the shading, e.g. "Sh1".
	 */
	const std::string& add_shading(const shading& s);

	/**
	 * @brief Get registered fonts.
	 * @return Map of base font name to resource name.
	 */
	const decltype(fonts) & get_fonts() const noexcept
	{
		return this->fonts;
	}

	const decltype(shadings) & get_shadings() const noexcept
	{
		return this->shadings;
	}
};

struct content_stream {
	std::string data;

	/**
	 * @brief Whether the stream was read from an existing document.
	 * Original streams are never appended to.
	 */
	bool is_original = false;
};

/**
 * @brief Accessibility tagging collaborator.
 */
class tagging_context
{
public:
	virtual ~tagging_context() = default;

	/**
	 * @brief Release hints of tagged elements which are finished.
	 */
	virtual void release_finished_hints() = 0;

	/**
	 * @brief Point the tagging cursor at the page.
	 */
	virtual void set_page_for_tagging(page& p) = 0;
};

class page
{
	friend class document;

	unsigned number;

	page_size media_box;
	std::optional<page_size> trim_box;

	// deque, because references to streams must stay valid while new streams are inserted in front
	std::deque<content_stream> content_streams;

	pdfren::resources res;

	bool flushed = false;

	page(unsigned number, const page_size& size);

	void throw_if_flushed() const;

public:
	unsigned get_number() const noexcept
	{
		return this->number;
	}

	const page_size& get_media_box() const noexcept
	{
		return this->media_box;
	}

	/**
	 * @brief Get trim box.
	 * @return Trim box or media box if trim box is not set.
	 */
	const page_size& get_trim_box() const noexcept;

	void set_trim_box(const page_size& box);

	size_t get_content_stream_count() const noexcept
	{
		return this->content_streams.size();
	}

	/**
	 * @brief Get last content stream.
	 * @return Pointer to last content stream or nullptr if the page has no content streams.
	 */
	const content_stream* get_last_content_stream() const noexcept;

	const std::deque<content_stream>& get_content_streams() const noexcept
	{
		return this->content_streams;
	}

	/**
	 * @brief Concatenated content of all content streams.
	 */
	std::string get_content() const;

	/**
	 * @brief Add content which is considered part of the original document.
	 * Used for pages of a document opened for reading.
	 * @param data - content stream data.
	 */
	void add_original_content(std::string data);

	content_stream& new_content_stream_before();
	content_stream& new_content_stream_after();

	/**
	 * @brief Get stream to append new content to.
	 * @return Last content stream if it was created by this session, otherwise new content stream.
	 */
	content_stream& get_writable_stream();

	pdfren::resources& get_resources();

	const pdfren::resources& get_resources() const noexcept
	{
		return this->res;
	}

	bool is_flushed() const noexcept
	{
		return this->flushed;
	}

	/**
	 * @brief Finalize the page.
	 * After flushing no more content can be added to the page.
	 * Flushing already flushed page does nothing.
	 */
	void flush();
};

class document
{
public:
	enum class mode {
		/**
		 * @brief New document, writer only.
		 */
		write,

		/**
		 * @brief Existing document opened for reading only.
		 */
		read,

		/**
		 * @brief Existing document opened for reading and writing.
		 * New content is appended to the existing one.
		 */
		incremental
	};

private:
	mode open_mode;

	page_size default_page_size;

	std::vector<std::unique_ptr<page>> pages;

	tagging_context* tagging = nullptr;

public:
	document(mode open_mode = mode::write, const page_size& default_page_size = a4);

	bool has_reader() const noexcept
	{
		return this->open_mode != mode::write;
	}

	bool has_writer() const noexcept
	{
		return this->open_mode != mode::read;
	}

	bool is_incremental_update() const noexcept
	{
		return this->has_reader() && this->has_writer();
	}

	const page_size& get_default_page_size() const noexcept
	{
		return this->default_page_size;
	}

	void set_default_page_size(const page_size& size);

	unsigned get_number_of_pages() const noexcept
	{
		return unsigned(this->pages.size());
	}

	/**
	 * @brief Get page.
	 * @param number - page number, starting from 1.
	 * @return Reference to the page.
	 * @throw std::out_of_range - if there is no page with given number.
	 */
	page& get_page(unsigned number);
	const page& get_page(unsigned number) const;

	page& get_last_page();

	/**
	 * @brief Append new page.
	 * @param size - page size, if not set then default page size is used.
	 * @return Reference to the new page.
	 */
	page& add_new_page(const std::optional<page_size>& size = std::nullopt);

	/**
	 * @brief Set tagging collaborator.
	 * @param t - tagging context, nullptr disables tagging. Must outlive the document.
	 */
	void set_tagging_context(tagging_context* t) noexcept
	{
		this->tagging = t;
	}

	tagging_context* get_tagging_context() const noexcept
	{
		return this->tagging;
	}

	bool is_tagged() const noexcept
	{
		return this->tagging != nullptr;
	}
};

} // namespace pdfren
