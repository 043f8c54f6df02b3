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
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace pdfren {

/**
 * @brief Number of glyph space units in one text space unit.
 */
constexpr real text_space_to_glyph_space = 1000;

/**
 * @brief Font metrics needed for text placement.
 */
class font
{
public:
	font() = default;

	font(const font&) = delete;
	font& operator=(const font&) = delete;

	font(font&&) = delete;
	font& operator=(font&&) = delete;

	virtual ~font() = default;

	/**
	 * @brief PDF base font name, e.g. Helvetica.
	 */
	virtual const std::string& get_name() const noexcept = 0;

	/**
	 * @brief Glyph width in glyph space units.
	 * @param c - character code.
	 */
	virtual real get_glyph_width(char32_t c) const = 0;

	/**
	 * @brief Ascender in glyph space units.
	 */
	virtual real get_ascender() const noexcept = 0;

	/**
	 * @brief Descender in glyph space units, negative value.
	 */
	virtual real get_descender() const noexcept = 0;

	/**
	 * @brief Calculate text width.
	 * @param text - UTF-8 text.
	 * @param font_size - font size.
	 * @return Width of the text in text space units.
	 */
	real get_width(std::string_view text, real font_size) const;
};

/**
 * @brief One of the standard Helvetica fonts.
 * Standard fonts need not be embedded, so they are always available.
 */
class standard_font : public font
{
	std::string name;

public:
	enum class variant {
		regular,
		bold,
		oblique,
		bold_oblique
	};

	standard_font(variant v = variant::regular);

	const std::string& get_name() const noexcept override
	{
		return this->name;
	}

	real get_glyph_width(char32_t c) const override;

	real get_ascender() const noexcept override;
	real get_descender() const noexcept override;
};

/**
 * @brief Create the default font.
 * @return Regular Helvetica.
 */
std::shared_ptr<font> create_default_font();

struct font_characteristics {
	bool bold = false;
	bool italic = false;
};

/**
 * @brief Collection of fonts available for selection.
 */
class font_set
{
public:
	struct entry {
		std::string family;
		font_characteristics characteristics;
		std::shared_ptr<pdfren::font> font;
	};

private:
	std::vector<entry> entries;

public:
	void add(std::string family, font_characteristics characteristics, std::shared_ptr<pdfren::font> f);

	bool empty() const noexcept
	{
		return this->entries.empty();
	}

	const std::vector<entry>& get_entries() const noexcept
	{
		return this->entries;
	}
};

/**
 * @brief Selects fonts by family and style.
 */
class font_provider
{
public:
	font_set fonts;

	/**
	 * @brief Find the best matching font.
	 * Fonts from the temporary set take precedence over provider's own fonts.
	 * Family match weighs more than style match.
	 * @param families - font families in order of preference.
	 * @param characteristics - requested style.
	 * @param temp_fonts - additional fonts, can be nullptr.
	 * @return Best matching font or nullptr if there are no fonts at all.
	 */
	std::shared_ptr<font> get_best_match(
		const std::vector<std::string>& families,
		const font_characteristics& characteristics,
		const font_set* temp_fonts
	) const;
};

} // namespace pdfren
