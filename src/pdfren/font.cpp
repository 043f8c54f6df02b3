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

#include "font.hpp"

#include <array>

#include <utki/debug.hpp>
#include <utki/unicode.hpp>

#include "util.hxx"

using namespace pdfren;

namespace {
constexpr char32_t first_ascii_glyph = 32;

// glyph widths of printable ASCII characters, starting from space
const std::array<short, 95> helvetica_widths = {
	278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
	556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
	1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
	667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
	333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
	556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584
};

const std::array<short, 95> helvetica_bold_widths = {
	278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
	556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
	975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
	667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
	333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
	611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584
};

// width of glyphs outside of ASCII range
constexpr real default_glyph_width = 556;

constexpr real helvetica_ascender = 718;
constexpr real helvetica_descender = -207;
} // namespace

real font::get_width(std::string_view text, real font_size) const
{
	real width = 0;
	for (auto c : utki::to_utf32(text)) {
		width += this->get_glyph_width(c);
	}
	return width * font_size / text_space_to_glyph_space;
}

standard_font::standard_font(variant v)
{
	switch (v) {
		case variant::regular:
			this->name = "Helvetica";
			break;
		case variant::bold:
			this->name = "Helvetica-Bold";
			break;
		case variant::oblique:
			this->name = "Helvetica-Oblique";
			break;
		case variant::bold_oblique:
			this->name = "Helvetica-BoldOblique";
			break;
	}
}

real standard_font::get_glyph_width(char32_t c) const
{
	if (c < first_ascii_glyph || c >= first_ascii_glyph + helvetica_widths.size()) {
		return default_glyph_width;
	}

	// bold fonts have "Bold" in their names
	const auto& widths = this->name.find("Bold") == std::string::npos ? helvetica_widths : helvetica_bold_widths;

	return real(widths[c - first_ascii_glyph]);
}

real standard_font::get_ascender() const noexcept
{
	return helvetica_ascender;
}

real standard_font::get_descender() const noexcept
{
	return helvetica_descender;
}

std::shared_ptr<font> pdfren::create_default_font()
{
	return std::make_shared<standard_font>();
}

void font_set::add(std::string family, font_characteristics characteristics, std::shared_ptr<pdfren::font> f)
{
	ASSERT(f)
	this->entries.push_back(entry{std::move(family), characteristics, std::move(f)});
}

std::shared_ptr<font> font_provider::get_best_match(
	const std::vector<std::string>& families,
	const font_characteristics& characteristics,
	const font_set* temp_fonts
) const
{
	const font_set::entry* best = nullptr;
	int best_score = -1;

	auto consider = [&](const font_set& set) {
		for (const auto& e : set.get_entries()) {
			int score = 0;
			for (size_t i = 0; i != families.size(); ++i) {
				if (equals_ignore_case(families[i], e.family)) {
					// earlier families in the list are preferred
					score += int(4 * (families.size() - i));
					break;
				}
			}
			if (e.characteristics.bold == characteristics.bold) {
				score += 2;
			}
			if (e.characteristics.italic == characteristics.italic) {
				score += 1;
			}
			if (score > best_score) {
				best_score = score;
				best = &e;
			}
		}
	};

	if (temp_fonts) {
		consider(*temp_fonts);
	}
	consider(this->fonts);

	if (!best) {
		return nullptr;
	}
	return best->font;
}
