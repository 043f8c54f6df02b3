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

#include <string>
#include <string_view>
#include <vector>

#include <r4/vector.hpp>

#include "config.hpp"
#include "svg_draw_context.hpp"

namespace pdfren {

/**
 * @brief Base class of SVG path commands.
 */
class path_shape
{
	bool relative;

	// non-owning
	svg_draw_context* context = nullptr;

protected:
	/**
	 * @brief Coordinates of the command, always absolute.
	 */
	std::vector<std::string> coordinates;

	svg_draw_context& get_context() const;

	real parse_horizontal_length(std::string_view value) const;
	real parse_vertical_length(std::string_view value) const;

	/**
	 * @brief Convert relative coordinates to absolute ones.
	 * @param coords - pairs of x and y coordinates.
	 * @param start_point - point the coordinates are relative to.
	 * @return Absolute coordinates.
	 */
	static std::vector<std::string> make_coordinates_absolute(
		const std::vector<std::string>& coords,
		const r4::vector2<real>& start_point
	);

public:
	path_shape(bool relative) :
		relative(relative)
	{}

	path_shape(const path_shape&) = delete;
	path_shape& operator=(const path_shape&) = delete;

	virtual ~path_shape() = default;

	bool is_relative() const noexcept
	{
		return this->relative;
	}

	void set_context(svg_draw_context& ctx) noexcept
	{
		this->context = &ctx;
	}

	const std::vector<std::string>& get_coordinates() const noexcept
	{
		return this->coordinates;
	}

	/**
	 * @brief Set coordinates of the command.
	 * @param coords - coordinate tokens.
	 * @param start_point - current point of the path, relative coordinates are resolved against it.
	 * @throw argument_count_error - if the number of coordinates is wrong for the command.
	 */
	virtual void set_coordinates(const std::vector<std::string>& coords, const r4::vector2<real>& start_point) = 0;

	/**
	 * @brief Point where the command ends.
	 */
	r4::vector2<real> get_end_point() const;

	/**
	 * @brief Draw the command to the current canvas of the draw context.
	 * @throw std::logic_error - if draw context is not set.
	 */
	virtual void draw() = 0;
};

/**
 * @brief lineTo (L or l) path command.
 */
class line_to : public path_shape
{
public:
	line_to(bool relative = false) :
		path_shape(relative)
	{}

	void set_coordinates(const std::vector<std::string>& coords, const r4::vector2<real>& start_point) override;

	void draw() override;
};

/**
 * @brief moveTo (M or m) path command.
 */
class move_to : public path_shape
{
public:
	move_to(bool relative = false) :
		path_shape(relative)
	{}

	void set_coordinates(const std::vector<std::string>& coords, const r4::vector2<real>& start_point) override;

	void draw() override;
};

} // namespace pdfren
