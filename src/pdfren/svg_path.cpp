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

#include "svg_path.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <svgdom/length.hpp>

#include "errors.hpp"
#include "svg_length.hxx"
#include "util.hxx"

using namespace pdfren;

namespace {
constexpr size_t point_argument_size = 2;

std::string to_string(const std::vector<std::string>& coords)
{
	std::stringstream ss;
	ss << '[';
	for (auto i = coords.begin(); i != coords.end(); ++i) {
		if (i != coords.begin()) {
			ss << ", ";
		}
		ss << *i;
	}
	ss << ']';
	return ss.str();
}

real parse_number(std::string_view str)
{
	try {
		return svgdom::length::parse(trim(str)).value;
	} catch (std::invalid_argument&) {
		// not a number
		return 0;
	}
}

// unlike format_number() keeps all significant digits
std::string to_coordinate(real value)
{
	std::stringstream ss;
	ss << std::setprecision(std::numeric_limits<real>::max_digits10) << value;
	return ss.str();
}

void check_point_arguments(const std::vector<std::string>& coords, std::string_view command)
{
	if (coords.size() != point_argument_size) {
		std::stringstream ss;
		ss << "(x y)+ parameters are expected for " << command << ". Got: " << to_string(coords);
		throw argument_count_error(ss.str());
	}
}
} // namespace

svg_draw_context& path_shape::get_context() const
{
	if (!this->context) {
		throw std::logic_error("path_shape: draw context is not set");
	}
	return *this->context;
}

real path_shape::parse_horizontal_length(std::string_view value) const
{
	const auto& ctx = this->get_context();
	return length_to_pt(
		svgdom::length::parse(trim(value)),
		ctx.viewport.d.x(),
		ctx.css_context.get_root_font_size()
	);
}

real path_shape::parse_vertical_length(std::string_view value) const
{
	const auto& ctx = this->get_context();
	return length_to_pt(
		svgdom::length::parse(trim(value)),
		ctx.viewport.d.y(),
		ctx.css_context.get_root_font_size()
	);
}

std::vector<std::string> path_shape::make_coordinates_absolute(
	const std::vector<std::string>& coords,
	const r4::vector2<real>& start_point
)
{
	std::vector<std::string> ret;
	ret.reserve(coords.size());
	for (size_t i = 0; i != coords.size(); ++i) {
		// even coordinates are x, odd are y
		auto base = i % 2 == 0 ? start_point.x() : start_point.y();
		ret.push_back(to_coordinate(parse_number(coords[i]) + base));
	}
	return ret;
}

r4::vector2<real> path_shape::get_end_point() const
{
	if (this->coordinates.size() < point_argument_size) {
		return 0;
	}
	auto last = this->coordinates.end() - point_argument_size;
	return {parse_absolute_length(*last), parse_absolute_length(*(last + 1))};
}

void line_to::set_coordinates(const std::vector<std::string>& coords, const r4::vector2<real>& start_point)
{
	check_point_arguments(coords, "lineTo");

	if (this->is_relative()) {
		this->coordinates = make_coordinates_absolute(coords, start_point);
	} else {
		this->coordinates = coords;
	}
}

void line_to::draw()
{
	auto x = this->parse_horizontal_length(this->coordinates.at(0));
	auto y = this->parse_vertical_length(this->coordinates.at(1));
	this->get_context().get_current_canvas().line_to(x, y);
}

void move_to::set_coordinates(const std::vector<std::string>& coords, const r4::vector2<real>& start_point)
{
	check_point_arguments(coords, "moveTo");

	if (this->is_relative()) {
		this->coordinates = make_coordinates_absolute(coords, start_point);
	} else {
		this->coordinates = coords;
	}
}

void move_to::draw()
{
	auto x = this->parse_horizontal_length(this->coordinates.at(0));
	auto y = this->parse_vertical_length(this->coordinates.at(1));
	this->get_context().get_current_canvas().move_to(x, y);
}
