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

#include "shading.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <utki/util.hpp>

#include "util.hxx"

using namespace pdfren;

namespace {
const std::array<unsigned, 8> allowed_bits_per_coordinate = {1, 2, 4, 8, 12, 16, 24, 32};
const std::array<unsigned, 6> allowed_bits_per_component = {1, 2, 4, 8, 12, 16};
const std::array<unsigned, 3> allowed_bits_per_flag = {2, 4, 8};

constexpr unsigned coordinates_start = 0;
constexpr unsigned colors_start = 4;

constexpr unsigned num_new_patch_points = 12;
constexpr unsigned num_new_patch_colors = 4;
constexpr unsigned num_continued_patch_points = 8;
constexpr unsigned num_continued_patch_colors = 2;

constexpr unsigned max_edge_flag = 3;

template <size_t size>
bool is_allowed(const std::array<unsigned, size>& allowed, unsigned value)
{
	return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

// writes values most significant bit first
class bit_writer
{
	std::vector<uint8_t>& data;
	unsigned num_free_bits = 0;

public:
	bit_writer(std::vector<uint8_t>& data) :
		data(data)
	{}

	void write(uint64_t value, unsigned num_bits)
	{
		for (unsigned i = num_bits; i != 0; --i) {
			if (this->num_free_bits == 0) {
				this->data.push_back(0);
				this->num_free_bits = utki::byte_bits;
			}
			--this->num_free_bits;
			if ((value >> (i - 1)) & 1) {
				this->data.back() |= uint8_t(1 << this->num_free_bits);
			}
		}
	}

	// rest of the last byte stays zero
	void align()
	{
		this->num_free_bits = 0;
	}
};

uint64_t encode(real value, real min, real max, unsigned num_bits)
{
	uint64_t max_code = (uint64_t(1) << num_bits) - 1;
	if (max == min) {
		return 0;
	}

	using std::round;
	auto code = round(double(value - min) / double(max - min) * double(max_code));

	using std::clamp;
	return uint64_t(clamp(code, 0.0, double(max_code)));
}
} // namespace

shading::shading(type t, std::string color_space) :
	shading_type(t),
	color_space(std::move(color_space))
{
	if (this->color_space.empty()) {
		throw std::invalid_argument("shading::shading(): colour space name is empty");
	}
	if (this->color_space == "Pattern") {
		throw std::invalid_argument("shading::shading(): Pattern colour space is not allowed for shadings");
	}
}

void shading::write_entries(std::ostream& o) const
{
	o << " /ShadingType " << unsigned(this->shading_type);
	o << " /ColorSpace /" << this->color_space;
}

std::string shading::to_dictionary() const
{
	std::stringstream ss;
	ss << "<<";
	this->write_entries(ss);
	ss << " >>";
	return ss.str();
}

mesh_shading::mesh_shading(type t, std::string color_space) :
	shading(t, std::move(color_space))
{}

void mesh_shading::set_bits_per_coordinate(unsigned bits)
{
	if (!is_allowed(allowed_bits_per_coordinate, bits)) {
		throw std::invalid_argument(
			"mesh_shading::set_bits_per_coordinate(): invalid value " + std::to_string(bits) +
			", allowed values are 1, 2, 4, 8, 12, 16, 24, 32"
		);
	}
	this->bits_per_coordinate = bits;
}

void mesh_shading::set_bits_per_component(unsigned bits)
{
	if (!is_allowed(allowed_bits_per_component, bits)) {
		throw std::invalid_argument(
			"mesh_shading::set_bits_per_component(): invalid value " + std::to_string(bits) +
			", allowed values are 1, 2, 4, 8, 12, 16"
		);
	}
	this->bits_per_component = bits;
}

void mesh_shading::set_decode(std::vector<real> decode)
{
	if (decode.size() % 2 != 0 || decode.size() < colors_start + 2) {
		throw std::invalid_argument(
			"mesh_shading::set_decode(): decode array must contain pairs of values for x, y and at least one colour component, got " +
			std::to_string(decode.size()) + " values"
		);
	}
	this->decode = std::move(decode);
}

void mesh_shading::set_function(std::string function_reference)
{
	this->function = std::move(function_reference);
}

unsigned mesh_shading::get_num_color_components() const noexcept
{
	if (this->function) {
		return 1;
	}
	if (this->decode.size() < colors_start) {
		return 0;
	}
	return unsigned(this->decode.size() - colors_start) / 2;
}

void mesh_shading::write_entries(std::ostream& o) const
{
	this->shading::write_entries(o);

	o << " /BitsPerCoordinate " << this->bits_per_coordinate;
	o << " /BitsPerComponent " << this->bits_per_component;

	o << " /Decode [";
	for (auto i = this->decode.begin(); i != this->decode.end(); ++i) {
		if (i != this->decode.begin()) {
			o << ' ';
		}
		o << format_number(*i);
	}
	o << "]";

	if (this->function) {
		o << " /Function " << *this->function;
	}
}

mesh_shading_with_flags::mesh_shading_with_flags(type t, std::string color_space) :
	mesh_shading(t, std::move(color_space))
{}

void mesh_shading_with_flags::set_bits_per_flag(unsigned bits)
{
	if (!is_allowed(allowed_bits_per_flag, bits)) {
		throw std::invalid_argument(
			"mesh_shading_with_flags::set_bits_per_flag(): invalid value " + std::to_string(bits) +
			", allowed values are 2, 4, 8"
		);
	}
	this->bits_per_flag = bits;
}

void mesh_shading_with_flags::write_entries(std::ostream& o) const
{
	this->mesh_shading::write_entries(o);
	o << " /BitsPerFlag " << this->bits_per_flag;
}

coons_patch_shading::coons_patch_shading(
	std::string color_space,
	unsigned bits_per_coordinate,
	unsigned bits_per_component,
	unsigned bits_per_flag,
	std::vector<real> decode
) :
	mesh_shading_with_flags(type::coons_patch_mesh, std::move(color_space))
{
	this->set_bits_per_coordinate(bits_per_coordinate);
	this->set_bits_per_component(bits_per_component);
	this->set_bits_per_flag(bits_per_flag);
	this->set_decode(std::move(decode));
}

void coons_patch_shading::add_patch(const coons_patch& p)
{
	if (p.edge_flag > max_edge_flag) {
		throw std::invalid_argument(
			"coons_patch_shading::add_patch(): edge flag must be 0, 1, 2 or 3, got " + std::to_string(p.edge_flag)
		);
	}
	if (p.edge_flag != 0 && this->num_patches == 0) {
		throw std::invalid_argument(
			"coons_patch_shading::add_patch(): first patch must have edge flag 0, got " + std::to_string(p.edge_flag)
		);
	}

	unsigned num_points = p.edge_flag == 0 ? num_new_patch_points : num_continued_patch_points;
	unsigned num_colors = p.edge_flag == 0 ? num_new_patch_colors : num_continued_patch_colors;

	if (p.points.size() != num_points || p.colors.size() != num_colors) {
		throw std::invalid_argument(
			"coons_patch_shading::add_patch(): patch with edge flag " + std::to_string(p.edge_flag) + " needs " +
			std::to_string(num_points) + " points and " + std::to_string(num_colors) + " colours, got " +
			std::to_string(p.points.size()) + " points and " + std::to_string(p.colors.size()) + " colours"
		);
	}

	const auto& decode = this->get_decode();
	auto num_components = this->get_num_color_components();

	if (decode.size() != colors_start + 2 * size_t(num_components)) {
		throw std::invalid_argument(
			"coons_patch_shading::add_patch(): decode array size does not match the number of colour components"
		);
	}

	for (const auto& c : p.colors) {
		if (c.size() != num_components) {
			throw std::invalid_argument(
				"coons_patch_shading::add_patch(): colour must have " + std::to_string(num_components) +
				" components, got " + std::to_string(c.size())
			);
		}
	}

	bit_writer w(this->data);

	w.write(p.edge_flag, this->get_bits_per_flag());

	for (const auto& pt : p.points) {
		w.write(
			encode(pt.x(), decode[coordinates_start], decode[coordinates_start + 1], this->get_bits_per_coordinate()),
			this->get_bits_per_coordinate()
		);
		w.write(
			encode(pt.y(), decode[coordinates_start + 2], decode[coordinates_start + 3], this->get_bits_per_coordinate()),
			this->get_bits_per_coordinate()
		);
	}

	for (const auto& c : p.colors) {
		for (unsigned i = 0; i != num_components; ++i) {
			w.write(
				encode(c[i], decode[colors_start + 2 * i], decode[colors_start + 2 * i + 1], this->get_bits_per_component()),
				this->get_bits_per_component()
			);
		}
	}

	w.align();

	++this->num_patches;
}

std::string coons_patch_shading::to_dictionary() const
{
	if (this->num_patches == 0) {
		throw std::logic_error("coons_patch_shading::to_dictionary(): at least one complete patch must be specified");
	}

	std::stringstream ss;
	ss << "<<";
	this->write_entries(ss);
	ss << " /Length " << this->data.size();
	ss << " >>";
	return ss.str();
}
