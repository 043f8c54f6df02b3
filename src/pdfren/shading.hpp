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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <r4/vector.hpp>

#include "config.hpp"

namespace pdfren {

/**
 * @brief Shading dictionary.
 */
class shading
{
public:
	enum class type {
		function_based = 1,
		axial = 2,
		radial = 3,
		free_form_gouraud = 4,
		lattice_form_gouraud = 5,
		coons_patch_mesh = 6,
		tensor_product_patch_mesh = 7
	};

private:
	type shading_type;
	std::string color_space;

protected:
	virtual void write_entries(std::ostream& o) const;

public:
	/**
	 * @brief Constructor.
	 * @param t - shading type.
	 * @param color_space - name of the colour space in which colour values are expressed,
	 *        e.g. DeviceRGB. The special Pattern colour space is not accepted.
	 * @throw std::invalid_argument - if colour space is empty or Pattern.
	 */
	shading(type t, std::string color_space);

	shading(const shading&) = delete;
	shading& operator=(const shading&) = delete;

	shading(shading&&) = delete;
	shading& operator=(shading&&) = delete;

	virtual ~shading() = default;

	type get_shading_type() const noexcept
	{
		return this->shading_type;
	}

	const std::string& get_color_space() const noexcept
	{
		return this->color_space;
	}

	/**
	 * @brief Serialize shading dictionary.
	 * @return Shading dictionary in PDF syntax.
	 */
	virtual std::string to_dictionary() const;
};

/**
 * @brief Base for shadings defined by a mesh stream.
 */
class mesh_shading : public shading
{
	unsigned bits_per_coordinate = 0;
	unsigned bits_per_component = 0;
	std::vector<real> decode;
	std::optional<std::string> function;

protected:
	std::vector<uint8_t> data;

	void write_entries(std::ostream& o) const override;

public:
	mesh_shading(type t, std::string color_space);

	/**
	 * @param bits - 1, 2, 4, 8, 12, 16, 24 or 32.
	 * @throw std::invalid_argument - if the value is not one of the allowed ones.
	 */
	void set_bits_per_coordinate(unsigned bits);

	unsigned get_bits_per_coordinate() const noexcept
	{
		return this->bits_per_coordinate;
	}

	/**
	 * @param bits - 1, 2, 4, 8, 12 or 16.
	 * @throw std::invalid_argument - if the value is not one of the allowed ones.
	 */
	void set_bits_per_component(unsigned bits);

	unsigned get_bits_per_component() const noexcept
	{
		return this->bits_per_component;
	}

	/**
	 * @brief Set decode array.
	 * Specifies how to map vertex coordinates and colour components into
	 * the appropriate ranges of values: [x_min x_max y_min y_max c1_min c1_max ... cn_min cn_max].
	 * Only one pair of colour values is given if function is set.
	 * @param decode - decode array.
	 * @throw std::invalid_argument - if array has odd number of values or less than 6 values.
	 */
	void set_decode(std::vector<real> decode);

	const std::vector<real>& get_decode() const noexcept
	{
		return this->decode;
	}

	/**
	 * @brief Set function.
	 * With function set, colour of every vertex is a single parametric value.
	 * @param function_reference - reference to the function object, e.g. "12 0 R".
	 */
	void set_function(std::string function_reference);

	const std::optional<std::string>& get_function() const noexcept
	{
		return this->function;
	}

	/**
	 * @brief Number of colour values per vertex.
	 */
	unsigned get_num_color_components() const noexcept;

	/**
	 * @brief Mesh stream data.
	 */
	const std::vector<uint8_t>& get_data() const noexcept
	{
		return this->data;
	}
};

class mesh_shading_with_flags : public mesh_shading
{
	unsigned bits_per_flag = 0;

protected:
	void write_entries(std::ostream& o) const override;

public:
	mesh_shading_with_flags(type t, std::string color_space);

	/**
	 * @param bits - 2, 4 or 8. Only two least significant bits of flag values are used.
	 * @throw std::invalid_argument - if the value is not one of the allowed ones.
	 */
	void set_bits_per_flag(unsigned bits);

	unsigned get_bits_per_flag() const noexcept
	{
		return this->bits_per_flag;
	}
};

/**
 * @brief One patch of Coons patch mesh.
 */
struct coons_patch {
	/**
	 * @brief Edge flag.
	 * 0 starts a new patch, 1, 2 and 3 continue the previous patch sharing one of its edges.
	 */
	unsigned edge_flag = 0;

	/**
	 * @brief Control points.
	 * 12 points for edge flag 0, 8 points otherwise.
	 */
	std::vector<r4::vector2<real>> points;

	/**
	 * @brief Corner colours.
	 * 4 colours for edge flag 0, 2 colours otherwise.
	 */
	std::vector<std::vector<real>> colors;
};

/**
 * @brief Coons patch mesh shading (shading type 6).
 *
 * The shading is constructed from one or more colour patches, each bounded by four cubic Bezier curves.
 * The shape of a patch is defined by 12 control points. Colours are specified for each corner of the unit square,
 * and bilinear interpolation is used to fill in colours over the entire unit square.
 * At least one complete patch must be added before the shading is serialized.
 */
class coons_patch_shading : public mesh_shading_with_flags
{
	size_t num_patches = 0;

public:
	coons_patch_shading(
		std::string color_space,
		unsigned bits_per_coordinate,
		unsigned bits_per_component,
		unsigned bits_per_flag,
		std::vector<real> decode
	);

	/**
	 * @brief Append patch to the mesh stream.
	 * @param p - patch to append.
	 * @throw std::invalid_argument - if the patch is inconsistent with the shading parameters.
	 */
	void add_patch(const coons_patch& p);

	size_t get_num_patches() const noexcept
	{
		return this->num_patches;
	}

	/**
	 * @throw std::logic_error - if no patches were added.
	 */
	std::string to_dictionary() const override;
};

} // namespace pdfren
