#include <tst/set.hpp>
#include <tst/check.hpp>

#include <stdexcept>

#include "../../src/pdfren/shading.hpp"

namespace{
pdfren::coons_patch make_patch(unsigned edge_flag, pdfren::real coord, std::vector<pdfren::real> color){
	pdfren::coons_patch p;
	p.edge_flag = edge_flag;
	p.points.assign(edge_flag == 0 ? 12 : 8, r4::vector2<pdfren::real>{coord, coord});
	p.colors.assign(edge_flag == 0 ? 4 : 2, color);
	return p;
}

template <class exception_type, class function_type>
bool throws(function_type f){
	try{
		f();
	}catch(exception_type&){
		return true;
	}
	return false;
}
}

namespace{
const tst::set set("shading", [](tst::suite& suite){
	suite.add(
		"pattern_color_space_is_rejected",
		[](){
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("Pattern", 8, 8, 8, {0, 1, 0, 1, 0, 1});
			}), SL);
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("", 8, 8, 8, {0, 1, 0, 1, 0, 1});
			}), SL);
		}
	);

	suite.add(
		"invalid_bit_depths_are_rejected",
		[](){
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("DeviceGray", 3, 8, 8, {0, 1, 0, 1, 0, 1});
			}), SL);
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("DeviceGray", 8, 24, 8, {0, 1, 0, 1, 0, 1});
			}), SL);
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("DeviceGray", 8, 8, 1, {0, 1, 0, 1, 0, 1});
			}), SL);
			tst::check(throws<std::invalid_argument>([](){
				pdfren::coons_patch_shading s("DeviceGray", 8, 8, 8, {0, 1, 0, 1, 0});
			}), SL);
		}
	);

	suite.add(
		"first_patch_must_have_edge_flag_0",
		[](){
			pdfren::coons_patch_shading s("DeviceGray", 8, 8, 8, {0, 255, 0, 255, 0, 1});

			tst::check(throws<std::invalid_argument>([&](){
				s.add_patch(make_patch(1, 0, {0}));
			}), SL);

			s.add_patch(make_patch(0, 0, {0}));
			s.add_patch(make_patch(2, 0, {0}));

			tst::check_eq(s.get_num_patches(), size_t(2), SL);

			tst::check(throws<std::invalid_argument>([&](){
				s.add_patch(make_patch(4, 0, {0}));
			}), SL);
		}
	);

	suite.add(
		"wrong_number_of_points_or_colors_is_rejected",
		[](){
			pdfren::coons_patch_shading s("DeviceRGB", 8, 8, 8, {0, 255, 0, 255, 0, 1, 0, 1, 0, 1});

			auto p = make_patch(0, 0, {0, 0, 0});
			p.points.pop_back();
			tst::check(throws<std::invalid_argument>([&](){
				s.add_patch(p);
			}), SL);

			tst::check(throws<std::invalid_argument>([&](){
				s.add_patch(make_patch(0, 0, {0, 0}));
			}), SL);

			tst::check_eq(s.get_num_patches(), size_t(0), SL);
		}
	);

	suite.add(
		"byte_aligned_patch_data",
		[](){
			pdfren::coons_patch_shading s("DeviceGray", 8, 8, 8, {0, 255, 0, 255, 0, 1});

			s.add_patch(make_patch(0, 10, {1}));

			const auto& d = s.get_data();

			// flag, 12 points of 2 coordinates and 4 colours of 1 component
			tst::check_eq(d.size(), size_t(1 + 24 + 4), SL);
			tst::check_eq(unsigned(d[0]), unsigned(0), SL);
			tst::check_eq(unsigned(d[1]), unsigned(10), SL);
			tst::check_eq(unsigned(d[2]), unsigned(10), SL);
			tst::check_eq(unsigned(d[25]), unsigned(255), SL);
		}
	);

	suite.add(
		"sub_byte_values_are_packed_most_significant_bit_first",
		[](){
			pdfren::coons_patch_shading s("DeviceGray", 4, 4, 2, {0, 15, 0, 15, 0, 15});

			s.add_patch(make_patch(0, 15, {15}));

			const auto& d = s.get_data();

			// 2 + 24 * 4 + 4 * 4 = 114 bits, padded to byte boundary
			tst::check_eq(d.size(), size_t(15), SL);
			tst::check_eq(unsigned(d[0]), unsigned(0x3f), SL);
			tst::check_eq(unsigned(d.back()), unsigned(0xc0), SL);

			s.add_patch(make_patch(1, 0, {0}));

			// 2 + 16 * 4 + 2 * 4 = 74 bits of the next patch start on a new byte
			tst::check_eq(d.size(), size_t(15 + 10), SL);
			tst::check_eq(unsigned(d[15]), unsigned(0x40), SL);
		}
	);

	suite.add(
		"values_are_mapped_through_decode_ranges",
		[](){
			pdfren::coons_patch_shading s("DeviceGray", 8, 8, 8, {-100, 100, 0, 510, 0, 1});

			s.add_patch(make_patch(0, 0, {0.5}));

			const auto& d = s.get_data();

			tst::check_eq(unsigned(d[1]), unsigned(128), SL); // x = 0 is in the middle of [-100, 100]
			tst::check_eq(unsigned(d[2]), unsigned(0), SL);
			tst::check_eq(unsigned(d[25]), unsigned(128), SL);
		}
	);

	suite.add(
		"function_makes_colors_single_valued",
		[](){
			pdfren::coons_patch_shading s("DeviceRGB", 8, 8, 8, {0, 255, 0, 255, 0, 1});
			s.set_function("12 0 R");

			tst::check_eq(s.get_num_color_components(), unsigned(1), SL);

			s.add_patch(make_patch(0, 0, {0.25}));

			tst::check_eq(
				s.to_dictionary(),
				std::string("<< /ShadingType 6 /ColorSpace /DeviceRGB /BitsPerCoordinate 8 /BitsPerComponent 8"
					" /Decode [0 255 0 255 0 1] /Function 12 0 R /BitsPerFlag 8 /Length 29 >>"),
				SL
			);
		}
	);

	suite.add(
		"dictionary",
		[](){
			pdfren::coons_patch_shading s("DeviceGray", 8, 16, 8, {0, 255, 0, 255, 0, 1});

			tst::check(throws<std::logic_error>([&](){
				s.to_dictionary();
			}), SL);

			s.add_patch(make_patch(0, 0, {0}));

			tst::check_eq(
				s.to_dictionary(),
				std::string("<< /ShadingType 6 /ColorSpace /DeviceGray /BitsPerCoordinate 8 /BitsPerComponent 16"
					" /Decode [0 255 0 255 0 1] /BitsPerFlag 8 /Length 33 >>"),
				SL
			);
		}
	);
});
}
