#include <tst/set.hpp>
#include <tst/check.hpp>

#include <stdexcept>

#include "../../src/pdfren/document_renderer.hpp"
#include "../../src/pdfren/svg_content_renderer.hpp"

namespace{
const tst::set set("svg_content_renderer", [](tst::suite& suite){
	suite.add(
		"text_is_drawn_into_occupied_area",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();

			auto root = std::make_unique<pdfren::text_branch>();
			root->set_attribute("x", "0");
			root->set_attribute("y", "10");
			root->add_child(std::make_unique<pdfren::text_leaf>("a"));

			pdfren::svg_content_renderer svg(std::move(root), {100, 50});
			svg.set_occupied_area(pdfren::layout_area{1, {{36, 36}, {100, 50}}});

			r.deliver_finished_content(svg);

			tst::check_eq(
				doc.get_page(1).get_content(),
				std::string(
					"q\n"
					"1 0 0 -1 36 86 cm\n"
					"q\nBT\n/F1 12 Tf\n0 Tr\n0 0 0 rg\n1 0 0 -1 0 10 Tm\n(a) Tj\nET\nQ\n"
					"Q\n"
				),
				SL
			);

			tst::check_eq(doc.get_page(1).get_resources().get_fonts().at("Helvetica"), std::string("F1"), SL);
		}
	);

	suite.add(
		"root_font_size_from_css_context",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			auto root = std::make_unique<pdfren::text_branch>();
			root->set_attribute("y", "10");
			root->add_child(std::make_unique<pdfren::text_leaf>("a"));

			pdfren::svg_content_renderer svg(std::move(root), {100, 50});
			svg.css_context.set_root_font_size("20pt");
			svg.set_occupied_area(pdfren::layout_area{1, {{0, 0}, {100, 50}}});

			r.deliver_finished_content(svg);

			tst::check(doc.get_page(1).get_content().find("/F1 20 Tf\n") != std::string::npos, SL);
		}
	);

	suite.add(
		"null_root_is_rejected",
		[](){
			bool thrown = false;
			try{
				pdfren::svg_content_renderer svg(nullptr, {100, 50});
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);
});
}
