#include <tst/set.hpp>
#include <tst/check.hpp>

#include "../../src/pdfren/document_renderer.hpp"
#include "../../src/pdfren/errors.hpp"

namespace{
class test_content : public pdfren::content_renderer{
public:
	bool transform = false;
	bool floating = false;

	unsigned num_draws = 0;

	test_content(unsigned page_number){
		this->set_occupied_area(pdfren::layout_area{page_number, {{36, 36}, {100, 100}}});
	}

	bool has_transform()const override{
		return this->transform;
	}

	bool is_floating()const override{
		return this->floating;
	}

	void draw(pdfren::draw_context& ctx)override{
		++this->num_draws;
		ctx.canvas.move_to(1, 2);
	}
};

class test_tagging : public pdfren::tagging_context{
public:
	unsigned num_releases = 0;
	pdfren::page* tagged_page = nullptr;

	void release_finished_hints()override{
		++this->num_releases;
	}

	void set_page_for_tagging(pdfren::page& p)override{
		this->tagged_page = &p;
	}
};

bool is_same(const r4::rectangle<pdfren::real>& a, const r4::rectangle<pdfren::real>& b){
	return a.p == b.p && a.d == b.d;
}
}

namespace{
const tst::set set("document_renderer", [](tst::suite& suite){
	suite.add(
		"first_area_is_page_1_inset_by_margins",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			const auto& area = r.advance_to_next_area();

			tst::check_eq(area.page_number, unsigned(1), SL);
			tst::check_eq(doc.get_number_of_pages(), unsigned(1), SL);
			tst::check(is_same(area.bbox, {{36, 36}, {523, 770}}), SL) << "bbox = " << area.bbox.p << ", " << area.bbox.d;
		}
	);

	suite.add(
		"custom_margins",
		[](){
			pdfren::document doc;
			pdfren::layout_parameters params;
			params.margin_left = 10;
			params.margin_right = 20;
			params.margin_top = 30;
			params.margin_bottom = 40;
			pdfren::document_renderer r(doc, params);

			const auto& area = r.advance_to_next_area();

			tst::check(is_same(area.bbox, {{10, 40}, {565, 772}}), SL) << "bbox = " << area.bbox.p << ", " << area.bbox.d;
		}
	);

	suite.add(
		"previous_page_is_flushed_in_immediate_mode",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();
			r.advance_to_next_area();

			tst::check(!doc.get_page(1).is_flushed(), SL);
			tst::check(!doc.get_page(2).is_flushed(), SL);

			r.advance_to_next_area();

			tst::check(doc.get_page(1).is_flushed(), SL);
			tst::check(!doc.get_page(2).is_flushed(), SL);
			tst::check(!doc.get_page(3).is_flushed(), SL);
		}
	);

	suite.add(
		"no_flushing_without_immediate_mode",
		[](){
			pdfren::document doc;
			pdfren::layout_parameters params;
			params.immediate_flush = false;
			pdfren::document_renderer r(doc, params);

			for(unsigned i = 0; i != 4; ++i){
				r.advance_to_next_area();
			}
			r.close();

			for(unsigned i = 1; i <= doc.get_number_of_pages(); ++i){
				tst::check(!doc.get_page(i).is_flushed(), SL) << "page " << i;
			}
		}
	);

	suite.add(
		"content_is_drawn_to_its_page",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();

			test_content c(1);
			r.deliver_finished_content(c);

			tst::check_eq(c.num_draws, unsigned(1), SL);
			tst::check(c.is_flushed(), SL);
			tst::check(c.get_document() == &doc, SL);
			tst::check_eq(doc.get_page(1).get_content(), std::string("1 2 m\n"), SL);

			// flushed content is not drawn again
			r.deliver_finished_content(c);
			tst::check_eq(c.num_draws, unsigned(1), SL);
		}
	);

	suite.add(
		"content_of_missing_page_creates_the_page",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			test_content c(3);
			r.deliver_finished_content(c);

			tst::check_eq(doc.get_number_of_pages(), unsigned(3), SL);
			tst::check_eq(doc.get_page(3).get_content(), std::string("1 2 m\n"), SL);
		}
	);

	suite.add(
		"drawing_to_flushed_page_throws",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();
			r.advance_to_next_area();
			r.advance_to_next_area();

			test_content c(1);

			bool thrown = false;
			try{
				r.deliver_finished_content(c);
			}catch(pdfren::illegal_page_state_error&){
				thrown = true;
			}
			tst::check(thrown, SL);
			tst::check_eq(c.num_draws, unsigned(0), SL);
		}
	);

	suite.add(
		"content_without_area_is_not_drawn",
		[](){
			class no_area_content : public pdfren::content_renderer{
			public:
				unsigned num_draws = 0;
				void draw(pdfren::draw_context& ctx)override{
					++this->num_draws;
				}
			} c;

			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();
			r.deliver_finished_content(c);

			tst::check_eq(c.num_draws, unsigned(0), SL);
		}
	);

	suite.add(
		"transformed_content_is_drawn_when_layout_leaves_the_page",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();

			test_content c(1);
			c.transform = true;
			r.deliver_finished_content(c);

			tst::check_eq(c.num_draws, unsigned(0), SL);

			r.advance_to_next_area();
			tst::check_eq(c.num_draws, unsigned(0), SL);

			r.advance_to_next_area();
			tst::check_eq(c.num_draws, unsigned(1), SL);

			// drawn before the page was flushed
			tst::check(doc.get_page(1).is_flushed(), SL);
			tst::check_eq(doc.get_page(1).get_content(), std::string("1 2 m\n"), SL);
		}
	);

	suite.add(
		"close_draws_waiting_content_and_flushes_pages",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			r.advance_to_next_area();
			r.advance_to_next_area();

			test_content c1(1);
			c1.floating = true;
			r.deliver_finished_content(c1);

			test_content c2(2);
			c2.transform = true;
			r.deliver_finished_content(c2);

			r.close();

			tst::check_eq(c1.num_draws, unsigned(1), SL);
			tst::check_eq(c2.num_draws, unsigned(1), SL);
			tst::check(doc.get_page(1).is_flushed(), SL);
			tst::check(doc.get_page(2).is_flushed(), SL);
		}
	);

	suite.add(
		"last_page_break_jumps_to_the_last_page",
		[](){
			pdfren::document doc;
			doc.add_new_page();
			doc.add_new_page();
			doc.add_new_page();

			pdfren::document_renderer r(doc);

			pdfren::area_break brk;
			brk.break_type = pdfren::area_break::type::last_page;

			const auto& area = r.advance_to_next_area(&brk);

			tst::check_eq(area.page_number, unsigned(3), SL);
			tst::check_eq(doc.get_number_of_pages(), unsigned(3), SL);
			tst::check(doc.get_page(1).is_flushed(), SL);
			tst::check(!doc.get_page(2).is_flushed(), SL);
		}
	);

	suite.add(
		"last_page_break_in_empty_document_starts_first_page",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			pdfren::area_break brk;
			brk.break_type = pdfren::area_break::type::last_page;

			const auto& area = r.advance_to_next_area(&brk);

			tst::check_eq(area.page_number, unsigned(1), SL);
			tst::check_eq(doc.get_number_of_pages(), unsigned(1), SL);
			tst::check(!doc.get_page(1).is_flushed(), SL);
		}
	);

	suite.add(
		"externally_flushed_pages_are_skipped",
		[](){
			pdfren::document doc;
			doc.add_new_page().flush();
			doc.add_new_page().flush();

			pdfren::document_renderer r(doc);

			const auto& area = r.advance_to_next_area();

			tst::check_eq(area.page_number, unsigned(3), SL);
			tst::check_eq(doc.get_number_of_pages(), unsigned(3), SL);
		}
	);

	suite.add(
		"area_of_existing_page_follows_its_trim_box",
		[](){
			pdfren::document doc;
			doc.add_new_page().set_trim_box({{0, 0}, {300, 400}});

			pdfren::document_renderer r(doc);

			const auto& area = r.advance_to_next_area();

			tst::check(is_same(area.bbox, {{36, 36}, {228, 328}}), SL) << "bbox = " << area.bbox.p << ", " << area.bbox.d;
		}
	);

	suite.add(
		"page_size_override",
		[](){
			pdfren::document doc;
			pdfren::document_renderer r(doc);

			pdfren::area_break brk;
			brk.page_size_override = pdfren::page_size{{0, 0}, {200, 300}};

			const auto& area = r.advance_to_next_area(&brk);

			tst::check(doc.get_page(1).get_media_box().d == r4::vector2<pdfren::real>{200, 300}, SL);
			tst::check(is_same(area.bbox, {{36, 36}, {128, 228}}), SL) << "bbox = " << area.bbox.p << ", " << area.bbox.d;
		}
	);

	suite.add(
		"old_content_is_wrapped_once_in_incremental_mode",
		[](){
			pdfren::document doc(pdfren::document::mode::incremental);
			doc.add_new_page().add_original_content("1 w\n");

			pdfren::document_renderer r(doc);

			test_content c1(1);
			r.deliver_finished_content(c1);

			tst::check(r.is_content_wrapped(1), SL);

			test_content c2(1);
			r.deliver_finished_content(c2);

			tst::check_eq(doc.get_page(1).get_content(), std::string("q\n1 w\nQ\n1 2 m\n1 2 m\n"), SL);
		}
	);

	suite.add(
		"old_content_is_not_wrapped_in_write_mode",
		[](){
			pdfren::document doc;
			doc.add_new_page().add_original_content("1 w\n");

			pdfren::document_renderer r(doc);

			test_content c(1);
			r.deliver_finished_content(c);

			tst::check_eq(doc.get_page(1).get_content(), std::string("1 w\n1 2 m\n"), SL);
		}
	);

	suite.add(
		"tagging_is_notified",
		[](){
			test_tagging t;

			pdfren::document doc;
			doc.set_tagging_context(&t);

			pdfren::document_renderer r(doc);

			r.advance_to_next_area();
			r.advance_to_next_area();

			tst::check_eq(t.num_releases, unsigned(2), SL);

			test_content c(2);
			r.deliver_finished_content(c);

			tst::check(t.tagged_page == &doc.get_page(2), SL);
		}
	);
});
}
