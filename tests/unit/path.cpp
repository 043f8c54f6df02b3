#include <tst/set.hpp>
#include <tst/check.hpp>

#include <cmath>
#include <stdexcept>

#include "../../src/pdfren/errors.hpp"
#include "../../src/pdfren/svg_path.hpp"

namespace{
const tst::set set("path", [](tst::suite& suite){
	suite.add(
		"absolute_line_to",
		[](){
			std::string s;
			pdfren::resources res;
			pdfren::pdf_canvas c(s, res);

			pdfren::svg_draw_context ctx;
			pdfren::svg_canvas_push canvas_push(ctx, c);

			pdfren::line_to l;
			l.set_context(ctx);
			l.set_coordinates({"10", "5"}, {100, 100});

			tst::check(!l.is_relative(), SL);
			tst::check_eq(l.get_coordinates()[0], std::string("10"), SL);

			l.draw();

			tst::check_eq(s, std::string("10 5 l\n"), SL);
		}
	);

	suite.add(
		"relative_line_to_is_made_absolute",
		[](){
			std::string s;
			pdfren::resources res;
			pdfren::pdf_canvas c(s, res);

			pdfren::svg_draw_context ctx;
			pdfren::svg_canvas_push canvas_push(ctx, c);

			pdfren::line_to l(true);
			l.set_context(ctx);
			l.set_coordinates({"10", "5"}, {100, 100});

			tst::check_eq(l.get_coordinates()[0], std::string("110"), SL);
			tst::check_eq(l.get_coordinates()[1], std::string("105"), SL);
			tst::check(l.get_end_point() == r4::vector2<pdfren::real>{110, 105}, SL);

			l.draw();

			tst::check_eq(s, std::string("110 105 l\n"), SL);
		}
	);

	suite.add(
		"percentage_coordinates_are_resolved_against_viewport",
		[](){
			std::string s;
			pdfren::resources res;
			pdfren::pdf_canvas c(s, res);

			pdfren::svg_draw_context ctx;
			ctx.viewport = {{0, 0}, {200, 100}};
			pdfren::svg_canvas_push canvas_push(ctx, c);

			pdfren::move_to m;
			m.set_context(ctx);
			m.set_coordinates({"50%", "1in"}, {0, 0});
			m.draw();

			tst::check_eq(s, std::string("100 72 m\n"), SL);
		}
	);

	suite.add(
		"relative_steps_do_not_lose_precision",
		[](){
			std::string s;
			pdfren::resources res;
			pdfren::pdf_canvas c(s, res);

			pdfren::svg_draw_context ctx;
			pdfren::svg_canvas_push canvas_push(ctx, c);

			r4::vector2<pdfren::real> point{100, 0};
			for (unsigned i = 0; i != 1000; ++i) {
				pdfren::line_to l(true);
				l.set_coordinates({"0.0004", "0"}, point);
				point = l.get_end_point();
			}

			tst::check(std::abs(point.x() - pdfren::real(100.4)) < 1e-3, SL) << "point = " << point;
			tst::check(std::abs(point.y()) < 1e-6, SL) << "point = " << point;

			pdfren::line_to l(true);
			l.set_context(ctx);
			l.set_coordinates({"0.0004", "0"}, {100, 0});

			tst::check(std::abs(l.get_end_point().x() - pdfren::real(100.0004)) < 1e-5, SL);

			// content stream operands are still rounded
			l.draw();
			tst::check_eq(s, std::string("100 0 l\n"), SL);
		}
	);

	suite.add(
		"relative_move_to",
		[](){
			pdfren::move_to m(true);
			m.set_coordinates({"-1.5", "2.25"}, {10, 20});

			tst::check_eq(m.get_coordinates()[0], std::string("8.5"), SL);
			tst::check_eq(m.get_coordinates()[1], std::string("22.25"), SL);
		}
	);

	suite.add(
		"wrong_number_of_arguments",
		[](){
			pdfren::line_to l;

			std::string message;
			try{
				l.set_coordinates({"1", "2", "3"}, {0, 0});
			}catch(pdfren::argument_count_error& e){
				message = e.what();
			}
			tst::check_eq(message, std::string("(x y)+ parameters are expected for lineTo. Got: [1, 2, 3]"), SL);

			pdfren::move_to m;

			bool thrown = false;
			try{
				m.set_coordinates({"1"}, {0, 0});
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"drawing_without_context_throws",
		[](){
			pdfren::line_to l;
			l.set_coordinates({"1", "2"}, {0, 0});

			bool thrown = false;
			try{
				l.draw();
			}catch(std::logic_error&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);
});
}
