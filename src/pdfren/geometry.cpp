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

#include "geometry.hpp"

#include <algorithm>

using namespace pdfren;

r4::matrix2<real> pdfren::text_flip()
{
	return {
		{1, 0, 0},
		{0, -1, 0}
	};
}

r4::rectangle<real> pdfren::unite(const std::optional<r4::rectangle<real>>& a, const r4::rectangle<real>& b)
{
	if (!a) {
		return b;
	}

	using std::max;
	using std::min;

	r4::vector2<real> p1{min(a->p.x(), b.p.x()), min(a->p.y(), b.p.y())};

	auto a2 = a->x2_y2();
	auto b2 = b.x2_y2();

	r4::vector2<real> p2{max(a2.x(), b2.x()), max(a2.y(), b2.y())};

	return {p1, p2 - p1};
}

r4::matrix2<real> pdfren::translated(const r4::matrix2<real>& m, const r4::vector2<real>& t)
{
	auto ret = m;
	ret[0][2] = m[0][0] * t.x() + m[0][1] * t.y() + m[0][2];
	ret[1][2] = m[1][0] * t.x() + m[1][1] * t.y() + m[1][2];
	return ret;
}
