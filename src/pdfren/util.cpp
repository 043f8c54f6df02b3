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

#include "util.hxx"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace pdfren;

namespace {
bool is_space(char c)
{
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

std::string pdfren::format_number(real value)
{
	std::stringstream ss;
	ss << std::fixed << std::setprecision(3) << double(value);

	auto str = ss.str();

	auto dot = str.find('.');
	if (dot != std::string::npos) {
		auto last = str.find_last_not_of('0');
		if (last == dot) {
			--last;
		}
		str.resize(last + 1);
	}

	if (str == "-0") {
		return "0";
	}
	return str;
}

std::string pdfren::escape_string(std::string_view str)
{
	std::string ret;
	ret.reserve(str.size());
	for (auto c : str) {
		switch (c) {
			case '(':
			case ')':
			case '\\':
				ret.push_back('\\');
				ret.push_back(c);
				break;
			case '\n':
				ret.append("\\n");
				break;
			case '\r':
				ret.append("\\r");
				break;
			default:
				ret.push_back(c);
				break;
		}
	}
	return ret;
}

std::vector<std::string> pdfren::split_value_list(std::string_view str)
{
	std::vector<std::string> ret;

	std::string cur;
	for (auto c : str) {
		if (is_space(c) || c == ',') {
			if (!cur.empty()) {
				ret.push_back(std::move(cur));
				cur.clear();
			}
			continue;
		}
		cur.push_back(c);
	}
	if (!cur.empty()) {
		ret.push_back(std::move(cur));
	}

	return ret;
}

bool pdfren::equals_ignore_case(std::string_view a, std::string_view b)
{
	if (a.size() != b.size()) {
		return false;
	}
	for (size_t i = 0; i != a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

std::string_view pdfren::trim(std::string_view str)
{
	while (!str.empty() && is_space(str.front())) {
		str.remove_prefix(1);
	}
	while (!str.empty() && is_space(str.back())) {
		str.remove_suffix(1);
	}
	return str;
}
