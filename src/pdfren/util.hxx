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

#include "config.hpp"

namespace pdfren {

/**
 * @brief Format number for PDF content.
 * At most three digits after decimal point, trailing zeros are omitted.
 */
std::string format_number(real value);

/**
 * @brief Escape string for use as PDF literal string.
 * @param str - string to escape.
 * @return Escaped string, without enclosing parentheses.
 */
std::string escape_string(std::string_view str);

/**
 * @brief Split list of values separated by whitespaces and/or commas.
 * @param str - string to split.
 * @return List of values, empty if the string contains no values.
 */
std::vector<std::string> split_value_list(std::string_view str);

bool equals_ignore_case(std::string_view a, std::string_view b);

std::string_view trim(std::string_view str);

} // namespace pdfren
