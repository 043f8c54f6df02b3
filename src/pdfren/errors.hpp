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

#include <stdexcept>
#include <string>

namespace pdfren {

/**
 * @brief Thrown when content is about to be written to a page which is already flushed.
 * Such a page is finalized and cannot receive any more drawing operations.
 */
class illegal_page_state_error : public std::logic_error
{
public:
	illegal_page_state_error(const std::string& message) :
		std::logic_error(message)
	{}
};

/**
 * @brief Thrown when no usable font can be obtained for drawing text.
 */
class font_resolution_error : public std::runtime_error
{
public:
	font_resolution_error(const std::string& message) :
		std::runtime_error(message)
	{}
};

/**
 * @brief Thrown when a command receives a wrong number of arguments.
 */
class argument_count_error : public std::invalid_argument
{
public:
	argument_count_error(const std::string& message) :
		std::invalid_argument(message)
	{}
};

} // namespace pdfren
