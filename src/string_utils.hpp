/*
	Copyright (C) 2003-2014 by David White <davewx7@gmail.com>
	
	This software is provided 'as-is', without any express or implied
	warranty. In no event will the authors be held liable for any damages
	arising from the use of this software.

	Permission is granted to anyone to use this software for any purpose,
	including commercial applications, and to alter it and redistribute it
	freely, subject to the following restrictions:

	   1. The origin of this software must not be misrepresented; you must not
	   claim that you wrote the original software. If you use this software
	   in a product, an acknowledgement in the product documentation would be
	   appreciated but is not required.

	   2. Altered source versions must be plainly marked as such, and must not be
	   misrepresented as being the original software.

	   3. This notice may not be removed or altered from any source
	   distribution.
*/

#pragma once

#include <string>
#include <vector>

namespace util
{
	bool c_isspace(int c);

	bool c_isnewline(char c);
	bool portable_isspace(char c);
	bool notspace(char c);

	std::string& strip(std::string& str);
	std::string strip_copy(const std::string& str);
	std::string to_lower(std::string str);
	bool is_blank(const std::string& str);

	enum { REMOVE_EMPTY = 0x01, STRIP_SPACES = 0x02 };
	std::vector<std::string> split(std::string const &val, char c = ',', int flags = REMOVE_EMPTY | STRIP_SPACES);
	void split(std::string const &val, std::vector<std::string>& res, char c = ',', int flags = REMOVE_EMPTY | STRIP_SPACES);
	// splits on runs of whitespace, never producing empty strings.
	std::vector<std::string> split_on_whitespace(std::string const &val);
	std::string join(const std::vector<std::string>& v, char c=',');

	bool string_starts_with(const std::string& target, const std::string& prefix);
}
