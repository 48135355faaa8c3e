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

#include "string_utils.hpp"
#include "unit_test.hpp"

#include <algorithm>
#include <cctype>

namespace util
{
	bool c_isspace(int c)
	{
		return ::isspace(static_cast<unsigned char>(c)) != 0;
	}

	bool c_isnewline(char c)
	{
		return c == '\r' || c == '\n';
	}

	bool portable_isspace(char c)
	{
		return c_isnewline(c) || c_isspace(c);
	}

	bool notspace(char c)
	{
		return !portable_isspace(c);
	}

	std::string &strip(std::string &str)
	{
		std::string::iterator it = std::find_if(str.begin(), str.end(), notspace);
		str.erase(str.begin(), it);
		str.erase(std::find_if(str.rbegin(), str.rend(), notspace).base(), str.end());

		return str;
	}

	std::string strip_copy(const std::string& str)
	{
		std::string res(str);
		return strip(res);
	}

	std::string to_lower(std::string str)
	{
		std::transform(str.begin(), str.end(), str.begin(), [](char c) { return static_cast<char>(::tolower(static_cast<unsigned char>(c))); });
		return str;
	}

	bool is_blank(const std::string& str)
	{
		return std::find_if(str.begin(), str.end(), notspace) == str.end();
	}

	std::vector<std::string> split(std::string const &val, char c, int flags)
	{
		std::vector<std::string> res;
		split(val, res, c, flags);
		return res;
	}

	void split(std::string const &val, std::vector<std::string>& res, char c, int flags)
	{
		std::string::const_iterator i1 = val.begin();
		std::string::const_iterator i2 = val.begin();

		while (i2 != val.end()) {
			if (*i2 == c) {
				std::string new_val(i1, i2);
				if (flags & STRIP_SPACES)
					strip(new_val);
				if (!(flags & REMOVE_EMPTY) || !new_val.empty())
					res.push_back(new_val);
				++i2;
				i1 = i2;
			} else {
				++i2;
			}
		}

		std::string new_val(i1, i2);
		if (flags & STRIP_SPACES)
			strip(new_val);
		if (!(flags & REMOVE_EMPTY) || !new_val.empty())
			res.push_back(new_val);
	}

	std::vector<std::string> split_on_whitespace(std::string const &val)
	{
		std::vector<std::string> res;
		std::string::const_iterator i = val.begin();
		while(i != val.end()) {
			i = std::find_if(i, val.end(), notspace);
			std::string::const_iterator end = std::find_if(i, val.end(), portable_isspace);
			if(i != end) {
				res.push_back(std::string(i, end));
			}
			i = end;
		}
		return res;
	}

	std::string join(const std::vector<std::string>& v, char j)
	{
		std::string res;
		for(size_t n = 0; n != v.size(); ++n) {
			if(n != 0) {
				res.push_back(j);
			}

			res += v[n];
		}

		return res;
	}

	bool string_starts_with(const std::string& target, const std::string& prefix) {
		if(target.length() < prefix.length()) {
			return false;
		}
		std::string target_pfx = target.substr(0,prefix.length());
		return target_pfx == prefix;
	}
}

UNIT_TEST(test_split_csv_rows)
{
	std::vector<std::string> v = util::split("1,2,\n3, 4 ,\n5");
	CHECK_EQ(v.size(), 5);
	CHECK_EQ(v[0], "1");
	CHECK_EQ(v[2], "3");
	CHECK_EQ(v[3], "4");
	CHECK_EQ(v[4], "5");

	v = util::split("a,,b", ',', 0);
	CHECK_EQ(v.size(), 3);
	CHECK_EQ(v[1], "");

	CHECK(util::split("  \n ").empty(), "blank input produced fields");
}

UNIT_TEST(test_split_on_whitespace)
{
	std::vector<std::string> v = util::split_on_whitespace("  0,0 10,5\n\t-3.5,2  ");
	CHECK_EQ(v.size(), 3);
	CHECK_EQ(v[0], "0,0");
	CHECK_EQ(v[1], "10,5");
	CHECK_EQ(v[2], "-3.5,2");
	CHECK(util::split_on_whitespace("").empty(), "empty input produced fields");
}

UNIT_TEST(test_strip_and_lower)
{
	std::string s = "\r\n  Yes \t";
	CHECK_EQ(util::strip(s), "Yes");
	CHECK_EQ(util::to_lower(s), "yes");
	CHECK(util::is_blank(" \n\t"), "whitespace not blank");
	CHECK(!util::is_blank(" x "), "text reported blank");
	CHECK(util::string_starts_with("template.tx", "temp"), "prefix not found");
	CHECK_EQ(util::join(util::split("a, b ,c"), ';'), "a;b;c");
}
