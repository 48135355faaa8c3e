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

#include <cstdint>

#include "base64.hpp"
#include "string_utils.hpp"
#include "unit_test.hpp"

namespace base64 
{
	namespace 
	{
		const char* const alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

		int decode_char(char c)
		{
			if(c >= 'A' && c <= 'Z') {
				return c - 'A';
			} else if(c >= 'a' && c <= 'z') {
				return c - 'a' + 26;
			} else if(c >= '0' && c <= '9') {
				return c - '0' + 52;
			} else if(c == '+') {
				return 62;
			} else if(c == '/') {
				return 63;
			}
			return -1;
		}
	}

	std::string b64encode(const std::vector<char>& data)
	{
		std::string res;
		res.reserve(((data.size() + 2) / 3) * 4);
		size_t n = 0;
		for(; n + 2 < data.size(); n += 3) {
			const uint32_t v = (static_cast<uint32_t>(static_cast<uint8_t>(data[n])) << 16)
				| (static_cast<uint32_t>(static_cast<uint8_t>(data[n+1])) << 8)
				| static_cast<uint32_t>(static_cast<uint8_t>(data[n+2]));
			res.push_back(alphabet[(v >> 18) & 0x3f]);
			res.push_back(alphabet[(v >> 12) & 0x3f]);
			res.push_back(alphabet[(v >> 6) & 0x3f]);
			res.push_back(alphabet[v & 0x3f]);
		}

		const size_t remaining = data.size() - n;
		if(remaining == 1) {
			const uint32_t v = static_cast<uint32_t>(static_cast<uint8_t>(data[n])) << 16;
			res.push_back(alphabet[(v >> 18) & 0x3f]);
			res.push_back(alphabet[(v >> 12) & 0x3f]);
			res += "==";
		} else if(remaining == 2) {
			const uint32_t v = (static_cast<uint32_t>(static_cast<uint8_t>(data[n])) << 16)
				| (static_cast<uint32_t>(static_cast<uint8_t>(data[n+1])) << 8);
			res.push_back(alphabet[(v >> 18) & 0x3f]);
			res.push_back(alphabet[(v >> 12) & 0x3f]);
			res.push_back(alphabet[(v >> 6) & 0x3f]);
			res.push_back('=');
		}
		return res;
	}

	bool b64decode(const std::string& data, std::vector<char>* out)
	{
		std::vector<char> res;
		res.reserve((data.size() / 4) * 3);

		uint32_t accum = 0;
		int nbits = 0;
		int nchars = 0;
		int npadding = 0;
		for(char c : data) {
			if(util::portable_isspace(c)) {
				continue;
			}
			if(c == '=') {
				++npadding;
				continue;
			}
			if(npadding != 0) {
				// data after padding.
				return false;
			}
			const int v = decode_char(c);
			if(v < 0) {
				return false;
			}
			accum = (accum << 6) | static_cast<uint32_t>(v);
			nbits += 6;
			++nchars;
			if(nbits >= 8) {
				nbits -= 8;
				res.push_back(static_cast<char>((accum >> nbits) & 0xff));
			}
		}

		if(nchars % 4 == 1 || npadding > 2) {
			return false;
		}
		if(npadding != 0 && (nchars + npadding) % 4 != 0) {
			return false;
		}

		out->swap(res);
		return true;
	}
}

UNIT_TEST(base64_decode_known_values)
{
	std::vector<char> out;
	CHECK(base64::b64decode("AQAAAAIAAAA=", &out), "valid input rejected");
	CHECK_EQ(out.size(), 8);
	CHECK_EQ(out[0], 1);
	CHECK_EQ(out[4], 2);

	CHECK(base64::b64decode("  TWFu\n  TWE=\n", &out), "whitespace not skipped");
	CHECK_EQ(std::string(out.begin(), out.end()), "ManMa");

	CHECK(base64::b64decode("TWE", &out), "unpadded input rejected");
	CHECK_EQ(std::string(out.begin(), out.end()), "Ma");

	CHECK(base64::b64decode("", &out), "empty input rejected");
	CHECK(out.empty(), "empty input produced data");
}

UNIT_TEST(base64_rejects_malformed_input)
{
	std::vector<char> out(3, 'x');
	CHECK(!base64::b64decode("!!!notbase64!!!", &out), "invalid characters accepted");
	CHECK(!base64::b64decode("TWFuT", &out), "truncated quantum accepted");
	CHECK(!base64::b64decode("TW==Fu", &out), "data after padding accepted");
	CHECK_EQ(out.size(), 3);
}

UNIT_TEST(base64_encode_matches_decode)
{
	const std::string text = "tiled map data";
	const std::string encoded = base64::b64encode(std::vector<char>(text.begin(), text.end()));
	CHECK_EQ(encoded, "dGlsZWQgbWFwIGRhdGE=");
	std::vector<char> out;
	CHECK(base64::b64decode(encoded, &out), "encoded text rejected");
	CHECK_EQ(std::string(out.begin(), out.end()), text);
}
