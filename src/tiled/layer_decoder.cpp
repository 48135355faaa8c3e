/*
	Copyright (C) 2013-2014 by Kristina Simpson <sweet.kristas@gmail.com>
	
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

#include <algorithm>

#include <boost/lexical_cast.hpp>

#include "asserts.hpp"
#include "base64.hpp"
#include "compress.hpp"
#include "layer_decoder.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "unit_test.hpp"

namespace tiled
{
	namespace
	{
		inline uint32_t make_uint32_le(char n3, char n2, char n1, char n0)
		{
			return (static_cast<uint32_t>(static_cast<uint8_t>(n3)) << 24) 
				| (static_cast<uint32_t>(static_cast<uint8_t>(n2)) << 16) 
				| (static_cast<uint32_t>(static_cast<uint8_t>(n1)) << 8) 
				| static_cast<uint32_t>(static_cast<uint8_t>(n0));
		}

		Result<std::vector<char>> decompress_payload(const std::vector<char>& data, const std::string& compression)
		{
			try {
				if(compression.empty()) {
					return data;
				} else if(compression == "zlib") {
					return zip::decompress(data);
				} else if(compression == "gzip") {
					return zip::gzip_decompress(data);
				} else if(compression == "zstd") {
					if(!zip::have_zstd()) {
						return TILED_ERROR(UNSUPPORTED_COMPRESSION, "zstd compression found, but zstd support not built");
					}
					return zip::zstd_decompress(data);
				}
			} catch(zip::CompressionException& e) {
				return TILED_ERROR(MALFORMED_LAYER_DATA, "Unable to decompress " << compression << " layer data: " << e.msg);
			}
			return TILED_ERROR(UNSUPPORTED_COMPRESSION, "Unsupported compression: '" << compression << "'");
		}

		Result<std::vector<uint32_t>> parse_csv(const std::string& text)
		{
			std::vector<uint32_t> res;
			if(util::is_blank(text)) {
				return res;
			}
			std::vector<std::string> tiles = util::split(text, ',', util::STRIP_SPACES);
			// a single trailing comma after the last row is tolerated.
			if(tiles.size() > 1 && tiles.back().empty()) {
				tiles.pop_back();
			}
			res.reserve(tiles.size());
			for(size_t n = 0; n != tiles.size(); ++n) {
				const std::string& tile = tiles[n];
				if(tile.empty()) {
					return TILED_ERROR(MALFORMED_LAYER_DATA, "Empty CSV cell at position " << n);
				}
				try {
					const int64_t value = boost::lexical_cast<int64_t>(tile);
					if(value < 0 || value > 0xffffffffLL) {
						return TILED_ERROR(MALFORMED_LAYER_DATA, "CSV gid out of range: " << tile);
					}
					res.emplace_back(static_cast<uint32_t>(value));
				} catch(boost::bad_lexical_cast& e) {
					return TILED_ERROR(MALFORMED_LAYER_DATA, "Couldn't convert '" << tile << "' to integer value: " << e.what());
				}
			}
			return res;
		}
	}

	std::vector<uint32_t> unpack_gids(const std::vector<char>& bytes)
	{
		if(bytes.size() % 4 != 0) {
			LOG_WARN("Layer data size is not a multiple of 4, found: " << bytes.size() << ", ignoring the trailing " << bytes.size() % 4 << " byte(s)");
		}
		std::vector<uint32_t> res;
		res.reserve(bytes.size() / 4);
		for(size_t n = 0; n + 4 <= bytes.size(); n += 4) {
			res.emplace_back(make_uint32_le(bytes[n+3], bytes[n+2], bytes[n+1], bytes[n+0]));
		}
		return res;
	}

	Result<DecodedData> decode_layer_data(const std::string& text, const std::string& encoding, const std::string& compression)
	{
		DecodedData res;
		if(encoding == "base64") {
			std::vector<char> unencoded;
			if(!base64::b64decode(text, &unencoded)) {
				return TILED_ERROR(MALFORMED_LAYER_DATA, "Invalid base64 layer data");
			}
			auto uncompressed = decompress_payload(unencoded, compression);
			if(!uncompressed) {
				return uncompressed.error();
			}
			res.raw = uncompressed.value();
			res.gids = unpack_gids(res.raw);
		} else if(encoding == "csv") {
			auto gids = parse_csv(text);
			if(!gids) {
				return gids.error();
			}
			res.gids = gids.value();
		} else if(!encoding.empty()) {
			return TILED_ERROR(UNSUPPORTED_ENCODING, "Unsupported encoding: '" << encoding << "'");
		} else if(!util::is_blank(text)) {
			return TILED_ERROR(UNSUPPORTED_ENCODING, "Layer data has no encoding attribute but contains text");
		}
		return res;
	}

	Result<std::vector<uint32_t>> decode_gids(const std::string& text, const std::string& encoding, const std::string& compression)
	{
		auto res = decode_layer_data(text, encoding, compression);
		if(!res) {
			return res.error();
		}
		return res.value().gids;
	}

	GidGrid reshape(const std::vector<uint32_t>& gids, int width)
	{
		ASSERT_LOG(width > 0, "Cannot reshape gids into rows of width " << width);
		GidGrid res;
		res.reserve((gids.size() + width - 1) / width);
		for(size_t n = 0; n < gids.size(); n += width) {
			const size_t end = std::min(gids.size(), n + static_cast<size_t>(width));
			res.emplace_back(gids.begin() + n, gids.begin() + end);
		}
		return res;
	}

	std::vector<uint32_t> flatten(const GidGrid& grid)
	{
		std::vector<uint32_t> res;
		for(auto& row : grid) {
			res.insert(res.end(), row.begin(), row.end());
		}
		return res;
	}
}

namespace 
{
	std::string encode_gids(const std::vector<uint32_t>& gids, const std::string& compression)
	{
		std::vector<char> bytes;
		for(auto g : gids) {
			bytes.push_back(static_cast<char>(g & 0xff));
			bytes.push_back(static_cast<char>((g >> 8) & 0xff));
			bytes.push_back(static_cast<char>((g >> 16) & 0xff));
			bytes.push_back(static_cast<char>((g >> 24) & 0xff));
		}
		if(compression == "zlib") {
			bytes = zip::compress(bytes);
		} else if(compression == "gzip") {
			bytes = zip::gzip_compress(bytes);
		}
		return base64::b64encode(bytes);
	}
}

UNIT_TEST(decode_base64_uncompressed)
{
	// four gids: 1, 2, 0x80000003, 0
	auto res = tiled::decode_layer_data("AQAAAAIAAAADAACAAAAAAA==", "base64", "");
	CHECK(res.ok(), res.error());
	CHECK_EQ(res.value().gids, (std::vector<uint32_t>{1, 2, 0x80000003U, 0}));
	CHECK_EQ(res.value().raw.size(), 16);

	// whitespace in the payload is ignored.
	auto spaced = tiled::decode_gids("\n   AQAAAAIA\n   AAADAACAAAAAAA==\n  ", "base64", "");
	CHECK(spaced.ok(), spaced.error());
	CHECK_EQ(spaced.value(), res.value().gids);
}

UNIT_TEST(decode_base64_compressed)
{
	const std::vector<uint32_t> gids{7, 0, 0, 12, 0xa0000001U, 99};
	auto zlib_res = tiled::decode_gids(encode_gids(gids, "zlib"), "base64", "zlib");
	CHECK(zlib_res.ok(), zlib_res.error());
	CHECK_EQ(zlib_res.value(), gids);

	auto gzip_res = tiled::decode_gids(encode_gids(gids, "gzip"), "base64", "gzip");
	CHECK(gzip_res.ok(), gzip_res.error());
	CHECK_EQ(gzip_res.value(), gids);

	// zlib data labelled as gzip is corrupt, not unsupported.
	auto wrong = tiled::decode_gids(encode_gids(gids, "zlib"), "base64", "gzip");
	CHECK(!wrong.ok(), "mislabelled compression accepted");
	CHECK(wrong.error().kind == tiled::ErrorKind::MALFORMED_LAYER_DATA, wrong.error());
}

UNIT_TEST(decode_unsupported_formats)
{
	auto lzma = tiled::decode_gids("AQAAAA==", "base64", "lzma");
	CHECK(!lzma.ok(), "lzma accepted");
	CHECK(lzma.error().kind == tiled::ErrorKind::UNSUPPORTED_COMPRESSION, lzma.error());

	auto xml = tiled::decode_gids("1,2", "xml", "");
	CHECK(!xml.ok(), "xml encoding accepted");
	CHECK(xml.error().kind == tiled::ErrorKind::UNSUPPORTED_ENCODING, xml.error());

	auto zstd = tiled::decode_gids("KLUv/QBYIQAAAQAAAA==", "base64", "zstd");
	if(!zip::have_zstd()) {
		CHECK(!zstd.ok(), "zstd accepted without support");
		CHECK(zstd.error().kind == tiled::ErrorKind::UNSUPPORTED_COMPRESSION, zstd.error());
	}

	auto bad64 = tiled::decode_gids("AQ*AAA==", "base64", "");
	CHECK(!bad64.ok(), "invalid base64 accepted");
	CHECK(bad64.error().kind == tiled::ErrorKind::MALFORMED_LAYER_DATA, bad64.error());
}

UNIT_TEST(decode_csv)
{
	auto res = tiled::decode_gids("1,2,3,\n4,5,2147483649\n", "csv", "");
	CHECK(res.ok(), res.error());
	CHECK_EQ(res.value(), (std::vector<uint32_t>{1, 2, 3, 4, 5, 0x80000001U}));
	CHECK(tiled::decode_layer_data("1,2", "csv", "").value().raw.empty(), "csv should carry no raw bytes");

	auto blank = tiled::decode_gids("  \n ", "csv", "");
	CHECK(blank.ok(), blank.error());
	CHECK(blank.value().empty(), "blank csv should decode to nothing");

	auto bad = tiled::decode_gids("1,two,3", "csv", "");
	CHECK(!bad.ok(), "non-numeric csv accepted");
	CHECK(bad.error().kind == tiled::ErrorKind::MALFORMED_LAYER_DATA, bad.error());

	auto negative = tiled::decode_gids("1,-2", "csv", "");
	CHECK(!negative.ok(), "negative gid accepted");
}

UNIT_TEST(decode_csv_rejects_empty_cells)
{
	auto gap = tiled::decode_gids("1,,2,3", "csv", "");
	CHECK(!gap.ok(), "empty csv cell accepted");
	CHECK(gap.error().kind == tiled::ErrorKind::MALFORMED_LAYER_DATA, gap.error());

	auto row_gap = tiled::decode_gids("1,2,\n,3,4", "csv", "");
	CHECK(!row_gap.ok(), "empty csv cell at the start of a row accepted");

	auto double_trailing = tiled::decode_gids("1,2,3,4,,", "csv", "");
	CHECK(!double_trailing.ok(), "two trailing commas accepted");

	auto trailing = tiled::decode_gids("1,2,\n3,4,\n", "csv", "");
	CHECK(trailing.ok(), trailing.error());
	CHECK_EQ(trailing.value(), (std::vector<uint32_t>{1, 2, 3, 4}));
}

UNIT_TEST(decode_without_encoding)
{
	auto empty = tiled::decode_gids("   ", "", "");
	CHECK(empty.ok(), empty.error());
	CHECK(empty.value().empty(), "expected no gids");

	auto text = tiled::decode_gids("1,2,3", "", "");
	CHECK(!text.ok(), "text without encoding accepted");
	CHECK(text.error().kind == tiled::ErrorKind::UNSUPPORTED_ENCODING, text.error());
}

UNIT_TEST(decode_truncates_partial_values)
{
	log_capture_scope capture;
	// six bytes: one whole gid plus two stray bytes.
	auto res = tiled::decode_gids("BQAAAAEC", "base64", "");
	CHECK(res.ok(), res.error());
	CHECK_EQ(res.value(), (std::vector<uint32_t>{5}));
	CHECK(capture.contains("not a multiple of 4", SDL_LOG_PRIORITY_WARN), "no truncation warning");
}

UNIT_TEST(reshape_and_flatten)
{
	const tiled::GidGrid grid{{1, 2, 3}, {4, 5, 6}};
	CHECK_EQ(tiled::reshape(tiled::flatten(grid), 3), grid);

	const tiled::GidGrid ragged{{1, 2}, {3, 4}, {5}};
	CHECK_EQ(tiled::reshape(std::vector<uint32_t>{1, 2, 3, 4, 5}, 2), ragged);
	CHECK(tiled::reshape(std::vector<uint32_t>(), 4).empty(), "empty input should give no rows");

	bool thrown = false;
	{
		assert_recover_scope scope;
		try {
			tiled::reshape(std::vector<uint32_t>{1}, 0);
		} catch(validation_failure_exception&) {
			thrown = true;
		}
	}
	CHECK(thrown, "zero width accepted");
}

BENCHMARK(decode_zlib_layer)
{
	std::vector<char> bytes;
	for(uint32_t n = 0; n != 256*256; ++n) {
		const uint32_t gid = (n % 97) + 1;
		for(int b = 0; b != 4; ++b) {
			bytes.push_back(static_cast<char>((gid >> (8 * b)) & 0xff));
		}
	}
	const std::string text = base64::b64encode(zip::compress(bytes));

	BENCHMARK_LOOP {
		auto res = tiled::decode_gids(text, "base64", "zlib");
		ASSERT_LOG(res.ok() && res.value().size() == 256*256, "benchmark layer failed to decode");
	}
}
