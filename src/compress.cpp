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

#include <cstdlib>
#include <sstream>

#include "asserts.hpp"
#include "compress.hpp"
#include "unit_test.hpp"
#include "zlib.h"

#if defined(TILED_HAVE_ZSTD)
#include "zstd.h"
#endif

#define CHUNK 16384

namespace zip 
{
	namespace
	{
		const size_t MAX_OUTPUT_SIZE = 256*1024*1024;

		// window_bits of MAX_WBITS reads a zlib stream, 16+MAX_WBITS a gzip one.
		std::vector<char> inflate_data(const std::vector<char>& data, int window_bits, const char* format)
		{
			z_stream zs = {};
			if(inflateInit2(&zs, window_bits) != Z_OK) {
				throw CompressionException(std::string("failed to initialise ") + format + " decompression");
			}

			zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
			zs.avail_in = static_cast<uInt>(data.size());

			std::vector<char> output;
			char buf[CHUNK];
			int ret = Z_OK;
			do {
				zs.next_out = reinterpret_cast<Bytef*>(buf);
				zs.avail_out = sizeof(buf);
				ret = inflate(&zs, Z_NO_FLUSH);
				if(ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
					std::ostringstream ss;
					ss << format << " data corrupt: " << (zs.msg ? zs.msg : "unknown error");
					inflateEnd(&zs);
					throw CompressionException(ss.str());
				}
				output.insert(output.end(), buf, buf + (sizeof(buf) - zs.avail_out));
				if(output.size() > MAX_OUTPUT_SIZE) {
					inflateEnd(&zs);
					throw CompressionException(std::string(format) + " data expands beyond the maximum output size");
				}
			} while(ret != Z_STREAM_END && (zs.avail_in != 0 || zs.avail_out == 0));

			inflateEnd(&zs);
			if(ret != Z_STREAM_END) {
				std::ostringstream ss;
				ss << "truncated " << format << " stream of " << data.size() << " bytes";
				throw CompressionException(ss.str());
			}
			return output;
		}

		std::vector<char> deflate_data(const std::vector<char>& data, int compression_level, int window_bits)
		{
			ASSERT_LOG(compression_level >= -1 && compression_level <= 9, "Compression level must be between -1(default) and 9.");
			z_stream zs = {};
			const int init = deflateInit2(&zs, compression_level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY);
			ASSERT_EQ(init, Z_OK);

			std::vector<char> output(deflateBound(&zs, static_cast<uLong>(data.size())));
			zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
			zs.avail_in = static_cast<uInt>(data.size());
			zs.next_out = reinterpret_cast<Bytef*>(&output[0]);
			zs.avail_out = static_cast<uInt>(output.size());

			const int result = deflate(&zs, Z_FINISH);
			output.resize(zs.total_out);
			deflateEnd(&zs);
			ASSERT_EQ(result, Z_STREAM_END);
			return output;
		}
	}

	std::vector<char> compress(const std::vector<char>& data, int compression_level)
	{
		return deflate_data(data, compression_level, MAX_WBITS);
	}

	std::vector<char> gzip_compress(const std::vector<char>& data, int compression_level)
	{
		return deflate_data(data, compression_level, 16 + MAX_WBITS);
	}

	std::vector<char> decompress(const std::vector<char>& data)
	{
		return inflate_data(data, MAX_WBITS, "zlib");
	}

	std::vector<char> gzip_decompress(const std::vector<char>& data)
	{
		return inflate_data(data, 16 + MAX_WBITS, "gzip");
	}

#if defined(TILED_HAVE_ZSTD)
	bool have_zstd()
	{
		return true;
	}

	std::vector<char> zstd_compress(const std::vector<char>& data, int compression_level)
	{
		std::vector<char> output(ZSTD_compressBound(data.size()));
		const size_t result = ZSTD_compress(&output[0], output.size(), data.data(), data.size(), compression_level);
		ASSERT_LOG(!ZSTD_isError(result), "zstd compression failed: " << ZSTD_getErrorName(result));
		output.resize(result);
		return output;
	}

	std::vector<char> zstd_decompress(const std::vector<char>& data)
	{
		ZSTD_DStream* stream = ZSTD_createDStream();
		if(stream == nullptr) {
			throw CompressionException("failed to create zstd decompression stream");
		}
		ZSTD_initDStream(stream);

		std::vector<char> output;
		std::vector<char> buf(ZSTD_DStreamOutSize());
		ZSTD_inBuffer input = { data.data(), data.size(), 0 };
		size_t result = 0;
		while(input.pos < input.size) {
			ZSTD_outBuffer out = { &buf[0], buf.size(), 0 };
			result = ZSTD_decompressStream(stream, &out, &input);
			if(ZSTD_isError(result)) {
				const std::string msg = std::string("zstd data corrupt: ") + ZSTD_getErrorName(result);
				ZSTD_freeDStream(stream);
				throw CompressionException(msg);
			}
			output.insert(output.end(), buf.begin(), buf.begin() + out.pos);
			if(output.size() > MAX_OUTPUT_SIZE) {
				ZSTD_freeDStream(stream);
				throw CompressionException("zstd data expands beyond the maximum output size");
			}
		}
		ZSTD_freeDStream(stream);

		// a non-zero hint means the final frame was not completed.
		if(result != 0) {
			std::ostringstream ss;
			ss << "truncated zstd stream of " << data.size() << " bytes";
			throw CompressionException(ss.str());
		}
		return output;
	}
#else
	bool have_zstd()
	{
		return false;
	}

	std::vector<char> zstd_compress(const std::vector<char>& data, int compression_level)
	{
		ASSERT_LOG(false, "zstd support not built");
		return std::vector<char>();
	}

	std::vector<char> zstd_decompress(const std::vector<char>& data)
	{
		throw CompressionException("zstd support not built");
	}
#endif
}

UNIT_TEST(compression_test)
{
	std::vector<char> data(100000);
	for(size_t n = 0; n != data.size(); ++n) {
		data[n] = 'A' + rand()%26;
	}

	std::vector<char> compressed = zip::compress(data);
	std::vector<char> uncompressed = zip::decompress(compressed);
	CHECK_EQ(uncompressed.size(), data.size());
	CHECK(uncompressed == data, "zlib data changed");

	compressed = zip::gzip_compress(data);
	CHECK_EQ(static_cast<unsigned char>(compressed[0]), 0x1f);
	CHECK_EQ(static_cast<unsigned char>(compressed[1]), 0x8b);
	uncompressed = zip::gzip_decompress(compressed);
	CHECK(uncompressed == data, "gzip data changed");
}

UNIT_TEST(decompress_corrupt_data_throws)
{
	const std::string text = "not compressed at all";
	std::vector<char> data(text.begin(), text.end());
	bool thrown = false;
	try {
		zip::decompress(data);
	} catch(zip::CompressionException& e) {
		thrown = true;
		CHECK(e.msg.find("zlib") != std::string::npos, e.msg);
	}
	CHECK(thrown, "corrupt zlib data accepted");

	std::vector<char> truncated = zip::gzip_compress(std::vector<char>(1000, 'x'));
	truncated.resize(truncated.size() / 2);
	thrown = false;
	try {
		zip::gzip_decompress(truncated);
	} catch(zip::CompressionException& e) {
		thrown = true;
	}
	CHECK(thrown, "truncated gzip data accepted");
}

UNIT_TEST(zstd_availability)
{
	std::vector<char> data(4096, 'z');
	if(zip::have_zstd()) {
		CHECK(zip::zstd_decompress(zip::zstd_compress(data)) == data, "zstd data changed");
	} else {
		bool thrown = false;
		try {
			zip::zstd_decompress(data);
		} catch(zip::CompressionException& e) {
			thrown = true;
			CHECK(e.msg.find("not built") != std::string::npos, e.msg);
		}
		CHECK(thrown, "zstd decompression without zstd support did not fail");
	}
}
