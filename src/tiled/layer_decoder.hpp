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

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace tiled
{
	typedef std::vector<std::vector<uint32_t>> GidGrid;

	struct DecodedData
	{
		std::vector<uint32_t> gids;
		// decompressed bytes the gids were unpacked from; empty for csv.
		std::vector<char> raw;
	};

	// Decodes the text payload of a <data> or <chunk> element.
	//  encoding: "base64", "csv" or "" (no payload expected).
	//  compression: "", "zlib", "gzip" or "zstd"; only meaningful for base64.
	Result<DecodedData> decode_layer_data(const std::string& text, const std::string& encoding, const std::string& compression);
	Result<std::vector<uint32_t>> decode_gids(const std::string& text, const std::string& encoding, const std::string& compression);

	// Splits gids into rows of width elements. The last row is short when
	// the length is not a multiple of width.
	GidGrid reshape(const std::vector<uint32_t>& gids, int width);
	std::vector<uint32_t> flatten(const GidGrid& grid);

	// Little-endian unpacking; trailing bytes that do not make up a whole
	// value are dropped with a warning.
	std::vector<uint32_t> unpack_gids(const std::vector<char>& bytes);
}
