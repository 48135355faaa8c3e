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

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "geometry.hpp"
#include "gid_codec.hpp"
#include "layer_decoder.hpp"
#include "result.hpp"

namespace tiled
{
	// The attributes and text of one <chunk> element, exactly as found.
	struct ChunkRecord
	{
		boost::optional<std::string> x;
		boost::optional<std::string> y;
		boost::optional<std::string> width;
		boost::optional<std::string> height;
		boost::optional<std::string> text;
	};

	// One decoded page of an infinite layer. Positions and sizes are in tiles.
	class Chunk
	{
	public:
		Chunk(const point& position, int width, int height, GidGrid&& grid, std::vector<char>&& raw);

		const point& getPosition() const { return position_; }
		int getWidth() const { return width_; }
		int getHeight() const { return height_; }
		const GidGrid& getGrid() const { return grid_; }
		const std::vector<char>& getRawData() const { return raw_; }
	private:
		point position_;
		int width_;
		int height_;
		GidGrid grid_;
		std::vector<char> raw_;
	};

	// Missing text and undecodable payloads are logged and the chunk
	// dropped; a missing, non-integer or negative size attribute fails the
	// whole extraction.
	Result<std::vector<Chunk>> extract_chunks(const std::vector<ChunkRecord>& records, const std::string& encoding, const std::string& compression);

	// Places every chunk into a zero-filled width x height grid, passing each
	// raw gid through registry. Later chunks overwrite earlier ones.
	GidGrid stitch_chunks(const std::vector<Chunk>& chunks, int width, int height, GidRegistry& registry);
}
