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
#include <cstdint>
#include <map>

#include <boost/lexical_cast.hpp>

#include "chunk.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "unit_test.hpp"

namespace tiled
{
	namespace
	{
		Result<int> parse_chunk_attribute(int index, const char* name, const boost::optional<std::string>& value)
		{
			if(!value) {
				return TILED_ERROR(INVALID_CHUNK_ATTRIBUTE, "Chunk " << index << " is missing the '" << name << "' attribute");
			}
			try {
				return boost::lexical_cast<int>(util::strip_copy(*value));
			} catch(boost::bad_lexical_cast&) {
				return TILED_ERROR(INVALID_CHUNK_ATTRIBUTE, "Chunk " << index << " attribute '" << name << "' is not an integer: '" << *value << "'");
			}
		}
	}

	Chunk::Chunk(const point& position, int width, int height, GidGrid&& grid, std::vector<char>&& raw)
		: position_(position),
		  width_(width),
		  height_(height),
		  grid_(std::move(grid)),
		  raw_(std::move(raw))
	{
	}

	Result<std::vector<Chunk>> extract_chunks(const std::vector<ChunkRecord>& records, const std::string& encoding, const std::string& compression)
	{
		std::vector<Chunk> res;
		int index = 0;
		for(auto& rec : records) {
			const int i = index++;
			auto x = parse_chunk_attribute(i, "x", rec.x);
			auto y = parse_chunk_attribute(i, "y", rec.y);
			auto width = parse_chunk_attribute(i, "width", rec.width);
			auto height = parse_chunk_attribute(i, "height", rec.height);
			for(auto attr : { &x, &y, &width, &height }) {
				if(!attr->ok()) {
					return attr->error();
				}
			}
			if(width.value() < 0 || height.value() < 0) {
				return TILED_ERROR(INVALID_CHUNK_ATTRIBUTE, "Chunk " << i << " has a negative size: " << width.value() << "x" << height.value());
			}
			const int w = width.value();
			const int h = height.value();
			LOG_DEBUG("[Chunk " << i << "] Position: (" << x.value() << ", " << y.value() << "), Size: " << w << "x" << h);

			if(!rec.text || util::is_blank(*rec.text)) {
				LOG_ERROR("[Chunk " << i << "] Missing text content in chunk");
				continue;
			}

			auto decoded = decode_layer_data(util::strip_copy(*rec.text), encoding, compression);
			if(!decoded.ok()) {
				LOG_ERROR("[Chunk " << i << "] Failed to decode GIDs: " << decoded.error());
				continue;
			}

			const std::vector<uint32_t>& gids = decoded.value().gids;
			if(gids.size() != static_cast<size_t>(w) * h) {
				LOG_WARN("[Chunk " << i << "] GID count mismatch: expected " << w * h << ", got " << gids.size());
			}

			GidGrid grid;
			grid.reserve(h);
			for(int row = 0; row != h; ++row) {
				const size_t begin = std::min(gids.size(), static_cast<size_t>(row) * w);
				const size_t end = std::min(gids.size(), static_cast<size_t>(row + 1) * w);
				grid.emplace_back(gids.begin() + begin, gids.begin() + end);
			}

			res.emplace_back(point(x.value(), y.value()), w, h, std::move(grid), std::move(decoded.value().raw));
		}
		LOG_INFO("Total chunks extracted: " << res.size());
		return res;
	}

	GidGrid stitch_chunks(const std::vector<Chunk>& chunks, int width, int height, GidRegistry& registry)
	{
		GidGrid res(std::max(height, 0), std::vector<uint32_t>(std::max(width, 0), 0));

		int index = 0;
		for(auto& chunk : chunks) {
			const int i = index++;
			const point& pos = chunk.getPosition();
			if(pos.x < 0 || pos.y < 0) {
				LOG_WARN("Skipping chunk at negative position (" << pos.x << ", " << pos.y << ")");
				continue;
			}

			bool out_of_bounds_logged = false;
			bool short_row_logged = false;
			const GidGrid& grid = chunk.getGrid();
			for(int y = 0; y != chunk.getHeight(); ++y) {
				const std::vector<uint32_t>* row = y < static_cast<int>(grid.size()) ? &grid[y] : nullptr;
				for(int x = 0; x != chunk.getWidth(); ++x) {
					if(row == nullptr || x >= static_cast<int>(row->size())) {
						if(!short_row_logged) {
							LOG_WARN("[Chunk " << i << "] Row " << y << " is missing tiles, leaving them empty");
							short_row_logged = true;
						}
						break;
					}

					const uint32_t gid = registry.registerGidCheckFlags((*row)[x]);
					const int64_t gx = static_cast<int64_t>(pos.x) + x;
					const int64_t gy = static_cast<int64_t>(pos.y) + y;
					if(gx < width && gy < height) {
						res[gy][gx] = gid;
					} else if(!out_of_bounds_logged) {
						LOG_WARN("[Chunk " << i << "] Contains out-of-bounds tiles (e.g., (" << gx << ", " << gy << "))");
						out_of_bounds_logged = true;
					}
				}
			}
		}
		LOG_DEBUG("Chunks stitched into a " << width << "x" << height << " grid");
		return res;
	}
}

namespace
{
	// Hands out compact ids per distinct raw gid, like the map does.
	class test_registry : public tiled::GidRegistry
	{
	public:
		uint32_t registerGidCheckFlags(uint32_t raw) override {
			++calls;
			if(raw == 0) {
				return 0;
			}
			auto it = ids.find(raw);
			if(it != ids.end()) {
				return it->second;
			}
			const uint32_t id = static_cast<uint32_t>(ids.size()) + 1;
			ids[raw] = id;
			return id;
		}
		std::map<uint32_t, uint32_t> ids;
		int calls = 0;
	};

	// Passes gids through unchanged.
	class identity_registry : public tiled::GidRegistry
	{
	public:
		uint32_t registerGidCheckFlags(uint32_t raw) override { return raw; }
	};

	tiled::ChunkRecord make_record(const std::string& x, const std::string& y, const std::string& w, const std::string& h, const std::string& text)
	{
		tiled::ChunkRecord rec;
		rec.x = x;
		rec.y = y;
		rec.width = w;
		rec.height = h;
		rec.text = text;
		return rec;
	}
}

UNIT_TEST(stitch_empty_chunk_list)
{
	identity_registry registry;
	auto grid = tiled::stitch_chunks(std::vector<tiled::Chunk>(), 3, 2, registry);
	CHECK_EQ(grid, (tiled::GidGrid{{0, 0, 0}, {0, 0, 0}}));
}

UNIT_TEST(stitch_two_chunks)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "0", "2", "2", "1,2,3,4"));
	records.push_back(make_record("2", "0", "2", "2", "5,6,7,8"));
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());
	CHECK_EQ(chunks.value().size(), 2);
	CHECK_EQ(chunks.value()[1].getPosition(), point(2, 0));
	CHECK_EQ(chunks.value()[0].getGrid(), (tiled::GidGrid{{1, 2}, {3, 4}}));

	identity_registry registry;
	auto grid = tiled::stitch_chunks(chunks.value(), 4, 2, registry);
	CHECK_EQ(grid, (tiled::GidGrid{{1, 2, 5, 6}, {3, 4, 7, 8}}));
}

UNIT_TEST(stitch_normalizes_through_registry)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "0", "2", "1", "9,0"));
	records.push_back(make_record("1", "1", "2", "1", "2147483657,9"));
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());

	test_registry registry;
	log_capture_scope capture;
	auto grid = tiled::stitch_chunks(chunks.value(), 2, 2, registry);
	// every cell is registered, including the one falling off the map.
	CHECK_EQ(registry.calls, 4);
	CHECK_EQ(grid, (tiled::GidGrid{{1, 0}, {0, 2}}));
	CHECK_EQ(capture.count(SDL_LOG_PRIORITY_WARN), 1);
	CHECK(capture.contains("out-of-bounds", SDL_LOG_PRIORITY_WARN), "missing out-of-bounds warning");
}

UNIT_TEST(stitch_skips_negative_positions)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("-16", "0", "1", "1", "3"));
	records.push_back(make_record("1", "1", "1", "1", "4"));
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());

	identity_registry registry;
	log_capture_scope capture;
	auto grid = tiled::stitch_chunks(chunks.value(), 2, 2, registry);
	CHECK_EQ(grid, (tiled::GidGrid{{0, 0}, {0, 4}}));
	CHECK(capture.contains("negative position", SDL_LOG_PRIORITY_WARN), "missing negative position warning");
}

UNIT_TEST(stitch_chunk_far_outside_map)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("2147483647", "0", "2", "1", "1,2"));
	records.push_back(make_record("0", "0", "1", "1", "5"));
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());

	identity_registry registry;
	log_capture_scope capture;
	auto grid = tiled::stitch_chunks(chunks.value(), 2, 2, registry);
	CHECK_EQ(grid, (tiled::GidGrid{{5, 0}, {0, 0}}));
	CHECK_EQ(capture.count(SDL_LOG_PRIORITY_WARN), 1);
	CHECK(capture.contains("(2147483647, 0)", SDL_LOG_PRIORITY_WARN), "out-of-bounds position not reported");
}

UNIT_TEST(stitch_overlap_last_wins)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "0", "2", "1", "1,1"));
	records.push_back(make_record("1", "0", "1", "1", "2"));
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());
	identity_registry registry;
	CHECK_EQ(tiled::stitch_chunks(chunks.value(), 2, 1, registry), (tiled::GidGrid{{1, 2}}));
}

UNIT_TEST(extract_chunks_count_mismatch)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "0", "2", "2", "1,2,3"));
	log_capture_scope capture;
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());
	CHECK(capture.contains("GID count mismatch", SDL_LOG_PRIORITY_WARN), "missing mismatch warning");
	CHECK_EQ(chunks.value()[0].getGrid(), (tiled::GidGrid{{1, 2}, {3}}));

	capture.clear();
	identity_registry registry;
	auto grid = tiled::stitch_chunks(chunks.value(), 2, 2, registry);
	CHECK_EQ(grid, (tiled::GidGrid{{1, 2}, {3, 0}}));
	CHECK_EQ(capture.count(SDL_LOG_PRIORITY_WARN), 1);
	CHECK(capture.contains("missing tiles", SDL_LOG_PRIORITY_WARN), "missing short row warning");
}

UNIT_TEST(extract_chunks_skips_undecodable)
{
	std::vector<tiled::ChunkRecord> records;
	tiled::ChunkRecord no_text = make_record("0", "0", "1", "1", "");
	no_text.text.reset();
	records.push_back(no_text);
	records.push_back(make_record("1", "0", "1", "1", "x"));
	records.push_back(make_record("2", "0", "1", "1", "7"));

	log_capture_scope capture;
	auto chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());
	CHECK_EQ(chunks.value().size(), 1);
	CHECK_EQ(chunks.value()[0].getPosition(), point(2, 0));
	CHECK_EQ(capture.count(SDL_LOG_PRIORITY_ERROR), 2);
	CHECK(capture.contains("Failed to decode GIDs", SDL_LOG_PRIORITY_ERROR), "missing decode failure message");
}

UNIT_TEST(extract_chunks_skips_blank_text)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "0", "1", "1", " \n\t "));

	log_capture_scope capture;
	auto chunks = tiled::extract_chunks(records, "base64", "zlib");
	CHECK(chunks.ok(), chunks.error());
	CHECK_EQ(chunks.value().size(), 0);
	CHECK(capture.contains("Missing text content", SDL_LOG_PRIORITY_ERROR), "blank chunk not reported as missing");
	CHECK(!capture.contains("Failed to decode GIDs", SDL_LOG_PRIORITY_ERROR), "blank chunk was decoded");

	capture.clear();
	records.push_back(make_record("1", "0", "1", "1", "7"));
	chunks = tiled::extract_chunks(records, "csv", "");
	CHECK(chunks.ok(), chunks.error());
	CHECK_EQ(chunks.value().size(), 1);
	CHECK_EQ(chunks.value()[0].getPosition(), point(1, 0));
	CHECK_EQ(capture.count(SDL_LOG_PRIORITY_ERROR), 1);
}

UNIT_TEST(extract_chunks_rejects_bad_attributes)
{
	std::vector<tiled::ChunkRecord> records;
	records.push_back(make_record("0", "zero", "1", "1", "1"));
	auto res = tiled::extract_chunks(records, "csv", "");
	CHECK(!res.ok(), "non-integer attribute accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_CHUNK_ATTRIBUTE, res.error());

	records[0].y.reset();
	res = tiled::extract_chunks(records, "csv", "");
	CHECK(!res.ok(), "missing attribute accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_CHUNK_ATTRIBUTE, res.error());
}
