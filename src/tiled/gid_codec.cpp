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

#include <thread>
#include <vector>

#include "gid_codec.hpp"
#include "unit_test.hpp"

namespace tiled
{
	bool operator==(const TileFlags& a, const TileFlags& b)
	{
		return a.flipped_horizontally == b.flipped_horizontally
			&& a.flipped_vertically == b.flipped_vertically
			&& a.flipped_diagonally == b.flipped_diagonally;
	}

	bool operator!=(const TileFlags& a, const TileFlags& b)
	{
		return !operator==(a, b);
	}

	std::ostream& operator<<(std::ostream& os, const TileFlags& f)
	{
		os << "{h:" << f.flipped_horizontally << ",v:" << f.flipped_vertically << ",d:" << f.flipped_diagonally << "}";
		return os;
	}

	bool FlagCache::lookup(uint32_t raw, TileFlags* flags) const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		auto it = entries_.find(raw);
		if(it == entries_.end()) {
			return false;
		}
		*flags = it->second;
		return true;
	}

	void FlagCache::store(uint32_t raw, const TileFlags& flags)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.insert(std::make_pair(raw, flags));
	}

	size_t FlagCache::size() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_.size();
	}

	GidCodec::GidCodec(FlagCachePtr cache)
		: cache_(cache ? cache : std::make_shared<FlagCache>())
	{
	}

	std::pair<uint32_t, TileFlags> GidCodec::decode(uint32_t raw) const
	{
		if(raw < FLIPPED_DIAGONALLY_BIT) {
			return std::make_pair(raw, TileFlags());
		}

		TileFlags flags;
		if(!cache_->lookup(raw, &flags)) {
			flags = flags_from_gid(raw);
			cache_->store(raw, flags);
		}
		return std::make_pair(gid_base(raw), flags);
	}

	TileFlags flags_from_gid(uint32_t raw)
	{
		return TileFlags((raw & FLIPPED_HORIZONTALLY_BIT) != 0,
			(raw & FLIPPED_VERTICALLY_BIT) != 0,
			(raw & FLIPPED_DIAGONALLY_BIT) != 0);
	}

	uint32_t gid_base(uint32_t raw)
	{
		return raw & ~GID_FLAG_MASK;
	}

	uint32_t encode_gid(uint32_t base, const TileFlags& flags)
	{
		uint32_t res = gid_base(base);
		if(flags.flipped_horizontally) {
			res |= FLIPPED_HORIZONTALLY_BIT;
		}
		if(flags.flipped_vertically) {
			res |= FLIPPED_VERTICALLY_BIT;
		}
		if(flags.flipped_diagonally) {
			res |= FLIPPED_DIAGONALLY_BIT;
		}
		return res;
	}

	int rotation_from_flags(const TileFlags& flags)
	{
		if(!flags.flipped_diagonally) {
			return 0;
		}
		if(flags.flipped_horizontally && !flags.flipped_vertically) {
			return 90;
		} else if(flags.flipped_horizontally && flags.flipped_vertically) {
			return 180;
		} else if(flags.flipped_vertically) {
			return 270;
		}
		return 0;
	}
}

UNIT_TEST(gid_codec_plain_gids_pass_through)
{
	tiled::GidCodec codec;
	const uint32_t samples[] = { 0, 1, 42, 0x1fffffffU };
	for(auto raw : samples) {
		auto res = codec.decode(raw);
		CHECK_EQ(res.first, raw);
		CHECK_EQ(res.second, tiled::TileFlags());
	}
	CHECK_EQ(codec.getCache()->size(), 0);
}

UNIT_TEST(gid_codec_decodes_flags)
{
	tiled::GidCodec codec;
	auto res = codec.decode(0x80000005U);
	CHECK_EQ(res.first, 5);
	CHECK_EQ(res.second, tiled::TileFlags(true, false, false));

	res = codec.decode(0xe0000003U);
	CHECK_EQ(res.first, 3);
	CHECK_EQ(res.second, tiled::TileFlags(true, true, true));

	res = codec.decode(0x20000001U);
	CHECK_EQ(res.first, 1);
	CHECK_EQ(res.second, tiled::TileFlags(false, false, true));

	// cached and uncached results agree.
	CHECK_EQ(codec.getCache()->size(), 3);
	auto again = codec.decode(0xe0000003U);
	CHECK_EQ(again.first, 3);
	CHECK_EQ(again.second, tiled::TileFlags(true, true, true));
	CHECK_EQ(codec.getCache()->size(), 3);

	CHECK_EQ(tiled::encode_gid(3, tiled::TileFlags(true, true, true)), 0xe0000003U);
}

UNIT_TEST(gid_codec_rotation_table)
{
	using tiled::TileFlags;
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(false, false, false)), 0);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(true, false, false)), 0);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(true, true, false)), 0);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(true, false, true)), 90);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(true, true, true)), 180);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(false, true, true)), 270);
	CHECK_EQ(tiled::rotation_from_flags(TileFlags(false, false, true)), 0);
}

UNIT_TEST(gid_codec_shared_cache_across_threads)
{
	auto cache = std::make_shared<tiled::FlagCache>();
	std::vector<std::thread> threads;
	std::vector<int> failures(4, 0);
	for(int t = 0; t != 4; ++t) {
		threads.emplace_back([cache, t, &failures]() {
			tiled::GidCodec codec(cache);
			for(uint32_t n = 0; n != 1000; ++n) {
				const uint32_t raw = (n % 8) << 29 | n;
				auto res = codec.decode(raw);
				if(res.first != n || res.second != tiled::flags_from_gid(raw)) {
					++failures[t];
				}
			}
		});
	}
	for(auto& th : threads) {
		th.join();
	}
	for(auto f : failures) {
		CHECK_EQ(f, 0);
	}
	// every n not divisible by 8 carries flags and is cached once.
	CHECK_EQ(cache->size(), 875);
}
