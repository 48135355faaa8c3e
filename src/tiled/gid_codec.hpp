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
#include <memory>
#include <mutex>
#include <ostream>
#include <unordered_map>
#include <utility>

namespace tiled
{
	const uint32_t FLIPPED_HORIZONTALLY_BIT = 1U << 31;
	const uint32_t FLIPPED_VERTICALLY_BIT   = 1U << 30;
	const uint32_t FLIPPED_DIAGONALLY_BIT   = 1U << 29;
	const uint32_t GID_FLAG_MASK = FLIPPED_HORIZONTALLY_BIT | FLIPPED_VERTICALLY_BIT | FLIPPED_DIAGONALLY_BIT;

	struct TileFlags
	{
		TileFlags() : flipped_horizontally(false), flipped_vertically(false), flipped_diagonally(false) {}
		TileFlags(bool h, bool v, bool d) : flipped_horizontally(h), flipped_vertically(v), flipped_diagonally(d) {}
		bool any() const { return flipped_horizontally || flipped_vertically || flipped_diagonally; }
		bool flipped_horizontally;
		bool flipped_vertically;
		bool flipped_diagonally;
	};

	bool operator==(const TileFlags& a, const TileFlags& b);
	bool operator!=(const TileFlags& a, const TileFlags& b);
	std::ostream& operator<<(std::ostream& os, const TileFlags& f);

	// Memoized flag decoding, keyed on the raw gid. Entries are written whole
	// under the lock and never change once present.
	class FlagCache
	{
	public:
		FlagCache() {}
		bool lookup(uint32_t raw, TileFlags* flags) const;
		void store(uint32_t raw, const TileFlags& flags);
		size_t size() const;
	private:
		FlagCache(const FlagCache&);
		void operator=(const FlagCache&);

		mutable std::mutex mutex_;
		std::unordered_map<uint32_t, TileFlags> entries_;
	};
	typedef std::shared_ptr<FlagCache> FlagCachePtr;

	class GidCodec
	{
	public:
		// A new private cache is created when none is supplied.
		explicit GidCodec(FlagCachePtr cache=FlagCachePtr());

		// Splits a raw gid into its base tile id and flip flags. Values without
		// any flag bit set are returned as-is and never touch the cache.
		std::pair<uint32_t, TileFlags> decode(uint32_t raw) const;

		const FlagCachePtr& getCache() const { return cache_; }
	private:
		FlagCachePtr cache_;
	};

	TileFlags flags_from_gid(uint32_t raw);
	uint32_t gid_base(uint32_t raw);
	uint32_t encode_gid(uint32_t base, const TileFlags& flags);

	// Rotation in degrees implied by the flip flags. A diagonal flip on its
	// own maps to 0, matching the editor's transposition without rotation.
	int rotation_from_flags(const TileFlags& flags);

	// Implemented by whoever owns gid normalization (the map). Called once
	// for every raw gid that ends up in a tile grid.
	class GidRegistry
	{
	public:
		virtual ~GidRegistry() {}
		virtual uint32_t registerGidCheckFlags(uint32_t raw) = 0;
	};
}
