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

#include <vector>

#include "result.hpp"
#include "unit_test.hpp"

namespace tiled
{
	const char* error_kind_name(ErrorKind kind)
	{
		switch(kind) {
			case ErrorKind::UNSUPPORTED_ENCODING:		return "UnsupportedEncoding";
			case ErrorKind::UNSUPPORTED_COMPRESSION:	return "UnsupportedCompression";
			case ErrorKind::UNSUPPORTED_TILE_FORMAT:	return "UnsupportedTileFormat";
			case ErrorKind::INVALID_CHUNK_ATTRIBUTE:	return "InvalidChunkAttribute";
			case ErrorKind::MALFORMED_LAYER_DATA:		return "MalformedLayerData";
			case ErrorKind::MALFORMED_SHAPE_DATA:		return "MalformedShapeData";
			case ErrorKind::NON_CONVEX_POLYGON:			return "NonConvexPolygon";
			case ErrorKind::INVALID_MAP:				return "InvalidMap";
			case ErrorKind::INVALID_VALUE:				return "InvalidValue";
		}
		return "Unknown";
	}
}

UNIT_TEST(result_holds_value_or_error)
{
	tiled::Result<std::vector<int>> good(std::vector<int>{1, 2, 3});
	CHECK(good.ok(), "value result reports failure");
	CHECK_EQ(good.value().size(), 3);

	tiled::Result<std::vector<int>> bad(TILED_ERROR(UNSUPPORTED_ENCODING, "encoding '" << "xml" << "' " << 42));
	CHECK(!bad, "error result reports success");
	CHECK(bad.error().kind == tiled::ErrorKind::UNSUPPORTED_ENCODING, "wrong error kind");
	CHECK_EQ(bad.error().message, "encoding 'xml' 42");

	std::ostringstream ss;
	ss << bad.error();
	CHECK_EQ(ss.str(), "UnsupportedEncoding: encoding 'xml' 42");
}

UNIT_TEST(result_value_of_error_asserts)
{
	tiled::Result<int> bad(TILED_ERROR(INVALID_VALUE, "nope"));
	bool thrown = false;
	{
		assert_recover_scope scope;
		try {
			bad.value();
		} catch(validation_failure_exception&) {
			thrown = true;
		}
	}
	CHECK(thrown, "reading a failed result did not assert");

	tiled::Result<void> done;
	CHECK(done.ok(), "empty void result should succeed");
}
