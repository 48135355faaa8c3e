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

#include <cmath>

#include "logger.hpp"
#include "orientation.hpp"
#include "unit_test.hpp"

namespace tiled
{
	namespace
	{
		const double hex_stride = 0.75;

		bool is_shifted_line(int line, StaggerIndex index)
		{
			const bool odd = (line & 1) != 0;
			return index == StaggerIndex::ODD ? odd : !odd;
		}

		int floor_int(double v)
		{
			return static_cast<int>(std::floor(v));
		}

		// Staggered and hexagonal maps differ only in the spacing of lines
		// along the stagger axis.
		point staggered_pixel_to_tile(const pointf& pixel, double stride, int tile_width, int tile_height, StaggerAxis axis, StaggerIndex index)
		{
			if(axis == StaggerAxis::X) {
				const int col = floor_int(pixel.x / (tile_width * stride));
				const double offset = is_shifted_line(col, index) ? tile_height / 2.0 : 0.0;
				return point(col, floor_int((pixel.y - offset) / tile_height));
			}
			const int row = floor_int(pixel.y / (tile_height * stride));
			const double offset = is_shifted_line(row, index) ? tile_width / 2.0 : 0.0;
			return point(floor_int((pixel.x - offset) / tile_width), row);
		}

		pointf staggered_tile_to_pixel(const point& tile, double stride, int tile_width, int tile_height, StaggerAxis axis, StaggerIndex index)
		{
			if(axis == StaggerAxis::X) {
				const double offset = is_shifted_line(tile.x, index) ? tile_height / 2.0 : 0.0;
				return pointf(tile.x * tile_width * stride, tile.y * tile_height + offset);
			}
			const double offset = is_shifted_line(tile.y, index) ? tile_width / 2.0 : 0.0;
			return pointf(tile.x * tile_width + offset, tile.y * tile_height * stride);
		}
	}

	Orientation convert_orientation(const std::string& o)
	{
		if(o == "orthogonal") {
			return Orientation::ORTHOGONAL;
		} else if(o == "isometric") {
			return Orientation::ISOMETRIC;
		} else if(o == "staggered") {
			return Orientation::STAGGERED;
		} else if(o == "hexagonal") {
			return Orientation::HEXAGONAL;
		}
		LOG_WARN("Unrecognised value for orientation: '" << o << "', treating as orthogonal");
		return Orientation::UNKNOWN;
	}

	const char* orientation_name(Orientation o)
	{
		switch(o) {
			case Orientation::ORTHOGONAL:	return "orthogonal";
			case Orientation::ISOMETRIC:	return "isometric";
			case Orientation::STAGGERED:	return "staggered";
			case Orientation::HEXAGONAL:	return "hexagonal";
			case Orientation::UNKNOWN:		break;
		}
		return "unknown";
	}

	StaggerAxis convert_stagger_axis(const std::string& axis)
	{
		if(axis == "x") {
			return StaggerAxis::X;
		} else if(axis != "y") {
			LOG_WARN("Unrecognised value for staggeraxis: '" << axis << "', using 'y'");
		}
		return StaggerAxis::Y;
	}

	StaggerIndex convert_stagger_index(const std::string& index)
	{
		if(index == "even") {
			return StaggerIndex::EVEN;
		} else if(index != "odd") {
			LOG_WARN("Unrecognised value for staggerindex: '" << index << "', using 'odd'");
		}
		return StaggerIndex::ODD;
	}

	point pixel_to_tile(const pointf& pixel, Orientation orientation, int tile_width, int tile_height, StaggerAxis axis, StaggerIndex index)
	{
		switch(orientation) {
			case Orientation::ISOMETRIC: {
				const double tx = pixel.x / tile_width;
				const double ty = pixel.y / tile_height;
				return point(floor_int((tx + ty) / 2.0), floor_int((ty - tx) / 2.0));
			}
			case Orientation::STAGGERED:
				return staggered_pixel_to_tile(pixel, 0.5, tile_width, tile_height, axis, index);
			case Orientation::HEXAGONAL:
				return staggered_pixel_to_tile(pixel, hex_stride, tile_width, tile_height, axis, index);
			case Orientation::ORTHOGONAL:
			case Orientation::UNKNOWN:
				break;
		}
		return point(floor_int(pixel.x / tile_width), floor_int(pixel.y / tile_height));
	}

	pointf tile_to_pixel(const point& tile, Orientation orientation, int tile_width, int tile_height, StaggerAxis axis, StaggerIndex index)
	{
		switch(orientation) {
			case Orientation::ISOMETRIC:
				return pointf(static_cast<double>(tile.x - tile.y) * tile_width, static_cast<double>(tile.x + tile.y) * tile_height);
			case Orientation::STAGGERED:
				return staggered_tile_to_pixel(tile, 0.5, tile_width, tile_height, axis, index);
			case Orientation::HEXAGONAL:
				return staggered_tile_to_pixel(tile, hex_stride, tile_width, tile_height, axis, index);
			case Orientation::ORTHOGONAL:
			case Orientation::UNKNOWN:
				break;
		}
		return pointf(static_cast<double>(tile.x) * tile_width, static_cast<double>(tile.y) * tile_height);
	}

	pointf adjust_gid_object_position(double x, double y, double width, double height, Orientation orientation, int rotation, int tile_width, int tile_height, bool invert_y)
	{
		switch(orientation) {
			case Orientation::ORTHOGONAL:
			case Orientation::STAGGERED:
			case Orientation::HEXAGONAL:
				if(rotation == 90) {
					x += height;
				} else if(rotation == 180) {
					x += width;
					y += height;
				} else if(rotation == 270) {
					y += width;
				}
				if(invert_y) {
					y -= height;
				}
				break;
			case Orientation::ISOMETRIC:
				x -= tile_width / 2.0;
				y -= tile_height / 2.0;
				if(rotation == 90 || rotation == 270) {
					x += height / 2.0;
				}
				if(invert_y) {
					y -= height / 2.0;
				}
				break;
			case Orientation::UNKNOWN:
				break;
		}
		return pointf(x, y);
	}
}

UNIT_TEST(pixel_to_tile_orthogonal_and_isometric)
{
	using namespace tiled;
	CHECK_EQ(pixel_to_tile(pointf(64, 96), Orientation::ORTHOGONAL, 32, 32), point(2, 3));
	CHECK_EQ(pixel_to_tile(pointf(-1, 0), Orientation::ORTHOGONAL, 32, 32), point(-1, 0));
	CHECK_EQ(pixel_to_tile(pointf(64, 32), Orientation::ISOMETRIC, 32, 32), point(1, -1));
	CHECK_EQ(pixel_to_tile(pointf(0, 0), Orientation::ISOMETRIC, 32, 32), point(0, 0));
	CHECK_EQ(pixel_to_tile(pointf(64, 64), Orientation::UNKNOWN, 32, 32), point(2, 2));
}

UNIT_TEST(pixel_to_tile_staggered_and_hexagonal)
{
	using namespace tiled;
	CHECK_EQ(pixel_to_tile(pointf(48, 32), Orientation::STAGGERED, 32, 32, StaggerAxis::Y, StaggerIndex::EVEN), point(1, 2));
	CHECK_EQ(pixel_to_tile(pointf(48, 32), Orientation::STAGGERED, 32, 32, StaggerAxis::Y, StaggerIndex::ODD), point(1, 2));
	CHECK_EQ(pixel_to_tile(pointf(32, 48), Orientation::STAGGERED, 32, 32, StaggerAxis::X, StaggerIndex::EVEN), point(2, 1));
	CHECK_EQ(pixel_to_tile(pointf(32, 48), Orientation::STAGGERED, 32, 32, StaggerAxis::X, StaggerIndex::ODD), point(2, 1));
	CHECK_EQ(pixel_to_tile(pointf(64, 64), Orientation::HEXAGONAL, 32, 32, StaggerAxis::Y, StaggerIndex::ODD), point(2, 2));
	CHECK_EQ(pixel_to_tile(pointf(64, 64), Orientation::HEXAGONAL, 32, 32, StaggerAxis::X, StaggerIndex::ODD), point(2, 2));
}

UNIT_TEST(tile_to_pixel_inverts_pixel_to_tile)
{
	using namespace tiled;
	const Orientation orientations[] = { Orientation::ORTHOGONAL, Orientation::ISOMETRIC, Orientation::STAGGERED, Orientation::HEXAGONAL };
	const StaggerAxis axes[] = { StaggerAxis::X, StaggerAxis::Y };
	const StaggerIndex indexes[] = { StaggerIndex::EVEN, StaggerIndex::ODD };
	for(auto o : orientations) {
		for(auto axis : axes) {
			for(auto index : indexes) {
				for(int ty = -3; ty <= 3; ++ty) {
					for(int tx = -3; tx <= 3; ++tx) {
						const point tile(tx, ty);
						const pointf px = tile_to_pixel(tile, o, 32, 16, axis, index);
						CHECK(pixel_to_tile(px, o, 32, 16, axis, index) == tile, orientation_name(o) << " " << tile << " -> " << px);
					}
				}
			}
		}
	}
	CHECK_EQ(tile_to_pixel(point(2, 3), Orientation::ORTHOGONAL, 32, 32), pointf(64, 96));
}

UNIT_TEST(adjust_gid_object_position_by_orientation)
{
	using namespace tiled;
	CHECK_EQ(adjust_gid_object_position(10, 20, 30, 40, Orientation::ORTHOGONAL, 0, 64, 64, false), pointf(10, 20));
	CHECK_EQ(adjust_gid_object_position(0, 0, 10, 20, Orientation::ORTHOGONAL, 90, 64, 64, false), pointf(20, 0));
	CHECK_EQ(adjust_gid_object_position(5, 5, 10, 20, Orientation::ORTHOGONAL, 180, 64, 64, true), pointf(15, 5));
	CHECK_EQ(adjust_gid_object_position(100, 100, 32, 32, Orientation::ISOMETRIC, 0, 64, 64, false), pointf(68, 68));
	CHECK_EQ(adjust_gid_object_position(100, 100, 32, 32, Orientation::ISOMETRIC, 90, 64, 64, true), pointf(84, 52));
	CHECK_EQ(adjust_gid_object_position(0, 0, 10, 20, Orientation::STAGGERED, 270, 64, 64, false), pointf(0, 10));
	CHECK_EQ(adjust_gid_object_position(10, 10, 10, 20, Orientation::HEXAGONAL, 180, 64, 64, true), pointf(20, 10));
	CHECK_EQ(adjust_gid_object_position(1, 2, 3, 4, Orientation::UNKNOWN, 0, 64, 64, false), pointf(1, 2));
}

UNIT_TEST(orientation_names)
{
	log_capture_scope capture;
	CHECK(tiled::convert_orientation("hexagonal") == tiled::Orientation::HEXAGONAL, "hexagonal not recognised");
	CHECK(tiled::convert_orientation("oblique") == tiled::Orientation::UNKNOWN, "unknown orientation accepted");
	CHECK(capture.contains("oblique", SDL_LOG_PRIORITY_WARN), "no warning for unknown orientation");
	CHECK(tiled::convert_stagger_axis("x") == tiled::StaggerAxis::X, "x axis not recognised");
	CHECK(tiled::convert_stagger_index("even") == tiled::StaggerIndex::EVEN, "even index not recognised");
	CHECK(tiled::convert_stagger_index("odd") == tiled::StaggerIndex::ODD, "odd index not recognised");
}
