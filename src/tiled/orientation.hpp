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

#include "geometry.hpp"

namespace tiled
{
	enum class Orientation {
		ORTHOGONAL,
		ISOMETRIC,
		STAGGERED,
		HEXAGONAL,
		UNKNOWN,
	};

	enum class StaggerAxis {
		X,
		Y,
	};

	enum class StaggerIndex {
		EVEN,
		ODD,
	};

	// Unrecognised names give UNKNOWN and a warning; such maps are treated as
	// orthogonal for coordinate conversion.
	Orientation convert_orientation(const std::string& o);
	const char* orientation_name(Orientation o);
	StaggerAxis convert_stagger_axis(const std::string& axis);
	StaggerIndex convert_stagger_index(const std::string& index);

	point pixel_to_tile(const pointf& pixel, Orientation orientation, int tile_width, int tile_height, 
		StaggerAxis axis=StaggerAxis::Y, StaggerIndex index=StaggerIndex::ODD);

	// The anchor pixel of a tile. pixel_to_tile(tile_to_pixel(t)) == t.
	pointf tile_to_pixel(const point& tile, Orientation orientation, int tile_width, int tile_height, 
		StaggerAxis axis=StaggerAxis::Y, StaggerIndex index=StaggerIndex::ODD);

	// Moves a tile object from the editor's anchor to its top-left corner,
	// accounting for the object's rotation. invert_y shifts it up by its
	// height for bottom-anchored objects.
	pointf adjust_gid_object_position(double x, double y, double width, double height, Orientation orientation, 
		int rotation, int tile_width, int tile_height, bool invert_y);
}
