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

#include <vector>

#include "geometry.hpp"
#include "result.hpp"

namespace tiled
{
	// Rotates points about origin by angle degrees.
	std::vector<pointf> rotate(const std::vector<pointf>& points, const pointf& origin, double angle);

	// Integer box (min_x, min_y, max_x, max_y), truncated toward zero. An
	// empty point list gives an all-zero box.
	rect bounding_box(const std::vector<pointf>& points);

	bool point_in_polygon(const pointf& p, const std::vector<pointf>& polygon);
	bool point_in_ellipse(const pointf& p, const pointf& centre, double rx, double ry);
	bool is_convex(const std::vector<pointf>& polygon);

	// Strict overlap; rectangles that only share an edge do not intersect.
	bool intersects_rect(const rect& a, const rect& b);

	// Separating axis test. Both polygons must be convex.
	Result<bool> intersects_polygon(const std::vector<pointf>& a, const std::vector<pointf>& b);
}
