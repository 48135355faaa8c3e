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
#include <cmath>

#include "collision.hpp"
#include "unit_test.hpp"

namespace tiled
{
	namespace
	{
		const double pi = 3.14159265358979323846;

		double cross(const pointf& p1, const pointf& p2, const pointf& p3)
		{
			return (p2.x - p1.x) * (p3.y - p1.y) - (p2.y - p1.y) * (p3.x - p1.x);
		}

		void add_axes(const std::vector<pointf>& polygon, std::vector<pointf>* axes)
		{
			for(size_t n = 0; n != polygon.size(); ++n) {
				const pointf& p1 = polygon[n];
				const pointf& p2 = polygon[(n + 1) % polygon.size()];
				const double nx = -(p2.y - p1.y);
				const double ny = p2.x - p1.x;
				const double length = std::sqrt(nx * nx + ny * ny);
				if(length == 0.0) {
					continue;
				}
				axes->emplace_back(nx / length, ny / length);
			}
		}

		void project(const std::vector<pointf>& polygon, const pointf& axis, double* min_out, double* max_out)
		{
			*min_out = *max_out = polygon.front().x * axis.x + polygon.front().y * axis.y;
			for(auto& p : polygon) {
				const double d = p.x * axis.x + p.y * axis.y;
				*min_out = std::min(*min_out, d);
				*max_out = std::max(*max_out, d);
			}
		}
	}

	std::vector<pointf> rotate(const std::vector<pointf>& points, const pointf& origin, double angle)
	{
		if(angle == 0.0) {
			return points;
		}
		const double radians = angle * pi / 180.0;
		const double sin_t = std::sin(radians);
		const double cos_t = std::cos(radians);
		std::vector<pointf> res;
		res.reserve(points.size());
		for(auto& p : points) {
			const double dx = p.x - origin.x;
			const double dy = p.y - origin.y;
			res.emplace_back(origin.x + cos_t * dx - sin_t * dy, origin.y + sin_t * dx + cos_t * dy);
		}
		return res;
	}

	rect bounding_box(const std::vector<pointf>& points)
	{
		if(points.empty()) {
			return rect();
		}
		double min_x = points.front().x, max_x = points.front().x;
		double min_y = points.front().y, max_y = points.front().y;
		for(auto& p : points) {
			min_x = std::min(min_x, p.x);
			max_x = std::max(max_x, p.x);
			min_y = std::min(min_y, p.y);
			max_y = std::max(max_y, p.y);
		}
		return rect::from_coordinates(static_cast<int>(min_x), static_cast<int>(min_y), static_cast<int>(max_x), static_cast<int>(max_y));
	}

	bool point_in_polygon(const pointf& p, const std::vector<pointf>& polygon)
	{
		bool inside = false;
		const size_t count = polygon.size();
		for(size_t i = 0; i != count; ++i) {
			const pointf& vi = polygon[i];
			const pointf& vj = polygon[(i + count - 1) % count];
			const bool crosses = (vi.y > p.y) != (vj.y > p.y);
			if(crosses && p.x < (vj.x - vi.x) * (p.y - vi.y) / (vj.y - vi.y + 1e-10) + vi.x) {
				inside = !inside;
			}
		}
		return inside;
	}

	bool point_in_ellipse(const pointf& p, const pointf& centre, double rx, double ry)
	{
		if(rx <= 0.0 || ry <= 0.0) {
			return false;
		}
		const double dx = p.x - centre.x;
		const double dy = p.y - centre.y;
		return (dx * dx) / (rx * rx) + (dy * dy) / (ry * ry) <= 1.0;
	}

	bool is_convex(const std::vector<pointf>& polygon)
	{
		const size_t count = polygon.size();
		if(count < 3) {
			return true;
		}
		size_t positive = 0;
		for(size_t n = 0; n != count; ++n) {
			if(cross(polygon[n], polygon[(n + 1) % count], polygon[(n + 2) % count]) > 0) {
				++positive;
			}
		}
		return positive == count || positive == 0;
	}

	bool intersects_rect(const rect& a, const rect& b)
	{
		return a.x1() < b.x2() && a.x2() > b.x1() && a.y1() < b.y2() && a.y2() > b.y1();
	}

	Result<bool> intersects_polygon(const std::vector<pointf>& a, const std::vector<pointf>& b)
	{
		if(!is_convex(a) || !is_convex(b)) {
			return TILED_ERROR(NON_CONVEX_POLYGON, "Separating axis test requires convex polygons");
		}
		if(a.empty() || b.empty()) {
			return false;
		}

		std::vector<pointf> axes;
		add_axes(a, &axes);
		add_axes(b, &axes);
		for(auto& axis : axes) {
			double min1, max1, min2, max2;
			project(a, axis, &min1, &max1);
			project(b, axis, &min2, &max2);
			if(max1 < min2 || max2 < min1) {
				return false;
			}
		}
		return true;
	}
}

namespace
{
	std::vector<pointf> square(double x, double y, double size)
	{
		return std::vector<pointf>{pointf(x, y), pointf(x + size, y), pointf(x + size, y + size), pointf(x, y + size)};
	}
}

UNIT_TEST(rotate_points)
{
	const std::vector<pointf> pts{pointf(3, 4), pointf(-1.5, 2)};
	const pointf origin(1, 1);
	auto same = tiled::rotate(pts, origin, 0);
	auto full = tiled::rotate(pts, origin, 360);
	for(size_t n = 0; n != pts.size(); ++n) {
		CHECK_NEAR(same[n].x, pts[n].x, 1e-9);
		CHECK_NEAR(same[n].y, pts[n].y, 1e-9);
		CHECK_NEAR(full[n].x, same[n].x, 1e-9);
		CHECK_NEAR(full[n].y, same[n].y, 1e-9);
	}

	auto quarter = tiled::rotate(std::vector<pointf>{pointf(2, 1)}, origin, 90);
	CHECK_NEAR(quarter[0].x, 1.0, 1e-9);
	CHECK_NEAR(quarter[0].y, 2.0, 1e-9);
}

UNIT_TEST(bounding_box_truncates)
{
	CHECK_EQ(tiled::bounding_box(std::vector<pointf>{pointf(0.9, 1.5), pointf(10.7, -2.2)}), rect::from_coordinates(0, -2, 10, 1));
	CHECK_EQ(tiled::bounding_box(std::vector<pointf>()), rect());
}

UNIT_TEST(point_in_polygon_and_ellipse)
{
	const auto sq = square(0, 0, 10);
	CHECK(tiled::point_in_polygon(pointf(5, 5), sq), "centre should be inside");
	CHECK(!tiled::point_in_polygon(pointf(15, 5), sq), "point right of square should be outside");
	CHECK(!tiled::point_in_polygon(pointf(5, 5), std::vector<pointf>()), "empty polygon contains nothing");

	CHECK(tiled::point_in_ellipse(pointf(10, 5), pointf(10, 10), 5, 5), "point on the ellipse edge is inside");
	CHECK(!tiled::point_in_ellipse(pointf(14, 14), pointf(10, 10), 5, 5), "corner point is outside");
	CHECK(!tiled::point_in_ellipse(pointf(10, 10), pointf(10, 10), 0, 5), "degenerate ellipse contains nothing");
}

UNIT_TEST(convexity)
{
	CHECK(tiled::is_convex(square(0, 0, 4)), "square is convex");
	CHECK(tiled::is_convex(std::vector<pointf>{pointf(0, 0), pointf(4, 0), pointf(2, 3)}), "triangle is convex");
	CHECK(tiled::is_convex(std::vector<pointf>{pointf(0, 0), pointf(1, 1)}), "fewer than three points counts as convex");
	const std::vector<pointf> arrow{pointf(0, 0), pointf(2, 1), pointf(4, 0), pointf(2, 4)};
	CHECK(!tiled::is_convex(arrow), "arrow is concave");
}

UNIT_TEST(rect_overlap_is_strict)
{
	CHECK(tiled::intersects_rect(rect::from_coordinates(0, 0, 10, 10), rect::from_coordinates(5, 5, 15, 15)), "overlap missed");
	CHECK(!tiled::intersects_rect(rect::from_coordinates(0, 0, 10, 10), rect::from_coordinates(10, 0, 20, 10)), "touching edges counted as overlap");
}

UNIT_TEST(separating_axis_test)
{
	auto overlap = tiled::intersects_polygon(square(0, 0, 10), square(5, 5, 10));
	CHECK(overlap.ok(), overlap.error());
	CHECK(overlap.value(), "overlapping squares reported apart");

	auto apart = tiled::intersects_polygon(square(0, 0, 10), square(20, 20, 5));
	CHECK(apart.ok(), apart.error());
	CHECK(!apart.value(), "disjoint squares reported overlapping");

	const std::vector<pointf> arrow{pointf(0, 0), pointf(2, 1), pointf(4, 0), pointf(2, 4)};
	auto concave = tiled::intersects_polygon(arrow, square(0, 0, 10));
	CHECK(!concave.ok(), "concave polygon accepted");
	CHECK(concave.error().kind == tiled::ErrorKind::NON_CONVEX_POLYGON, concave.error());

	// a collapsed polygon has only zero length edges, which give no axes.
	const std::vector<pointf> dot{pointf(1, 1), pointf(1, 1)};
	auto inside = tiled::intersects_polygon(dot, square(0, 0, 10));
	CHECK(inside.ok(), inside.error());
	CHECK(inside.value(), "collapsed polygon inside the square reported apart");
	auto outside = tiled::intersects_polygon(std::vector<pointf>{pointf(20, 20), pointf(20, 20)}, square(0, 0, 10));
	CHECK(outside.ok(), outside.error());
	CHECK(!outside.value(), "collapsed polygon outside the square reported overlapping");
}
