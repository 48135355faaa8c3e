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

#include <algorithm>
#include <ostream>
#include <sstream>
#include <string>

namespace geometry
{
	template<typename T>
	struct Point {
		explicit Point(T x=0, T y=0) : x(x), y(y)
		{}

		T x, y;
	};

	template<typename T> inline
	bool operator==(const Point<T>& a, const Point<T>& b)
	{
		return a.x == b.x && a.y == b.y;
	}

	template<typename T> inline
	bool operator!=(const Point<T>& a, const Point<T>& b)
	{
		return !operator==(a, b);
	}

	template<typename T> inline
	std::ostream& operator<<(std::ostream& os, const Point<T>& p)
	{
		os << "(" << p.x << "," << p.y << ")";
		return os;
	}

	// Axis aligned rectangle stored as two corners. w() and h() are derived,
	// so a rectangle built from coordinates keeps its exact edges.
	template<typename T>
	class Rect
	{
	public:
		explicit Rect(T x=0, T y=0, T w=0, T h=0) 
			: top_left_(std::min(x, x+w), std::min(y, y+h)),
			  bottom_right_(std::max(x, x+w), std::max(y, y+h))
		{}
		explicit Rect(const Point<T>& p1, const Point<T>& p2) 
			: top_left_(p1), bottom_right_(p2)
		{}

		static Rect from_coordinates(T x1, T y1, T x2, T y2) {
			if(x1 > x2) {
				std::swap(x1, x2);
			}
			if(y1 > y2) {
				std::swap(y1, y2);
			}
			return Rect(Point<T>(x1, y1), Point<T>(x2, y2));
		}

		T x() const { return top_left_.x; }
		T y() const { return top_left_.y; }
		T x1() const { return top_left_.x; }
		T y1() const { return top_left_.y; }
		T x2() const { return bottom_right_.x; }
		T y2() const { return bottom_right_.y; }
		T w() const { return bottom_right_.x - top_left_.x; }
		T h() const { return bottom_right_.y - top_left_.y; }

		const Point<T>& top_left() const { return top_left_; }
		const Point<T>& bottom_right() const { return bottom_right_; }

		std::string toString() const {
			std::stringstream ss;
			ss << x1() << "," << y1() << "," << x2() << "," << y2();
			return ss.str();
		}
	private:
		Point<T> top_left_;
		Point<T> bottom_right_;
	};

	template<typename T> inline
	bool operator==(const Rect<T>& a, const Rect<T>& b)
	{
		return a.top_left() == b.top_left() && a.bottom_right() == b.bottom_right();
	}

	template<typename T> inline
	bool operator!=(const Rect<T>& a, const Rect<T>& b)
	{
		return !operator==(a, b);
	}

	template<typename T> inline
	std::ostream& operator<<(std::ostream& os, const Rect<T>& r)
	{
		os << "[" << r.toString() << "]";
		return os;
	}
}

typedef geometry::Point<int> point;
typedef geometry::Point<double> pointf;

typedef geometry::Rect<int> rect;
typedef geometry::Rect<double> rectf;
