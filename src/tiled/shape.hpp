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
#include <boost/property_tree/ptree.hpp>

#include "geometry.hpp"
#include "result.hpp"

namespace tiled
{
	enum class ShapeKind {
		RECTANGLE,
		POLYGON,
		POLYLINE,
		ELLIPSE,
		POINT,
		TEXT,
	};

	const char* shape_kind_name(ShapeKind kind);

	struct TextAttributes
	{
		TextAttributes();
		std::string text;
		std::string font_family;
		int pixel_size;
		std::string color;
		std::string halign;
		std::string valign;
		bool wrap;
		bool bold;
		bool italic;
		bool underline;
		bool strikeout;
		bool kerning;
	};

	// The geometry of an object. Bounds are computed once on construction and
	// the value never changes afterwards.
	class Shape
	{
	public:
		Shape(ShapeKind kind, const std::vector<pointf>& points, bool closed);
		explicit Shape(const TextAttributes& text);

		ShapeKind getKind() const { return kind_; }
		const std::vector<pointf>& getPoints() const { return points_; }
		bool hasPoints() const { return !points_.empty(); }
		bool isClosed() const { return closed_; }

		// nullptr unless this is a text shape.
		const TextAttributes* getText() const { return text_ ? &*text_ : nullptr; }

		const rectf& getBounds() const { return bounds_; }
		double getWidth() const { return bounds_.w(); }
		double getHeight() const { return bounds_.h(); }
	private:
		ShapeKind kind_;
		std::vector<pointf> points_;
		bool closed_;
		boost::optional<TextAttributes> text_;
		rectf bounds_;
	};

	// Corners in clockwise order starting at (x,y).
	std::vector<pointf> generate_rectangle_points(double x, double y, double width, double height);

	// segments evenly spaced samples around the ellipse inscribed in the
	// given box, rotated by rotation radians about its centre.
	std::vector<pointf> generate_ellipse_points(double x, double y, double width, double height, int segments=16, double rotation=0.0);

	// Parses a whitespace separated list of "x,y" pairs.
	Result<std::vector<pointf>> parse_points(const std::string& text);

	// Builds the shape declared by the children of an <object> element.
	// (x, y, width, height) are the object's own attributes.
	Result<Shape> parse_shape(const boost::property_tree::ptree& object_node, double x, double y, double width, double height, int ellipse_segments=16);
}
