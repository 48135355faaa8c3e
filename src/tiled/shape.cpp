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
#include <sstream>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "logger.hpp"
#include "shape.hpp"
#include "string_utils.hpp"
#include "unit_test.hpp"

namespace tiled
{
	using namespace boost::property_tree;

	namespace
	{
		const double pi = 3.14159265358979323846;

		rectf compute_bounds(const std::vector<pointf>& points)
		{
			if(points.empty()) {
				return rectf();
			}
			double min_x = points.front().x, max_x = points.front().x;
			double min_y = points.front().y, max_y = points.front().y;
			for(auto& p : points) {
				min_x = std::min(min_x, p.x);
				max_x = std::max(max_x, p.x);
				min_y = std::min(min_y, p.y);
				max_y = std::max(max_y, p.y);
			}
			return rectf::from_coordinates(min_x, min_y, max_x, max_y);
		}

		Result<TextAttributes> parse_text_attributes(const ptree& pt)
		{
			TextAttributes res;
			res.text = pt.data();
			auto attributes = pt.get_child_optional("<xmlattr>");
			if(!attributes) {
				return res;
			}
			res.font_family = attributes->get<std::string>("fontfamily", res.font_family);
			auto pixel_size = attributes->get_optional<std::string>("pixelsize");
			if(pixel_size) {
				try {
					res.pixel_size = boost::lexical_cast<int>(util::strip_copy(*pixel_size));
				} catch(boost::bad_lexical_cast&) {
					return TILED_ERROR(INVALID_VALUE, "Text 'pixelsize' is not an integer: '" << *pixel_size << "'");
				}
			}
			res.color = attributes->get<std::string>("color", res.color);
			res.halign = attributes->get<std::string>("halign", res.halign);
			res.valign = attributes->get<std::string>("valign", res.valign);
			res.wrap = attributes->get<std::string>("wrap", "0") == "1";
			res.bold = attributes->get<std::string>("bold", "0") == "1";
			res.italic = attributes->get<std::string>("italic", "0") == "1";
			res.underline = attributes->get<std::string>("underline", "0") == "1";
			res.strikeout = attributes->get<std::string>("strikeout", "0") == "1";
			res.kerning = attributes->get<std::string>("kerning", "1") == "1";
			return res;
		}
	}

	const char* shape_kind_name(ShapeKind kind)
	{
		switch(kind) {
			case ShapeKind::RECTANGLE:	return "rectangle";
			case ShapeKind::POLYGON:	return "polygon";
			case ShapeKind::POLYLINE:	return "polyline";
			case ShapeKind::ELLIPSE:	return "ellipse";
			case ShapeKind::POINT:		return "point";
			case ShapeKind::TEXT:		return "text";
		}
		return "unknown";
	}

	TextAttributes::TextAttributes()
		: font_family("Sans Serif"),
		  pixel_size(16),
		  color("#000000FF"),
		  halign("left"),
		  valign("top"),
		  wrap(false),
		  bold(false),
		  italic(false),
		  underline(false),
		  strikeout(false),
		  kerning(true)
	{
	}

	Shape::Shape(ShapeKind kind, const std::vector<pointf>& points, bool closed)
		: kind_(kind),
		  points_(points),
		  closed_(closed),
		  bounds_(compute_bounds(points))
	{
	}

	Shape::Shape(const TextAttributes& text)
		: kind_(ShapeKind::TEXT),
		  closed_(false),
		  text_(text)
	{
	}

	std::vector<pointf> generate_rectangle_points(double x, double y, double width, double height)
	{
		std::vector<pointf> res;
		res.emplace_back(x, y);
		res.emplace_back(x + width, y);
		res.emplace_back(x + width, y + height);
		res.emplace_back(x, y + height);
		return res;
	}

	std::vector<pointf> generate_ellipse_points(double x, double y, double width, double height, int segments, double rotation)
	{
		const double cx = x + width / 2.0;
		const double cy = y + height / 2.0;
		const double rx = width / 2.0;
		const double ry = height / 2.0;
		const double cos_r = std::cos(rotation);
		const double sin_r = std::sin(rotation);

		std::vector<pointf> res;
		for(int n = 0; n < segments; ++n) {
			const double theta = 2.0 * pi * n / segments;
			const double ex = rx * std::cos(theta);
			const double ey = ry * std::sin(theta);
			res.emplace_back(cx + ex * cos_r - ey * sin_r, cy + ex * sin_r + ey * cos_r);
		}
		return res;
	}

	Result<std::vector<pointf>> parse_points(const std::string& text)
	{
		std::vector<pointf> res;
		for(auto& pair : util::split_on_whitespace(text)) {
			std::vector<std::string> coords = util::split(pair, ',', 0);
			if(coords.size() != 2) {
				return TILED_ERROR(MALFORMED_SHAPE_DATA, "Expected an 'x,y' pair, found: '" << pair << "'");
			}
			try {
				res.emplace_back(boost::lexical_cast<double>(coords[0]), boost::lexical_cast<double>(coords[1]));
			} catch(boost::bad_lexical_cast&) {
				return TILED_ERROR(MALFORMED_SHAPE_DATA, "Non-numeric coordinate in point pair: '" << pair << "'");
			}
		}
		return res;
	}

	Result<Shape> parse_shape(const ptree& object_node, double x, double y, double width, double height, int ellipse_segments)
	{
		static const char* const points_shapes[] = { "polygon", "polyline" };
		for(auto tag : points_shapes) {
			auto subnode = object_node.get_child_optional(tag);
			if(!subnode) {
				continue;
			}
			auto relative = parse_points(subnode->get<std::string>("<xmlattr>.points", ""));
			if(!relative) {
				return relative.error();
			}
			std::vector<pointf> points;
			points.reserve(relative.value().size());
			for(auto& p : relative.value()) {
				points.emplace_back(p.x + x, p.y + y);
			}
			const bool is_polygon = std::string(tag) == "polygon";
			return Shape(is_polygon ? ShapeKind::POLYGON : ShapeKind::POLYLINE, points, is_polygon);
		}

		if(object_node.get_child_optional("ellipse")) {
			return Shape(ShapeKind::ELLIPSE, generate_ellipse_points(x, y, width, height, ellipse_segments), true);
		} else if(object_node.get_child_optional("point")) {
			return Shape(ShapeKind::POINT, std::vector<pointf>(), false);
		}

		auto text = object_node.get_child_optional("text");
		if(text) {
			auto attributes = parse_text_attributes(*text);
			if(!attributes) {
				return attributes.error();
			}
			return Shape(attributes.value());
		}

		return Shape(ShapeKind::RECTANGLE, generate_rectangle_points(x, y, width, height), true);
	}
}

namespace
{
	boost::property_tree::ptree read_object(const std::string& xml)
	{
		boost::property_tree::ptree pt;
		std::istringstream ss(xml);
		boost::property_tree::read_xml(ss, pt);
		return pt.get_child("object");
	}
}

UNIT_TEST(rectangle_points_are_clockwise)
{
	CHECK_EQ(tiled::generate_rectangle_points(0, 0, 10, 20), (std::vector<pointf>{pointf(0, 0), pointf(10, 0), pointf(10, 20), pointf(0, 20)}));
}

UNIT_TEST(ellipse_points)
{
	CHECK(tiled::generate_ellipse_points(0, 0, 10, 10, 0).empty(), "zero segments should give no points");
	auto single = tiled::generate_ellipse_points(0, 0, 10, 20, 1);
	CHECK_EQ(single.size(), 1);
	CHECK_NEAR(single[0].x, 10.0, 1e-9);
	CHECK_NEAR(single[0].y, 10.0, 1e-9);

	auto pts = tiled::generate_ellipse_points(0, 0, 20, 10, 4);
	CHECK_EQ(pts.size(), 4);
	CHECK_NEAR(pts[1].x, 10.0, 1e-9);
	CHECK_NEAR(pts[1].y, 10.0, 1e-9);
	CHECK_NEAR(pts[2].x, 0.0, 1e-9);

	// a quarter turn swaps the radii about the centre (10, 5).
	auto rotated = tiled::generate_ellipse_points(0, 0, 20, 10, 4, 3.14159265358979323846 / 2);
	CHECK_NEAR(rotated[0].x, 10.0, 1e-9);
	CHECK_NEAR(rotated[0].y, 15.0, 1e-9);
}

UNIT_TEST(parse_points_pairs)
{
	auto res = tiled::parse_points(" 0,0  10.5,-2\n3,4 ");
	CHECK(res.ok(), res.error());
	CHECK_EQ(res.value(), (std::vector<pointf>{pointf(0, 0), pointf(10.5, -2), pointf(3, 4)}));

	auto bad = tiled::parse_points("0,0 1;2");
	CHECK(!bad.ok(), "malformed pair accepted");
	CHECK(bad.error().kind == tiled::ErrorKind::MALFORMED_SHAPE_DATA, bad.error());

	bad = tiled::parse_points("0,0 a,b");
	CHECK(!bad.ok(), "non-numeric pair accepted");
	CHECK(bad.error().kind == tiled::ErrorKind::MALFORMED_SHAPE_DATA, bad.error());
}

UNIT_TEST(parse_polygon_and_polyline_shapes)
{
	auto polygon = tiled::parse_shape(read_object("<object x='10' y='20'><polygon points='0,0 5,0 5,5'/></object>"), 10, 20, 0, 0);
	CHECK(polygon.ok(), polygon.error());
	CHECK(polygon->getKind() == tiled::ShapeKind::POLYGON, tiled::shape_kind_name(polygon->getKind()));
	CHECK(polygon->isClosed(), "polygon should be closed");
	CHECK_EQ(polygon->getPoints(), (std::vector<pointf>{pointf(10, 20), pointf(15, 20), pointf(15, 25)}));
	CHECK_EQ(polygon->getWidth(), 5.0);
	CHECK_EQ(polygon->getHeight(), 5.0);

	auto polyline = tiled::parse_shape(read_object("<object><polyline points='0,0 4,8'/></object>"), 1, 1, 0, 0);
	CHECK(polyline.ok(), polyline.error());
	CHECK(polyline->getKind() == tiled::ShapeKind::POLYLINE, tiled::shape_kind_name(polyline->getKind()));
	CHECK(!polyline->isClosed(), "polyline should be open");
	CHECK_EQ(polyline->getBounds(), rectf::from_coordinates(1, 1, 5, 9));

	auto broken = tiled::parse_shape(read_object("<object><polygon points='0,0 x'/></object>"), 0, 0, 0, 0);
	CHECK(!broken.ok(), "broken polygon accepted");
	CHECK(broken.error().kind == tiled::ErrorKind::MALFORMED_SHAPE_DATA, broken.error());
}

UNIT_TEST(parse_ellipse_point_and_rectangle_shapes)
{
	auto ellipse = tiled::parse_shape(read_object("<object><ellipse/></object>"), 0, 0, 32, 16, 16);
	CHECK(ellipse.ok(), ellipse.error());
	CHECK(ellipse->getKind() == tiled::ShapeKind::ELLIPSE, tiled::shape_kind_name(ellipse->getKind()));
	CHECK_EQ(ellipse->getPoints().size(), 16);
	CHECK_NEAR(ellipse->getWidth(), 32.0, 1e-9);
	CHECK_NEAR(ellipse->getHeight(), 16.0, 1e-9);

	auto pt = tiled::parse_shape(read_object("<object><point/></object>"), 4, 4, 0, 0);
	CHECK(pt.ok(), pt.error());
	CHECK(pt->getKind() == tiled::ShapeKind::POINT, tiled::shape_kind_name(pt->getKind()));
	CHECK(!pt->hasPoints(), "point shape should carry no vertices");

	auto box = tiled::parse_shape(read_object("<object/>"), 0, 0, 10, 20);
	CHECK(box.ok(), box.error());
	CHECK(box->getKind() == tiled::ShapeKind::RECTANGLE, tiled::shape_kind_name(box->getKind()));
	CHECK_EQ(box->getPoints(), tiled::generate_rectangle_points(0, 0, 10, 20));
}

UNIT_TEST(parse_text_shape)
{
	auto plain = tiled::parse_shape(read_object("<object><text>Hello</text></object>"), 0, 0, 100, 20);
	CHECK(plain.ok(), plain.error());
	CHECK(plain->getKind() == tiled::ShapeKind::TEXT, tiled::shape_kind_name(plain->getKind()));
	const tiled::TextAttributes* text = plain->getText();
	CHECK(text != nullptr, "text shape without attributes");
	CHECK_EQ(text->text, "Hello");
	CHECK_EQ(text->font_family, "Sans Serif");
	CHECK_EQ(text->pixel_size, 16);
	CHECK_EQ(text->color, "#000000FF");
	CHECK_EQ(text->halign, "left");
	CHECK_EQ(text->valign, "top");
	CHECK(text->kerning && !text->wrap && !text->bold, "wrong text defaults");

	auto styled = tiled::parse_shape(read_object("<object><text fontfamily='Mono' pixelsize='12' bold='1' kerning='0' halign='center' color='#ff0000'>Hi</text></object>"), 0, 0, 0, 0);
	CHECK(styled.ok(), styled.error());
	text = styled->getText();
	CHECK_EQ(text->font_family, "Mono");
	CHECK_EQ(text->pixel_size, 12);
	CHECK_EQ(text->halign, "center");
	CHECK_EQ(text->color, "#ff0000");
	CHECK(text->bold && !text->kerning && !text->italic, "text flags not read");
}

UNIT_TEST(parse_text_shape_rejects_bad_pixel_size)
{
	auto res = tiled::parse_shape(read_object("<object><text pixelsize='huge'>Hi</text></object>"), 0, 0, 0, 0);
	CHECK(!res.ok(), "non-numeric pixel size accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_VALUE, res.error());

	auto padded = tiled::parse_shape(read_object("<object><text pixelsize=' 24 '>Hi</text></object>"), 0, 0, 0, 0);
	CHECK(padded.ok(), padded.error());
	CHECK_EQ(padded->getText()->pixel_size, 24);
}
