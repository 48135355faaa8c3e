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

#include "collision.hpp"
#include "logger.hpp"
#include "string_utils.hpp"
#include "tiled.hpp"
#include "unit_test.hpp"

namespace tiled
{
	Result<bool> convert_to_bool(const std::string& value)
	{
		const std::string s = util::to_lower(util::strip_copy(value));
		if(s.empty()) {
			return false;
		}
		switch(s[0]) {
			case '1': case 'y': case 't':
				return true;
			case '-': case '0': case 'n': case 'f':
				return false;
			default: break;
		}
		return TILED_ERROR(INVALID_VALUE, "cannot parse \"" << value << "\" as bool");
	}

	const Property* find_property(const Properties& props, const std::string& name)
	{
		for(auto& p : props) {
			if(p.name == name) {
				return &p;
			}
		}
		return nullptr;
	}

	Properties merge_properties(const Properties& base, const Properties& overrides)
	{
		Properties res = base;
		for(auto& p : overrides) {
			auto it = std::find_if(res.begin(), res.end(), [&p](const Property& q) { return q.name == p.name; });
			if(it != res.end()) {
				*it = p;
			} else {
				res.emplace_back(p);
			}
		}
		return res;
	}

	TileDefinition::TileDefinition(int local_id)
		: local_id_(local_id),
		  image_width_(0),
		  image_height_(0)
	{
	}

	TileSet::TileSet(int first_gid)
		: first_gid_(first_gid),
		  tile_width_(0),
		  tile_height_(0),
		  spacing_(0),
		  margin_(0),
		  tile_count_(0),
		  columns_(0),
		  tile_offset_x_(0),
		  tile_offset_y_(0)
	{
	}

	const TileDefinition* TileSet::getTileDefinition(int local_id) const
	{
		for(auto& td : tiles_) {
			if(td.getLocalId() == local_id) {
				return &td;
			}
		}
		return nullptr;
	}

	rect TileSet::getImageRect(int local_id) const
	{
		const int columns = std::max(columns_, 1);
		const int col = local_id % columns;
		const int row = local_id / columns;
		return rect(margin_ + col * (tile_width_ + spacing_), margin_ + row * (tile_height_ + spacing_), tile_width_, tile_height_);
	}

	TileLayer::TileLayer(const std::string& name)
		: name_(name),
		  id_(0),
		  width_(0),
		  height_(0),
		  opacity_(1.0f),
		  is_visible_(true)
	{
	}

	uint32_t TileLayer::getGid(int x, int y) const
	{
		if(y < 0 || y >= static_cast<int>(data_.size())) {
			return 0;
		}
		const auto& row = data_[y];
		if(x < 0 || x >= static_cast<int>(row.size())) {
			return 0;
		}
		return row[x];
	}

	Object::Object()
		: id_(0),
		  x_(0),
		  y_(0),
		  width_(0),
		  height_(0),
		  rotation_(0),
		  is_visible_(true),
		  gid_(0)
	{
	}

	void Object::setShape(const Shape& shape)
	{
		shape_ = shape;
		if(shape.hasPoints()) {
			width_ = shape.getWidth();
			height_ = shape.getHeight();
		}
	}

	std::string Object::getObjectType() const
	{
		if(isTileObject()) {
			return "tile";
		}
		return shape_kind_name(shape_ ? shape_->getKind() : ShapeKind::RECTANGLE);
	}

	std::vector<pointf> Object::asPoints() const
	{
		std::vector<pointf> res;
		res.emplace_back(x_, y_);
		res.emplace_back(x_, y_ + height_);
		res.emplace_back(x_ + width_, y_ + height_);
		res.emplace_back(x_ + width_, y_);
		return res;
	}

	std::vector<pointf> Object::applyTransformations() const
	{
		const pointf origin(x_, y_);
		if(shape_ && shape_->hasPoints() && !isTileObject()) {
			return rotate(shape_->getPoints(), origin, rotation_);
		}
		return rotate(asPoints(), origin, rotation_);
	}

	bool Object::asEllipse(pointf* centre, double* rx, double* ry) const
	{
		if(!shape_ || shape_->getKind() != ShapeKind::ELLIPSE) {
			return false;
		}
		*centre = pointf(x_ + width_ / 2.0, y_ + height_ / 2.0);
		*rx = width_ / 2.0;
		*ry = height_ / 2.0;
		return true;
	}

	rect Object::getBoundingBox() const
	{
		return bounding_box(applyTransformations());
	}

	bool Object::collidesWithPoint(double x, double y) const
	{
		const pointf p(x, y);
		if(isTileObject() || !shape_ || shape_->getKind() == ShapeKind::RECTANGLE) {
			return point_in_polygon(p, applyTransformations());
		}

		pointf centre;
		double rx, ry;
		if(asEllipse(&centre, &rx, &ry)) {
			return point_in_ellipse(p, centre, rx, ry);
		} else if(shape_->hasPoints()) {
			return point_in_polygon(p, applyTransformations());
		}
		return false;
	}

	bool Object::intersectsWithRect(const rect& r) const
	{
		return intersects_rect(getBoundingBox(), r);
	}

	bool Object::intersectsWithObject(const Object& other) const
	{
		return intersectsWithRect(other.getBoundingBox());
	}

	Result<bool> Object::intersectsWithPolygon(const Object& other) const
	{
		return intersects_polygon(applyTransformations(), other.applyTransformations());
	}

	void Object::adjustGidObjectPosition(Orientation orientation, int rotation, int tile_width, int tile_height, bool invert_y)
	{
		const pointf p = adjust_gid_object_position(x_, y_, width_, height_, orientation, rotation, tile_width, tile_height, invert_y);
		x_ = p.x;
		y_ = p.y;
	}

	ObjectGroup::ObjectGroup(const std::string& name)
		: name_(name),
		  id_(0),
		  opacity_(1.0f),
		  is_visible_(true),
		  draw_order_("topdown")
	{
	}

	Map::Map(FlagCachePtr cache)
		: width_(0),
		  height_(0),
		  tile_width_(0),
		  tile_height_(0),
		  orientation_(Orientation::ORTHOGONAL),
		  render_order_("right-down"),
		  infinite_(false),
		  stagger_axis_(StaggerAxis::Y),
		  stagger_index_(StaggerIndex::ODD),
		  hexside_length_(0),
		  codec_(cache),
		  max_gid_(1)
	{
	}

	MapPtr Map::create(FlagCachePtr cache)
	{
		return std::make_shared<Map>(cache);
	}

	std::shared_ptr<TileLayer> Map::getLayerByName(const std::string& name) const
	{
		for(auto& layer : layers_) {
			if(layer->getName() == name) {
				return layer;
			}
		}
		return std::shared_ptr<TileLayer>();
	}

	std::shared_ptr<ObjectGroup> Map::getObjectGroupByName(const std::string& name) const
	{
		for(auto& group : object_groups_) {
			if(group->getName() == name) {
				return group;
			}
		}
		return std::shared_ptr<ObjectGroup>();
	}

	const Object* Map::getObjectByName(const std::string& name) const
	{
		for(auto& group : object_groups_) {
			for(auto& obj : group->getObjects()) {
				if(obj.getName() == name) {
					return &obj;
				}
			}
		}
		return nullptr;
	}

	const TileSet* Map::getTileSetForGid(uint32_t tiled_gid) const
	{
		const TileSet* res = nullptr;
		for(auto& ts : tile_sets_) {
			if(ts.getFirstId() >= 0 && static_cast<uint32_t>(ts.getFirstId()) <= tiled_gid 
				&& (res == nullptr || ts.getFirstId() > res->getFirstId())) {
				res = &ts;
			}
		}
		return res;
	}

	const TileDefinition* Map::getTileDefinition(uint32_t internal_gid) const
	{
		const uint32_t tiled_gid = getTiledGid(internal_gid);
		const TileSet* ts = getTileSetForGid(tiled_gid);
		if(tiled_gid == 0 || ts == nullptr) {
			return nullptr;
		}
		return ts->getTileDefinition(static_cast<int>(tiled_gid) - ts->getFirstId());
	}

	uint32_t Map::registerGid(uint32_t tiled_gid, const TileFlags& flags)
	{
		if(tiled_gid == 0) {
			return 0;
		}
		const uint32_t key = encode_gid(tiled_gid, flags);
		auto it = gid_lookup_.find(key);
		if(it != gid_lookup_.end()) {
			return it->second;
		}

		const uint32_t gid = max_gid_++;
		gid_lookup_[key] = gid;
		tiled_to_internal_[gid_base(tiled_gid)].push_back(gid);
		internal_to_tiled_[gid] = key;
		return gid;
	}

	uint32_t Map::registerGidCheckFlags(uint32_t raw)
	{
		auto decoded = codec_.decode(raw);
		return registerGid(decoded.first, decoded.second);
	}

	std::vector<uint32_t> Map::mapGid(uint32_t tiled_gid) const
	{
		auto it = tiled_to_internal_.find(tiled_gid);
		if(it == tiled_to_internal_.end()) {
			return std::vector<uint32_t>();
		}
		return it->second;
	}

	uint32_t Map::getTiledGid(uint32_t internal_gid) const
	{
		auto it = internal_to_tiled_.find(internal_gid);
		return it == internal_to_tiled_.end() ? 0 : gid_base(it->second);
	}

	TileFlags Map::getTileFlags(uint32_t internal_gid) const
	{
		auto it = internal_to_tiled_.find(internal_gid);
		return it == internal_to_tiled_.end() ? TileFlags() : flags_from_gid(it->second);
	}

	point Map::pixelToTile(const pointf& pixel) const
	{
		return pixel_to_tile(pixel, orientation_, tile_width_, tile_height_, stagger_axis_, stagger_index_);
	}

	pointf Map::tileToPixel(const point& tile) const
	{
		return tile_to_pixel(tile, orientation_, tile_width_, tile_height_, stagger_axis_, stagger_index_);
	}
}

UNIT_TEST(convert_to_bool_spellings)
{
	const char* truthy[] = { "1", "y", "yes", "True", "  t ", "YES" };
	for(auto s : truthy) {
		auto res = tiled::convert_to_bool(s);
		CHECK(res.ok() && res.value(), "'" << s << "' should be true");
	}
	const char* falsy[] = { "0", "n", "no", "False", "-", "f", "", "   " };
	for(auto s : falsy) {
		auto res = tiled::convert_to_bool(s);
		CHECK(res.ok() && !res.value(), "'" << s << "' should be false");
	}
	auto bad = tiled::convert_to_bool("maybe");
	CHECK(!bad.ok(), "'maybe' accepted as a bool");
	CHECK(bad.error().kind == tiled::ErrorKind::INVALID_VALUE, bad.error());
}

UNIT_TEST(map_registers_gids)
{
	tiled::Map map;
	CHECK_EQ(map.registerGidCheckFlags(0), 0);
	const uint32_t plain = map.registerGidCheckFlags(5);
	const uint32_t flipped = map.registerGidCheckFlags(5 | tiled::FLIPPED_HORIZONTALLY_BIT);
	CHECK_EQ(plain, 1);
	CHECK_EQ(flipped, 2);
	CHECK_EQ(map.registerGidCheckFlags(5), plain);
	CHECK_EQ(map.registerGid(5, tiled::TileFlags(true, false, false)), flipped);

	CHECK_EQ(map.mapGid(5), (std::vector<uint32_t>{1, 2}));
	CHECK(map.mapGid(6).empty(), "unregistered gid has internal ids");
	CHECK_EQ(map.getTiledGid(flipped), 5);
	CHECK_EQ(map.getTileFlags(flipped), tiled::TileFlags(true, false, false));
	CHECK_EQ(map.getTileFlags(plain), tiled::TileFlags());
	CHECK_EQ(map.getTiledGid(99), 0);
	CHECK_EQ(map.getRegisteredGidCount(), 2);
}

UNIT_TEST(map_shares_injected_flag_cache)
{
	auto cache = std::make_shared<tiled::FlagCache>();
	tiled::Map a(cache);
	tiled::Map b(cache);
	a.registerGidCheckFlags(3 | tiled::FLIPPED_VERTICALLY_BIT);
	b.registerGidCheckFlags(3 | tiled::FLIPPED_VERTICALLY_BIT);
	CHECK_EQ(cache->size(), 1);
}

UNIT_TEST(tileset_lookup_and_image_rects)
{
	tiled::Map map;
	tiled::TileSet first(1);
	first.setTileDimensions(16, 16);
	first.setColumns(4);
	first.setMargin(1);
	first.setSpacing(2);
	tiled::TileSet second(65);
	map.addTileSet(second);
	map.addTileSet(first);

	CHECK(map.getTileSetForGid(0) == nullptr, "gid 0 has a tileset");
	CHECK_EQ(map.getTileSetForGid(64)->getFirstId(), 1);
	CHECK_EQ(map.getTileSetForGid(65)->getFirstId(), 65);
	CHECK_EQ(first.getImageRect(5), rect(19, 19, 16, 16));
}

UNIT_TEST(object_geometry_queries)
{
	tiled::Object box;
	box.setPosition(0, 0);
	box.setDimensions(10, 10);
	box.setShape(tiled::Shape(tiled::ShapeKind::RECTANGLE, tiled::generate_rectangle_points(0, 0, 10, 10), true));
	CHECK_EQ(box.getObjectType(), "rectangle");
	CHECK(box.collidesWithPoint(5, 5), "centre of box not inside");
	CHECK(!box.collidesWithPoint(15, 5), "point outside box reported inside");
	CHECK_EQ(box.getBoundingBox(), rect::from_coordinates(0, 0, 10, 10));

	tiled::Object other = box;
	other.setPosition(5, 5);
	other.setShape(tiled::Shape(tiled::ShapeKind::RECTANGLE, tiled::generate_rectangle_points(5, 5, 10, 10), true));
	CHECK(box.intersectsWithObject(other), "overlapping boxes reported apart");
	auto sat = box.intersectsWithPolygon(other);
	CHECK(sat.ok(), sat.error());
	CHECK(sat.value(), "overlapping boxes reported apart by SAT");
	CHECK(!box.intersectsWithRect(rect::from_coordinates(10, 0, 20, 10)), "touching rect reported overlapping");

	tiled::Object ellipse;
	ellipse.setPosition(0, 0);
	ellipse.setDimensions(20, 10);
	ellipse.setShape(tiled::Shape(tiled::ShapeKind::ELLIPSE, tiled::generate_ellipse_points(0, 0, 20, 10), true));
	pointf centre;
	double rx = 0, ry = 0;
	CHECK(ellipse.asEllipse(&centre, &rx, &ry), "ellipse not reported as one");
	CHECK_EQ(centre, pointf(10, 5));
	CHECK(ellipse.collidesWithPoint(10, 5), "ellipse centre not inside");
	CHECK(!ellipse.collidesWithPoint(1, 1), "ellipse corner reported inside");

	tiled::Object marker;
	marker.setShape(tiled::Shape(tiled::ShapeKind::POINT, std::vector<pointf>(), false));
	CHECK(!marker.collidesWithPoint(0, 0), "point objects have no area");
}

UNIT_TEST(object_rotation_and_tile_objects)
{
	tiled::Object tile;
	tile.setGid(1);
	tile.setPosition(0, 0);
	tile.setDimensions(10, 20);
	tile.setRotation(90);
	CHECK_EQ(tile.getObjectType(), "tile");
	CHECK_EQ(tile.getBoundingBox(), rect::from_coordinates(-20, 0, 0, 10));

	tile.setRotation(0);
	tile.adjustGidObjectPosition(tiled::Orientation::ORTHOGONAL, 0, 32, 32, true);
	CHECK_EQ(tile.y(), -20.0);
}

UNIT_TEST(map_pixel_conversion_uses_map_settings)
{
	tiled::Map map;
	map.setTileDimensions(32, 32);
	map.setOrientation(tiled::Orientation::STAGGERED);
	map.setStaggerAxis(tiled::StaggerAxis::X);
	map.setStaggerIndex(tiled::StaggerIndex::EVEN);
	CHECK_EQ(map.pixelToTile(pointf(32, 48)), point(2, 1));
	CHECK_EQ(map.pixelToTile(map.tileToPixel(point(3, 4))), point(3, 4));
}
