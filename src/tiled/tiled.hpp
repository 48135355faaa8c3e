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
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "chunk.hpp"
#include "geometry.hpp"
#include "gid_codec.hpp"
#include "layer_decoder.hpp"
#include "orientation.hpp"
#include "result.hpp"
#include "shape.hpp"

namespace tiled
{
	class Map;
	typedef std::shared_ptr<Map> MapPtr;
	class ObjectGroup;

	// Accepts the many spellings the editor and hand written maps use:
	// anything starting with 1, y or t is true, with -, 0, n or f false.
	// Blank text is false.
	Result<bool> convert_to_bool(const std::string& value);

	struct Property
	{
		explicit Property(const std::string& n, const std::string& v, const std::string& t="string") : name(n), type(t), value(v) {}
		Result<bool> asBool() const { return convert_to_bool(value); }
		std::string name;
		std::string type;
		std::string value;
	};
	typedef std::vector<Property> Properties;

	const Property* find_property(const Properties& props, const std::string& name);
	// Properties in overrides replace those with the same name in base.
	Properties merge_properties(const Properties& base, const Properties& overrides);

	struct AnimationFrame
	{
		AnimationFrame(uint32_t g, int d) : gid(g), duration(d) {}
		// Internal gid of the frame's tile.
		uint32_t gid;
		// Milliseconds.
		int duration;
	};

	class TileDefinition
	{
	public:
		explicit TileDefinition(int local_id);
		void setProperties(Properties* props) { properties_.swap(*props); }
		void setImage(const std::string& source, int width, int height) { image_source_ = source; image_width_ = width; image_height_ = height; }
		void addFrame(const AnimationFrame& frame) { frames_.emplace_back(frame); }
		void setColliders(std::shared_ptr<ObjectGroup> colliders) { colliders_ = colliders; }

		int getLocalId() const { return local_id_; }
		const Properties& getProperties() const { return properties_; }
		const std::string& getImageSource() const { return image_source_; }
		int getImageWidth() const { return image_width_; }
		int getImageHeight() const { return image_height_; }
		const std::vector<AnimationFrame>& getFrames() const { return frames_; }
		bool isAnimated() const { return !frames_.empty(); }
		// nullptr when the tile has no collision shapes.
		std::shared_ptr<ObjectGroup> getColliders() const { return colliders_; }
	private:
		TileDefinition() = delete;
		int local_id_;
		Properties properties_;
		std::string image_source_;
		int image_width_;
		int image_height_;
		std::vector<AnimationFrame> frames_;
		std::shared_ptr<ObjectGroup> colliders_;
	};

	class TileSet
	{
	public:
		explicit TileSet(int first_gid);

		void setName(const std::string& name) { name_ = name; }
		void setSource(const std::string& source) { source_ = source; }
		void setTileDimensions(int width, int height) { tile_width_ = width; tile_height_ = height; }
		void setSpacing(int spacing) { spacing_ = spacing; }
		void setMargin(int margin) { margin_ = margin; }
		void setTileCount(int count) { tile_count_ = count; }
		void setColumns(int columns) { columns_ = columns; }
		void setTileOffset(int x, int y) { tile_offset_x_ = x; tile_offset_y_ = y; }
		void setProperties(Properties* props) { properties_.swap(*props); }
		void addTile(const TileDefinition& t) { tiles_.emplace_back(t); }

		int getFirstId() const { return first_gid_; }
		const std::string& getName() const { return name_; }
		const std::string& getSource() const { return source_; }
		int getTileWidth() const { return tile_width_; }
		int getTileHeight() const { return tile_height_; }
		int getSpacing() const { return spacing_; }
		int getMargin() const { return margin_; }
		int getTileCount() const { return tile_count_; }
		int getColumns() const { return columns_; }
		int getTileOffsetX() const { return tile_offset_x_; }
		int getTileOffsetY() const { return tile_offset_y_; }
		const Properties& getProperties() const { return properties_; }
		const std::vector<TileDefinition>& getTiles() const { return tiles_; }
		const TileDefinition* getTileDefinition(int local_id) const;

		// Source rectangle of a tile within the tileset image.
		rect getImageRect(int local_id) const;
	private:
		int first_gid_;
		std::string name_;
		std::string source_;
		int tile_width_;
		int tile_height_;
		int spacing_;
		int margin_;
		int tile_count_;
		int columns_;
		int tile_offset_x_;
		int tile_offset_y_;
		Properties properties_;
		std::vector<TileDefinition> tiles_;
	};

	class TileLayer
	{
	public:
		explicit TileLayer(const std::string& name);

		void setId(int id) { id_ = id; }
		void setDimensions(int w, int h) { width_ = w; height_ = h; }
		void setOpacity(float o) { opacity_ = o; }
		void setVisibility(bool visible) { is_visible_ = visible; }
		void setProperties(Properties* props) { properties_.swap(*props); }
		void setData(GidGrid&& data) { data_ = std::move(data); }
		void setChunks(std::vector<Chunk>&& chunks) { chunks_ = std::move(chunks); }

		const std::string& getName() const { return name_; }
		int getId() const { return id_; }
		int getWidth() const { return width_; }
		int getHeight() const { return height_; }
		float getOpacity() const { return opacity_; }
		bool isVisible() const { return is_visible_; }
		const Properties& getProperties() const { return properties_; }

		// Rows of internal gids; see Map::getTiledGid().
		const GidGrid& getData() const { return data_; }
		const std::vector<Chunk>& getChunks() const { return chunks_; }

		// 0 outside the layer.
		uint32_t getGid(int x, int y) const;
	private:
		std::string name_;
		int id_;
		int width_;
		int height_;
		float opacity_;
		bool is_visible_;
		Properties properties_;
		GidGrid data_;
		std::vector<Chunk> chunks_;
	};

	class Object
	{
	public:
		Object();

		void setId(int id) { id_ = id; }
		void setName(const std::string& name) { name_ = name; }
		void setType(const std::string& type) { type_ = type; }
		void setTemplate(const std::string& tmpl) { template_ = tmpl; }
		void setPosition(double x, double y) { x_ = x; y_ = y; }
		void setDimensions(double w, double h) { width_ = w; height_ = h; }
		void setRotation(double r) { rotation_ = r; }
		void setVisibility(bool visible) { is_visible_ = visible; }
		void setGid(uint32_t gid) { gid_ = gid; }
		void setProperties(Properties* props) { properties_.swap(*props); }
		// Objects with vertices take their width and height from the shape.
		void setShape(const Shape& shape);
		void clearShape() { shape_.reset(); }

		int getId() const { return id_; }
		const std::string& getName() const { return name_; }
		const std::string& getType() const { return type_; }
		const std::string& getTemplate() const { return template_; }
		double x() const { return x_; }
		double y() const { return y_; }
		double getWidth() const { return width_; }
		double getHeight() const { return height_; }
		double getRotation() const { return rotation_; }
		bool isVisible() const { return is_visible_; }
		uint32_t getGid() const { return gid_; }
		const Properties& getProperties() const { return properties_; }
		const Shape* getShape() const { return shape_ ? &*shape_ : nullptr; }

		bool isTileObject() const { return gid_ != 0 && (!shape_ || shape_->getKind() == ShapeKind::RECTANGLE); }
		// "tile" for tile objects, otherwise the shape kind.
		std::string getObjectType() const;

		// Corners of the object's box: (x,y), (x,y+h), (x+w,y+h), (x+w,y).
		std::vector<pointf> asPoints() const;
		// Shape vertices, or asPoints() without any, rotated about (x,y).
		std::vector<pointf> applyTransformations() const;
		bool asEllipse(pointf* centre, double* rx, double* ry) const;

		rect getBoundingBox() const;
		bool collidesWithPoint(double x, double y) const;
		bool intersectsWithRect(const rect& r) const;
		bool intersectsWithObject(const Object& other) const;
		Result<bool> intersectsWithPolygon(const Object& other) const;

		void adjustGidObjectPosition(Orientation orientation, int rotation, int tile_width, int tile_height, bool invert_y);
	private:
		int id_;
		std::string name_;
		std::string type_;
		std::string template_;
		double x_;
		double y_;
		double width_;
		double height_;
		double rotation_;
		bool is_visible_;
		uint32_t gid_;
		Properties properties_;
		boost::optional<Shape> shape_;
	};

	class ObjectGroup
	{
	public:
		explicit ObjectGroup(const std::string& name);

		void setId(int id) { id_ = id; }
		void setColor(const std::string& color) { color_ = color; }
		void setOpacity(float o) { opacity_ = o; }
		void setVisibility(bool visible) { is_visible_ = visible; }
		void setDrawOrder(const std::string& order) { draw_order_ = order; }
		void setProperties(Properties* props) { properties_.swap(*props); }
		void addObject(const Object& obj) { objects_.emplace_back(obj); }

		const std::string& getName() const { return name_; }
		int getId() const { return id_; }
		const std::string& getColor() const { return color_; }
		float getOpacity() const { return opacity_; }
		bool isVisible() const { return is_visible_; }
		const std::string& getDrawOrder() const { return draw_order_; }
		const Properties& getProperties() const { return properties_; }
		const std::vector<Object>& getObjects() const { return objects_; }
		std::vector<Object>& getObjects() { return objects_; }
	private:
		std::string name_;
		int id_;
		std::string color_;
		float opacity_;
		bool is_visible_;
		std::string draw_order_;
		Properties properties_;
		std::vector<Object> objects_;
	};

	class Map : public GidRegistry
	{
	public:
		explicit Map(FlagCachePtr cache=FlagCachePtr());
		static MapPtr create(FlagCachePtr cache=FlagCachePtr());

		void setVersion(const std::string& version) { version_ = version; }
		void setDimensions(int w, int h) { width_ = w; height_ = h; }
		void setTileDimensions(int w, int h) { tile_width_ = w; tile_height_ = h; }
		void setOrientation(Orientation o) { orientation_ = o; }
		void setRenderOrder(const std::string& ro) { render_order_ = ro; }
		void setInfinite(bool infinite) { infinite_ = infinite; }
		void setStaggerAxis(StaggerAxis axis) { stagger_axis_ = axis; }
		void setStaggerIndex(StaggerIndex si) { stagger_index_ = si; }
		void setHexsideLength(int length) { hexside_length_ = length; }
		void setBackgroundColor(const std::string& color) { background_color_ = color; }
		void setProperties(Properties* props) { properties_.swap(*props); }
		void addTileSet(const TileSet& ts) { tile_sets_.emplace_back(ts); }
		void addLayer(std::shared_ptr<TileLayer> layer) { layers_.emplace_back(layer); }
		void addObjectGroup(std::shared_ptr<ObjectGroup> group) { object_groups_.emplace_back(group); }

		const std::string& getVersion() const { return version_; }
		int getWidth() const { return width_; }
		int getHeight() const { return height_; }
		int getTileWidth() const { return tile_width_; }
		int getTileHeight() const { return tile_height_; }
		Orientation getOrientation() const { return orientation_; }
		const std::string& getRenderOrder() const { return render_order_; }
		bool isInfinite() const { return infinite_; }
		StaggerAxis getStaggerAxis() const { return stagger_axis_; }
		StaggerIndex getStaggerIndex() const { return stagger_index_; }
		int getHexsideLength() const { return hexside_length_; }
		const std::string& getBackgroundColor() const { return background_color_; }
		const Properties& getProperties() const { return properties_; }
		const std::vector<TileSet>& getTileSets() const { return tile_sets_; }
		const std::vector<std::shared_ptr<TileLayer>>& getLayers() const { return layers_; }
		const std::vector<std::shared_ptr<ObjectGroup>>& getObjectGroups() const { return object_groups_; }

		std::shared_ptr<TileLayer> getLayerByName(const std::string& name) const;
		std::shared_ptr<ObjectGroup> getObjectGroupByName(const std::string& name) const;
		const Object* getObjectByName(const std::string& name) const;
		// The tileset a Tiled gid (flags stripped) belongs to, or nullptr.
		const TileSet* getTileSetForGid(uint32_t tiled_gid) const;
		// Per-tile data for an internal gid, or nullptr.
		const TileDefinition* getTileDefinition(uint32_t internal_gid) const;

		// Gid normalization. Each distinct (tiled gid, flags) pair gets its own
		// internal gid, handed out from 1 upwards; 0 always stays 0.
		uint32_t registerGid(uint32_t tiled_gid, const TileFlags& flags=TileFlags());
		uint32_t registerGidCheckFlags(uint32_t raw) override;
		std::vector<uint32_t> mapGid(uint32_t tiled_gid) const;
		uint32_t getTiledGid(uint32_t internal_gid) const;
		TileFlags getTileFlags(uint32_t internal_gid) const;
		size_t getRegisteredGidCount() const { return internal_to_tiled_.size(); }

		point pixelToTile(const pointf& pixel) const;
		pointf tileToPixel(const point& tile) const;
	private:
		std::string version_;
		int width_;
		int height_;
		int tile_width_;
		int tile_height_;
		Orientation orientation_;
		std::string render_order_;
		bool infinite_;
		StaggerAxis stagger_axis_;
		StaggerIndex stagger_index_;
		int hexside_length_;
		std::string background_color_;

		std::vector<TileSet> tile_sets_;
		Properties properties_;
		std::vector<std::shared_ptr<TileLayer>> layers_;
		std::vector<std::shared_ptr<ObjectGroup>> object_groups_;

		GidCodec codec_;
		uint32_t max_gid_;
		// raw (tiled gid | flag bits) -> internal gid
		std::map<uint32_t, uint32_t> gid_lookup_;
		std::map<uint32_t, std::vector<uint32_t>> tiled_to_internal_;
		// internal gid -> raw (tiled gid | flag bits)
		std::map<uint32_t, uint32_t> internal_to_tiled_;
	};
}
