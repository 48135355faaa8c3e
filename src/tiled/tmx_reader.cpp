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

// Built based on information from https://github.com/bjorn/tiled/wiki/TMX-Map-Format

#include <algorithm>
#include <iostream>
#include <sstream>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "asserts.hpp"
#include "base64.hpp"
#include "compress.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "preferences.hpp"
#include "profile_timer.hpp"
#include "string_utils.hpp"
#include "tmx_reader.hpp"
#include "unit_test.hpp"

PREF_INT(ellipse_segments, 16, "Number of vertices generated for ellipse objects");
PREF_BOOL(adjust_tile_objects, false, "Move tile objects from their editor anchor to their top-left corner when loading");
PREF_BOOL(invert_tile_objects, false, "When adjusting tile objects, treat their y position as the bottom edge");

namespace tiled
{
	using namespace boost::property_tree;

	namespace
	{
		// Attribute access for one element, optionally falling back to a
		// template's element. Conversion failures are remembered, first one
		// wins, and the default value is returned in their place.
		class AttributeReader
		{
		public:
			AttributeReader(const ptree& node, const std::string& element, const ptree* fallback=nullptr)
				: node_(node), fallback_(fallback), element_(element)
			{}

			boost::optional<std::string> find(const std::string& name) const {
				auto v = node_.get_child_optional("<xmlattr>." + name);
				if(v) {
					return v->data();
				}
				if(fallback_ != nullptr) {
					auto f = fallback_->get_child_optional("<xmlattr>." + name);
					if(f) {
						return f->data();
					}
				}
				return boost::none;
			}

			bool has(const std::string& name) const { return find(name).is_initialized(); }

			std::string getString(const std::string& name, const std::string& default_value=std::string()) const {
				auto v = find(name);
				return v ? *v : default_value;
			}

			template<typename T>
			T get(const std::string& name, const T& default_value) {
				auto v = find(name);
				if(!v) {
					return default_value;
				}
				try {
					return boost::lexical_cast<T>(util::strip_copy(*v));
				} catch(boost::bad_lexical_cast&) {
					fail(TILED_ERROR(INVALID_VALUE, "Attribute '" << name << "' of <" << element_ << "> has an invalid value: '" << *v << "'"));
				}
				return default_value;
			}

			template<typename T>
			T require(const std::string& name) {
				if(!has(name)) {
					fail(TILED_ERROR(INVALID_MAP, "<" << element_ << "> element is missing the required '" << name << "' attribute"));
					return T();
				}
				return get<T>(name, T());
			}

			bool getBool(const std::string& name, bool default_value) {
				auto v = find(name);
				if(!v) {
					return default_value;
				}
				auto res = convert_to_bool(*v);
				if(!res) {
					fail(res.error());
					return default_value;
				}
				return res.value();
			}

			uint32_t getGid(const std::string& name) {
				const int64_t v = get<int64_t>(name, 0);
				if(v < 0 || v > 0xffffffffLL) {
					fail(TILED_ERROR(INVALID_VALUE, "Attribute '" << name << "' of <" << element_ << "> is not a valid gid: " << v));
					return 0;
				}
				return static_cast<uint32_t>(v);
			}

			bool ok() const { return !error_.is_initialized(); }
			const Error& error() const { return *error_; }
		private:
			void fail(const Error& e) {
				if(!error_) {
					error_ = e;
				}
			}

			const ptree& node_;
			const ptree* fallback_;
			std::string element_;
			boost::optional<Error> error_;
		};

		Result<ptree> read_xml_string(const std::string& str, const std::string& what)
		{
			ptree pt;
			try {
				std::stringstream ss(str);
				read_xml(ss, pt);
			} catch(xml_parser_error& e) {
				return TILED_ERROR(INVALID_MAP, "Failed to read " << what << ": " << e.what());
			}
			return pt;
		}

		std::string resolve_path(const std::string& base_dir, const std::string& fname)
		{
			return sys::is_path_absolute(fname) ? fname : sys::join_path(base_dir, fname);
		}

		bool has_shape_element(const ptree& pt)
		{
			static const char* const shape_tags[] = { "polygon", "polyline", "ellipse", "point", "text" };
			for(auto tag : shape_tags) {
				if(pt.get_child_optional(tag)) {
					return true;
				}
			}
			return false;
		}

		int normalize_rotation(double rotation)
		{
			const int r = static_cast<int>(rotation) % 360;
			return r < 0 ? r + 360 : r;
		}
	}

	TmxReader::TmxReader(MapPtr map)
		: map_(map)
	{
	}

	Result<void> TmxReader::parseFile(const std::string& filename)
	{
		if(!sys::file_exists(filename)) {
			return TILED_ERROR(INVALID_MAP, "Unable to read map file: " << filename);
		}
		base_dir_ = sys::get_dir_name(filename);
		LOG_INFO("Loading map " << filename);
		profile::manager timer("parse " + filename);
		return parseString(sys::read_file(filename));
	}

	Result<void> TmxReader::parseString(const std::string& str)
	{
		auto pt = read_xml_string(str, "TMX data");
		if(!pt) {
			return pt.error();
		}
		auto map_node = pt.value().get_child_optional("map");
		if(!map_node) {
			return TILED_ERROR(INVALID_MAP, "No <map> element found");
		}
		return parseMapElement(*map_node);
	}

	Result<void> TmxReader::addTemplate(const std::string& name, const std::string& xml)
	{
		auto pt = read_xml_string(xml, "template " + name);
		if(!pt) {
			return pt.error();
		}
		auto obj = pt.value().get_child_optional("template.object");
		if(!obj) {
			return TILED_ERROR(INVALID_MAP, "Template '" << name << "' has no <object> element");
		}
		templates_[name] = *obj;
		return Result<void>();
	}

	const ptree* TmxReader::findTemplate(const std::string& name)
	{
		auto it = templates_.find(name);
		if(it != templates_.end()) {
			return &it->second;
		}

		const std::string fname = resolve_path(base_dir_, name);
		if(!sys::file_exists(fname)) {
			return nullptr;
		}
		auto res = addTemplate(name, sys::read_file(fname));
		if(!res) {
			LOG_ERROR("Failed to load template " << fname << ": " << res.error());
			return nullptr;
		}
		return &templates_[name];
	}

	Result<void> TmxReader::parseMapElement(const ptree& pt)
	{
		AttributeReader attributes(pt, "map");
		map_->setVersion(attributes.getString("version"));
		map_->setOrientation(convert_orientation(attributes.getString("orientation", "orthogonal")));
		const int width = attributes.require<int>("width");
		const int height = attributes.require<int>("height");
		map_->setDimensions(width, height);
		const int tilewidth = attributes.require<int>("tilewidth");
		const int tileheight = attributes.require<int>("tileheight");
		map_->setTileDimensions(tilewidth, tileheight);
		map_->setInfinite(attributes.getBool("infinite", false));
		map_->setRenderOrder(attributes.getString("renderorder", "right-down"));
		if(attributes.has("staggeraxis")) {
			map_->setStaggerAxis(convert_stagger_axis(attributes.getString("staggeraxis")));
		}
		if(attributes.has("staggerindex")) {
			map_->setStaggerIndex(convert_stagger_index(attributes.getString("staggerindex")));
		}
		map_->setHexsideLength(attributes.get<int>("hexsidelength", 0));
		map_->setBackgroundColor(attributes.getString("backgroundcolor"));
		if(!attributes.ok()) {
			return attributes.error();
		}

		for(auto& v : pt) {
			if(v.first == "properties") {
				auto props = parseProperties(v.second);
				map_->setProperties(&props);
			} else if(v.first == "tileset") {
				auto ts = parseTileset(v.second);
				if(!ts) {
					return ts.error();
				}
				map_->addTileSet(ts.value());
			}
		}

		// layers after tilesets, since tilesets may follow the layers using them.
		return parseLayers(pt);
	}

	Result<void> TmxReader::parseLayers(const ptree& pt)
	{
		for(auto& v : pt) {
			if(v.first == "layer") {
				auto layer = parseLayerElement(v.second);
				if(!layer) {
					return layer.error();
				}
				map_->addLayer(layer.value());
			} else if(v.first == "objectgroup") {
				auto group = parseObjectGroup(v.second);
				if(!group) {
					return group.error();
				}
				map_->addObjectGroup(group.value());
			} else if(v.first == "group") {
				LOG_DEBUG("Flattening group layer '" << v.second.get<std::string>("<xmlattr>.name", "") << "'");
				auto res = parseLayers(v.second);
				if(!res) {
					return res;
				}
			} else if(v.first == "imagelayer") {
				LOG_DEBUG("Ignoring image layer '" << v.second.get<std::string>("<xmlattr>.name", "") << "'");
			}
		}
		return Result<void>();
	}

	Result<TileSet> TmxReader::parseTileset(const ptree& pt)
	{
		AttributeReader attributes(pt, "tileset");
		TileSet ts(attributes.require<int>("firstgid"));
		if(!attributes.ok()) {
			return attributes.error();
		}

		const ptree* definition = &pt;
		ptree external;
		auto source = attributes.find("source");
		if(source) {
			ts.setSource(*source);
			const std::string fname = resolve_path(base_dir_, *source);
			if(sys::file_exists(fname)) {
				auto tsx = read_xml_string(sys::read_file(fname), "tileset " + fname);
				if(!tsx) {
					return tsx.error();
				}
				external = tsx.value();
				auto node = external.get_child_optional("tileset");
				if(!node) {
					return TILED_ERROR(INVALID_MAP, "Tileset file " << fname << " has no <tileset> element");
				}
				definition = &*node;
			} else {
				LOG_WARN("Tileset source '" << fname << "' not found, only the reference in the map is used");
			}
		}

		AttributeReader def(*definition, "tileset");
		ts.setName(def.getString("name"));
		ts.setTileDimensions(def.get<int>("tilewidth", map_->getTileWidth()), def.get<int>("tileheight", map_->getTileHeight()));
		ts.setSpacing(def.get<int>("spacing", 0));
		ts.setMargin(def.get<int>("margin", 0));
		ts.setTileCount(def.get<int>("tilecount", 0));
		ts.setColumns(def.get<int>("columns", 0));
		if(!def.ok()) {
			return def.error();
		}

		for(auto& v : *definition) {
			if(v.first == "properties") {
				auto props = parseProperties(v.second);
				ts.setProperties(&props);
			} else if(v.first == "tileoffset") {
				AttributeReader offset(v.second, "tileoffset");
				ts.setTileOffset(offset.get<int>("x", 0), offset.get<int>("y", 0));
				if(!offset.ok()) {
					return offset.error();
				}
			} else if(v.first == "tile") {
				auto td = parseTileElement(ts, v.second);
				if(!td) {
					return td.error();
				}
				ts.addTile(td.value());
			}
		}
		return ts;
	}

	Result<TileDefinition> TmxReader::parseTileElement(const TileSet& ts, const ptree& pt)
	{
		AttributeReader attributes(pt, "tile");
		TileDefinition res(attributes.require<int>("id"));
		if(!attributes.ok()) {
			return attributes.error();
		}
		if(res.getLocalId() < 0) {
			return TILED_ERROR(INVALID_VALUE, "Tile id must not be negative: " << res.getLocalId());
		}

		for(auto& v : pt) {
			if(v.first == "properties") {
				auto props = parseProperties(v.second);
				res.setProperties(&props);
			} else if(v.first == "image") {
				// Image collection tiles carry their own image and size.
				AttributeReader image(v.second, "image");
				res.setImage(image.getString("source"), image.get<int>("width", ts.getTileWidth()), image.get<int>("height", ts.getTileHeight()));
				if(!image.ok()) {
					return image.error();
				}
			} else if(v.first == "animation") {
				for(auto& f : v.second) {
					if(f.first != "frame") {
						continue;
					}
					AttributeReader frame(f.second, "frame");
					const int tile_id = frame.require<int>("tileid");
					const int duration = frame.require<int>("duration");
					if(!frame.ok()) {
						return frame.error();
					}
					if(tile_id < 0 || duration < 0) {
						return TILED_ERROR(INVALID_VALUE, "Animation frame of tile " << res.getLocalId() 
							<< " has a negative tile id or duration: " << tile_id << ", " << duration);
					}
					res.addFrame(AnimationFrame(map_->registerGid(static_cast<uint32_t>(static_cast<int64_t>(tile_id) + ts.getFirstId())), duration));
				}
			} else if(v.first == "objectgroup") {
				auto colliders = parseObjectGroup(v.second);
				if(!colliders) {
					return colliders.error();
				}
				res.setColliders(colliders.value());
			}
		}
		return res;
	}

	Properties TmxReader::parseProperties(const ptree& pt)
	{
		Properties res;

		// No attributes are expected
		for(auto& v : pt) {
			if(v.first == "property") {
				auto prop = v.second.get_child_optional("<xmlattr>");
				if(prop) {
					const std::string name = prop->get<std::string>("name", "");
					// multi-line values are stored as the element's text.
					const std::string value = prop->get<std::string>("value", v.second.data());
					res.emplace_back(name, value, prop->get<std::string>("type", "string"));
				}
			} else if(v.first != "<xmlattr>") {
				LOG_WARN("Ignoring element '" << v.first << "' as child of 'properties' element");
			}
		}

		return res;
	}

	Result<std::shared_ptr<TileLayer>> TmxReader::parseLayerElement(const ptree& pt)
	{
		AttributeReader attributes(pt, "layer");
		auto res = std::make_shared<TileLayer>(attributes.getString("name"));
		res->setId(attributes.get<int>("id", 0));
		res->setDimensions(attributes.get<int>("width", map_->getWidth()), attributes.get<int>("height", map_->getHeight()));
		res->setOpacity(attributes.get<float>("opacity", 1.0f));
		res->setVisibility(attributes.getBool("visible", true));
		if(!attributes.ok()) {
			return attributes.error();
		}

		for(auto& v : pt) {
			if(v.first == "properties") {
				auto props = parseProperties(v.second);
				res->setProperties(&props);
			} else if(v.first == "data") {
				auto data = parseDataElement(v.second, res.get());
				if(!data) {
					return data.error();
				}
			}
		}
		return res;
	}

	Result<void> TmxReader::parseDataElement(const ptree& pt, TileLayer* layer)
	{
		AttributeReader attributes(pt, "data");
		const std::string encoding = attributes.getString("encoding");
		const std::string compression = attributes.getString("compression");

		std::vector<ChunkRecord> records;
		for(auto& v : pt) {
			if(v.first == "tile") {
				return TILED_ERROR(UNSUPPORTED_TILE_FORMAT, "Layer '" << layer->getName() << "' stores its tiles as <tile> elements, save the map with csv or base64 encoding");
			} else if(v.first == "chunk") {
				AttributeReader chunk_attributes(v.second, "chunk");
				ChunkRecord rec;
				rec.x = chunk_attributes.find("x");
				rec.y = chunk_attributes.find("y");
				rec.width = chunk_attributes.find("width");
				rec.height = chunk_attributes.find("height");
				if(!util::is_blank(v.second.data())) {
					rec.text = v.second.data();
				}
				records.emplace_back(rec);
			}
		}

		if(!records.empty()) {
			auto chunks = extract_chunks(records, encoding, compression);
			if(!chunks) {
				return chunks.error();
			}
			layer->setData(stitch_chunks(chunks.value(), layer->getWidth(), layer->getHeight(), *map_));
			layer->setChunks(std::move(chunks.value()));
			return Result<void>();
		}

		auto gids = decode_gids(pt.data(), encoding, compression);
		if(!gids) {
			return gids.error();
		}
		std::vector<uint32_t>& data = gids.value();
		if(data.empty()) {
			LOG_DEBUG("Layer '" << layer->getName() << "' has no tile data");
			return Result<void>();
		}
		if(layer->getWidth() <= 0) {
			return TILED_ERROR(INVALID_MAP, "Layer '" << layer->getName() << "' has tile data but a width of " << layer->getWidth());
		}

		const size_t expected = static_cast<size_t>(layer->getWidth()) * std::max(layer->getHeight(), 0);
		if(data.size() != expected) {
			LOG_WARN("Layer '" << layer->getName() << "' has " << data.size() << " tiles, expected " << expected);
		}
		for(auto& gid : data) {
			gid = map_->registerGidCheckFlags(gid);
		}
		layer->setData(reshape(data, layer->getWidth()));
		return Result<void>();
	}

	Result<std::shared_ptr<ObjectGroup>> TmxReader::parseObjectGroup(const ptree& pt)
	{
		AttributeReader attributes(pt, "objectgroup");
		auto res = std::make_shared<ObjectGroup>(attributes.getString("name"));
		res->setId(attributes.get<int>("id", 0));
		res->setColor(attributes.getString("color"));
		res->setOpacity(attributes.get<float>("opacity", 1.0f));
		res->setVisibility(attributes.getBool("visible", true));
		res->setDrawOrder(attributes.getString("draworder", "topdown"));
		if(!attributes.ok()) {
			return attributes.error();
		}

		for(auto& v : pt) {
			if(v.first == "properties") {
				auto props = parseProperties(v.second);
				res->setProperties(&props);
			} else if(v.first == "object") {
				auto obj = parseObject(v.second);
				if(!obj) {
					return obj.error();
				}
				res->addObject(obj.value());
			}
		}
		return res;
	}

	Result<Object> TmxReader::parseObject(const ptree& pt)
	{
		const ptree* tmpl = nullptr;
		auto template_name = pt.get_optional<std::string>("<xmlattr>.template");
		if(template_name) {
			tmpl = findTemplate(*template_name);
			if(tmpl == nullptr) {
				LOG_WARN("Template '" << *template_name << "' not found, using the object's own attributes");
			}
		}

		AttributeReader attributes(pt, "object", tmpl);
		Object res;
		res.setId(attributes.get<int>("id", 0));
		res.setName(attributes.getString("name"));
		// "class" replaced "type" in newer versions of the editor.
		res.setType(attributes.has("type") ? attributes.getString("type") : attributes.getString("class"));
		const double x = attributes.get<double>("x", 0.0);
		const double y = attributes.get<double>("y", 0.0);
		const double width = attributes.get<double>("width", 0.0);
		const double height = attributes.get<double>("height", 0.0);
		res.setPosition(x, y);
		res.setDimensions(width, height);
		res.setRotation(attributes.get<double>("rotation", 0.0));
		res.setVisibility(attributes.getBool("visible", true));
		const uint32_t raw_gid = attributes.getGid("gid");
		if(!attributes.ok()) {
			return attributes.error();
		}
		if(template_name) {
			res.setTemplate(*template_name);
		}
		if(raw_gid != 0) {
			res.setGid(map_->registerGidCheckFlags(raw_gid));
		}

		Properties props;
		if(tmpl != nullptr) {
			auto tmpl_props = tmpl->get_child_optional("properties");
			if(tmpl_props) {
				props = parseProperties(*tmpl_props);
			}
		}
		auto node_props = pt.get_child_optional("properties");
		if(node_props) {
			props = merge_properties(props, parseProperties(*node_props));
		}
		res.setProperties(&props);

		const ptree& shape_node = (tmpl != nullptr && !has_shape_element(pt)) ? *tmpl : pt;
		// The box of a tile object is anchored where the object ends up.
		if(g_adjust_tile_objects && raw_gid != 0 && !has_shape_element(shape_node)) {
			res.adjustGidObjectPosition(map_->getOrientation(), normalize_rotation(res.getRotation()), 
				map_->getTileWidth(), map_->getTileHeight(), g_invert_tile_objects);
		}
		auto shape = parse_shape(shape_node, res.x(), res.y(), width, height, g_ellipse_segments);
		if(!shape) {
			return shape.error();
		}
		res.setShape(shape.value());
		return res;
	}
}

COMMAND_LINE_UTILITY(tmx_info)
{
	ASSERT_LOG(args.size() == 1, "Usage: --utility=tmx_info FILE");
	auto map = tiled::Map::create();
	tiled::TmxReader reader(map);
	auto res = reader.parseFile(args[0]);
	ASSERT_LOG(res.ok(), "Failed to load " << args[0] << ": " << res.error());

	std::cout << args[0] << ": " << tiled::orientation_name(map->getOrientation()) << " "
		<< map->getWidth() << "x" << map->getHeight() << " tiles of "
		<< map->getTileWidth() << "x" << map->getTileHeight() << " pixels"
		<< (map->isInfinite() ? ", infinite" : "") << "\n";
	for(auto& ts : map->getTileSets()) {
		std::cout << "  tileset '" << ts.getName() << "' firstgid " << ts.getFirstId() << "\n";
	}
	for(auto& layer : map->getLayers()) {
		int used = 0;
		for(auto& row : layer->getData()) {
			used += static_cast<int>(std::count_if(row.begin(), row.end(), [](uint32_t g) { return g != 0; }));
		}
		std::cout << "  layer '" << layer->getName() << "' " << layer->getWidth() << "x" << layer->getHeight() 
			<< ", " << used << " tiles";
		if(!layer->getChunks().empty()) {
			std::cout << " in " << layer->getChunks().size() << " chunks";
		}
		std::cout << "\n";
	}
	for(auto& group : map->getObjectGroups()) {
		std::cout << "  object group '" << group->getName() << "', " << group->getObjects().size() << " objects\n";
		for(auto& obj : group->getObjects()) {
			std::cout << "    " << obj.getId() << " '" << obj.getName() << "' " << obj.getObjectType() 
				<< " bounds " << obj.getBoundingBox() << "\n";
		}
	}
	std::cout << "  " << map->getRegisteredGidCount() << " distinct tiles\n";
}

namespace
{
	const char* const basic_map = 
		"<?xml version='1.0' encoding='UTF-8'?>"
		"<map version='1.10' orientation='orthogonal' renderorder='right-down' width='4' height='2' tilewidth='32' tileheight='32' infinite='0' backgroundcolor='#112233'>"
		" <properties>"
		"  <property name='music' value='theme.ogg'/>"
		"  <property name='dark' type='bool' value='true'/>"
		" </properties>"
		" <tileset firstgid='1' name='terrain' tilewidth='32' tileheight='32' tilecount='64' columns='8'>"
		"  <tileoffset x='2' y='-4'/>"
		" </tileset>"
		" <layer id='1' name='ground' width='4' height='2'>"
		"  <data encoding='csv'>\n1,2,0,2147483649,\n3,3,0,0\n</data>"
		" </layer>"
		" <objectgroup id='2' name='things'>"
		"  <object id='1' name='box' x='10' y='20' width='30' height='40'/>"
		"  <object id='2' name='poly' x='100' y='100'><polygon points='0,0 10,0 10,10 0,10'/></object>"
		"  <object id='3' name='blob' x='0' y='0' width='20' height='10'><ellipse/></object>"
		"  <object id='4' name='sign' x='5' y='5' width='50' height='10'><text wrap='1'>Welcome</text></object>"
		"  <object id='5' name='coin' gid='2147483650' x='64' y='64' width='32' height='32'/>"
		"  <object id='6' name='spawn' x='1' y='2'><point/></object>"
		" </objectgroup>"
		"</map>";

	std::string map_with_layer(const std::string& data_element)
	{
		return "<map orientation='orthogonal' width='2' height='2' tilewidth='16' tileheight='16'>"
			"<layer name='l' width='2' height='2'>" + data_element + "</layer></map>";
	}

	std::string map_with_object(const std::string& object_element)
	{
		return "<map orientation='orthogonal' width='2' height='2' tilewidth='16' tileheight='16'>"
			"<objectgroup name='g'>" + object_element + "</objectgroup></map>";
	}

	tiled::Result<void> parse(tiled::MapPtr map, const std::string& xml)
	{
		tiled::TmxReader reader(map);
		return reader.parseString(xml);
	}
}

UNIT_TEST(tmx_reader_basic_map)
{
	auto map = tiled::Map::create();
	auto res = parse(map, basic_map);
	CHECK(res.ok(), res.error());

	CHECK_EQ(map->getVersion(), "1.10");
	CHECK(map->getOrientation() == tiled::Orientation::ORTHOGONAL, "wrong orientation");
	CHECK_EQ(map->getWidth(), 4);
	CHECK_EQ(map->getTileHeight(), 32);
	CHECK_EQ(map->getBackgroundColor(), "#112233");
	CHECK(!map->isInfinite(), "finite map reported infinite");

	const tiled::Property* dark = tiled::find_property(map->getProperties(), "dark");
	CHECK(dark != nullptr, "map property missing");
	CHECK_EQ(dark->type, "bool");
	CHECK(dark->asBool().value(), "bool property not true");

	CHECK_EQ(map->getTileSets().size(), 1);
	CHECK_EQ(map->getTileSets()[0].getName(), "terrain");
	CHECK_EQ(map->getTileSets()[0].getColumns(), 8);
	CHECK_EQ(map->getTileSets()[0].getTileOffsetY(), -4);

	auto ground = map->getLayerByName("ground");
	CHECK(ground != nullptr, "layer missing");
	CHECK_EQ(ground->getData(), (tiled::GidGrid{{1, 2, 0, 3}, {4, 4, 0, 0}}));
	CHECK_EQ(map->getTiledGid(3), 1);
	CHECK_EQ(map->getTileFlags(3), tiled::TileFlags(true, false, false));
	CHECK_EQ(ground->getGid(1, 0), 2);
}

UNIT_TEST(tmx_reader_objects)
{
	auto map = tiled::Map::create();
	auto res = parse(map, basic_map);
	CHECK(res.ok(), res.error());

	auto group = map->getObjectGroupByName("things");
	CHECK(group != nullptr, "object group missing");
	CHECK_EQ(group->getObjects().size(), 6);

	const tiled::Object* box = map->getObjectByName("box");
	CHECK_EQ(box->getObjectType(), "rectangle");
	CHECK_EQ(box->getShape()->getPoints(), tiled::generate_rectangle_points(10, 20, 30, 40));

	const tiled::Object* poly = map->getObjectByName("poly");
	CHECK_EQ(poly->getObjectType(), "polygon");
	CHECK_EQ(poly->getWidth(), 10.0);
	CHECK(poly->collidesWithPoint(105, 105), "point inside polygon object missed");

	const tiled::Object* blob = map->getObjectByName("blob");
	CHECK_EQ(blob->getObjectType(), "ellipse");
	CHECK_EQ(blob->getShape()->getPoints().size(), 16);

	const tiled::Object* sign = map->getObjectByName("sign");
	CHECK_EQ(sign->getObjectType(), "text");
	CHECK_EQ(sign->getShape()->getText()->text, "Welcome");
	CHECK(sign->getShape()->getText()->wrap, "wrap flag not read");
	CHECK_EQ(sign->getWidth(), 50.0);

	const tiled::Object* coin = map->getObjectByName("coin");
	CHECK_EQ(coin->getObjectType(), "tile");
	CHECK_EQ(map->getTiledGid(coin->getGid()), 2);
	CHECK(map->getTileFlags(coin->getGid()).flipped_horizontally, "coin flip flag lost");

	const tiled::Object* spawn = map->getObjectByName("spawn");
	CHECK_EQ(spawn->getObjectType(), "point");
	CHECK(!spawn->getShape()->hasPoints(), "point object has vertices");
}

UNIT_TEST(tmx_reader_encoded_layers)
{
	std::vector<char> bytes;
	const uint32_t gids[] = { 1, 0, 0x40000002U, 1 };
	for(auto g : gids) {
		for(int n = 0; n != 4; ++n) {
			bytes.push_back(static_cast<char>((g >> (8 * n)) & 0xff));
		}
	}

	auto map = tiled::Map::create();
	auto res = parse(map, map_with_layer("<data encoding='base64' compression='zlib'>\n   " + base64::b64encode(zip::compress(bytes)) + "\n  </data>"));
	CHECK(res.ok(), res.error());
	CHECK_EQ(map->getLayers()[0]->getData(), (tiled::GidGrid{{1, 0}, {2, 1}}));
	CHECK(map->getTileFlags(2).flipped_vertically, "vertical flip lost");

	map = tiled::Map::create();
	res = parse(map, map_with_layer("<data encoding='base64' compression='gzip'>" + base64::b64encode(zip::gzip_compress(bytes)) + "</data>"));
	CHECK(res.ok(), res.error());
	CHECK_EQ(map->getLayers()[0]->getData(), (tiled::GidGrid{{1, 0}, {2, 1}}));
}

UNIT_TEST(tmx_reader_infinite_map)
{
	auto map = tiled::Map::create();
	auto res = parse(map, 
		"<map orientation='orthogonal' width='4' height='2' tilewidth='16' tileheight='16' infinite='1'>"
		" <layer id='1' name='world' width='4' height='2'>"
		"  <data encoding='csv'>"
		"   <chunk x='0' y='0' width='2' height='2'>1,2,3,4</chunk>"
		"   <chunk x='2' y='0' width='2' height='2'>5,6,7,8</chunk>"
		"  </data>"
		" </layer>"
		"</map>");
	CHECK(res.ok(), res.error());
	CHECK(map->isInfinite(), "infinite flag not read");
	auto world = map->getLayerByName("world");
	CHECK_EQ(world->getChunks().size(), 2);
	CHECK_EQ(world->getData(), (tiled::GidGrid{{1, 2, 5, 6}, {3, 4, 7, 8}}));

	map = tiled::Map::create();
	res = parse(map, map_with_layer("<data encoding='csv'><chunk x='a' y='0' width='2' height='2'>1,2,3,4</chunk></data>"));
	CHECK(!res.ok(), "bad chunk attribute accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_CHUNK_ATTRIBUTE, res.error());
}

UNIT_TEST(tmx_reader_templates)
{
	auto map = tiled::Map::create();
	tiled::TmxReader reader(map);
	auto added = reader.addTemplate("crate.tx", 
		"<template><object name='crate' type='prop' width='16' height='16'>"
		"<properties><property name='weight' value='10'/><property name='breakable' value='true'/></properties>"
		"</object></template>");
	CHECK(added.ok(), added.error());
	added = reader.addTemplate("tri.tx", "<template><object name='tri'><polygon points='0,0 8,0 4,6'/></object></template>");
	CHECK(added.ok(), added.error());

	auto res = reader.parseString(map_with_object(
		"<object id='7' template='crate.tx' x='50' y='60'><properties><property name='weight' value='20'/></properties></object>"
		"<object id='8' template='tri.tx' name='spike' x='10' y='10'/>"));
	CHECK(res.ok(), res.error());

	const tiled::Object* crate = map->getObjectByName("crate");
	CHECK(crate != nullptr, "templated object lost its name");
	CHECK_EQ(crate->getId(), 7);
	CHECK_EQ(crate->getType(), "prop");
	CHECK_EQ(crate->getTemplate(), "crate.tx");
	CHECK_EQ(crate->getWidth(), 16.0);
	CHECK_EQ(crate->getBoundingBox(), rect::from_coordinates(50, 60, 66, 76));
	CHECK_EQ(tiled::find_property(crate->getProperties(), "weight")->value, "20");
	CHECK_EQ(tiled::find_property(crate->getProperties(), "breakable")->value, "true");

	const tiled::Object* spike = map->getObjectByName("spike");
	CHECK(spike != nullptr, "node name does not override the template");
	CHECK_EQ(spike->getObjectType(), "polygon");
	CHECK_EQ(spike->getShape()->getPoints(), (std::vector<pointf>{pointf(10, 10), pointf(18, 10), pointf(14, 16)}));
	CHECK_EQ(spike->getHeight(), 6.0);

	auto bad = reader.addTemplate("empty.tx", "<template/>");
	CHECK(!bad.ok(), "template without object accepted");
}

UNIT_TEST(tmx_reader_template_files)
{
	const std::string tmpl_file = sys::get_temp_file_name(".tx");
	const std::string map_file = sys::join_path(sys::get_dir_name(tmpl_file), "level-" + sys::get_base_name(tmpl_file) + ".tmx");
	sys::write_file(tmpl_file, "<template><object name='door' width='8' height='24'/></template>");
	sys::write_file(map_file, map_with_object("<object template='" + sys::get_base_name(tmpl_file) + "' x='4' y='4'/>"));

	auto map = tiled::Map::create();
	tiled::TmxReader reader(map);
	auto res = reader.parseFile(map_file);
	sys::remove_file(tmpl_file);
	sys::remove_file(map_file);
	CHECK(res.ok(), res.error());
	const tiled::Object* door = map->getObjectByName("door");
	CHECK(door != nullptr, "template file not loaded");
	CHECK_EQ(door->getHeight(), 24.0);

	auto missing = reader.parseFile(map_file);
	CHECK(!missing.ok(), "missing map file accepted");
	CHECK(missing.error().kind == tiled::ErrorKind::INVALID_MAP, missing.error());
}

UNIT_TEST(tmx_reader_errors)
{
	auto res = parse(tiled::Map::create(), "<map");
	CHECK(!res.ok() && res.error().kind == tiled::ErrorKind::INVALID_MAP, "broken xml accepted");

	res = parse(tiled::Map::create(), "<map orientation='orthogonal' height='2' tilewidth='16' tileheight='16'/>");
	CHECK(!res.ok() && res.error().kind == tiled::ErrorKind::INVALID_MAP, "map without width accepted");

	res = parse(tiled::Map::create(), map_with_layer("<data><tile gid='1'/><tile gid='2'/></data>"));
	CHECK(!res.ok(), "inline tiles accepted");
	CHECK(res.error().kind == tiled::ErrorKind::UNSUPPORTED_TILE_FORMAT, res.error());

	res = parse(tiled::Map::create(), map_with_layer("<data encoding='base64' compression='lzma'>AQAAAA==</data>"));
	CHECK(!res.ok(), "lzma accepted");
	CHECK(res.error().kind == tiled::ErrorKind::UNSUPPORTED_COMPRESSION, res.error());

	res = parse(tiled::Map::create(), map_with_object("<object x='0' y='0'><polygon points='0,0 1'/></object>"));
	CHECK(!res.ok(), "bad polygon accepted");
	CHECK(res.error().kind == tiled::ErrorKind::MALFORMED_SHAPE_DATA, res.error());

	res = parse(tiled::Map::create(), map_with_object("<object x='0' y='0' visible='perhaps'/>"));
	CHECK(!res.ok(), "bad visible flag accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_VALUE, res.error());

	res = parse(tiled::Map::create(), map_with_layer("<data encoding='csv'>1,,2,3</data>"));
	CHECK(!res.ok(), "empty csv cell accepted");
	CHECK(res.error().kind == tiled::ErrorKind::MALFORMED_LAYER_DATA, res.error());
}

UNIT_TEST(tmx_reader_adjusts_tile_objects)
{
	const bool old_adjust = g_adjust_tile_objects;
	const bool old_invert = g_invert_tile_objects;
	g_adjust_tile_objects = true;
	g_invert_tile_objects = true;

	auto map = tiled::Map::create();
	auto res = parse(map, map_with_object("<object name='tile' gid='1' x='0' y='32' width='16' height='16'/>"
		"<object name='plain' x='0' y='32' width='16' height='16'/>"));
	g_adjust_tile_objects = old_adjust;
	g_invert_tile_objects = old_invert;

	CHECK(res.ok(), res.error());
	const tiled::Object* tile = map->getObjectByName("tile");
	CHECK_EQ(tile->y(), 16.0);
	CHECK_EQ(tile->getObjectType(), "tile");
	CHECK_EQ(tile->getShape()->getPoints(), tiled::generate_rectangle_points(0, 16, 16, 16));
	CHECK_EQ(tile->getBoundingBox(), rect::from_coordinates(0, 16, 16, 32));
	const tiled::Object* plain = map->getObjectByName("plain");
	CHECK_EQ(plain->y(), 32.0);
	CHECK_EQ(plain->getShape()->getPoints(), tiled::generate_rectangle_points(0, 32, 16, 16));
}

UNIT_TEST(tmx_reader_tile_definitions)
{
	auto map = tiled::Map::create();
	auto res = parse(map, 
		"<map orientation='orthogonal' width='2' height='1' tilewidth='16' tileheight='16'>"
		" <tileset firstgid='1' name='water' tilewidth='16' tileheight='16' tilecount='4' columns='2'>"
		"  <tile id='1'>"
		"   <properties><property name='liquid' type='bool' value='true'/></properties>"
		"   <animation><frame tileid='1' duration='100'/><frame tileid='2' duration='150'/></animation>"
		"   <objectgroup draworder='index'>"
		"    <object id='1' x='0' y='8' width='16' height='8'/>"
		"    <object id='2' x='0' y='0'><polygon points='0,0 16,0 8,8'/></object>"
		"   </objectgroup>"
		"  </tile>"
		"  <tile id='3'><image source='rock.png' width='32' height='24'/></tile>"
		" </tileset>"
		" <layer name='l' width='2' height='1'><data encoding='csv'>2,4</data></layer>"
		"</map>");
	CHECK(res.ok(), res.error());

	const tiled::TileSet& ts = map->getTileSets()[0];
	CHECK_EQ(ts.getTiles().size(), 2);
	CHECK(ts.getTileDefinition(0) == nullptr, "tile without definition found");

	const tiled::TileDefinition* water = ts.getTileDefinition(1);
	CHECK(water != nullptr, "tile definition missing");
	CHECK(tiled::find_property(water->getProperties(), "liquid")->asBool().value(), "tile property lost");

	CHECK(water->isAnimated(), "animation not read");
	CHECK_EQ(water->getFrames().size(), 2);
	CHECK_EQ(map->getTiledGid(water->getFrames()[0].gid), 2);
	CHECK_EQ(water->getFrames()[0].duration, 100);
	CHECK_EQ(map->getTiledGid(water->getFrames()[1].gid), 3);
	CHECK_EQ(water->getFrames()[1].duration, 150);

	auto colliders = water->getColliders();
	CHECK(colliders != nullptr, "collider group missing");
	CHECK_EQ(colliders->getDrawOrder(), "index");
	CHECK_EQ(colliders->getObjects().size(), 2);
	CHECK_EQ(colliders->getObjects()[0].getShape()->getPoints(), tiled::generate_rectangle_points(0, 8, 16, 8));
	CHECK_EQ(colliders->getObjects()[1].getObjectType(), "polygon");
	CHECK(colliders->getObjects()[1].collidesWithPoint(8, 2), "point inside collider polygon missed");

	const tiled::TileDefinition* rock = ts.getTileDefinition(3);
	CHECK_EQ(rock->getImageSource(), "rock.png");
	CHECK_EQ(rock->getImageWidth(), 32);
	CHECK(!rock->isAnimated(), "still tile reported animated");
	CHECK(rock->getColliders() == nullptr, "tile without colliders has a collider group");

	// Layer gids resolve to the same definitions.
	auto layer = map->getLayerByName("l");
	CHECK(map->getTileDefinition(layer->getGid(0, 0)) == water, "layer gid not matched to its tile definition");
	CHECK(map->getTileDefinition(layer->getGid(1, 0)) == rock, "layer gid not matched to its tile definition");
	CHECK(map->getTileDefinition(0) == nullptr, "gid 0 has a tile definition");
}

UNIT_TEST(tmx_reader_tile_definition_errors)
{
	const std::string head = "<map orientation='orthogonal' width='1' height='1' tilewidth='16' tileheight='16'><tileset firstgid='1' tilecount='4' columns='2'>";
	const std::string tail = "</tileset></map>";

	auto res = parse(tiled::Map::create(), head + "<tile id='0'><animation><frame tileid='1' duration='fast'/></animation></tile>" + tail);
	CHECK(!res.ok(), "bad frame duration accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_VALUE, res.error());

	res = parse(tiled::Map::create(), head + "<tile id='0'><animation><frame duration='10'/></animation></tile>" + tail);
	CHECK(!res.ok(), "frame without tileid accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_MAP, res.error());

	res = parse(tiled::Map::create(), head + "<tile><properties/></tile>" + tail);
	CHECK(!res.ok(), "tile without id accepted");
	CHECK(res.error().kind == tiled::ErrorKind::INVALID_MAP, res.error());

	res = parse(tiled::Map::create(), head + "<tile id='0'><objectgroup><object x='0' y='0'><polygon points='0,0 1'/></object></objectgroup></tile>" + tail);
	CHECK(!res.ok(), "bad collider polygon accepted");
	CHECK(res.error().kind == tiled::ErrorKind::MALFORMED_SHAPE_DATA, res.error());
}
