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

// Built based on information from https://doc.mapeditor.org/en/stable/reference/tmx-map-format/

#pragma once

#include <map>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "result.hpp"
#include "tiled.hpp"

namespace tiled
{
	class TmxReader
	{
	public:
		explicit TmxReader(MapPtr map);
		// Relative tileset and template references are resolved against the
		// directory of filename.
		Result<void> parseFile(const std::string& filename);
		Result<void> parseString(const std::string& str);

		// Makes a template available under name, as referenced by an object's
		// template attribute. Registered templates take precedence over files.
		Result<void> addTemplate(const std::string& name, const std::string& xml);
	private:
		Result<void> parseMapElement(const boost::property_tree::ptree& pt);
		Result<void> parseLayers(const boost::property_tree::ptree& pt);
		Result<TileSet> parseTileset(const boost::property_tree::ptree& pt);
		Result<TileDefinition> parseTileElement(const TileSet& ts, const boost::property_tree::ptree& pt);
		Properties parseProperties(const boost::property_tree::ptree& pt);
		Result<std::shared_ptr<TileLayer>> parseLayerElement(const boost::property_tree::ptree& pt);
		Result<void> parseDataElement(const boost::property_tree::ptree& pt, TileLayer* layer);
		Result<std::shared_ptr<ObjectGroup>> parseObjectGroup(const boost::property_tree::ptree& pt);
		Result<Object> parseObject(const boost::property_tree::ptree& pt);
		const boost::property_tree::ptree* findTemplate(const std::string& name);

		MapPtr map_;
		std::string base_dir_;
		std::map<std::string, boost::property_tree::ptree> templates_;
	};
}
