/*
	Copyright (C) 2003-2014 by David White <davewx7@gmail.com>
	
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

#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>

#include "asserts.hpp"
#include "filesystem.hpp"
#include "unit_test.hpp"

namespace sys
{
	using namespace boost::filesystem;

	std::string read_file(const std::string& fname)
	{
		std::ifstream file(fname.c_str(), std::ios_base::binary);
		std::stringstream ss;
		ss << file.rdbuf();
		return ss.str();
	}

	void write_file(const std::string& fname, const std::string& data)
	{
		path p(fname);
		ASSERT_LOG(p.has_filename(), "No filename found in write_file path: " << fname);

		// Create any needed directories
		boost::system::error_code ec;
		if(p.has_parent_path()) {
			create_directories(p.parent_path(), ec);
		}

		std::ofstream file(fname.c_str(), std::ios_base::binary);
		file << data;
	}

	bool file_exists(const std::string& fname)
	{
		boost::system::error_code ec;
		path p(fname);
		return exists(p, ec) && is_regular_file(p, ec);
	}

	void remove_file(const std::string& fname)
	{
		boost::system::error_code ec;
		remove(path(fname), ec);
		if(ec) {
			LOG_WARN("Unable to remove " << fname << ": " << ec.message());
		}
	}

	std::string get_dir_name(const std::string& p)
	{
		return path(p).parent_path().generic_string();
	}

	std::string get_base_name(const std::string& p)
	{
		return path(p).filename().generic_string();
	}

	std::string join_path(const std::string& dir, const std::string& fname)
	{
		if(dir.empty()) {
			return fname;
		}
		return (path(dir) / path(fname)).generic_string();
	}

	bool is_path_absolute(const std::string& p)
	{
		return path(p).is_absolute();
	}

	std::string get_temp_file_name(const std::string& suffix)
	{
		return (temp_directory_path() / unique_path("tiledcore-%%%%-%%%%-%%%%" + suffix)).generic_string();
	}
}

UNIT_TEST(filesystem_write_then_read)
{
	const std::string fname = sys::get_temp_file_name(".txt");
	CHECK(!sys::file_exists(fname), "temporary file already exists: " << fname);
	sys::write_file(fname, "tile data\n");
	CHECK(sys::file_exists(fname), "file was not written: " << fname);
	CHECK_EQ(sys::read_file(fname), "tile data\n");
	sys::remove_file(fname);
	CHECK(!sys::file_exists(fname), "file was not removed: " << fname);
}

UNIT_TEST(filesystem_paths)
{
	CHECK_EQ(sys::get_dir_name("maps/level1.tmx"), "maps");
	CHECK_EQ(sys::get_base_name("maps/level1.tmx"), "level1.tmx");
	CHECK_EQ(sys::join_path("maps", "door.tx"), "maps/door.tx");
	CHECK_EQ(sys::join_path("", "door.tx"), "door.tx");
	CHECK(!sys::is_path_absolute("maps/level1.tmx"), "relative path reported absolute");
}
