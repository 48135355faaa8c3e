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

#pragma once

#include <string>

namespace sys
{
	// Reads the whole file. Returns an empty string if it cannot be opened;
	// use file_exists() to tell the cases apart.
	std::string read_file(const std::string& fname);
	void write_file(const std::string& fname, const std::string& data);

	bool file_exists(const std::string& fname);
	void remove_file(const std::string& fname);

	std::string get_dir_name(const std::string& path);
	std::string get_base_name(const std::string& path);
	std::string join_path(const std::string& dir, const std::string& fname);
	bool is_path_absolute(const std::string& path);

	// A unique path in the system temporary directory.
	std::string get_temp_file_name(const std::string& suffix);
}
