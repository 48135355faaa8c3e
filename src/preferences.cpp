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

#include <algorithm>
#include <map>
#include <sstream>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "asserts.hpp"
#include "filesystem.hpp"
#include "preferences.hpp"
#include "unit_test.hpp"

namespace preferences 
{
	namespace 
	{
		struct RegisteredSetting 
		{
			RegisteredSetting() : int_value(nullptr), bool_value(nullptr), double_value(nullptr), string_value(nullptr), helpstring(nullptr)
			{}

			bool read(const std::string& value) {
				try {
					if(int_value) {
						*int_value = boost::lexical_cast<int>(value);
					} else if(string_value) {
						*string_value = value;
					} else if(double_value) {
						*double_value = boost::lexical_cast<double>(value);
					} else if(bool_value) {
						if(value == "yes" || value == "true" || value == "1") {
							*bool_value = true;
						} else if(value == "no" || value == "false" || value == "0") {
							*bool_value = false;
						} else {
							return false;
						}
					} else {
						return false;
					}
				} catch(boost::bad_lexical_cast&) {
					return false;
				}
				return true;
			}

			int* int_value;
			bool* bool_value;
			double* double_value;
			std::string* string_value;
			const char* helpstring;
		};

		std::map<std::string, RegisteredSetting>& g_registered_settings() {
			static std::map<std::string, RegisteredSetting> instance;
			return instance;
		}

		std::vector<std::string>& g_argv() {
			static std::vector<std::string> instance;
			return instance;
		}
	}

	int register_string_setting(const std::string& id, std::string* value, const char* helpstring)
	{
		ASSERT_LOG(g_registered_settings().count(id) == 0, "Multiple definition of registered setting: " << id);
		RegisteredSetting& setting = g_registered_settings()[id];
		setting.string_value = value;
		setting.helpstring = helpstring;
		return static_cast<int>(g_registered_settings().size());
	}

	int register_int_setting(const std::string& id, int* value, const char* helpstring)
	{
		ASSERT_LOG(g_registered_settings().count(id) == 0, "Multiple definition of registered setting: " << id);
		RegisteredSetting& setting = g_registered_settings()[id];
		setting.int_value = value;
		setting.helpstring = helpstring;
		return static_cast<int>(g_registered_settings().size());
	}

	int register_bool_setting(const std::string& id, bool* value, const char* helpstring)
	{
		ASSERT_LOG(g_registered_settings().count(id) == 0, "Multiple definition of registered setting: " << id);
		RegisteredSetting& setting = g_registered_settings()[id];
		setting.bool_value = value;
		setting.helpstring = helpstring;
		return static_cast<int>(g_registered_settings().size());
	}

	int register_float_setting(const std::string& id, double* value, const char* helpstring)
	{
		ASSERT_LOG(g_registered_settings().count(id) == 0, "Multiple definition of registered setting: " << id);
		RegisteredSetting& setting = g_registered_settings()[id];
		setting.double_value = value;
		setting.helpstring = helpstring;
		return static_cast<int>(g_registered_settings().size());
	}

	std::string get_registered_helpstring()
	{
		std::string return_value;
		for(std::map<std::string, RegisteredSetting>::const_iterator i = g_registered_settings().begin(); i != g_registered_settings().end(); ++i) {
			std::ostringstream s;
			s << "        --";
			if(i->second.bool_value) {
				s << "[no-]";
			}

			std::string name = i->first;
			std::replace(name.begin(), name.end(), '_', '-');
			s << name;
			if(i->second.int_value) {
				s << "=" << *i->second.int_value;
			} else if(i->second.string_value) {
				s << "=" << *i->second.string_value;
			} else if(i->second.double_value) {
				s << "=" << *i->second.double_value;
			} else if(i->second.bool_value) {
				s << " (default: " << (*i->second.bool_value ? "true" : "false") << ")";
			}

			std::string str = s.str();
			if(str.size() < 40) {
				str.resize(40, ' ');
			} else {
				str += "\n" + std::string(40, ' ');
			}

			return_value += str + (i->second.helpstring ? i->second.helpstring : "") + "\n";
		}

		return return_value;
	}

	const std::vector<std::string>& argv()
	{
		return g_argv();
	}

	void set_argv(const std::vector<std::string>& args)
	{
		g_argv() = args;
	}

	bool set_setting(const std::string& id, const std::string& value)
	{
		std::string base_name(id);
		std::replace(base_name.begin(), base_name.end(), '-', '_');
		auto it = g_registered_settings().find(base_name);
		if(it == g_registered_settings().end()) {
			return false;
		}
		if(!it->second.read(value)) {
			LOG_ERROR("Invalid value for setting " << base_name << ": '" << value << "'");
			return false;
		}
		return true;
	}

	bool parse_arg(const std::string& arg)
	{
		if(arg.size() <= 2 || arg[0] != '-' || arg[1] != '-') {
			return false;
		}

		std::string::const_iterator equal = std::find(arg.begin(), arg.end(), '=');
		if(equal != arg.end()) {
			const std::string base_name(arg.begin()+2, equal);
			return set_setting(base_name, std::string(equal+1, arg.end()));
		}

		std::string::const_iterator begin = arg.begin() + 2;
		bool value = true;
		if(arg.size() > 5 && std::equal(begin, begin+3, "no-")) {
			value = false;
			begin += 3;
		}

		std::string base_name(begin, arg.end());
		std::replace(base_name.begin(), base_name.end(), '-', '_');
		auto it = g_registered_settings().find(base_name);
		if(it == g_registered_settings().end()) {
			return false;
		}
		if(it->second.bool_value == nullptr) {
			LOG_ERROR("Must provide value for option: " << base_name);
			return false;
		}

		*it->second.bool_value = value;
		return true;
	}

	bool load_preferences(const std::string& fname)
	{
		if(!sys::file_exists(fname)) {
			LOG_ERROR("Preferences file not found: " << fname);
			return false;
		}

		boost::property_tree::ptree pt;
		try {
			boost::property_tree::ini_parser::read_ini(fname, pt);
		} catch(boost::property_tree::ini_parser_error& e) {
			LOG_ERROR("Failed to read preferences file " << fname << ": " << e.what());
			return false;
		}

		for(auto& v : pt) {
			if(v.second.empty()) {
				if(!set_setting(v.first, v.second.data())) {
					LOG_WARN("Ignoring preference '" << v.first << "' in " << fname);
				}
			} else if(v.first == "tiledcore") {
				for(auto& s : v.second) {
					if(!set_setting(s.first, s.second.data())) {
						LOG_WARN("Ignoring preference '" << s.first << "' in " << fname);
					}
				}
			} else {
				LOG_WARN("Ignoring section [" << v.first << "] in " << fname);
			}
		}
		return true;
	}
}

namespace
{
	PREF_INT(test_pref_int, 3, "Setting used by the preferences unit tests");
	PREF_BOOL(test_pref_bool, false, "Setting used by the preferences unit tests");
	PREF_STRING(test_pref_string, "abc", "Setting used by the preferences unit tests");
}

UNIT_TEST(preferences_parse_arg)
{
	CHECK(preferences::parse_arg("--test-pref-int=17"), "int setting not recognised");
	CHECK_EQ(g_test_pref_int, 17);
	CHECK(!preferences::parse_arg("--test-pref-int=seventeen"), "bad int accepted");
	CHECK_EQ(g_test_pref_int, 17);

	CHECK(preferences::parse_arg("--test-pref-bool"), "bool flag not recognised");
	CHECK_EQ(g_test_pref_bool, true);
	CHECK(preferences::parse_arg("--no-test-pref-bool"), "negated bool flag not recognised");
	CHECK_EQ(g_test_pref_bool, false);
	CHECK(preferences::parse_arg("--test_pref_bool=yes"), "bool value not recognised");
	CHECK_EQ(g_test_pref_bool, true);

	CHECK(preferences::parse_arg("--test-pref-string=xyz"), "string setting not recognised");
	CHECK_EQ(g_test_pref_string, "xyz");

	CHECK(!preferences::parse_arg("--no-such-setting=1"), "unknown setting accepted");
	CHECK(!preferences::parse_arg("plain"), "non option accepted");

	g_test_pref_int = 3;
	g_test_pref_bool = false;
	g_test_pref_string = "abc";
}

UNIT_TEST(preferences_helpstring_lists_settings)
{
	const std::string help = preferences::get_registered_helpstring();
	CHECK(help.find("--test-pref-int=3") != std::string::npos, help);
	CHECK(help.find("--[no-]test-pref-bool") != std::string::npos, help);
}

UNIT_TEST(preferences_load_ini_file)
{
	const std::string fname = sys::get_temp_file_name(".ini");
	sys::write_file(fname, "test_pref_int = 42\n[tiledcore]\ntest-pref-string = from file\ntest_pref_bool = true\n");
	CHECK(preferences::load_preferences(fname), "failed to load " << fname);
	CHECK_EQ(g_test_pref_int, 42);
	CHECK_EQ(g_test_pref_string, "from file");
	CHECK_EQ(g_test_pref_bool, true);
	sys::remove_file(fname);

	CHECK(!preferences::load_preferences(fname), "missing file reported as loaded");

	g_test_pref_int = 3;
	g_test_pref_bool = false;
	g_test_pref_string = "abc";
}
