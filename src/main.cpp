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
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "asserts.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "preferences.hpp"
#include "string_utils.hpp"
#include "unit_test.hpp"

namespace 
{
	void print_help(const std::string& argv0)
	{
		std::cout << "Usage: " << argv0 << " [OPTIONS]\n" <<
			"\n" <<
			"      --config=FILE            reads settings from an INI file before the\n" <<
			"                                 remaining arguments are applied\n" <<
			"      --tests                  runs all the unit tests and exits\n" <<
			"      --tests=\"foo,bar,baz\"  runs the named unit tests and exits\n" <<
			"      --benchmarks             runs all the benchmarks and exits\n" <<
			"      --benchmarks=NAME        runs a single named benchmark\n" <<
			"      --utility=NAME           runs the specified UTILITY( NAME ) code block,\n" <<
			"                                 such as tmx_info, with the remaining\n" <<
			"                                 arguments\n" <<
			"      --help, -h               prints this message and exits\n" <<
			"\n" <<
			"Settings:\n" <<
		   preferences::get_registered_helpstring();
	}

	std::vector<std::string> split_name_list(const std::string& value)
	{
		// If the list is quoted, remove the quotes
		if(value.size() >= 2 && value.front() == '\"' && value.back() == '\"') {
			return util::split(value.substr(1, value.size()-2));
		}
		return util::split(value);
	}
}

int main(int argcount, char* argvec[])
{
	SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);

	std::vector<std::string> argv;
	for(int i = 1; i < argcount; ++i) {
		argv.emplace_back(argvec[i]);
	}
	preferences::set_argv(argv);

	// the config file is applied first so that explicit arguments override it.
	for(const std::string& arg : argv) {
		if(util::string_starts_with(arg, "--config=")) {
			const std::string fname = arg.substr(9);
			if(!preferences::load_preferences(fname)) {
				LOG_ERROR("Unable to read config file: " << fname);
				return -1;
			}
		}
	}

	bool run_tests = false;
	bool run_benchmarks = false;
	std::unique_ptr<std::vector<std::string>> test_names;
	std::vector<std::string> benchmarks_list;
	std::string utility_program;
	std::vector<std::string> util_args;

	for(size_t n = 0; n < argv.size(); ++n) {
		const std::string& arg = argv[n];
		std::string arg_name, arg_value;
		std::string::const_iterator equal = std::find(arg.begin(), arg.end(), '=');
		if(equal != arg.end()) {
			arg_name = std::string(arg.begin(), equal);
			arg_value = std::string(equal+1, arg.end());
		}

		if(arg_name == "--config") {
			// already processed.
		} else if(arg_name == "--utility") {
			utility_program = arg_value;
			util_args.assign(argv.begin() + n + 1, argv.end());
			break;
		} else if(arg == "--benchmarks") {
			run_benchmarks = true;
		} else if(arg_name == "--benchmarks") {
			run_benchmarks = true;
			benchmarks_list = split_name_list(arg_value);
		} else if(arg == "--tests") {
			run_tests = true;
		} else if(arg_name == "--tests") {
			run_tests = true;
			if(!arg_value.empty()) {
				test_names.reset(new std::vector<std::string>(split_name_list(arg_value)));
			}
		} else if(arg == "--help" || arg == "-h") {
			print_help(std::string(argvec[0]));
			return 0;
		} else if(!preferences::parse_arg(arg)) {
			print_help(std::string(argvec[0]));
			LOG_ERROR("unrecognized arg: '" << arg << "'");
			return -1;
		}
	}

	apply_log_level_preference();

	if(!utility_program.empty()) {
		try {
			const assert_recover_scope recover;
			return test::run_utility(utility_program, util_args) ? 0 : -1;
		} catch(validation_failure_exception& e) {
			LOG_ERROR(e.msg);
			return -1;
		}
	}

	if(run_tests) {
		if(!test::run_tests(test_names.get())) {
			return -1;
		}
	}

	if(run_benchmarks) {
		test::run_benchmarks(benchmarks_list.empty() ? nullptr : &benchmarks_list);
	}

	if(!run_tests && !run_benchmarks) {
		print_help(std::string(argvec[0]));
	}
	return 0;
}
