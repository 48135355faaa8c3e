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
#include <map>

#include "asserts.hpp"
#include "preferences.hpp"
#include "profile_timer.hpp"
#include "unit_test.hpp"

namespace
{
	PREF_BOOL(run_failing_unit_tests, false, "Also run unit tests whose names end in FAILS");
}

namespace test 
{
	namespace 
	{
		typedef std::map<std::string, UnitTest> TestMap;
		TestMap& get_test_map()
		{
			static TestMap map;
			return map;
		}

		typedef std::map<std::string, BenchmarkTest> BenchmarkMap;
		BenchmarkMap& get_benchmark_map()
		{
			static BenchmarkMap map;
			return map;
		}

		typedef std::map<std::string, UtilityProgram> UtilityMap;
		UtilityMap& get_utility_map()
		{
			static UtilityMap map;
			return map;
		}
	}

	int register_test(const std::string& name, UnitTest test)
	{
		get_test_map()[name] = test;
		return 0;
	}

	int register_utility(const std::string& name, UtilityProgram utility)
	{
		get_utility_map()[name] = utility;
		return 0;
	}

	std::vector<std::string> get_test_names()
	{
		std::vector<std::string> res;
		for(auto& t : get_test_map()) {
			res.push_back(t.first);
		}
		return res;
	}

	bool run_tests(const std::vector<std::string>* tests)
	{
		const int start_time = profile::get_tick_time();
		std::vector<std::string> all_tests;
		if(!tests) {
			all_tests = get_test_names();
			tests = &all_tests;
		}

		int npass = 0, nfail = 0;
		for(const std::string& test : *tests) {
			if(g_run_failing_unit_tests == false && test.size() > 5 && std::string(test.end()-5, test.end()) == "FAILS") {
				continue;
			}

			auto it = get_test_map().find(test);
			if(it == get_test_map().end()) {
				LOG_ERROR("TEST " << test << " NOT FOUND.");
				++nfail;
				continue;
			}

			try {
				// a failed assertion fails the test instead of taking the process down.
				assert_recover_scope recover;
				it->second();
				LOG_INFO("TEST " << test << " PASSED");
				++npass;
			} catch(FailureException&) {
				LOG_ERROR("TEST " << test << " FAILED!!");
				++nfail;
			} catch(validation_failure_exception& e) {
				LOG_ERROR("TEST " << test << " FAILED WITH ASSERTION: " << e.msg);
				++nfail;
			}
		}

		if(nfail) {
			LOG_INFO(npass << " TESTS PASSED, " << nfail << " TESTS FAILED");
			return false;
		} else {
			LOG_INFO("ALL " << npass << " TESTS PASSED IN " << (profile::get_tick_time() - start_time) << "ms");
			return true;
		}
	}

	std::string format_nanoseconds(int64_t ns)
	{
		static const char* const units[] = {"ns", "us", "ms", "s"};
		int unit = 0;
		while(ns > 10000 && unit < 3) {
			ns /= 1000;
			++unit;
		}
		std::ostringstream s;
		s << ns << units[unit];
		return s.str();
	}

	int register_benchmark(const std::string& name, BenchmarkTest test)
	{
		get_benchmark_map()[name] = test;
		return 0;
	}

	std::string run_benchmark(const std::string& name, BenchmarkTest fn)
	{
		//run it once without counting it to let any initialization code be run.
		fn(1);

		LOG_INFO("RUNNING BENCHMARK " << name << "...");
		const int MinTicks = 1000;
		for(int64_t nruns = 10; ; nruns *= 10) {
			const unsigned start_time = profile::get_tick_time();
			fn(static_cast<int>(nruns));
			const int64_t time_taken_ms = profile::get_tick_time() - start_time;
			if(time_taken_ms >= MinTicks || nruns > 1000000000) {
				const int64_t time_taken = time_taken_ms*1000000LL;
				std::ostringstream s;
				s << "BENCH " << name << ": " << nruns << " iterations, " << format_nanoseconds(time_taken/nruns) << "/iteration; total, " << format_nanoseconds(time_taken);
				LOG_INFO(s.str());
				return s.str();
			}
		}

		return "";
	}

	void run_benchmarks(const std::vector<std::string>* benchmarks)
	{
		std::vector<std::string> all_benchmarks;
		if(!benchmarks) {
			for(BenchmarkMap::const_iterator i = get_benchmark_map().begin(); i != get_benchmark_map().end(); ++i) {
				all_benchmarks.push_back(i->first);
			}

			benchmarks = &all_benchmarks;
		}

		for(const std::string& benchmark : *benchmarks) {
			auto it = get_benchmark_map().find(benchmark);
			if(it == get_benchmark_map().end()) {
				LOG_INFO("BENCHMARK " << benchmark << " NOT FOUND.");
				continue;
			}
			run_benchmark(benchmark, it->second);
		}
	}

	bool run_utility(const std::string& utility_name, const std::vector<std::string>& arg)
	{
		auto it = get_utility_map().find(utility_name);
		if(it == get_utility_map().end()) {
			std::string known;
			for(UtilityMap::const_iterator i = get_utility_map().begin(); i != get_utility_map().end(); ++i) {
				known += i->first + " ";
			}
			LOG_ERROR("Unknown utility: '" << utility_name << "'; known utilities: " << known);
			return false;
		}
		it->second(arg);
		return true;
	}
}

UNIT_TEST(benchmark_durations_use_readable_units)
{
	CHECK_EQ(test::format_nanoseconds(950), "950ns");
	CHECK_EQ(test::format_nanoseconds(10000), "10000ns");
	CHECK_EQ(test::format_nanoseconds(25000), "25us");
	CHECK_EQ(test::format_nanoseconds(3000000000LL), "3000ms");
	CHECK_EQ(test::format_nanoseconds(50000000000000LL), "50000s");
}
