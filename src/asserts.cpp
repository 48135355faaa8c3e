/*
	Copyright (C) 2003-2013 by David White <davewx7@gmail.com>
	
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

#include <csignal>
#include <cstdlib>

#include "asserts.hpp"
#include "preferences.hpp"
#include "unit_test.hpp"

namespace 
{
	PREF_BOOL(die_on_assert, false, "Abort immediately when an assertion fails, even inside a recover scope");

	int silence_on_assert = 0;
	int throw_validation_failure = 0;
	int throw_fatal = 0;
}

void report_assert_msg(const std::string& m)
{
	SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Assertion failed\n%s\n", m.c_str());

#if defined(__APPLE__)
    *((volatile int *) NULL) = 0;	/* To continue from here in GDB: "return" then "continue". */
    raise(SIGABRT);			/* In case above statement gets nixed by the optimizer. */
#else
    raise(SIGABRT);			/* To continue from here in GDB: "signal 0". */
#endif
}

validation_failure_exception::validation_failure_exception(const std::string& m)
  : msg(m)
{
	if(!silence_on_assert) {
		LOG_ERROR("ASSERT FAIL: " << m);
	}
}

fatal_assert_failure_exception::fatal_assert_failure_exception(const std::string& m)
  : msg(m)
{
	LOG_ERROR("ASSERT FAIL: " << m);
}

bool throw_validation_failure_on_assert()
{
	return throw_validation_failure != 0 && !g_die_on_assert;
}

assert_recover_scope::assert_recover_scope(int options) : options_(options), fatal_(throw_fatal)
{
	throw_fatal = 0;
	if(options_&static_cast<int>(SilenceAsserts)) {
		silence_on_assert++;
	}
	throw_validation_failure++;
}

assert_recover_scope::~assert_recover_scope()
{
	throw_fatal = fatal_;
	if(options_&SilenceAsserts) {
		silence_on_assert--;
	}
	throw_validation_failure--;
}

bool throw_fatal_error_on_assert()
{
	return throw_fatal != 0 && !g_die_on_assert;
}

fatal_assert_scope::fatal_assert_scope() : recover_(throw_validation_failure)
{
	throw_validation_failure = 0;
	throw_fatal++;
}

fatal_assert_scope::~fatal_assert_scope()
{
	throw_fatal--;
	throw_validation_failure = recover_;
}

void assert_failed(const std::string& msg)
{
	if(throw_validation_failure_on_assert()) {
		throw validation_failure_exception(msg);
	} else if(throw_fatal_error_on_assert()) {
		throw fatal_assert_failure_exception(msg);
	}
	log_internal(SDL_LOG_PRIORITY_CRITICAL, msg);
	report_assert_msg(msg);
	exit(1);
}

UNIT_TEST(assert_recover_scope_throws_validation_failure)
{
	const bool recovering_before = throw_validation_failure_on_assert();
	bool caught = false;
	{
		assert_recover_scope scope(SilenceAsserts);
		try {
			ASSERT_LOG(1 + 1 == 3, "arithmetic is broken");
		} catch(validation_failure_exception& e) {
			caught = true;
			CHECK(e.msg.find("arithmetic is broken") != std::string::npos, "unexpected message: " << e.msg);
		}
	}
	CHECK(caught, "assertion inside a recover scope did not throw");
	CHECK_EQ(throw_validation_failure_on_assert(), recovering_before);
}

UNIT_TEST(fatal_assert_scope_throws_fatal_failure)
{
	bool caught = false;
	{
		fatal_assert_scope scope;
		try {
			ASSERT_EQ(2, 3);
		} catch(fatal_assert_failure_exception& e) {
			caught = true;
			CHECK(e.msg.find("ASSERT EQ FAILED") != std::string::npos, "unexpected message: " << e.msg);
		}
	}
	CHECK(caught, "assertion inside a fatal scope did not throw");
}

UNIT_TEST(fatal_assert_scope_overrides_enclosing_recover_scope)
{
	assert_recover_scope recover(SilenceAsserts);
	bool caught = false;
	{
		fatal_assert_scope scope;
		CHECK(!throw_validation_failure_on_assert(), "recover scope still active inside fatal scope");
		try {
			ASSERT_LOG(false, "inner failure");
		} catch(fatal_assert_failure_exception&) {
			caught = true;
		}
	}
	CHECK(caught, "fatal scope nested in a recover scope did not throw a fatal failure");
	CHECK(throw_validation_failure_on_assert(), "recover scope not restored after fatal scope");
	CHECK(!throw_fatal_error_on_assert(), "fatal scope leaked");
}
