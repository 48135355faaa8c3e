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

#pragma once

#include <sstream>
#include <string>

#include "logger.hpp"

void report_assert_msg(const std::string& m);

//An exception we intend to recover from.
struct validation_failure_exception 
{
	explicit validation_failure_exception(const std::string& m);
	std::string msg;
};

//If we should try to recover on asserts
bool throw_validation_failure_on_assert();

enum AssertOptions { SilenceAsserts = 1 };

//Scope to make us recover
class assert_recover_scope 
{
	int options_;
	int fatal_;
public:
	assert_recover_scope(int options=0);
	~assert_recover_scope();
};

//An exception we intend to die from, but at a location we'll have better
//error reporting from.
struct fatal_assert_failure_exception 
{
	explicit fatal_assert_failure_exception(const std::string& m);
	std::string msg;
};

bool throw_fatal_error_on_assert();

//Scope to make us throw a fatal error on assert (as opposed to throwing
//a recoverable error, or just dying on the spot).
class fatal_assert_scope 
{
	int recover_;
public:
	fatal_assert_scope();
	~fatal_assert_scope();
};

// Throws whichever exception the active scopes ask for, otherwise logs the
// message and exits.
void assert_failed(const std::string& msg);

#define ASSERT_EQ(a,b) do { if((a) != (b)) { std::ostringstream _s; _s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERT EQ FAILED: " << #a << " != " << #b << ": " << (a) << " != " << (b) << "\n"; assert_failed(_s.str()); } } while(0)

#define ASSERT_NE(a,b) do { if((a) == (b)) { std::ostringstream _s; _s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERT NE FAILED: " << #a << " == " << #b << ": " << (a) << " == " << (b) << "\n"; assert_failed(_s.str()); } } while(0)

//for custom logging.  Example usage:
//ASSERT_LOG(x != y, "x not equal to y. Value of x: " << x << ", y: " << y);

#define ASSERT_LOG(_a,_b)										\
	do { if( !(_a) ) {											\
		std::ostringstream _s;									\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERTION FAILED: " << _b << "\n";	\
		assert_failed(_s.str());								\
	} } while(0)
