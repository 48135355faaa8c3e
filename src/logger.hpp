/*
	Copyright (C) 2003-2013 by Kristina Simpson <sweet.kristas@gmail.com>

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
#include <cstring>
#include <string>
#include <vector>

#include "SDL.h"

#if defined(_MSC_VER)
#define __SHORT_FORM_OF_FILE__	\
	(strrchr(__FILE__,'\\')		\
	? strrchr(__FILE__,'\\')+1	\
	: __FILE__					\
	)
#else
#define __SHORT_FORM_OF_FILE__	\
	(strrchr(__FILE__,'/')		\
	? strrchr(__FILE__,'/')+1	\
	: __FILE__					\
	)
#endif

void log_internal(SDL_LogPriority priority, const std::string& s);
// Pieces of at most max_length characters that log_internal() hands to SDL
// one at a time.
std::vector<std::string> split_log_packets(const std::string& s, size_t max_length);

// Sets the minimum priority that reaches the SDL log output. Accepts
// "verbose", "debug", "info", "warn", "error" and "critical".
bool set_log_level(const std::string& level);
SDL_LogPriority get_log_level();
// Applies the --log-level preference.
void apply_log_level_preference();

struct captured_log_message
{
	SDL_LogPriority priority;
	std::string msg;
};

// While alive, every message passed to log_internal() is also recorded so
// that it can be inspected. Scopes nest; the innermost one receives the
// messages.
class log_capture_scope
{
public:
	log_capture_scope();
	~log_capture_scope();

	const std::vector<captured_log_message>& messages() const { return messages_; }

	// true if a message at priority or above contains text.
	bool contains(const std::string& text, SDL_LogPriority priority=SDL_LOG_PRIORITY_VERBOSE) const;
	int count(SDL_LogPriority priority) const;
	void clear() { messages_.clear(); }

	void record(SDL_LogPriority priority, const std::string& s);
private:
	log_capture_scope(const log_capture_scope&);
	void operator=(const log_capture_scope&);

	std::vector<captured_log_message> messages_;
	log_capture_scope* parent_;
};

#define LOG_AT(_priority, _a)														\
	do {																			\
		std::ostringstream _s;														\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " : " << _a;				\
		log_internal(_priority, _s.str());											\
	} while(0)

#define LOG_VERBOSE(_a) LOG_AT(SDL_LOG_PRIORITY_VERBOSE, _a)
#define LOG_DEBUG(_a) LOG_AT(SDL_LOG_PRIORITY_DEBUG, _a)
#define LOG_INFO(_a) LOG_AT(SDL_LOG_PRIORITY_INFO, _a)
#define LOG_WARN(_a) LOG_AT(SDL_LOG_PRIORITY_WARN, _a)
#define LOG_ERROR(_a) LOG_AT(SDL_LOG_PRIORITY_ERROR, _a)
#define LOG_CRITICAL(_a) LOG_AT(SDL_LOG_PRIORITY_CRITICAL, _a)
