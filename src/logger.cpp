/*
	Copyright (C) 2012-2014 by Kristina Simpson <sweet.kristas@gmail.com>

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

#include <mutex>

#include "logger.hpp"
#include "preferences.hpp"
#include "unit_test.hpp"

PREF_STRING(log_level, "info", "Minimum priority of log messages to output: verbose, debug, info, warn, error or critical");

namespace
{
	/** Standard buffer. */
	const size_t max_log_packet_length = 3072;

	SDL_LogPriority g_current_priority = SDL_LOG_PRIORITY_INFO;

	std::mutex& capture_mutex()
	{
		static std::mutex m;
		return m;
	}

	log_capture_scope*& current_capture()
	{
		static log_capture_scope* scope = nullptr;
		return scope;
	}

	bool priority_from_string(const std::string& level, SDL_LogPriority* priority)
	{
		if(level == "verbose") {
			*priority = SDL_LOG_PRIORITY_VERBOSE;
		} else if(level == "debug") {
			*priority = SDL_LOG_PRIORITY_DEBUG;
		} else if(level == "info") {
			*priority = SDL_LOG_PRIORITY_INFO;
		} else if(level == "warn") {
			*priority = SDL_LOG_PRIORITY_WARN;
		} else if(level == "error") {
			*priority = SDL_LOG_PRIORITY_ERROR;
		} else if(level == "critical") {
			*priority = SDL_LOG_PRIORITY_CRITICAL;
		} else {
			return false;
		}
		return true;
	}
}

void log_internal(SDL_LogPriority priority, const std::string& str)
{
	{
		std::lock_guard<std::mutex> guard(capture_mutex());
		if(current_capture() != nullptr) {
			current_capture()->record(priority, str);
		}
	}

	if(priority < g_current_priority) {
		return;
	}

	for(auto& packet : split_log_packets(str, max_log_packet_length)) {
		SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, priority, "%s\n", packet.c_str());
	}
}

std::vector<std::string> split_log_packets(const std::string& str, size_t max_length)
{
	std::vector<std::string> res;
	if(max_length == 0) {
		res.push_back(str);
		return res;
	}
	std::string s(str);
	// break up long strings into something about max_length in size.
	while(s.size() > max_length) {
		res.push_back(s.substr(0, max_length));
		s = s.substr(max_length);
	}
	if(!s.empty()) {
		res.push_back(s);
	}
	return res;
}

bool set_log_level(const std::string& level)
{
	SDL_LogPriority priority;
	if(!priority_from_string(level, &priority)) {
		LOG_WARN("Unrecognised log level '" << level << "', keeping the current one");
		return false;
	}
	g_current_priority = priority;
	SDL_LogSetAllPriority(priority);
	return true;
}

SDL_LogPriority get_log_level()
{
	return g_current_priority;
}

void apply_log_level_preference()
{
	set_log_level(g_log_level);
}

log_capture_scope::log_capture_scope()
{
	std::lock_guard<std::mutex> guard(capture_mutex());
	parent_ = current_capture();
	current_capture() = this;
}

log_capture_scope::~log_capture_scope()
{
	std::lock_guard<std::mutex> guard(capture_mutex());
	current_capture() = parent_;
}

void log_capture_scope::record(SDL_LogPriority priority, const std::string& s)
{
	captured_log_message m;
	m.priority = priority;
	m.msg = s;
	messages_.push_back(m);
}

bool log_capture_scope::contains(const std::string& text, SDL_LogPriority priority) const
{
	for(const auto& m : messages_) {
		if(m.priority >= priority && m.msg.find(text) != std::string::npos) {
			return true;
		}
	}
	return false;
}

int log_capture_scope::count(SDL_LogPriority priority) const
{
	int res = 0;
	for(const auto& m : messages_) {
		if(m.priority == priority) {
			++res;
		}
	}
	return res;
}

UNIT_TEST(log_capture_scope_records_messages)
{
	log_capture_scope outer;
	LOG_INFO("outer message");
	{
		log_capture_scope inner;
		LOG_WARN("inner " << 42);
		CHECK_EQ(inner.messages().size(), 1);
		CHECK(inner.contains("inner 42", SDL_LOG_PRIORITY_WARN), "warning was not captured");
		CHECK_EQ(inner.count(SDL_LOG_PRIORITY_WARN), 1);
	}
	LOG_ERROR("after inner");
	CHECK_EQ(outer.messages().size(), 2);
	CHECK(outer.contains("after inner", SDL_LOG_PRIORITY_ERROR), "error was not captured");
	CHECK(!outer.contains("inner 42"), "inner scope message leaked to outer scope");
	CHECK(!outer.contains("outer message", SDL_LOG_PRIORITY_WARN), "priority filter ignored");
}

UNIT_TEST(set_log_level_rejects_unknown_names)
{
	const SDL_LogPriority old_level = get_log_level();
	log_capture_scope capture;
	CHECK(!set_log_level("chatty"), "unknown level accepted");
	CHECK_EQ(get_log_level(), old_level);
	CHECK(capture.contains("chatty", SDL_LOG_PRIORITY_WARN), "no warning for unknown level");
}

UNIT_TEST(split_log_packets_keeps_every_character)
{
	const std::string msg = "0123456789abcdefghij";
	auto packets = split_log_packets(msg, 8);
	CHECK_EQ(packets.size(), 3);
	CHECK_EQ(packets[0], "01234567");
	CHECK_EQ(packets[1], "89abcdef");
	CHECK_EQ(packets[2], "ghij");

	std::string joined;
	for(auto& p : packets) {
		joined += p;
	}
	CHECK_EQ(joined, msg);

	CHECK_EQ(split_log_packets("01234567", 8).size(), 1);
	CHECK_EQ(split_log_packets("0123456789abcdef", 8)[1], "89abcdef");
	CHECK(split_log_packets("", 8).empty(), "empty message produced a packet");
}
