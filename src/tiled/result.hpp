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

#pragma once

#include <ostream>
#include <sstream>
#include <string>

#include <boost/optional.hpp>

#include "asserts.hpp"

namespace tiled
{
	enum class ErrorKind {
		UNSUPPORTED_ENCODING,
		UNSUPPORTED_COMPRESSION,
		UNSUPPORTED_TILE_FORMAT,
		INVALID_CHUNK_ATTRIBUTE,
		MALFORMED_LAYER_DATA,
		MALFORMED_SHAPE_DATA,
		NON_CONVEX_POLYGON,
		INVALID_MAP,
		INVALID_VALUE,
	};

	const char* error_kind_name(ErrorKind kind);

	struct Error
	{
		Error(ErrorKind k, const std::string& m) : kind(k), message(m) {}
		ErrorKind kind;
		std::string message;
	};

	inline std::ostream& operator<<(std::ostream& os, ErrorKind kind)
	{
		os << error_kind_name(kind);
		return os;
	}

	inline std::ostream& operator<<(std::ostream& os, const Error& e)
	{
		os << error_kind_name(e.kind) << ": " << e.message;
		return os;
	}

	// Either a value or the Error that prevented producing it. Reading the
	// value of a failed result is a programming error.
	template<typename T>
	class Result
	{
	public:
		Result(const T& value) : value_(value) {}
		Result(T&& value) : value_(std::move(value)) {}
		Result(const Error& err) : error_(err) {}

		bool ok() const { return value_.is_initialized(); }
		explicit operator bool() const { return ok(); }

		const T& value() const {
			ASSERT_LOG(ok(), "Result holds no value: " << *error_);
			return *value_;
		}
		T& value() {
			ASSERT_LOG(ok(), "Result holds no value: " << *error_);
			return *value_;
		}
		const T& operator*() const { return value(); }
		const T* operator->() const { return &value(); }

		const Error& error() const {
			ASSERT_LOG(!ok(), "Result holds a value, not an error");
			return *error_;
		}
	private:
		boost::optional<T> value_;
		boost::optional<Error> error_;
	};

	template<>
	class Result<void>
	{
	public:
		Result() {}
		Result(const Error& err) : error_(err) {}

		bool ok() const { return !error_.is_initialized(); }
		explicit operator bool() const { return ok(); }

		const Error& error() const {
			ASSERT_LOG(!ok(), "Result holds no error");
			return *error_;
		}
	private:
		boost::optional<Error> error_;
	};
}

#define TILED_ERROR(kind, msg) \
	tiled::Error(tiled::ErrorKind::kind, static_cast<const std::ostringstream&>(std::ostringstream() << msg).str())
