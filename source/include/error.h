// error.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

#include <zpr.h>
#include <zst/zst.h>

namespace util::impl
{
	void log_impl(const char* prefix, int level, const std::string& msg, const char* who);
}

namespace folio
{
	/*
	    Everything that can go wrong while building or rendering a document falls into one of
	    three buckets. Configuration errors are found before the first page is produced; layout
	    errors are either reported by builders (eg. a table row with the wrong number of cells)
	    or abort a render pass; backend errors come from whatever serialises the pages.
	*/
	struct Error
	{
		enum class Kind
		{
			Configuration,
			Layout,
			RenderBackend,
		};

		Error() = default;
		explicit Error(Kind kind, const std::string& msg);

		Kind kind() const { return m_kind; }
		bool isConfiguration() const { return m_kind == Kind::Configuration; }
		bool isLayout() const { return m_kind == Kind::Layout; }
		bool isRenderBackend() const { return m_kind == Kind::RenderBackend; }

		void display() const;
		const std::string& string() const;
		[[noreturn]] void showAndExit() const;

		static const char* kindName(Kind kind);

	private:
		Kind m_kind = Kind::Layout;
		std::string m_message;
	};

	template <typename T>
	using ErrorOr = zst::Result<T, Error>;

	template <typename... Args>
	[[nodiscard]] zst::Err<Error> ErrConfig(const char* fmt, Args&&... args)
	{
		return zst::Err<Error>(Error::Kind::Configuration, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}

	template <typename... Args>
	[[nodiscard]] zst::Err<Error> ErrLayout(const char* fmt, Args&&... args)
	{
		return zst::Err<Error>(Error::Kind::Layout, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}

	template <typename... Args>
	[[nodiscard]] zst::Err<Error> ErrBackend(const char* fmt, Args&&... args)
	{
		return zst::Err<Error>(Error::Kind::RenderBackend, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}



	enum class LogLevel
	{
		Debug = 0,
		Info = 1,
		Warning = 2,
		Error = 3,
		Silent = 4,
	};

	void setLogLevel(LogLevel level);
	LogLevel getLogLevel();

	template <typename... Args>
	[[noreturn]] inline void internal_error(const char* fmt, Args&&... args)
	{
		zpr::fprintln(stderr, "internal error: {}", zpr::fwd(fmt, static_cast<Args&&>(args)...));
		abort();
	}

	template <typename... Args>
	inline void debug(const char* who, const char* fmt, Args&&... args)
	{
		if(getLogLevel() <= LogLevel::Debug)
			util::impl::log_impl("dbg", 0, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	inline void log(const char* who, const char* fmt, Args&&... args)
	{
		if(getLogLevel() <= LogLevel::Info)
			util::impl::log_impl("log", 1, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	inline void warn(const char* who, const char* fmt, Args&&... args)
	{
		if(getLogLevel() <= LogLevel::Warning)
			util::impl::log_impl("wrn", 2, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}
}

template <>
struct zpr::print_formatter<folio::Error>
{
	template <typename Cb>
	ZPR_ALWAYS_INLINE void print(const folio::Error& err, Cb&& cb, format_args args)
	{
		detail::print(static_cast<Cb&&>(cb), "{}: {}", folio::Error::kindName(err.kind()), err.string());
	}
};
