// error.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <unistd.h>

#include <atomic>

#include "error.h"

namespace folio
{
	inline constexpr const char* COLOUR_RESET = "\033[0m";
	inline constexpr const char* COLOUR_BLACK_BOLD = "\033[1m";
	inline constexpr const char* COLOUR_RED_BOLD = "\033[1m\033[31m";
	inline constexpr const char* COLOUR_YELLOW_BOLD = "\033[1m\033[33m";
	inline constexpr const char* COLOUR_BLUE_BOLD = "\033[1m\033[34m";
	inline constexpr const char* COLOUR_GREY_BOLD = "\033[30;1m";

	static std::atomic<LogLevel> g_log_level = LogLevel::Info;

	void setLogLevel(LogLevel level)
	{
		g_log_level = level;
	}

	LogLevel getLogLevel()
	{
		return g_log_level;
	}


	Error::Error(Kind kind, const std::string& msg) : m_kind(kind), m_message(msg)
	{
	}

	const std::string& Error::string() const
	{
		return m_message;
	}

	const char* Error::kindName(Kind kind)
	{
		switch(kind)
		{
			case Kind::Configuration: return "configuration error";
			case Kind::Layout: return "layout error";
			case Kind::RenderBackend: return "render backend error";
		}
		return "error";
	}

	void Error::display() const
	{
		bool coloured = isatty(STDERR_FILENO);

		const char* colour_error = coloured ? COLOUR_RED_BOLD : "";
		const char* colour_black_bold = coloured ? COLOUR_BLACK_BOLD : "";
		const char* colour_reset = coloured ? COLOUR_RESET : "";

		zpr::fprintln(stderr, "{}{}:{} {}{}{}", colour_error, kindName(m_kind), colour_reset, colour_black_bold,
		    m_message, colour_reset);
	}

	[[noreturn]] void Error::showAndExit() const
	{
		this->display();
		exit(1);
	}
}

namespace util::impl
{
	void log_impl(const char* prefix, int level, const std::string& msg, const char* who)
	{
		const bool coloured = isatty(STDERR_FILENO);

		const char* grey_bold = coloured ? folio::COLOUR_GREY_BOLD : "";
		const char* yellow_bold = coloured ? folio::COLOUR_YELLOW_BOLD : "";
		const char* red_bold = coloured ? folio::COLOUR_RED_BOLD : "";
		const char* blue_bold = coloured ? folio::COLOUR_BLUE_BOLD : "";

		const char* prefix_colour = level <= 1 ? grey_bold : level == 2 ? yellow_bold : red_bold;
		const char* colour_reset = coloured ? folio::COLOUR_RESET : "";

		zpr::fprintln(stderr, "{}[{}]{}{}{}{}{}{} {}", prefix_colour, prefix, colour_reset, who ? blue_bold : "",
		    who ? " " : "", who ? who : "", who ? colour_reset : "", who ? ":" : "", msg);
	}
}
