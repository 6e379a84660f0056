// font_backend.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string_view>

#include "folio/style.h"

namespace font
{
	struct AfmFont;
}

namespace folio
{
	struct LineMetrics
	{
		// both are distances from the baseline, so both are positive for any sane font
		Length ascent;
		Length descent;

		Length height() const { return ascent + descent; }
	};

	/*
	    Text measurement for the layout engine. Measurement queries are const, so one backend
	    can be shared by any number of documents; only `resolveFamily` (which happens while a
	    document is being configured) may load things.

	    The default implementations measure using the font that the style resolves to; they are
	    virtual so that callers (and tests) can substitute their own metrics.
	*/
	struct FontBackend
	{
		virtual ~FontBackend();

		virtual ErrorOr<FontFamily> resolveFamily(zst::str_view name) = 0;

		// the advance of each codepoint of `text`, without kerning
		virtual std::vector<Length> measure(const Style& style, std::u32string_view text) const;

		// the adjustment to apply between `left` and `right`; negative brings them closer
		virtual Length kerning(const Style& style, char32_t left, char32_t right) const;

		virtual LineMetrics lineMetrics(const Style& style) const;
	};


	/*
	    Resolves families from AFM files on disk. A family named `name` consists of the files
	    `name-Regular.afm`, `name-Bold.afm`, `name-Italic.afm` and `name-BoldItalic.afm` in one of
	    the search paths. The standard Helvetica family is always available without any files; if
	    the fallback is enabled, it also stands in for families that cannot be found.
	*/
	struct AfmFontBackend : FontBackend
	{
		AfmFontBackend();
		virtual ~AfmFontBackend() override;

		AfmFontBackend(const AfmFontBackend&) = delete;
		AfmFontBackend& operator=(const AfmFontBackend&) = delete;

		void addSearchPath(std::string path);
		void setBuiltinFallback(bool enabled) { m_builtin_fallback = enabled; }

		virtual ErrorOr<FontFamily> resolveFamily(zst::str_view name) override;

		FontFamily builtinFamily() const;

		static constexpr const char* BUILTIN_FAMILY_NAME = "Helvetica";

	private:
		ErrorOr<std::optional<FontFamily>> load_family_from_files(zst::str_view name);

		bool m_builtin_fallback = true;
		std::vector<std::string> m_search_paths;

		std::vector<std::unique_ptr<font::AfmFont>> m_fonts;
		util::hashmap<std::string, FontFamily> m_families;
	};
}
