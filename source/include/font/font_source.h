// font_source.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include "font/metrics.h"

namespace font
{
	/*
	    Anything that can answer advance-width and kerning queries for codepoints. The layout engine
	    only ever goes through this interface (via the FontBackend), so tests can supply fonts with
	    simple, predictable metrics.
	*/
	struct FontSource
	{
		virtual ~FontSource();

		// the postscript name
		const std::string& name() const { return m_name; }
		const FontMetrics& metrics() const { return m_metrics; }

		// in font design units
		virtual double glyphAdvance(char32_t codepoint) const = 0;
		virtual double kerningAdjustment(char32_t left, char32_t right) const = 0;

		virtual bool hasGlyph(char32_t codepoint) const = 0;

		// one of the standard pdf fonts, which readers provide themselves
		virtual bool isStandardFont() const { return false; }

	protected:
		std::string m_name;
		FontMetrics m_metrics;
	};
}
