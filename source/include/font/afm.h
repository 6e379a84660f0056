// afm.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include "defs.h"
#include "font/font_source.h"

namespace font
{
	std::optional<char32_t> codepointForGlyphName(zst::str_view name);

	/*
	    A font described by an Adobe Font Metrics file. Only the parts we need for layout are
	    kept: the font-wide metrics, the advance of each named glyph, and the kerning pairs.
	    Glyphs whose names are not in the glyph list are ignored.
	*/
	struct AfmFont : FontSource
	{
		static folio::ErrorOr<std::unique_ptr<AfmFont>> parse(zst::str_view contents, bool is_standard_font = false);

		virtual double glyphAdvance(char32_t codepoint) const override;
		virtual double kerningAdjustment(char32_t left, char32_t right) const override;
		virtual bool hasGlyph(char32_t codepoint) const override;
		virtual bool isStandardFont() const override { return m_is_standard; }

		size_t numGlyphs() const { return m_advances.size(); }
		size_t numKerningPairs() const { return m_kerning_pairs.size(); }

	private:
		AfmFont() = default;

		bool m_is_standard = false;
		double m_missing_width = 0;

		util::hashmap<char32_t, double> m_advances;
		util::hashmap<std::pair<char32_t, char32_t>, double> m_kerning_pairs;
	};
}
