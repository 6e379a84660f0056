// line.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "layout/base.h"

namespace folio::layout
{
	struct Glyph
	{
		char32_t codepoint;
		size_t style;
		Length advance;
	};

	struct PlacedGlyph
	{
		Glyph glyph;
		Length x;
	};

	// a maximal sequence of glyphs on a line that share a style
	struct LineRun
	{
		size_t style;
		Length x;
		TextRun run;
	};

	struct LineBox
	{
		Length ascent;
		Length height;
	};

	/*
	    Places glyphs one after another on a line, kerning each glyph against the one before it
	    whenever both are set in the same font at the same size. Since kerning only looks at the
	    previous glyph, the position of a glyph does not depend on how the text was split into
	    runs. `styles` holds the resolved styles that glyphs refer to by index.
	*/
	struct LineBuilder
	{
		LineBuilder(const RenderContext& ctx, const std::vector<Style>& styles);

		void add(const Glyph& glyph);

		size_t mark() const { return m_glyphs.size(); }
		void truncate(size_t mark);

		bool empty() const { return m_glyphs.empty(); }
		Length width() const;

		const std::vector<PlacedGlyph>& glyphs() const { return m_glyphs; }

		std::vector<LineRun> runs() const;
		LineBox box() const;

	private:
		const RenderContext& m_ctx;
		const std::vector<Style>& m_styles;

		std::vector<PlacedGlyph> m_glyphs;
	};

	// the horizontal offset of a line of the given width, within `available`
	Length alignmentOffset(Alignment alignment, Length available, Length line_width);
}
