// render_backend.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>
#include <optional>

#include "folio/style.h"

namespace folio
{
	struct PositionedGlyph
	{
		char32_t codepoint;

		// offset of the glyph's origin from the start of the run
		Length x;

		// the glyph's natural advance, without kerning
		Length advance;
	};

	/*
	    A run of glyphs that share one style and sit on one baseline. Kerning is already baked
	    into the glyph positions, so a backend can place each glyph at `x` verbatim; `width` is
	    the distance from the start of the run to the end of its last glyph.
	*/
	struct TextRun
	{
		std::vector<PositionedGlyph> glyphs;
		Length width;

		std::u32string text() const;
	};

	struct Paint
	{
		std::optional<Colour> fill;
		std::optional<LineStyle> stroke;

		static Paint filled(Colour c) { return Paint { .fill = c, .stroke = std::nullopt }; }
		static Paint stroked(LineStyle s) { return Paint { .fill = std::nullopt, .stroke = s }; }
	};

	/*
	    Consumes the drawing primitives produced by a render pass. All positions are absolute,
	    in millimetres from the top-left corner of the page, with y increasing downwards; it is
	    up to the backend to convert into whatever its output format uses.

	    The draw calls cannot fail; a backend that encounters trouble while drawing should
	    remember it and report it from `endPage` or `finish`.
	*/
	struct RenderBackend
	{
		virtual ~RenderBackend();

		virtual ErrorOr<void> beginPage(Size2d page_size) = 0;

		virtual void drawText(Position baseline, const TextRun& run, const Style& style) = 0;
		virtual void drawLine(Position start, Position end, const LineStyle& line_style) = 0;
		virtual void drawRect(Position top_left, Size2d size, const Paint& paint) = 0;

		virtual ErrorOr<void> endPage() = 0;
		virtual ErrorOr<zst::byte_buffer> finish() = 0;
	};
}
