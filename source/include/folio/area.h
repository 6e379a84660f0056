// area.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "folio/render_backend.h"

namespace folio
{
	/*
	    A rectangular region of a page, plus a cursor that tracks how much of its height has been
	    used so far. The cursor never exceeds the height, so once an area is full it stays full.

	    An area without a backend is a measuring area: everything about it behaves the same, but
	    draw calls are dropped. Tables use this to work out how tall a row will be before drawing it.
	*/
	struct Area
	{
		Area(RenderBackend* backend, Position origin, Size2d size);

		Length width() const { return m_size.x(); }
		Length height() const { return m_size.y(); }
		Size2d size() const { return m_size; }
		Position origin() const { return m_origin; }

		Length cursor() const { return m_cursor; }
		Length remainingHeight() const { return this->height() - m_cursor; }

		bool isDrawing() const { return m_backend != nullptr; }
		RenderBackend* backend() const { return m_backend; }

		// moves the cursor down, stopping at the bottom of the area
		void advance(Length dy);

		// the part of the area below the cursor
		[[nodiscard]] Area remainder() const;

		[[nodiscard]] Area shrink(const Margins& margins) const;
		[[nodiscard]] Area column(Length x, Length width) const;
		[[nodiscard]] Area withHeight(Length height) const;
		[[nodiscard]] Area measuring() const;

		// positions are relative to the origin of the area
		void drawText(Position baseline, const TextRun& run, const Style& style) const;
		void drawLine(Position start, Position end, const LineStyle& line_style) const;
		void drawRect(Position top_left, Size2d size, const Paint& paint) const;

	private:
		RenderBackend* m_backend;
		Position m_origin;
		Size2d m_size;
		Length m_cursor;
	};
}
