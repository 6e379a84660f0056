// path.h
// Copyright (c) 2023, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>
#include <optional>

#include "folio/colour.h"

#include "pdf/units.h"
#include "pdf/page_object.h"

namespace pdf
{
	// straight-line paths; stroked, filled, or both.
	struct Path : PageObject
	{
		struct MoveTo
		{
			Position2d pos;
		};

		struct LineTo
		{
			Position2d pos;
		};

		// `start` is the bottom-left corner, since y goes up
		struct Rectangle
		{
			Position2d start;
			Size2d size;
		};

		struct ClosePath
		{
		};

		struct PaintStyle
		{
			// no stroke if empty
			std::optional<folio::Colour> stroke_colour;
			PdfScalar line_width;

			// no fill if empty
			std::optional<folio::Colour> fill_colour;
		};

		using Segment = std::variant<MoveTo, LineTo, Rectangle, ClosePath>;

		explicit Path(PaintStyle style);
		void addSegment(Segment segment);

		virtual void writePdfCommands(Stream* stream) const override;

	private:
		PaintStyle m_style;
		std::vector<Segment> m_segments;
	};
}
