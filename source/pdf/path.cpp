// path.cpp
// Copyright (c) 2023, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"

#include "pdf/misc.h"
#include "pdf/page.h"
#include "pdf/path.h"
#include "pdf/object.h"

namespace pdf
{
	Path::Path(PaintStyle style) : m_style(std::move(style))
	{
	}

	void Path::addSegment(Segment segment)
	{
		m_segments.push_back(std::move(segment));
	}

	template <typename Cb>
	static void write_colour(Cb&& appender, const folio::Colour& colour, bool stroke)
	{
		if(colour.isRGB())
		{
			auto rgb = colour.rgb();
			zpr::cprint(appender, "{.3f} {.3f} {.3f} {}\n", rgb.r / 255.0, rgb.g / 255.0, rgb.b / 255.0,
			    stroke ? "RG" : "rg");
		}
		else if(colour.isCMYK())
		{
			auto cmyk = colour.cmyk();
			zpr::cprint(appender, "{.3f} {.3f} {.3f} {.3f} {}\n", cmyk.c / 255.0, cmyk.m / 255.0, cmyk.y / 255.0,
			    cmyk.k / 255.0, stroke ? "K" : "k");
		}
		else
		{
			zpr::cprint(appender, "{.3f} {}\n", colour.grey() / 255.0, stroke ? "G" : "g");
		}
	}

	void Path::writePdfCommands(Stream* stream) const
	{
		bool stroke = m_style.stroke_colour.has_value() && m_style.line_width.value() > 0;
		bool fill = m_style.fill_colour.has_value();

		// nothing would be painted
		if(not stroke && not fill)
			return;

		auto str_buf = zst::buffer<char>();
		auto appender = [&str_buf](const char* c, size_t n) { str_buf.append(c, n); };

		zpr::cprint(appender, "q\n");
		if(stroke)
		{
			write_colour(appender, *m_style.stroke_colour, /* stroke: */ true);
			zpr::cprint(appender, "{.3f} w 0 J 0 j\n", m_style.line_width.value());
		}

		if(fill)
			write_colour(appender, *m_style.fill_colour, /* stroke: */ false);

		for(auto& seg : m_segments)
		{
			std::visit(util::overloaded {
			               [&](const MoveTo& m) {
				               zpr::cprint(appender, " {.3f} {.3f} m", m.pos.x().value(), m.pos.y().value());
			               },
			               [&](const LineTo& l) {
				               zpr::cprint(appender, " {.3f} {.3f} l", l.pos.x().value(), l.pos.y().value());
			               },
			               [&](const Rectangle& re) {
				               zpr::cprint(appender, " {.3f} {.3f} {.3f} {.3f} re", re.start.x().value(),
				                   re.start.y().value(), re.size.x().value(), re.size.y().value());
			               },
			               [&](const ClosePath&) { zpr::cprint(appender, " h"); },
			           },
			    seg);
		}

		zpr::cprint(appender, " {}\nQ\n", stroke && fill ? "B" : (stroke ? "S" : "f"));
		stream->append(str_buf.bytes());
	}
}
