// text.cpp
// Copyright (c) 2021, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cmath>
#include <algorithm>

#include "pdf/font.h"
#include "pdf/misc.h"
#include "pdf/page.h"
#include "pdf/text.h"
#include "pdf/units.h"

namespace pdf
{
	void Text::writePdfCommands(Stream* stream) const
	{
		auto str_buf = zst::buffer<char>();
		auto appender = [&str_buf](const char* c, size_t n) { str_buf.append(c, n); };

		zpr::cprint(appender, "q BT\n");
		for(auto& group : m_groups)
		{
			for(auto& cmd : group.commands)
				appender(cmd.data(), cmd.size());

			if(not group.text.empty())
				zpr::cprint(appender, "[{}] TJ\n", group.text);
		}

		zpr::cprint(appender, "ET Q\n");
		stream->append(str_buf.bytes());
	}

	void Text::addResources(const Page* page) const
	{
		for(auto f : m_used_fonts)
			page->useFont(f);
	}

	void Text::setFont(const PdfFont* font, PdfScalar height)
	{
		if(font == nullptr)
			pdf::error("cannot set a null font");

		if(m_current_font.font == font && m_current_font.height == height)
			return;

		if(std::find(m_used_fonts.begin(), m_used_fonts.end(), font) == m_used_fonts.end())
			m_used_fonts.push_back(font);

		this->insertPDFCommand(zpr::sprint(" /{} {.3f} Tf\n", font->resourceName(), height.value()));

		m_current_font.font = font;
		m_current_font.height = height;
	}

	void Text::setColour(const folio::Colour& colour)
	{
		if(m_current_colour == colour)
			return;

		m_current_colour = colour;
		if(colour.isRGB())
		{
			auto rgb = colour.rgb();
			this->insertPDFCommand(zpr::sprint(" {.3f} {.3f} {.3f} rg\n", rgb.r / 255.0, rgb.g / 255.0, rgb.b / 255.0));
		}
		else if(colour.isCMYK())
		{
			auto cmyk = colour.cmyk();
			this->insertPDFCommand(zpr::sprint(" {.3f} {.3f} {.3f} {.3f} k\n", cmyk.c / 255.0, cmyk.m / 255.0,
			    cmyk.y / 255.0, cmyk.k / 255.0));
		}
		else
		{
			this->insertPDFCommand(zpr::sprint(" {.3f} g\n", colour.grey() / 255.0));
		}
	}

	void Text::insertPDFCommand(zst::str_view sv)
	{
		// if we have no groups yet, *OR* the last group has text in it, we must create a new group.
		if(m_groups.empty() || not m_groups.back().text.empty())
			m_groups.emplace_back();

		m_groups.back().commands.push_back(sv.str());
	}

	// convention is that all appends to the command list should start with a " ".
	void Text::moveAbs(Position2d pos)
	{
		this->insertPDFCommand(zpr::sprint(" 1 0 0 1 {.3f} {.3f} Tm\n", pos.x().value(), pos.y().value()));
	}

	void Text::offset(double ofs)
	{
		// TJ only understands so many digits anyway
		if(std::abs(ofs) < 0.001)
			return;

		if(m_groups.empty())
			m_groups.emplace_back();

		// note that we specify that a positive offset moves the glyph to the right
		m_groups.back().text += zpr::sprint(" {.3f} ", -1 * ofs);
	}

	void Text::addEncoded(size_t bytes, uint32_t encoded_value)
	{
		if(m_groups.empty())
			m_groups.emplace_back();

		if(bytes == 1)
			m_groups.back().text += zpr::sprint("<{02x}>", encoded_value & 0xFF);
		else if(bytes == 2)
			m_groups.back().text += zpr::sprint("<{04x}>", encoded_value & 0xFFFF);
		else
			pdf::error("invalid number of bytes");
	}
}
