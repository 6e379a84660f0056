// text.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <optional>
#include <vector>

#include "folio/colour.h"

#include "pdf/units.h"
#include "pdf/page_object.h"

namespace pdf
{
	struct Page;
	struct PdfFont;

	/*
	    The Text object operates on the idea of 'groups' (but these groups are hidden from the caller).
	    A group is simply an instance of the 'TJ' pdf operator, containing one or more encoded glyphs
	    to draw, as well as any number of horizontal adjustment commands within the array.

	    Between groups, arbitrary PDF commands can be inserted; these are usually positioning
	    commands (Tm), font changes (Tf), or colour changes (rg/k/g). Performing any of these ends
	    the current group.
	*/
	struct Text : PageObject
	{
		virtual void writePdfCommands(Stream* stream) const override;
		virtual void addResources(const Page* page) const override;

		// must be called before the first glyph is added
		void setFont(const PdfFont* font, PdfScalar height);
		void setColour(const folio::Colour& colour);

		void moveAbs(Position2d pos);

		void insertPDFCommand(zst::str_view sv);

		/*
		    offsets the next glyph, in thousandths of the font size. a positive value moves the
		    next glyph TO THE RIGHT (which is the opposite of what TJ does).
		*/
		void offset(double ofs);

		// `bytes` indicates how many bytes the value should be printed as; 1 gives <AA>, 2 gives <AABB>.
		void addEncoded(size_t bytes, uint32_t encoded_value);

	private:
		struct Group
		{
			std::vector<std::string> commands;
			std::string text;
		};

		struct
		{
			const PdfFont* font = nullptr;
			PdfScalar height {};
		} m_current_font {};

		std::optional<folio::Colour> m_current_colour {};

		std::vector<Group> m_groups {};
		std::vector<const PdfFont*> m_used_fonts {};
	};
}
