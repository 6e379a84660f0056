// style.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/style.h"

namespace folio
{
	Style Style::extendWith(const Style& main) const
	{
		auto flat_value_or = [](const auto& a, const auto& b) -> auto {
			if(a.has_value())
				return a;
			return b;
		};

		auto style = Style();
		style.set_font_family(flat_value_or(main.m_font_family, m_font_family))
		    .set_font_size(flat_value_or(main.m_font_size, m_font_size))
		    .set_colour(flat_value_or(main.m_colour, m_colour))
		    .set_bold(flat_value_or(main.m_bold, m_bold))
		    .set_italic(flat_value_or(main.m_italic, m_italic))
		    .set_line_spacing(flat_value_or(main.m_line_spacing, m_line_spacing)) //
		    ;

		return style;
	}

	bool Style::isComplete() const
	{
		return m_font_family.has_value() && m_font_size.has_value() && m_colour.has_value() && m_bold.has_value()
		    && m_italic.has_value() && m_line_spacing.has_value();
	}

	FontStyle Style::font_style() const
	{
		auto b = this->is_bold();
		auto i = this->is_italic();

		if(b && i)
			return FontStyle::BoldItalic;
		else if(b)
			return FontStyle::Bold;
		else if(i)
			return FontStyle::Italic;
		else
			return FontStyle::Regular;
	}

	const font::FontSource* Style::font() const
	{
		return this->font_family().getFontForStyle(this->font_style());
	}
}
