// font_family.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "font/font_source.h"

namespace folio
{
	enum class FontStyle
	{
		Regular = 0,
		Italic,
		Bold,
		BoldItalic,
	};

	/*
	    The four faces of a family. The fonts themselves are owned by whichever FontBackend
	    resolved the family, and must outlive every document that uses it.
	*/
	struct FontFamily
	{
		FontFamily(const font::FontSource* regular,
		    const font::FontSource* italic,
		    const font::FontSource* bold,
		    const font::FontSource* bold_italic)
		    : m_regular_font(regular)
		    , m_italic_font(italic)
		    , m_bold_font(bold)
		    , m_bold_italic_font(bold_italic)
		{
		}

		const font::FontSource* getFontForStyle(FontStyle style) const
		{
			switch(style)
			{
				case FontStyle::Regular: return m_regular_font;
				case FontStyle::Italic: return m_italic_font;
				case FontStyle::Bold: return m_bold_font;
				case FontStyle::BoldItalic: return m_bold_italic_font;
			}
			return m_regular_font;
		}

		const font::FontSource* regular() const { return m_regular_font; }
		const font::FontSource* italic() const { return m_italic_font; }
		const font::FontSource* bold() const { return m_bold_font; }
		const font::FontSource* boldItalic() const { return m_bold_italic_font; }

		constexpr bool operator==(const FontFamily&) const = default;

	private:
		const font::FontSource* m_regular_font;
		const font::FontSource* m_italic_font;
		const font::FontSource* m_bold_font;
		const font::FontSource* m_bold_italic_font;
	};
}
