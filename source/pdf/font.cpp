// font.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/file.h"
#include "pdf/font.h"
#include "pdf/misc.h"
#include "pdf/object.h"
#include "pdf/units.h"
#include "pdf/win_ansi_encoding.h"

namespace pdf
{
	static constexpr uint8_t FIRST_CHAR = 32;
	static constexpr uint8_t LAST_CHAR = 255;

	// PDF 1.7: 9.8.2 Font Descriptor Flags; bit 6 is "nonsymbolic"
	static constexpr int64_t FLAG_FIXED_PITCH = (1 << 0);
	static constexpr int64_t FLAG_NONSYMBOLIC = (1 << 5);

	// the width of the glyph for `byte`, as written to the Widths array
	static double glyph_space_width(const font::FontSource* source, uint8_t byte)
	{
		auto cp = encoding::codepointForWinAnsi(byte);
		if(not cp.has_value() || not source->hasGlyph(*cp))
			return 0;

		return std::round(source->glyphAdvance(*cp) * PDF_GLYPH_SPACE_UNITS / source->metrics().units_per_em);
	}

	static Dictionary* make_font_descriptor(File* file, const font::FontSource* source)
	{
		auto& m = source->metrics();
		auto scale = [&m](double x) -> int64_t {
			return static_cast<int64_t>(x * PDF_GLYPH_SPACE_UNITS / m.units_per_em);
		};

		int64_t flags = FLAG_NONSYMBOLIC;
		if(m.is_fixed_pitch)
			flags |= FLAG_FIXED_PITCH;

		auto bbox = file->make<Array>(std::vector<Object*> {
		    file->make<Integer>(scale(m.xmin)),
		    file->make<Integer>(scale(m.ymin)),
		    file->make<Integer>(scale(m.xmax)),
		    file->make<Integer>(scale(m.ymax)),
		});

		return file->makeIndirect<Dictionary>(names::FontDescriptor,
		    std::map<Name, Object*> {
		        { names::FontName, file->make<Name>(source->name()) },
		        { names::Flags, file->make<Integer>(flags) },
		        { names::FontBBox, bbox },
		        { names::ItalicAngle, file->make<Decimal>(m.italic_angle) },
		        { names::Ascent, file->make<Integer>(scale(m.ascent)) },
		        { names::Descent, file->make<Integer>(scale(m.descent)) },
		        { names::CapHeight, file->make<Integer>(scale(m.cap_height)) },
		        { names::XHeight, file->make<Integer>(scale(m.x_height)) },
		        { names::StemV, file->make<Integer>(scale(m.stem_v)) },
		    });
	}

	PdfFont::PdfFont(File* file, const font::FontSource* source, size_t resource_number)
	    : m_source(source), m_resource_name(zpr::sprint("F{}", resource_number))
	{
		m_font_dictionary = file->makeIndirect<Dictionary>(names::Font,
		    std::map<Name, Object*> {
		        { names::Subtype, names::Type1.ptr() },
		        { names::BaseFont, file->make<Name>(source->name()) },
		        { names::Encoding, names::WinAnsiEncoding.ptr() },
		    });

		if(source->isStandardFont())
			return;

		auto widths = file->make<Array>(std::vector<Object*> {});
		for(size_t i = FIRST_CHAR; i <= LAST_CHAR; i++)
		{
			auto width = glyph_space_width(source, static_cast<uint8_t>(i));
			widths->append(file->make<Integer>(static_cast<int64_t>(width)));
		}

		m_font_dictionary->add(names::FirstChar, file->make<Integer>(FIRST_CHAR));
		m_font_dictionary->add(names::LastChar, file->make<Integer>(LAST_CHAR));
		m_font_dictionary->add(names::Widths, widths);
		m_font_dictionary->add(names::FontDescriptor, make_font_descriptor(file, source));
	}

	uint8_t PdfFont::encode(char32_t codepoint) const
	{
		if(auto byte = encoding::WIN_ANSI(codepoint); byte.has_value())
			return *byte;

		if(not m_unencodable.contains(codepoint))
		{
			folio::warn("pdf", "font '{}' cannot encode U+{04x}, using '?' instead", m_source->name(),
			    static_cast<uint32_t>(codepoint));

			m_unencodable.insert(codepoint);
		}

		return '?';
	}

	double PdfFont::readerAdvance(uint8_t byte) const
	{
		return glyph_space_width(m_source, byte);
	}
}
