// font.h
// Copyright (c) 2021, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include "util.h" // for hashset

#include "font/font_source.h"

namespace pdf
{
	struct File;
	struct Dictionary;

	/*
	    A simple (Type1, WinAnsi-encoded) font resource. The standard fonts are referenced only by
	    name; other fonts carry their widths and a descriptor so that readers can substitute
	    something with matching metrics.
	*/
	struct PdfFont
	{
		PdfFont(File* file, const font::FontSource* source, size_t resource_number);

		PdfFont(const PdfFont&) = delete;
		PdfFont& operator=(const PdfFont&) = delete;

		// eg. "F1"
		const std::string& resourceName() const { return m_resource_name; }
		Dictionary* dictionary() const { return m_font_dictionary; }

		const font::FontSource* source() const { return m_source; }

		// the byte to use for this codepoint; unencodable codepoints become '?' (with a warning, once)
		uint8_t encode(char32_t codepoint) const;

		// how far a reader advances after showing this byte, in glyph space (1/1000 of the font size)
		double readerAdvance(uint8_t byte) const;

	private:
		const font::FontSource* m_source;
		std::string m_resource_name;
		Dictionary* m_font_dictionary;

		mutable util::hashset<char32_t> m_unencodable;
	};
}
