// afm.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <charconv>

#include "font/afm.h"

namespace font
{
	FontSource::~FontSource()
	{
	}

	static zst::str_view trim(zst::str_view sv)
	{
		while(not sv.empty() && util::is_one_of(sv[0], ' ', '\t', '\r', '\n'))
			sv.remove_prefix(1);

		while(not sv.empty() && util::is_one_of(sv.back(), ' ', '\t', '\r', '\n'))
			sv.remove_suffix(1);

		return sv;
	}

	static std::vector<zst::str_view> split_by(zst::str_view sv, char c)
	{
		std::vector<zst::str_view> ret {};
		while(not sv.empty())
		{
			auto x = trim(sv.take_prefix(sv.find(c)));
			if(not x.empty())
				ret.push_back(x);

			sv = trim(sv);
			if(sv.starts_with(c))
				sv.remove_prefix(1);
		}

		return ret;
	}

	static std::optional<double> to_number(zst::str_view sv)
	{
		double ret = 0;
		auto [ptr, ec] = std::from_chars(sv.begin(), sv.end(), ret);
		if(ec != std::errc())
			return std::nullopt;

		return ret;
	}

	static std::optional<zst::str_view> get_value_for_key(zst::str_view line, zst::str_view key)
	{
		if(line.starts_with(key) && line.drop(key.size()).starts_with(" "))
			return trim(line.drop(key.size()));

		return std::nullopt;
	}

	folio::ErrorOr<std::unique_ptr<AfmFont>> AfmFont::parse(zst::str_view contents, bool is_standard_font)
	{
		auto font = std::unique_ptr<AfmFont>(new AfmFont());
		font->m_is_standard = is_standard_font;

		if(not trim(contents).starts_with("StartFontMetrics"))
			return folio::ErrConfig("not an AFM file (missing 'StartFontMetrics')");

		auto number = [](zst::str_view key, zst::str_view value) -> folio::ErrorOr<double> {
			if(auto n = to_number(value); n.has_value())
				return folio::Ok(*n);

			return folio::ErrConfig("invalid number '{}' for '{}' in AFM file", value, key);
		};

		util::hashmap<std::string, char32_t> name_to_cp {};
		size_t expected_glyphs = 0;
		size_t expected_kerns = 0;

		while(not contents.empty())
		{
			auto line = trim(contents.take_prefix(contents.find('\n')));
			if(contents.starts_with('\n'))
				contents.remove_prefix(1);

			if(line.empty() || line.starts_with("Comment"))
				continue;

			if(auto x = get_value_for_key(line, "FontName"); x.has_value())
			{
				font->m_name = x->str();
			}
			else if(auto x = get_value_for_key(line, "ItalicAngle"); x.has_value())
			{
				font->m_metrics.italic_angle = TRY(number("ItalicAngle", *x));
			}
			else if(auto x = get_value_for_key(line, "IsFixedPitch"); x.has_value())
			{
				font->m_metrics.is_fixed_pitch = (x->sv() == "true");
			}
			else if(auto x = get_value_for_key(line, "FontBBox"); x.has_value())
			{
				auto parts = split_by(*x, ' ');
				if(parts.size() != 4)
					return folio::ErrConfig("malformed FontBBox '{}'", *x);

				font->m_metrics.xmin = TRY(number("FontBBox", parts[0]));
				font->m_metrics.ymin = TRY(number("FontBBox", parts[1]));
				font->m_metrics.xmax = TRY(number("FontBBox", parts[2]));
				font->m_metrics.ymax = TRY(number("FontBBox", parts[3]));
			}
			else if(auto x = get_value_for_key(line, "CapHeight"); x.has_value())
			{
				font->m_metrics.cap_height = TRY(number("CapHeight", *x));
			}
			else if(auto x = get_value_for_key(line, "XHeight"); x.has_value())
			{
				font->m_metrics.x_height = TRY(number("XHeight", *x));
			}
			else if(auto x = get_value_for_key(line, "Ascender"); x.has_value())
			{
				font->m_metrics.ascent = TRY(number("Ascender", *x));
			}
			else if(auto x = get_value_for_key(line, "Descender"); x.has_value())
			{
				font->m_metrics.descent = TRY(number("Descender", *x));
			}
			else if(auto x = get_value_for_key(line, "StdVW"); x.has_value())
			{
				font->m_metrics.stem_v = TRY(number("StdVW", *x));
			}
			else if(auto x = get_value_for_key(line, "StartCharMetrics"); x.has_value())
			{
				expected_glyphs = static_cast<size_t>(TRY(number("StartCharMetrics", *x)));
			}
			else if(auto x = get_value_for_key(line, "StartKernPairs"); x.has_value())
			{
				expected_kerns = static_cast<size_t>(TRY(number("StartKernPairs", *x)));
			}
			else if(auto x = get_value_for_key(line, "C"); x.has_value() && expected_glyphs > 0)
			{
				expected_glyphs--;

				zst::str_view glyph_name {};
				std::optional<double> advance {};
				for(auto part : split_by(*x, ';'))
				{
					if(auto wx = get_value_for_key(part, "WX"); wx.has_value())
						advance = TRY(number("WX", *wx));
					else if(auto n = get_value_for_key(part, "N"); n.has_value())
						glyph_name = *n;
				}

				if(glyph_name.empty() || not advance.has_value())
					return folio::ErrConfig("malformed glyph metrics '{}'", line);

				if(glyph_name == ".notdef")
				{
					font->m_missing_width = *advance;
					continue;
				}

				// glyphs we can't map to unicode can't be typed, so skip them
				auto cp = codepointForGlyphName(glyph_name);
				if(not cp.has_value())
					continue;

				font->m_advances[*cp] = *advance;
				name_to_cp[glyph_name.str()] = *cp;
			}
			else if(auto x = get_value_for_key(line, "KPX"); x.has_value() && expected_kerns > 0)
			{
				--expected_kerns;

				auto parts = split_by(*x, ' ');
				if(parts.size() != 3)
					return folio::ErrConfig("malformed kerning pair '{}'", line);

				auto left = name_to_cp.find(parts[0].sv());
				auto right = name_to_cp.find(parts[1].sv());
				if(left == name_to_cp.end() || right == name_to_cp.end())
					continue;

				font->m_kerning_pairs[{ left->second, right->second }] = TRY(number("KPX", parts[2]));
			}
		}

		if(font->m_name.empty())
			return folio::ErrConfig("AFM file has no FontName");

		if(font->m_advances.empty())
			return folio::ErrConfig("AFM file for '{}' has no usable glyphs", font->m_name);

		font->m_metrics.units_per_em = 1000;
		if(font->m_metrics.ascent == 0 && font->m_metrics.descent == 0)
		{
			font->m_metrics.ascent = font->m_metrics.ymax;
			font->m_metrics.descent = font->m_metrics.ymin;
		}

		return folio::Ok(std::move(font));
	}

	double AfmFont::glyphAdvance(char32_t codepoint) const
	{
		if(auto it = m_advances.find(codepoint); it != m_advances.end())
			return it->second;

		return m_missing_width;
	}

	double AfmFont::kerningAdjustment(char32_t left, char32_t right) const
	{
		if(auto it = m_kerning_pairs.find(std::pair(left, right)); it != m_kerning_pairs.end())
			return it->second;

		return 0;
	}

	bool AfmFont::hasGlyph(char32_t codepoint) const
	{
		return m_advances.contains(codepoint);
	}
}
