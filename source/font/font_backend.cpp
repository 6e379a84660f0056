// font_backend.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "font/afm.h"
#include "font/builtin.h"

#include "folio/font_backend.h"

namespace folio
{
	FontBackend::~FontBackend()
	{
	}

	static Length font_units_to_length(const font::FontSource* font, double units, const Style& style)
	{
		return style.font_size_length() * (units / font->metrics().units_per_em);
	}

	std::vector<Length> FontBackend::measure(const Style& style, std::u32string_view text) const
	{
		auto font = style.font();

		std::vector<Length> ret {};
		ret.reserve(text.size());

		for(auto cp : text)
			ret.push_back(font_units_to_length(font, font->glyphAdvance(cp), style));

		return ret;
	}

	Length FontBackend::kerning(const Style& style, char32_t left, char32_t right) const
	{
		auto font = style.font();
		return font_units_to_length(font, font->kerningAdjustment(left, right), style);
	}

	LineMetrics FontBackend::lineMetrics(const Style& style) const
	{
		auto font = style.font();
		return LineMetrics {
			.ascent = font_units_to_length(font, font->metrics().ascent, style),
			.descent = font_units_to_length(font, -font->metrics().descent, style),
		};
	}




	static ErrorOr<std::unique_ptr<font::AfmFont>> load_builtin(font::builtin::Face face)
	{
		return font::AfmFont::parse(font::builtin::getAfmData(face), /* is_standard_font: */ true);
	}

	AfmFontBackend::AfmFontBackend()
	{
		using enum font::builtin::Face;
		for(auto face : { Helvetica, HelveticaOblique, HelveticaBold, HelveticaBoldOblique })
		{
			// the builtin metrics are compiled in, so failing to parse them is our fault
			auto font = load_builtin(face);
			if(font.is_err())
				internal_error("failed to load builtin font: {}", font.error());

			m_fonts.push_back(std::move(font.unwrap()));
		}

		m_families.emplace(BUILTIN_FAMILY_NAME, this->builtinFamily());
	}

	AfmFontBackend::~AfmFontBackend()
	{
	}

	FontFamily AfmFontBackend::builtinFamily() const
	{
		return FontFamily(m_fonts[0].get(), m_fonts[1].get(), m_fonts[2].get(), m_fonts[3].get());
	}

	void AfmFontBackend::addSearchPath(std::string path)
	{
		m_search_paths.push_back(std::move(path));
	}

	ErrorOr<std::optional<FontFamily>> AfmFontBackend::load_family_from_files(zst::str_view name)
	{
		static constexpr const char* SUFFIXES[] = { "Regular", "Italic", "Bold", "BoldItalic" };

		for(auto& dir : m_search_paths)
		{
			auto base = stdfs::path(dir);

			std::vector<std::unique_ptr<font::AfmFont>> faces {};
			for(auto suffix : SUFFIXES)
			{
				auto path = base / zpr::sprint("{}-{}.afm", name, suffix);
				auto contents = util::readEntireFile(path.string());
				if(not contents.has_value())
					break;

				auto font = font::AfmFont::parse(contents->span().chars());
				if(font.is_err())
					return ErrConfig("failed to load '{}': {}", path.string(), font.error().string());

				faces.push_back(std::move(font.unwrap()));
			}

			// a family needs all four faces; try the next directory otherwise
			if(faces.size() != 4)
				continue;

			auto family = FontFamily(faces[0].get(), faces[1].get(), faces[2].get(), faces[3].get());
			for(auto& f : faces)
				m_fonts.push_back(std::move(f));

			folio::log("fonts", "loaded family '{}' from '{}'", name, dir);
			return Ok(std::optional<FontFamily>(family));
		}

		return Ok(std::optional<FontFamily>());
	}

	ErrorOr<FontFamily> AfmFontBackend::resolveFamily(zst::str_view name)
	{
		if(auto it = m_families.find(name.sv()); it != m_families.end())
			return Ok(it->second);

		if(auto family = TRY(this->load_family_from_files(name)); family.has_value())
		{
			m_families.emplace(name.str(), *family);
			return Ok(*family);
		}

		if(not m_builtin_fallback)
			return ErrConfig("could not find font family '{}' (searched {} paths)", name, m_search_paths.size());

		folio::warn("fonts", "could not find font family '{}', using builtin '{}'", name, BUILTIN_FAMILY_NAME);
		return Ok(this->builtinFamily());
	}
}
