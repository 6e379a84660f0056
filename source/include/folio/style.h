// style.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include "folio/units.h"
#include "folio/colour.h"
#include "folio/font_family.h"

namespace folio
{
	enum class Alignment
	{
		Left,
		Centre,
		Right,
	};

	/*
	    A bag of optional text attributes. Elements carry partial styles; the engine resolves the
	    effective style of an element by extending its parent's (already resolved) style with the
	    element's own, starting from the document's root style, which has every field set. Reading
	    a field that is unset anywhere in that chain is a bug in the engine, not in the document.
	*/
	struct Style
	{
		Style() = default;

#define DEFINE_ACCESSOR(field_type, field_name, method_name)                 \
	inline field_type method_name() const                                    \
	{                                                                        \
		if(field_name.has_value())                                           \
			return *field_name;                                              \
		folio::internal_error("accessed unset style field '{}'", #method_name); \
	}

		DEFINE_ACCESSOR(FontFamily, m_font_family, font_family);
		DEFINE_ACCESSOR(double, m_font_size, font_size);
		DEFINE_ACCESSOR(Colour, m_colour, colour);
		DEFINE_ACCESSOR(bool, m_bold, is_bold);
		DEFINE_ACCESSOR(bool, m_italic, is_italic);
		DEFINE_ACCESSOR(double, m_line_spacing, line_spacing);
#undef DEFINE_ACCESSOR

#define DEFINE_SETTER(field_type, field_name, method_name, method_name2) \
	inline Style& method_name(std::optional<field_type> new_value)       \
	{                                                                    \
		field_name = std::move(new_value);                               \
		return *this;                                                    \
	}                                                                    \
                                                                         \
	inline Style method_name2(field_type new_value) const                \
	{                                                                    \
		auto copy = *this;                                               \
		copy.method_name(std::move(new_value));                          \
		return copy;                                                     \
	}

		DEFINE_SETTER(FontFamily, m_font_family, set_font_family, with_font_family);
		DEFINE_SETTER(double, m_font_size, set_font_size, with_font_size);
		DEFINE_SETTER(Colour, m_colour, set_colour, with_colour);
		DEFINE_SETTER(bool, m_bold, set_bold, with_bold);
		DEFINE_SETTER(bool, m_italic, set_italic, with_italic);
		DEFINE_SETTER(double, m_line_spacing, set_line_spacing, with_line_spacing);
#undef DEFINE_SETTER

		Style bold() const { return this->with_bold(true); }
		Style italic() const { return this->with_italic(true); }

		bool has_font_family() const { return m_font_family.has_value(); }
		bool has_font_size() const { return m_font_size.has_value(); }
		bool has_colour() const { return m_colour.has_value(); }

		// true if every field is set
		bool isComplete() const;

		/*
		    with the current style as the reference, change all of our fields to those that `main` has.
		*/
		Style extendWith(const Style& main) const;

		FontStyle font_style() const;
		const font::FontSource* font() const;

		// the font size, in layout units
		Length font_size_length() const { return pointsToLength(this->font_size()); }

		bool operator==(const Style& other) const = default;

	private:
		std::optional<FontFamily> m_font_family;
		std::optional<double> m_font_size;
		std::optional<Colour> m_colour;
		std::optional<bool> m_bold;
		std::optional<bool> m_italic;
		std::optional<double> m_line_spacing;
	};


	struct LineStyle
	{
		Length thickness = Length(0.1);
		Colour colour = Colour::black();

		LineStyle with_thickness(Length t) const
		{
			auto copy = *this;
			copy.thickness = t;
			return copy;
		}

		LineStyle with_colour(Colour c) const
		{
			auto copy = *this;
			copy.colour = c;
			return copy;
		}

		bool operator==(const LineStyle&) const = default;
	};
}
