// colour.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <zpr.h>

namespace folio
{
	// all channels are 0 - 255
	struct Colour
	{
		enum class Type
		{
			RGB,
			CMYK,
			Greyscale,
		};

		struct RGB
		{
			uint8_t r;
			uint8_t g;
			uint8_t b;

			constexpr bool operator==(const RGB&) const = default;
		};

		struct CMYK
		{
			uint8_t c;
			uint8_t m;
			uint8_t y;
			uint8_t k;

			constexpr bool operator==(const CMYK&) const = default;
		};

		constexpr bool isRGB() const { return m_type == Type::RGB; }
		constexpr bool isCMYK() const { return m_type == Type::CMYK; }
		constexpr bool isGreyscale() const { return m_type == Type::Greyscale; }

		constexpr RGB rgb() const { return m_rgb; }
		constexpr CMYK cmyk() const { return m_cmyk; }
		constexpr uint8_t grey() const { return m_grey; }
		constexpr Type type() const { return m_type; }

		constexpr static Colour rgb(uint8_t r, uint8_t g, uint8_t b)
		{
			Colour ret {};
			ret.m_type = Type::RGB;
			ret.m_rgb = RGB { .r = r, .g = g, .b = b };
			return ret;
		}

		constexpr static Colour cmyk(uint8_t c, uint8_t m, uint8_t y, uint8_t k)
		{
			Colour ret {};
			ret.m_type = Type::CMYK;
			ret.m_cmyk = CMYK { .c = c, .m = m, .y = y, .k = k };
			return ret;
		}

		constexpr static Colour greyscale(uint8_t grey)
		{
			Colour ret {};
			ret.m_type = Type::Greyscale;
			ret.m_grey = grey;
			return ret;
		}

		constexpr static Colour white() { return rgb(255, 255, 255); }
		constexpr static Colour black() { return rgb(0, 0, 0); }

		constexpr bool operator==(const Colour& other) const
		{
			if(m_type != other.m_type)
				return false;

			switch(m_type)
			{
				using enum Type;
				case RGB: return m_rgb == other.m_rgb;
				case CMYK: return m_cmyk == other.m_cmyk;
				case Greyscale: return m_grey == other.m_grey;
			}
			return false;
		}

		constexpr bool operator!=(const Colour& other) const { return not(*this == other); }

	private:
		Type m_type = Type::RGB;
		union
		{
			struct RGB m_rgb { 0, 0, 0 };
			struct CMYK m_cmyk;
			uint8_t m_grey;
		};
	};
}


template <>
struct zpr::print_formatter<folio::Colour>
{
	template <typename _Cb>
	void print(const folio::Colour& colour, _Cb&& cb, format_args args)
	{
		if(colour.isRGB())
			detail::print(static_cast<_Cb&&>(cb), "rgb({}, {}, {})", int(colour.rgb().r), int(colour.rgb().g),
			    int(colour.rgb().b));
		else if(colour.isCMYK())
			detail::print(static_cast<_Cb&&>(cb), "cmyk({}, {}, {}, {})", int(colour.cmyk().c), int(colour.cmyk().m),
			    int(colour.cmyk().y), int(colour.cmyk().k));
		else
			detail::print(static_cast<_Cb&&>(cb), "grey({})", int(colour.grey()));
	}
};
