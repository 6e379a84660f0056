// units.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "defs.h"

namespace folio
{
	using Length = dim::Scalar<dim::units::mm>;
	using Vector2 = dim::Vector2<dim::units::mm, BASE_COORD_SYSTEM>;

	// font sizes are specified in points
	using PointSize = dim::Scalar<dim::units::pt>;

	using Size2d = Vector2;
	using Position = Vector2;
	using Offset2d = Vector2;

	inline Length pointsToLength(double pt)
	{
		return PointSize(pt).into<dim::units::mm>();
	}

	struct Margins
	{
		Length top;
		Length right;
		Length bottom;
		Length left;

		static Margins all(Length x) { return Margins { x, x, x, x }; }
		static Margins trbl(Length t, Length r, Length b, Length l) { return Margins { t, r, b, l }; }
		static Margins vh(Length v, Length h) { return Margins { v, h, v, h }; }

		Length horizontal() const { return left + right; }
		Length vertical() const { return top + bottom; }

		bool operator==(const Margins&) const = default;
	};

	namespace literals
	{
		constexpr inline Length operator""_mm(long double x)
		{
			return Length(static_cast<double>(x));
		}

		constexpr inline Length operator""_mm(unsigned long long x)
		{
			return Length(static_cast<double>(x));
		}

		constexpr inline Length operator""_pt(long double x)
		{
			return PointSize(static_cast<double>(x)).into<dim::units::mm>();
		}

		constexpr inline Length operator""_pt(unsigned long long x)
		{
			return PointSize(static_cast<double>(x)).into<dim::units::mm>();
		}
	}
}
