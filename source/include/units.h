// units.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <type_traits>

#include <zpr.h>

namespace dim
{
	/*
	    A `Scalar` is a number tagged with its unit, so that values measured in different units
	    cannot be mixed by accident. Every unit is scaled in terms of the millimetre (scale 1); the
	    layout engine works in millimetres, font sizes are given in points, and the pdf layer
	    speaks in pdf user units (also 1/72 inch). Conversions are explicit, via `into<>()`.

	    `Vector2` additionally carries a coordinate system tag; the layout engine's coordinates
	    have y growing downwards from the top of the page, while pdf has y growing upwards.
	*/
	template <typename, typename = double>
	struct Scalar;

	template <typename, typename _CoordSystem, typename = double>
	struct Vector2;

	namespace impl
	{
		template <typename _FromUnit, typename _ToUnit>
		struct can_convert_units : std::false_type
		{
		};

		template <typename _U>
		struct can_convert_units<_U, _U> : std::true_type
		{
		};
	}

	template <typename _System, typename _Type>
	struct Scalar
	{
		using value_type = _Type;
		using unit_system = _System;
		using self_type = Scalar<_System, _Type>;
		using unit_tag_type = typename _System::Tag;

		static constexpr auto scale_factor = _System::scale_factor;
		static_assert(scale_factor != 0);

		constexpr Scalar() : _x(0) { }

		template <std::convertible_to<value_type> T>
		constexpr explicit Scalar(T x) : _x(x)
		{
		}

		constexpr Scalar(self_type&&) = default;
		constexpr Scalar(const self_type&) = default;
		constexpr self_type& operator=(self_type&&) = default;
		constexpr self_type& operator=(const self_type&) = default;

		constexpr bool iszero() const { return this->_x == 0; }
		constexpr bool nonzero() const { return this->_x != 0; }

		constexpr value_type value() const { return this->_x; }
		constexpr self_type abs() const { return self_type(_x < 0 ? -_x : _x); }

		constexpr self_type operator-() const { return self_type(-this->_x); }

		constexpr self_type& operator+=(self_type ofs)
		{
			this->_x += ofs._x;
			return *this;
		}
		constexpr self_type& operator-=(self_type ofs)
		{
			this->_x -= ofs._x;
			return *this;
		}
		constexpr self_type& operator*=(value_type scale)
		{
			this->_x *= scale;
			return *this;
		}
		constexpr self_type& operator/=(value_type scale)
		{
			this->_x /= scale;
			return *this;
		}

		constexpr bool operator==(const self_type& other) const { return this->_x == other._x; }
		constexpr bool operator!=(const self_type& other) const { return this->_x != other._x; }
		constexpr bool operator<=(const self_type& other) const { return this->_x <= other._x; }
		constexpr bool operator>=(const self_type& other) const { return this->_x >= other._x; }
		constexpr bool operator<(const self_type& other) const { return this->_x < other._x; }
		constexpr bool operator>(const self_type& other) const { return this->_x > other._x; }

		template <typename _Target>
		constexpr Scalar<_Target, _Type> into() const
		    requires(impl::can_convert_units<unit_tag_type, typename _Target::Tag>::value)
		{
			return Scalar<_Target, _Type>((this->_x * scale_factor) / _Target::scale_factor);
		}

		value_type _x;
	};

	template <typename _System, typename _CoordSystem, typename _Type>
	struct Vector2
	{
		using value_type = _Type;
		using unit_system = _System;
		using scalar_type = Scalar<_System, _Type>;
		using self_type = Vector2<_System, _CoordSystem, _Type>;
		using coord_system = _CoordSystem;

		constexpr Vector2() : _x(static_cast<_Type>(0)), _y(static_cast<_Type>(0)) { }
		constexpr Vector2(value_type x, value_type y) : _x(scalar_type(x)), _y(scalar_type(y)) { }
		constexpr Vector2(scalar_type x, scalar_type y) : _x(x), _y(y) { }

		constexpr Vector2(self_type&&) = default;
		constexpr Vector2(const self_type&) = default;
		constexpr self_type& operator=(self_type&&) = default;
		constexpr self_type& operator=(const self_type&) = default;

		constexpr bool iszero() const { return this->_x.iszero() && this->_y.iszero(); }

		constexpr self_type operator-() const { return self_type(-this->_x, -this->_y); }

		constexpr self_type& operator+=(self_type ofs)
		{
			this->_x += ofs._x;
			this->_y += ofs._y;
			return *this;
		}
		constexpr self_type& operator-=(self_type ofs)
		{
			this->_x -= ofs._x;
			this->_y -= ofs._y;
			return *this;
		}

		// no ordering; (x1 > x2 && y1 > y2) and (x1 > x2 || y1 > y2) are both useful.
		constexpr bool operator==(const self_type& other) const { return this->_x == other._x && this->_y == other._y; }
		constexpr bool operator!=(const self_type& other) const { return !(*this == other); }

		template <typename _Target>
		constexpr Vector2<_Target, coord_system, _Type> into() const
		    requires(impl::can_convert_units<typename _System::Tag, typename _Target::Tag>::value)
		{
			return Vector2<_Target, coord_system, _Type>(this->_x.template into<_Target>(),
			    this->_y.template into<_Target>());
		}

		constexpr const scalar_type& x() const { return this->_x; }
		constexpr const scalar_type& y() const { return this->_y; }

		constexpr scalar_type& x() { return this->_x; }
		constexpr scalar_type& y() { return this->_y; }

		scalar_type _x;
		scalar_type _y;
	};
}

/*
    units are defined in the global namespace and brought into `dim::units`; the names
    therefore cannot collide.
*/
#define DEFINE_UNIT(_unit_name, _SF, _Tag)              \
	namespace dim::units                                \
	{                                                   \
		struct _unit_name                               \
		{                                               \
			static constexpr double scale_factor = _SF; \
			using Tag = _Tag;                           \
		};                                              \
	}

struct BASE_COORD_SYSTEM;
DEFINE_UNIT(millimetre, 1.0, void);

// 72 points == 1 inch == 25.4 mm
DEFINE_UNIT(point, (25.4 / 72.0), void);

// same size as a point, but kept apart so that pdf coordinates don't leak into font sizes
struct PDF_UNIT_TAG;
DEFINE_UNIT(pdf_user_unit, (25.4 / 72.0), PDF_UNIT_TAG);

#define MAKE_UNITS_COMPATIBLE(_FromUnit, _ToUnit)                     \
	namespace dim::impl                                               \
	{                                                                 \
		template <>                                                   \
		struct can_convert_units<_FromUnit, _ToUnit> : std::true_type \
		{                                                             \
		};                                                            \
	}

MAKE_UNITS_COMPATIBLE(void, PDF_UNIT_TAG);
MAKE_UNITS_COMPATIBLE(PDF_UNIT_TAG, void);

namespace dim::units
{
	using mm = millimetre;
	using pt = point;
}

namespace dim
{
	constexpr inline auto mm(double x)
	{
		return Scalar<dim::units::mm>(x);
	}

	constexpr inline auto mm(double x, double y)
	{
		return Vector2<dim::units::mm, BASE_COORD_SYSTEM>(x, y);
	}

	constexpr inline auto pt(double x)
	{
		return Scalar<dim::units::pt>(x);
	}
}




namespace dim
{
	template <typename _S, typename _T>
	constexpr inline Scalar<_S, _T> operator+(Scalar<_S, _T> a, Scalar<_S, _T> b)
	{
		return Scalar<_S, _T>(a._x + b._x);
	}

	template <typename _S, typename _T>
	constexpr inline Scalar<_S, _T> operator-(Scalar<_S, _T> a, Scalar<_S, _T> b)
	{
		return Scalar<_S, _T>(a._x - b._x);
	}

	template <typename _S, typename _T, typename _ScaleT, typename = std::enable_if_t<std::is_fundamental_v<_ScaleT>>>
	constexpr inline Scalar<_S, _T> operator*(Scalar<_S, _T> value, _ScaleT scale)
	{
		return Scalar<_S, _T>(value._x * scale);
	}

	template <typename _S, typename _T, typename _ScaleT, typename = std::enable_if_t<std::is_fundamental_v<_ScaleT>>>
	constexpr inline Scalar<_S, _T> operator*(_ScaleT scale, Scalar<_S, _T> value)
	{
		return Scalar<_S, _T>(value._x * scale);
	}

	template <typename _S, typename _T, typename _ScaleT, typename = std::enable_if_t<std::is_fundamental_v<_ScaleT>>>
	constexpr inline Scalar<_S, _T> operator/(Scalar<_S, _T> value, _ScaleT scale)
	{
		return Scalar<_S, _T>(value._x / scale);
	}

	template <typename _S, typename _T>
	constexpr inline _T operator/(Scalar<_S, _T> a, Scalar<_S, _T> b)
	{
		return a._x / b._x;
	}

	template <typename _S, typename _T>
	constexpr inline Scalar<_S, _T> max(Scalar<_S, _T> a, Scalar<_S, _T> b)
	{
		return a._x < b._x ? b : a;
	}

	template <typename _S, typename _T>
	constexpr inline Scalar<_S, _T> min(Scalar<_S, _T> a, Scalar<_S, _T> b)
	{
		return a._x < b._x ? a : b;
	}



	template <typename _S, typename _C, typename _T>
	constexpr inline Vector2<_S, _C, _T> operator+(Vector2<_S, _C, _T> a, Vector2<_S, _C, _T> b)
	{
		return Vector2<_S, _C, _T>(a._x + b._x, a._y + b._y);
	}

	template <typename _S, typename _C, typename _T>
	constexpr inline Vector2<_S, _C, _T> operator-(Vector2<_S, _C, _T> a, Vector2<_S, _C, _T> b)
	{
		return Vector2<_S, _C, _T>(a._x - b._x, a._y - b._y);
	}
}




template <typename _S, typename _T>
struct zpr::print_formatter<dim::Scalar<_S, _T>>
{
	template <typename Cb>
	void print(dim::Scalar<_S, _T> x, Cb&& cb, format_args args)
	{
		detail::print_one(cb, args, x._x);
	}
};

template <typename _S, typename _C, typename _T>
struct zpr::print_formatter<dim::Vector2<_S, _C, _T>>
{
	template <typename Cb>
	void print(dim::Vector2<_S, _C, _T> x, Cb&& cb, format_args args)
	{
		detail::print(cb, "({}, {})", x._x, x._y);
	}
};
