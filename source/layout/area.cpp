// area.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/area.h"

namespace folio
{
	static Length non_negative(Length x)
	{
		return dim::max(x, Length(0));
	}

	Area::Area(RenderBackend* backend, Position origin, Size2d size)
	    : m_backend(backend)
	    , m_origin(origin)
	    , m_size(non_negative(size.x()), non_negative(size.y()))
	    , m_cursor(0)
	{
	}

	void Area::advance(Length dy)
	{
		m_cursor = dim::min(non_negative(m_cursor + dy), this->height());
	}

	Area Area::remainder() const
	{
		return Area(m_backend, m_origin + Offset2d(Length(0), m_cursor), Size2d(this->width(), this->remainingHeight()));
	}

	Area Area::shrink(const Margins& margins) const
	{
		auto area = this->remainder();
		return Area(m_backend, area.m_origin + Offset2d(margins.left, margins.top),
		    Size2d(area.width() - margins.horizontal(), area.height() - margins.vertical()));
	}

	Area Area::column(Length x, Length width) const
	{
		auto area = this->remainder();
		return Area(m_backend, area.m_origin + Offset2d(x, Length(0)), Size2d(width, area.height()));
	}

	Area Area::withHeight(Length height) const
	{
		auto area = this->remainder();
		return Area(m_backend, area.m_origin, Size2d(area.width(), dim::min(height, area.height())));
	}

	Area Area::measuring() const
	{
		auto copy = *this;
		copy.m_backend = nullptr;
		return copy;
	}

	void Area::drawText(Position baseline, const TextRun& run, const Style& style) const
	{
		if(m_backend != nullptr)
			m_backend->drawText(m_origin + baseline, run, style);
	}

	void Area::drawLine(Position start, Position end, const LineStyle& line_style) const
	{
		if(m_backend != nullptr)
			m_backend->drawLine(m_origin + start, m_origin + end, line_style);
	}

	void Area::drawRect(Position top_left, Size2d size, const Paint& paint) const
	{
		if(m_backend != nullptr)
			m_backend->drawRect(m_origin + top_left, size, paint);
	}
}
