// cell_decorator.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/cell_decorator.h"

namespace folio
{
	CellDecorator::~CellDecorator()
	{
	}

	Margins CellDecorator::cellPadding([[maybe_unused]] const CellInfo& info) const
	{
		return Margins {};
	}


	FrameCellDecorator::FrameCellDecorator(bool inner, bool outer, bool cont, LineStyle line_style)
	    : m_inner(inner)
	    , m_outer(outer)
	    , m_cont(cont)
	    , m_line_style(line_style)
	{
	}

	/*
	    Each cell draws its own left and top edge; the right edge is only drawn by the last column,
	    and the bottom edge only by the last row (or where a row is split), so that shared edges
	    are not drawn twice.
	*/
	CellBorders FrameCellDecorator::bordersFor(const CellInfo& info) const
	{
		bool first_col = (info.column == 0);
		bool last_col = (info.column + 1 == info.num_columns);
		bool first_row = (info.row == 0);
		bool last_row = (info.row + 1 == info.num_rows);

		CellBorders ret {};
		ret.left = first_col ? m_outer : m_inner;
		ret.right = last_col ? m_outer : false;

		if(info.continued)
			ret.top = m_cont;
		else
			ret.top = first_row ? m_outer : m_inner;

		if(info.continues)
			ret.bottom = m_cont;
		else
			ret.bottom = last_row ? m_outer : false;

		return ret;
	}

	Margins FrameCellDecorator::cellPadding([[maybe_unused]] const CellInfo& info) const
	{
		return Margins::all(m_line_style.thickness);
	}

	void FrameCellDecorator::decorateCell(const CellInfo& info, const Area& cell_area, Length row_height) const
	{
		auto borders = this->bordersFor(info);

		auto width = cell_area.width();
		auto half = m_line_style.thickness / 2;
		auto zero = Length(0);

		if(borders.top)
			cell_area.drawLine(Position(zero, half), Position(width, half), m_line_style);

		if(borders.bottom)
			cell_area.drawLine(Position(zero, row_height - half), Position(width, row_height - half), m_line_style);

		if(borders.left)
			cell_area.drawLine(Position(half, zero), Position(half, row_height), m_line_style);

		if(borders.right)
			cell_area.drawLine(Position(width - half, zero), Position(width - half, row_height), m_line_style);
	}
}
