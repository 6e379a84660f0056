// cell_decorator.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "folio/area.h"

namespace folio
{
	struct CellInfo
	{
		size_t column;
		size_t row;

		size_t num_columns;
		size_t num_rows;

		// the cell's content did not fit, and carries on to the next page
		bool continues;

		// the cell's content started on a previous page
		bool continued;
	};

	/*
	    Decides how the cells of a table are framed. `cellPadding` is asked for the space to leave
	    around the content of each cell; since it is needed to measure the cell in the first place,
	    `continues` is always false in the info passed to it. `decorateCell` is called once per cell
	    after the cell's content has been drawn; `cell_area` spans the column's width and the
	    height of the whole row.
	*/
	struct CellDecorator
	{
		virtual ~CellDecorator();

		virtual Margins cellPadding(const CellInfo& info) const;
		virtual void decorateCell(const CellInfo& info, const Area& cell_area, Length row_height) const = 0;
	};

	struct CellBorders
	{
		bool top;
		bool bottom;
		bool left;
		bool right;

		bool operator==(const CellBorders&) const = default;
	};

	/*
	    Draws a grid. `inner` controls the lines between cells, `outer` the lines around the
	    table, and `cont` the lines at the edges where a row is split across pages.
	*/
	struct FrameCellDecorator : CellDecorator
	{
		FrameCellDecorator(bool inner, bool outer, bool cont, LineStyle line_style = {});

		CellBorders bordersFor(const CellInfo& info) const;

		virtual Margins cellPadding(const CellInfo& info) const override;
		virtual void decorateCell(const CellInfo& info, const Area& cell_area, Length row_height) const override;

	private:
		bool m_inner;
		bool m_outer;
		bool m_cont;
		LineStyle m_line_style;
	};
}
