// units.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "folio/units.h"

/*
    PDF user space is 72 units to the inch, with Y+ going upwards from the bottom of the page.
    The layout engine works in millimetres with Y+ going downwards; positions are flipped at the
    pdf interface (see Page::convertPosition), which needs the page height.
*/
struct PDF_COORD_Y_UP;

// PDF 1.7: 9.2.4 Glyph Positioning and Metrics
// ... the units of glyph space are one-thousandth of a unit of text space ...
static constexpr double PDF_GLYPH_SPACE_UNITS = 1000.0;

namespace pdf
{
	using PdfScalar = dim::Scalar<dim::units::pdf_user_unit>;

	using Position2d = dim::Vector2<dim::units::pdf_user_unit, PDF_COORD_Y_UP>;
	using Size2d = Position2d;

	inline PdfScalar toPdfScalar(folio::Length len)
	{
		return len.into<dim::units::pdf_user_unit>();
	}
}
