// framed.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "layout/base.h"

namespace folio::layout
{
	static const Continuation* nested_resume(const Continuation* resume)
	{
		if(resume == nullptr || resume->nested.empty())
			return nullptr;

		return resumeOf(resume->nested[0]);
	}

	/*
	    The frame is split along with its content: the top edge is only drawn on the page where the
	    content starts, and the bottom edge only on the page where it ends. The sides are always drawn.
	*/
	ErrorOr<RenderResult> renderFramed(const RenderContext& ctx,
	    const Framed& frame,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		auto& line_style = frame.lineStyle();
		auto thickness = line_style.thickness;

		auto content_area = area.shrink(Margins::all(thickness));
		auto result = TRY(render(ctx, frame.child(), content_area, style, nested_resume(resume)));

		// if nothing fit, draw nothing; the whole frame moves to the next page.
		if(resume == nullptr && not result.isComplete() && result.continuation->isStart())
			return Ok(RenderResult::continued(Size2d(), Continuation {}));

		auto width = area.width();
		auto height = dim::min(result.size.y() + thickness * 2, area.remainingHeight());
		auto half = thickness / 2;

		if(resume == nullptr)
			area.drawLine(Position(Length(0), half), Position(width, half), line_style);

		if(result.isComplete())
			area.drawLine(Position(Length(0), height - half), Position(width, height - half), line_style);

		area.drawLine(Position(half, Length(0)), Position(half, height), line_style);
		area.drawLine(Position(width - half, Length(0)), Position(width - half, height), line_style);

		area.advance(height);
		if(result.isComplete())
			return Ok(RenderResult::complete(Size2d(width, height)));

		auto cont = Continuation {};
		cont.nested.push_back(std::move(*result.continuation));

		return Ok(RenderResult::continued(Size2d(width, height), std::move(cont)));
	}

	ErrorOr<RenderResult> renderPadded(const RenderContext& ctx,
	    const Padded& pad,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		auto& margins = pad.margins();

		auto result = TRY(render(ctx, pad.child(), area.shrink(margins), style, resume));
		if(not result.isComplete() && result.size.y().iszero())
			return Ok(result);

		auto size = Size2d(result.size.x() + margins.horizontal(), result.size.y() + margins.vertical());
		size.y() = dim::min(size.y(), area.remainingHeight());

		return Ok(RenderResult { .size = size, .continuation = std::move(result.continuation) });
	}
}
