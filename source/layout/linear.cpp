// linear.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "layout/base.h"

namespace folio::layout
{
	ErrorOr<RenderResult> renderLinearLayout(const RenderContext& ctx,
	    const LinearLayout& layout,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		auto& children = layout.children();

		size_t start = resume ? resume->index : 0;
		const Continuation* child_resume = nullptr;
		if(resume != nullptr && not resume->nested.empty())
			child_resume = resumeOf(resume->nested[0]);

		auto width = Length(0);
		for(size_t i = start; i < children.size(); i++)
		{
			auto result = TRY(render(ctx, children[i], area.remainder(), style, i == start ? child_resume : nullptr));

			area.advance(result.size.y());
			width = dim::max(width, result.size.x());

			if(result.isComplete())
				continue;

			auto cont = Continuation { .index = i };
			if(not result.continuation->isStart())
				cont.nested.push_back(std::move(*result.continuation));

			return Ok(RenderResult::continued(Size2d(width, area.cursor()), std::move(cont)));
		}

		return Ok(RenderResult::complete(Size2d(width, area.cursor())));
	}
}
