// render.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "layout/line.h"

namespace folio::layout
{
	bool Continuation::isStart() const
	{
		return index == 0 && not finished && nested.empty();
	}

	bool Continuation::operator==(const Continuation& other) const
	{
		return index == other.index && finished == other.finished && nested == other.nested;
	}

	const Continuation* resumeOf(const Continuation& cont)
	{
		if(cont.isStart())
			return nullptr;

		return &cont;
	}

	Length lineHeight(const RenderContext& ctx, const Style& style)
	{
		return ctx.fonts->lineMetrics(style).height() * style.line_spacing();
	}


	ErrorOr<RenderResult> renderText(const RenderContext& ctx, const Text& text, Area area, const Style& parent_style)
	{
		auto styles = std::vector<Style> { parent_style.extendWith(text.style()) };
		auto& style = styles[0];

		auto str = unicode::u32StringFromUtf8(text.text());
		auto advances = ctx.fonts->measure(style, str);

		auto line = LineBuilder(ctx, styles);
		for(size_t i = 0; i < str.size(); i++)
			line.add(Glyph { .codepoint = str[i], .style = 0, .advance = advances[i] });

		// text is placed whole or not at all
		auto box = line.box();
		if(box.height > area.remainingHeight())
			return Ok(RenderResult::continued(Size2d(), Continuation {}));

		for(auto& run : line.runs())
			area.drawText(Position(run.x, area.cursor() + box.ascent), run.run, styles[run.style]);

		area.advance(box.height);
		return Ok(RenderResult::complete(Size2d(line.width(), box.height)));
	}

	ErrorOr<RenderResult> renderBreak(const RenderContext& ctx, const Break& brk, Area area, const Style& style)
	{
		// space that does not fit is dropped instead of being carried over to the next page
		auto height = dim::min(lineHeight(ctx, style) * brk.lines(), area.remainingHeight());
		return Ok(RenderResult::complete(Size2d(Length(0), dim::max(height, Length(0)))));
	}

	ErrorOr<RenderResult> renderPageBreak([[maybe_unused]] const PageBreak& brk, const Continuation* resume)
	{
		if(resume != nullptr)
			return Ok(RenderResult::complete(Size2d()));

		return Ok(RenderResult::continued(Size2d(), Continuation { .index = 1 }));
	}

	ErrorOr<RenderResult> render(const RenderContext& ctx,
	    const Element& element,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		return std::visit(util::overloaded {
		                      [&](const Text& x) { return renderText(ctx, x, area, style); },
		                      [&](const Paragraph& x) { return renderParagraph(ctx, x, area, style, resume); },
		                      [&](const Break& x) { return renderBreak(ctx, x, area, style); },
		                      [&](const PageBreak& x) { return renderPageBreak(x, resume); },
		                      [&](const LinearLayout& x) { return renderLinearLayout(ctx, x, area, style, resume); },
		                      [&](const TableLayout& x) { return renderTableLayout(ctx, x, area, style, resume); },
		                      [&](const Styled& x) {
			                      return render(ctx, x.child(), area, style.extendWith(x.style()), resume);
		                      },
		                      [&](const Framed& x) { return renderFramed(ctx, x, area, style, resume); },
		                      [&](const Padded& x) { return renderPadded(ctx, x, area, style, resume); },
		                  },
		    element.variant());
	}
}
