// base.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include "folio/area.h"
#include "folio/element.h"
#include "folio/font_backend.h"

namespace folio::layout
{
	/*
	    Where an element stopped when it ran out of space. What `index` means depends on the
	    element: the next word of a paragraph, the child of a linear layout, the row of a table.
	    Composite elements keep the continuations of their children in `nested`; tables keep one
	    per column, with `finished` set for cells that were already complete.

	    A default-constructed continuation means "start from the beginning". An element that
	    could not place anything at all reports exactly that, which is how its parents (and
	    eventually the document) can tell that no progress was made.
	*/
	struct Continuation
	{
		size_t index = 0;
		bool finished = false;
		std::vector<Continuation> nested {};

		bool isStart() const;
		bool operator==(const Continuation& other) const;
	};

	struct RenderResult
	{
		Size2d size;
		std::optional<Continuation> continuation;

		bool isComplete() const { return not continuation.has_value(); }

		static RenderResult complete(Size2d size) { return RenderResult { .size = size, .continuation = std::nullopt }; }

		static RenderResult continued(Size2d size, Continuation cont)
		{
			return RenderResult { .size = size, .continuation = std::move(cont) };
		}
	};

	struct RenderContext
	{
		const FontBackend* fonts;
	};

	// null if the continuation says to start from the beginning
	const Continuation* resumeOf(const Continuation& cont);

	/*
	    Renders `element` into `area`, which should be empty (ie. its cursor should be at the top).
	    `style` is the fully resolved style inherited from the element's parents. If `resume` is
	    not null, rendering picks up where that continuation left off.
	*/
	ErrorOr<RenderResult> render(const RenderContext& ctx,
	    const Element& element,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	ErrorOr<RenderResult> renderText(const RenderContext& ctx, const Text& text, Area area, const Style& style);
	ErrorOr<RenderResult> renderParagraph(const RenderContext& ctx,
	    const Paragraph& para,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	ErrorOr<RenderResult> renderBreak(const RenderContext& ctx, const Break& brk, Area area, const Style& style);
	ErrorOr<RenderResult> renderPageBreak(const PageBreak& brk, const Continuation* resume);

	ErrorOr<RenderResult> renderLinearLayout(const RenderContext& ctx,
	    const LinearLayout& layout,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	ErrorOr<RenderResult> renderTableLayout(const RenderContext& ctx,
	    const TableLayout& table,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	ErrorOr<RenderResult> renderFramed(const RenderContext& ctx,
	    const Framed& frame,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	ErrorOr<RenderResult> renderPadded(const RenderContext& ctx,
	    const Padded& pad,
	    Area area,
	    const Style& style,
	    const Continuation* resume);

	// the height of one line of text in the given style, including line spacing
	Length lineHeight(const RenderContext& ctx, const Style& style);

	/*
	    Splits `available` between columns in proportion to their weights. The widths, summed from
	    left to right, come out to exactly `available`. Weights must all be positive.
	*/
	ErrorOr<std::vector<Length>> computeColumnWidths(const std::vector<double>& weights, Length available);
}

template <>
struct zpr::print_formatter<folio::layout::Continuation>
{
	template <typename Cb>
	void print(const folio::layout::Continuation& cont, Cb&& cb, format_args args)
	{
		detail::print(cb, "{}{}", cont.index, cont.finished ? "!" : "");
		if(cont.nested.empty())
			return;

		detail::print(cb, "(");
		for(size_t i = 0; i < cont.nested.size(); i++)
			detail::print(cb, "{}{}", i == 0 ? "" : ", ", cont.nested[i]);
		detail::print(cb, ")");
	}
};
