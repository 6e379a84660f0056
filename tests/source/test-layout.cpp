// test-layout.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

using folio::Length;
using folio::Size2d;
using folio::Position;
using folio::Paragraph;
using folio::LinearLayout;

using namespace folio::literals;

namespace test
{
	static void test_area(Context& ctx)
	{
		begin(ctx, "areas");

		auto area = folio::Area(nullptr, Position(10, 20), Size2d(100, 50));
		check(ctx, not area.isDrawing(), "no backend means measuring");

		area.advance(30_mm);
		check(ctx, approx(area.remainingHeight(), 20_mm), "remaining height");

		area.advance(100_mm);
		check(ctx, approx(area.cursor(), 50_mm), "the cursor stops at the bottom");
		check(ctx, area.remainingHeight().iszero(), "nothing remains");

		auto fresh = folio::Area(nullptr, Position(10, 20), Size2d(100, 50));
		fresh.advance(10_mm);

		auto rest = fresh.remainder();
		check(ctx, approx(rest.origin().y(), 30_mm) && approx(rest.height(), 40_mm), "remainder starts at the cursor");

		auto inner = fresh.shrink(folio::Margins::trbl(1_mm, 2_mm, 3_mm, 4_mm));
		check(ctx, approx(inner.origin().x(), 14_mm) && approx(inner.origin().y(), 31_mm), "shrink moves the origin");
		check(ctx, approx(inner.width(), 94_mm) && approx(inner.height(), 36_mm), "shrink reduces the size");

		auto col = fresh.column(25_mm, 30_mm);
		check(ctx, approx(col.origin().x(), 35_mm) && approx(col.width(), 30_mm), "columns");

		auto tiny = folio::Area(nullptr, Position(0, 0), Size2d(5, 5)).shrink(folio::Margins::all(10_mm));
		check(ctx, tiny.width().iszero() && tiny.height().iszero(), "sizes never go negative");

		// drawing through a measuring area does nothing
		auto backend = folio::RecordingBackend();
		check_ok(ctx, backend.beginPage(Size2d(100, 100)), "begin page");

		auto drawing = folio::Area(&backend, Position(10, 10), Size2d(50, 50));
		drawing.measuring().drawLine(Position(0, 0), Position(1, 1), folio::LineStyle());
		drawing.drawLine(Position(0, 0), Position(1, 1), folio::LineStyle());

		auto lines = backend.pages()[0].lines();
		check(ctx, lines.size() == 1, "only the real area draws");
		check(ctx, lines.size() == 1 && lines[0]->start == Position(10, 10), "draws are relative to the origin");
	}

	static LinearLayout make_lines(std::initializer_list<const char*> lines)
	{
		auto layout = LinearLayout();
		for(auto line : lines)
			layout.push(Paragraph(line));

		return layout;
	}

	static void test_linear(Context& ctx)
	{
		begin(ctx, "linear layouts stack their children");

		auto fx = PageFixture(Size2d(100, 100));

		auto layout = LinearLayout();
		layout.push(Paragraph("one")).push(folio::Break(2)).push(Paragraph("two"));

		auto result = fx.render(std::move(layout));
		if(not check_ok(ctx, result, "render"))
			return;

		auto texts = fx.backend.pages()[0].texts();
		check(ctx, texts.size() == 2, "two lines of text");
		if(texts.size() == 2)
		{
			check(ctx, approx(texts[0]->baseline.y(), 8_pt), "first baseline");
			check(ctx, approx(texts[1]->baseline.y(), FakeFontBackend::lineHeight() * 3 + 8_pt), "second baseline");
		}

		check(ctx, approx(result.unwrap().size.y(), FakeFontBackend::lineHeight() * 4), "total height");
		check(ctx, approx(result.unwrap().size.x(), FakeFontBackend::advance(3)), "width of the widest child");
	}

	static void test_linear_split(Context& ctx)
	{
		begin(ctx, "linear layouts split between children");

		auto fx = PageFixture(Size2d(Length(100), FakeFontBackend::lineHeight() * 2.5));
		auto layout = folio::Element(make_lines({ "a", "b", "c", "d", "e" }));

		auto first = fx.render(layout);
		if(not check_ok(ctx, first, "first page"))
			return;

		auto& cont = first.unwrap().continuation;
		check(ctx, cont.has_value() && cont->index == 2 && cont->nested.empty(), "continues at the third child ({})",
		    cont.has_value() ? zpr::sprint("{}", *cont) : "none");

		auto second = fx.render(layout, &*cont);
		auto third = fx.render(layout, second.ok() ? &*second.unwrap().continuation : nullptr);
		check(ctx, third.ok() && third.unwrap().isComplete(), "done after three pages");

		auto& pages = fx.backend.pages();
		check(ctx, pages.size() == 3, "three pages");
		if(pages.size() == 3)
		{
			check(ctx, pages[0].strings() == std::vector<std::string> { "a", "b" }, "page 1");
			check(ctx, pages[1].strings() == std::vector<std::string> { "c", "d" }, "page 2");
			check(ctx, pages[2].strings() == std::vector<std::string> { "e" }, "page 3");
		}
	}

	static void test_breaks(Context& ctx)
	{
		begin(ctx, "breaks at the bottom of a page");

		auto fx = PageFixture(Size2d(Length(100), FakeFontBackend::lineHeight() * 1.5));

		auto layout = LinearLayout();
		layout.push(Paragraph("a")).push(folio::Break(1)).push(Paragraph("b"));
		auto elem = folio::Element(std::move(layout));

		auto first = fx.render(elem);
		if(not check_ok(ctx, first, "first page"))
			return;

		// the break is cut short, and does not carry over
		auto& cont = first.unwrap().continuation;
		check(ctx, cont.has_value() && cont->index == 2, "continues with the paragraph after the break");

		auto second = fx.render(elem, &*cont);
		check(ctx, second.ok() && second.unwrap().isComplete(), "second page completes");

		auto texts = fx.backend.pages().back().texts();
		check(ctx, texts.size() == 1 && approx(texts[0]->baseline.y(), 8_pt), "b starts at the top of the page");
	}

	static void test_page_break(Context& ctx)
	{
		begin(ctx, "page breaks");

		auto fx = PageFixture(Size2d(100, 100));

		auto layout = LinearLayout();
		layout.push(Paragraph("a")).push(folio::PageBreak()).push(Paragraph("b"));
		auto elem = folio::Element(std::move(layout));

		auto first = fx.render(elem);
		if(not check_ok(ctx, first, "first page"))
			return;

		check(ctx, not first.unwrap().isComplete(), "the page break ends the page");
		check(ctx, fx.backend.pages()[0].strings() == std::vector<std::string> { "a" }, "only a on page 1");

		auto second = fx.render(elem, &*first.unwrap().continuation);
		check(ctx, second.ok() && second.unwrap().isComplete(), "second page completes");
		check(ctx, fx.backend.pages()[1].strings() == std::vector<std::string> { "b" }, "only b on page 2");
	}

	static void test_styled_and_padded(Context& ctx)
	{
		begin(ctx, "styled and padded wrappers");

		auto fx = PageFixture(Size2d(100, 100));

		auto layout = LinearLayout();
		layout.push(folio::styled(Paragraph("big"), folio::Style().with_font_size(20)));
		layout.push(folio::padded(Paragraph("pad"), folio::Margins::all(5_mm)));

		// an element's own style wins over the wrapper's
		layout.push(folio::styled(Paragraph("small", folio::Style().with_font_size(5)), folio::Style().with_font_size(20)));

		auto result = fx.render(std::move(layout));
		if(not check_ok(ctx, result, "render"))
			return;

		auto texts = fx.backend.pages()[0].texts();
		if(not check(ctx, texts.size() == 3, "three texts"))
			return;

		check(ctx, texts[0]->style.font_size() == 20, "styled text is 20pt");
		check(ctx, approx(texts[1]->baseline.x(), 5_mm), "padded text is inset");

		auto padded_top = FakeFontBackend::lineHeight(20);
		check(ctx, approx(texts[1]->baseline.y(), padded_top + 5_mm + 8_pt), "padded text is pushed down");
		check(ctx, texts[2]->style.font_size() == 5, "the innermost style wins");

		auto expected_height = FakeFontBackend::lineHeight(20) + FakeFontBackend::lineHeight() + 10_mm
		                     + FakeFontBackend::lineHeight(5);
		check(ctx, approx(result.unwrap().size.y(), expected_height), "padding adds to the height");
	}

	void test_layout(Context& ctx)
	{
		test_area(ctx);
		test_linear(ctx);
		test_linear_split(ctx);
		test_breaks(ctx);
		test_page_break(ctx);
		test_styled_and_padded(ctx);
	}
}
