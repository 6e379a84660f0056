// test-table.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

using folio::Length;
using folio::Size2d;
using folio::CellInfo;
using folio::Paragraph;
using folio::TableLayout;

using namespace folio::literals;

namespace test
{
	static void test_column_widths(Context& ctx)
	{
		begin(ctx, "column widths add up exactly");

		const std::vector<std::vector<double>> weight_sets = {
			{ 1 },
			{ 1, 1, 1 },
			{ 0.1, 0.2, 0.3 },
			{ 3, 7, 11, 13, 17 },
			{ 1e-3, 1e3, 1 },
			{ 2, 2 },
		};

		const double widths[] = { 100, 33.3, 210 - 2 * 25.4, 1.0 / 3.0, 297 };

		for(auto& weights : weight_sets)
		{
			for(auto w : widths)
			{
				auto available = Length(w);
				auto result = folio::layout::computeColumnWidths(weights, available);
				if(not check_ok(ctx, result, "compute widths"))
					continue;

				auto& cols = result.unwrap();

				auto sum = Length(0);
				for(auto c : cols)
					sum += c;

				check(ctx, cols.size() == weights.size(), "one width per column");
				check(ctx, sum == available, "{} columns in {}mm sum to {}mm", weights.size(), w, sum.value());

				double total = 0;
				for(auto x : weights)
					total += x;

				for(size_t i = 0; i < cols.size(); i++)
				{
					check(ctx, approx(cols[i].value(), w * weights[i] / total, 1e-9), "column {} is proportional", i);
				}
			}
		}

		auto none = folio::layout::computeColumnWidths({}, 100_mm);
		check_err(ctx, none, folio::Error::Kind::Layout, "no columns");
		check_err(ctx, folio::layout::computeColumnWidths({ 1, 0 }, 100_mm), folio::Error::Kind::Layout, "zero weight");
		check_err(ctx, folio::layout::computeColumnWidths({ 1, -2 }, 100_mm), folio::Error::Kind::Layout,
		    "negative weight");
		check_err(ctx, folio::layout::computeColumnWidths({ 1, std::nan("") }, 100_mm), folio::Error::Kind::Layout,
		    "NaN weight");
	}

	static void test_row_shape(Context& ctx)
	{
		begin(ctx, "rows must have one cell per column");

		auto table = TableLayout({ 2, 2 });

		check_err(ctx, table.row().element(Paragraph("a")).push(), folio::Error::Kind::Layout, "one cell");
		check_ok(ctx, table.row().element(Paragraph("a")).element(Paragraph("b")).push(), "two cells");
		check_err(ctx,
		    table.row().element(Paragraph("a")).element(Paragraph("b")).element(Paragraph("c")).push(),
		    folio::Error::Kind::Layout, "three cells");

		check(ctx, table.rows().size() == 1, "failed rows are not added");

		auto err = table.pushRow({});
		check(ctx, err.is_err() && err.error().string() == "table row has 0 cells, but the table has 2 columns",
		    "error message");
	}

	static void test_frame_borders(Context& ctx)
	{
		begin(ctx, "frame decorator borders");

		auto info = [](size_t col, size_t row, bool continues = false, bool continued = false) {
			return CellInfo {
				.column = col,
				.row = row,
				.num_columns = 2,
				.num_rows = 2,
				.continues = continues,
				.continued = continued,
			};
		};

		using B = folio::CellBorders;

		auto all = folio::FrameCellDecorator(true, true, true);
		check(ctx, all.bordersFor(info(0, 0)) == B { .top = true, .bottom = false, .left = true, .right = false }, "top left");
		check(ctx, all.bordersFor(info(1, 0)) == B { .top = true, .bottom = false, .left = true, .right = true }, "top right");
		check(ctx, all.bordersFor(info(0, 1)) == B { .top = true, .bottom = true, .left = true, .right = false }, "bottom left");
		check(ctx, all.bordersFor(info(1, 1)) == B { .top = true, .bottom = true, .left = true, .right = true }, "bottom right");

		auto outer = folio::FrameCellDecorator(false, true, false);
		check(ctx, outer.bordersFor(info(1, 0)) == B { .top = true, .bottom = false, .left = false, .right = true },
		    "outer only, top right");
		check(ctx, outer.bordersFor(info(0, 1)) == B { .top = false, .bottom = true, .left = true, .right = false },
		    "outer only, bottom left");

		// split rows
		check(ctx, outer.bordersFor(info(0, 0, true, false)).bottom == false, "no bottom at a split without cont");
		check(ctx, outer.bordersFor(info(0, 1, false, true)).top == false, "no top after a split without cont");
		check(ctx, all.bordersFor(info(0, 0, true, false)).bottom == true, "bottom at a split with cont");
		check(ctx, all.bordersFor(info(0, 0, false, true)).top == true, "top after a split with cont");

		auto inner = folio::FrameCellDecorator(true, false, false);
		check(ctx, inner.bordersFor(info(1, 1)) == B { .top = true, .bottom = false, .left = true, .right = false },
		    "inner only");

		check(ctx, approx(all.cellPadding(info(0, 0)).top, folio::LineStyle().thickness), "padding is the line width");
	}

	static void test_table_render(Context& ctx)
	{
		begin(ctx, "rendering tables");

		auto fx = PageFixture(Size2d(100, 100));

		auto table = TableLayout({ 1, 3 });
		table.setCellDecorator(std::make_unique<folio::FrameCellDecorator>(true, true, false));

		check_ok(ctx, table.row().element(Paragraph("a")).element(Paragraph("b b b")).push(), "row 1");
		check_ok(ctx,
		    table.row().element(Paragraph("c")).element(Paragraph("d")).background(folio::Colour::greyscale(200)).push(),
		    "row 2");

		auto result = fx.render(std::move(table));
		if(not check_ok(ctx, result, "render"))
			return;

		auto pad = folio::LineStyle().thickness;
		auto row_height = FakeFontBackend::lineHeight() + pad * 2;

		check(ctx, result.unwrap().isComplete(), "complete");
		check(ctx, approx(result.unwrap().size.y(), row_height * 2), "two rows tall");

		auto& page = fx.backend.pages()[0];
		auto texts = page.texts();
		if(check(ctx, texts.size() == 4, "four cells of text"))
		{
			check(ctx, approx(texts[0]->baseline.x(), pad), "first column is padded");
			check(ctx, approx(texts[1]->baseline.x(), 25_mm + pad), "second column starts a quarter of the way in");
			check(ctx, approx(texts[2]->baseline.y(), row_height + pad + 8_pt), "second row starts below the first");
		}

		auto rects = page.rects();
		if(check(ctx, rects.size() == 1, "one background"))
		{
			check(ctx, approx(rects[0]->top_left.y(), row_height), "background behind the second row");
			check(ctx, approx(rects[0]->size.x(), 100_mm) && approx(rects[0]->size.y(), row_height), "full row");
		}

		// 2 columns x 2 rows: 4 tops, 4 lefts, 2 rights, 2 bottoms
		check(ctx, page.lines().size() == 12, "{} lines in the grid", page.lines().size());
	}

	static void test_table_split(Context& ctx)
	{
		begin(ctx, "rows split across pages");

		auto pad = folio::LineStyle().thickness;
		auto fx = PageFixture(Size2d(Length(100), FakeFontBackend::lineHeight() * 2.5));

		auto table = TableLayout({ 1, 1 });
		table.setCellDecorator(std::make_unique<folio::FrameCellDecorator>(true, true, true));

		// two words of the first cell do not fit on one line
		auto narrow = Paragraph(std::string(15, 'x') + " " + std::string(15, 'y') + " " + std::string(15, 'z'));
		check_ok(ctx, table.row().element(std::move(narrow)).element(Paragraph("short")).push(), "row");
		check_ok(ctx, table.row().element(Paragraph("next")).element(Paragraph("row")).push(), "row");

		auto elem = folio::Element(std::move(table));

		auto first = fx.render(elem);
		if(not check_ok(ctx, first, "first page"))
			return;

		auto& cont = first.unwrap().continuation;
		if(not check(ctx, cont.has_value(), "the table continues"))
			return;

		check(ctx, cont->index == 0 && cont->nested.size() == 2, "the first row was split ({})", *cont);
		check(ctx, cont->nested.size() == 2 && cont->nested[1].finished, "the short cell is finished");
		check(ctx, fx.backend.pages()[0].strings().size() == 3, "three lines on the first page");

		// the split row is as tall as the two lines that fit
		check(ctx, approx(first.unwrap().size.y(), FakeFontBackend::lineHeight() * 2 + pad * 2), "split row height");

		auto second = fx.render(elem, &*cont);
		if(not check_ok(ctx, second, "second page"))
			return;

		check(ctx, second.unwrap().isComplete(), "the rest fits on the second page");

		auto strings = fx.backend.pages()[1].strings();
		check(ctx, strings == std::vector<std::string> { std::string(15, 'z'), "next", "row" }, "second page is {}",
		    strings);

		// the remainder of the split row is only as tall as the one line left in it
		auto texts = fx.backend.pages()[1].texts();
		if(texts.size() == 3)
		{
			auto row2_top = FakeFontBackend::lineHeight() + pad * 2;
			check(ctx, approx(texts[1]->baseline.y(), row2_top + pad + 8_pt), "the next row follows directly");
		}
	}

	static void test_empty_cell_is_not_progress(Context& ctx)
	{
		begin(ctx, "empty cells do not split a row");

		auto pad = folio::LineStyle().thickness;
		auto row_height = FakeFontBackend::lineHeight() + pad * 2;

		auto fx = PageFixture(Size2d(Length(100), FakeFontBackend::lineHeight() * 1.5));

		auto table = TableLayout({ 1, 1 });
		table.setCellDecorator(std::make_unique<folio::FrameCellDecorator>(true, true, true));
		check_ok(ctx, table.row().element(Paragraph("a")).element(Paragraph("b")).push(), "row");
		check_ok(ctx,
		    table.row().element(Paragraph("")).element(Paragraph("c")).background(folio::Colour::greyscale(200)).push(),
		    "row with an empty cell");

		auto elem = folio::Element(std::move(table));

		auto first = fx.render(elem);
		if(not check_ok(ctx, first, "first page"))
			return;

		auto& cont = first.unwrap().continuation;
		if(not check(ctx, cont.has_value(), "the table continues"))
			return;

		check(ctx, cont->index == 1 && cont->nested.empty(), "the second row moves as a whole ({})", *cont);
		check(ctx, approx(first.unwrap().size.y(), row_height), "only the first row is used");

		auto& page = fx.backend.pages()[0];
		check(ctx, page.strings() == std::vector<std::string> { "a", "b" }, "only the first row is drawn");
		check(ctx, page.rects().empty(), "no background for the second row");

		bool below = false;
		for(auto line : page.lines())
			below |= (line->start.y() > row_height + 1e-9_mm || line->end.y() > row_height + 1e-9_mm);

		check(ctx, not below, "no borders below the first row");

		auto second = fx.render(elem, &*cont);
		if(not check_ok(ctx, second, "second page"))
			return;

		check(ctx, second.unwrap().isComplete(), "complete on the second page");
		check(ctx, fx.backend.pages()[1].strings() == std::vector<std::string> { "c" }, "the second row");
		check(ctx, fx.backend.pages()[1].rects().size() == 1, "with its background");
	}

	void test_table(Context& ctx)
	{
		test_column_widths(ctx);
		test_row_shape(ctx);
		test_frame_borders(ctx);
		test_table_render(ctx);
		test_table_split(ctx);
		test_empty_cell_is_not_progress(ctx);
	}
}
