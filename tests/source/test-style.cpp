// test-style.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

namespace test
{
	static void test_extend(Context& ctx)
	{
		begin(ctx, "child fields override the parent's");

		auto fonts = FakeFontBackend();
		auto root = fonts.rootStyle();

		auto child = folio::Style().with_font_size(20).with_colour(folio::Colour::rgb(255, 0, 0));
		auto merged = root.extendWith(child);

		check(ctx, merged.isComplete(), "merged style is complete");
		check(ctx, merged.font_size() == 20, "font size is {}", merged.font_size());
		check(ctx, merged.colour() == folio::Colour::rgb(255, 0, 0), "colour comes from the child");
		check(ctx, merged.line_spacing() == 1, "line spacing comes from the parent");
		check(ctx, merged.font_family() == fonts.family(), "family comes from the parent");

		// extending with an empty style changes nothing
		check(ctx, root.extendWith(folio::Style()) == root, "empty style is an identity");
		check(ctx, not folio::Style().isComplete(), "a fresh style is not complete");
	}

	static void test_font_selection(Context& ctx)
	{
		begin(ctx, "bold and italic pick the right face");

		auto fonts = FakeFontBackend();
		auto root = fonts.rootStyle();
		auto family = fonts.family();

		check(ctx, root.font() == family.regular(), "regular");
		check(ctx, root.extendWith(folio::Style().bold()).font() == family.bold(), "bold");
		check(ctx, root.extendWith(folio::Style().italic()).font() == family.italic(), "italic");
		check(ctx, root.extendWith(folio::Style().bold().italic()).font() == family.boldItalic(), "bold italic");

		// a nested style can turn bold back off
		auto nested = root.extendWith(folio::Style().bold()).extendWith(folio::Style().with_bold(false));
		check(ctx, nested.font() == family.regular(), "bold can be switched off again");
	}

	static void test_line_style(Context& ctx)
	{
		begin(ctx, "line style helpers");

		using namespace folio::literals;

		auto ls = folio::LineStyle();
		check(ctx, approx(ls.thickness, folio::Length(0.1)), "default thickness");
		check(ctx, ls.colour == folio::Colour::black(), "default colour");

		auto thick = ls.with_thickness(2_mm).with_colour(folio::Colour::greyscale(128));
		check(ctx, approx(thick.thickness, 2_mm), "with_thickness");
		check(ctx, thick.colour == folio::Colour::greyscale(128), "with_colour");
		check(ctx, ls.thickness != thick.thickness, "original is unchanged");

		check(ctx, approx(1_pt, folio::Length(25.4 / 72.0)), "points convert to millimetres");
	}

	void test_style(Context& ctx)
	{
		test_extend(ctx);
		test_font_selection(ctx);
		test_line_style(ctx);
	}
}
