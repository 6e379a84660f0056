// test-frame.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

using folio::Length;
using folio::Size2d;
using folio::Paragraph;

using namespace folio::literals;

namespace test
{
	static folio::ErrorOr<folio::Document> make_document(FakeFontBackend* fonts)
	{
		auto settings = folio::DocumentSettings {};
		settings.paper_size = Size2d(100, 30);
		settings.margins = folio::DocumentSettings::MarginSettings { .top = 5_mm };

		return folio::Document::create(fonts, std::move(settings));
	}

	static size_t count_horizontal(const folio::RecordingBackend::Page& page)
	{
		size_t n = 0;
		for(auto line : page.lines())
			n += (line->start.y() == line->end.y());

		return n;
	}

	static void test_small_frame(Context& ctx)
	{
		begin(ctx, "a frame that fits on one page");

		auto fonts = FakeFontBackend();
		auto doc = make_document(&fonts);
		if(not check_ok(ctx, doc, "create document"))
			return;

		doc.unwrap().push(folio::framed(Paragraph("Lorem ipsum")));

		auto backend = folio::RecordingBackend();
		auto output = doc.unwrap().render(backend);
		if(not check_ok(ctx, output, "render"))
			return;

		auto& pages = backend.pages();
		if(not check(ctx, pages.size() == 1, "one page (got {})", pages.size()))
			return;

		auto& page = pages[0];
		check(ctx, page.strings() == std::vector<std::string> { "Lorem ipsum" }, "the text");
		check(ctx, page.lines().size() == 4, "a closed frame has four edges");
		check(ctx, count_horizontal(page) == 2, "top and bottom");

		auto line_height = FakeFontBackend::lineHeight(folio::DocumentSettings::DEFAULT_FONT_SIZE);
		auto thickness = folio::LineStyle().thickness;

		auto texts = page.texts();
		if(texts.size() == 1)
		{
			check(ctx, approx(texts[0]->baseline.x(), 5_mm + thickness), "text is inside the frame");
			check(ctx, approx(texts[0]->baseline.y(), 5_mm + thickness + line_height * 0.8), "baseline");
		}

		auto lines = page.lines();
		for(auto line : lines)
		{
			if(line->start.y() != line->end.y())
				continue;

			auto y = line->start.y();
			check(ctx, approx(y, 5_mm + thickness / 2) || approx(y, 5_mm + line_height + thickness * 1.5),
			    "edge at {}", y.value());
		}
	}

	static void test_split_frame(Context& ctx)
	{
		begin(ctx, "a frame split across pages");

		auto fonts = FakeFontBackend();
		auto doc = make_document(&fonts);
		if(not check_ok(ctx, doc, "create document"))
			return;

		auto text = std::string();
		for(size_t i = 0; i < 50; i++)
			text += "lorem ipsum ";

		doc.unwrap().push(folio::framed(Paragraph(text)));

		auto backend = folio::RecordingBackend();
		auto output = doc.unwrap().render(backend);
		if(not check_ok(ctx, output, "render"))
			return;

		auto& pages = backend.pages();
		if(not check(ctx, pages.size() > 2, "at least three pages (got {})", pages.size()))
			return;

		size_t words = 0;
		for(size_t i = 0; i < pages.size(); i++)
		{
			auto& page = pages[i];
			bool first = (i == 0);
			bool last = (i + 1 == pages.size());

			check(ctx, count_horizontal(page) == size_t(first) + size_t(last), "horizontal edges on page {}", i + 1);
			check(ctx, page.lines().size() - count_horizontal(page) == 2, "both sides on page {}", i + 1);

			for(auto& s : page.strings())
			{
				for(size_t k = 0; k < s.size(); k++)
					words += (s[k] != ' ' && (k == 0 || s[k - 1] == ' '));
			}
		}

		check(ctx, words == 100, "every word was drawn once ({})", words);
	}

	void test_frame(Context& ctx)
	{
		test_small_frame(ctx);
		test_split_frame(ctx);
	}
}
