// test-document.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

using folio::Length;
using folio::Size2d;
using folio::Margins;
using folio::Paragraph;
using folio::DocumentSettings;

using namespace folio::literals;

namespace test
{
	namespace
	{
		// fails at a chosen point, and otherwise records like a normal backend
		struct FailingBackend : folio::RecordingBackend
		{
			size_t fail_on_page = 0;
			bool fail_on_finish = false;

			virtual folio::ErrorOr<void> beginPage(Size2d page_size) override
			{
				if(++m_begun == fail_on_page)
					return folio::ErrBackend("out of paper");

				return RecordingBackend::beginPage(page_size);
			}

			virtual folio::ErrorOr<zst::byte_buffer> finish() override
			{
				if(fail_on_finish)
					return folio::ErrBackend("out of ink");

				return RecordingBackend::finish();
			}

		private:
			size_t m_begun = 0;
		};
	}

	static DocumentSettings small_paper()
	{
		auto settings = DocumentSettings {};
		settings.paper_size = Size2d(100, 30);
		settings.margins = DocumentSettings::MarginSettings { .top = 5_mm };
		settings.font_size = 10;

		return settings;
	}

	static void test_default_settings(Context& ctx)
	{
		begin(ctx, "default settings");

		auto empty = folio::fillDefaultSettings({});
		check(ctx, *empty.font_size == DocumentSettings::DEFAULT_FONT_SIZE, "font size");
		check(ctx, *empty.line_spacing == DocumentSettings::DEFAULT_LINE_SPACING, "line spacing");
		check(ctx, *empty.font_family == "Helvetica", "font family");
		check(ctx, approx(empty.paper_size->x(), 210_mm) && approx(empty.paper_size->y(), 297_mm), "A4");
		check(ctx, folio::marginsFromSettings(empty) == Margins::all(0_mm), "no margins");

		auto one = DocumentSettings {};
		one.margins = DocumentSettings::MarginSettings { .left = 3_mm };
		check(ctx, folio::marginsFromSettings(folio::fillDefaultSettings(one)) == Margins::all(3_mm),
		    "one side fills all of them");

		auto two = DocumentSettings {};
		two.margins = DocumentSettings::MarginSettings { .top = 1_mm, .left = 2_mm };
		check(ctx, folio::marginsFromSettings(folio::fillDefaultSettings(two)) == Margins::vh(1_mm, 2_mm),
		    "opposite sides are copied first");

		auto custom = DocumentSettings {};
		custom.font_size = 9;
		custom.font_family = "Fake";
		auto filled = folio::fillDefaultSettings(custom);
		check(ctx, *filled.font_size == 9 && *filled.font_family == "Fake", "given settings are kept");
	}

	static void test_configuration_errors(Context& ctx)
	{
		begin(ctx, "configuration errors");

		auto fonts = FakeFontBackend();
		using K = folio::Error::Kind;

		check_err(ctx, folio::Document::create(nullptr), K::Configuration, "no font backend");

		auto bad_size = small_paper();
		bad_size.font_size = 0;
		check_err(ctx, folio::Document::create(&fonts, bad_size), K::Configuration, "zero font size");

		auto bad_family = small_paper();
		bad_family.font_family = "Comic Sans";
		check_err(ctx, folio::Document::create(&fonts, bad_family), K::Configuration, "unknown family");

		auto doc = folio::Document::create(&fonts, small_paper());
		if(not check_ok(ctx, doc, "create"))
			return;

		auto& d = doc.unwrap();
		d.push(Paragraph("hello"));

		check(ctx, d.style().isComplete(), "the root style sets everything");
		check(ctx, d.style().font_size() == 10 && d.style().line_spacing() == 1, "from the settings");

		check_err(ctx, d.setFontFamily("Comic Sans"), K::Configuration, "setting an unknown family");

		// margins that leave nothing are caught before the backend sees anything
		d.setPageDecorator(std::make_unique<folio::SimplePageDecorator>(Margins::vh(20_mm, 5_mm)));
		{
			auto backend = folio::RecordingBackend();
			check_err(ctx, d.render(backend), K::Configuration, "margins taller than the page");
			check(ctx, backend.pages().empty(), "no pages were started");
		}

		d.setPageDecorator(nullptr);
		d.setFontSize(-1);
		{
			auto backend = folio::RecordingBackend();
			check_err(ctx, d.render(backend), K::Configuration, "negative font size");
			check(ctx, backend.pages().empty(), "no pages were started");
		}

		d.setFontSize(10);
		{
			auto backend = folio::RecordingBackend();
			check_ok(ctx, d.render(backend), "fixed");
			check(ctx, backend.isFinished(), "finished");
		}
	}

	static void test_backend_errors(Context& ctx)
	{
		begin(ctx, "backend errors are passed on");

		auto fonts = FakeFontBackend();
		auto doc = folio::Document::create(&fonts, small_paper());
		if(not check_ok(ctx, doc, "create"))
			return;

		// enough text for a few pages
		for(size_t i = 0; i < 20; i++)
			doc.unwrap().push(Paragraph(zpr::sprint("line {}", i)));

		{
			auto backend = FailingBackend();
			backend.fail_on_page = 2;

			auto result = doc.unwrap().render(backend);
			check_err(ctx, result, folio::Error::Kind::RenderBackend, "beginPage");
			check(ctx, result.is_err() && result.error().string() == "out of paper", "the backend's message");
			check(ctx, backend.pages().size() == 1, "stopped after the first page");
		}

		{
			auto backend = FailingBackend();
			backend.fail_on_finish = true;
			check_err(ctx, doc.unwrap().render(backend), folio::Error::Kind::RenderBackend, "finish");
		}

		{
			auto backend = folio::RecordingBackend();
			auto result = doc.unwrap().render(backend);
			if(check_ok(ctx, result, "render"))
			{
				check(ctx, backend.pages().size() > 1, "several pages");
				check(ctx, result.unwrap().size() > 0, "a listing is produced");
			}

			check_err(ctx, backend.finish(), folio::Error::Kind::RenderBackend, "finishing twice");
		}
	}

	static void test_no_progress(Context& ctx)
	{
		begin(ctx, "content that can never fit");

		auto fonts = FakeFontBackend();
		auto doc = folio::Document::create(&fonts, small_paper());
		if(not check_ok(ctx, doc, "create"))
			return;

		doc.unwrap().push(Paragraph("before"));
		doc.unwrap().push(folio::padded(Paragraph("too tall"), Margins::vh(50_mm, 0_mm)));

		auto backend = folio::RecordingBackend();
		auto result = doc.unwrap().render(backend);
		check_err(ctx, result, folio::Error::Kind::Layout, "no progress");

		// the first page had room for the paragraph before it
		check(ctx, backend.pages().size() == 2, "gave up on the second page ({} pages)", backend.pages().size());
		check(ctx, not backend.isFinished(), "not finished");
	}

	static void test_page_header(Context& ctx)
	{
		begin(ctx, "page headers");

		auto fonts = FakeFontBackend();
		auto doc = folio::Document::create(&fonts, small_paper());
		if(not check_ok(ctx, doc, "create"))
			return;

		auto decorator = std::make_unique<folio::SimplePageDecorator>(Margins::all(5_mm));
		decorator->setHeader([](size_t page) -> std::optional<folio::Element> {
			if(page == 1)
				return std::nullopt;

			return folio::Element(Paragraph(zpr::sprint("page {}", page)));
		});

		doc.unwrap().setPageDecorator(std::move(decorator));

		for(size_t i = 0; i < 8; i++)
			doc.unwrap().push(Paragraph(zpr::sprint("line {}", i)));

		auto backend = folio::RecordingBackend();
		if(not check_ok(ctx, doc.unwrap().render(backend), "render"))
			return;

		auto& pages = backend.pages();
		if(not check(ctx, pages.size() >= 2, "more than one page"))
			return;

		auto first = pages[0].strings();
		check(ctx, not first.empty() && first[0] == "line 0", "no header on the first page");

		for(size_t i = 1; i < pages.size(); i++)
		{
			auto strings = pages[i].strings();
			check(ctx, not strings.empty() && strings[0] == zpr::sprint("page {}", i + 1), "header of page {}", i + 1);

			auto texts = pages[i].texts();
			if(texts.size() > 1)
			{
				check(ctx, approx(texts[0]->baseline.y(), 5_mm + 8_pt), "header at the top of page {}", i + 1);
				check(ctx, approx(texts[1]->baseline.y(), 5_mm + 18_pt), "content below the header of page {}", i + 1);
			}
		}

		// every line turns up exactly once
		size_t total = 0;
		for(auto& page : pages)
		{
			for(auto& s : page.strings())
				total += (s.starts_with("line "));
		}

		check(ctx, total == 8, "all the lines ({})", total);
	}

	void test_document(Context& ctx)
	{
		test_default_settings(ctx);
		test_configuration_errors(ctx);
		test_backend_errors(ctx);
		test_no_progress(ctx);
		test_page_header(ctx);
	}
}
