// test-pdf.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "pdf/backend.h"
#include "pdf/win_ansi_encoding.h"

using folio::Size2d;
using folio::Margins;
using folio::Paragraph;
using folio::TableLayout;

using namespace folio::literals;

namespace test
{
	static std::string as_string(const zst::byte_buffer& buf)
	{
		return std::string(reinterpret_cast<const char*>(buf.data()), buf.size());
	}

	static bool contains(const std::string& haystack, std::string_view needle)
	{
		return haystack.find(needle) != std::string::npos;
	}

	static size_t count(const std::string& haystack, std::string_view needle)
	{
		size_t n = 0;
		for(auto i = haystack.find(needle); i != std::string::npos; i = haystack.find(needle, i + needle.size()))
			n++;

		return n;
	}

	static folio::ErrorOr<zst::byte_buffer> render_sample(folio::FontBackend* fonts, bool compress, size_t paragraphs)
	{
		auto settings = folio::DocumentSettings {};
		settings.paper_size = Size2d(100, 60);
		settings.margins = folio::DocumentSettings::MarginSettings { .top = 5_mm };
		settings.font_size = 10;

		auto doc = TRY(folio::Document::create(fonts, std::move(settings)));
		doc.push(Paragraph("AVAVA"));
		doc.push(folio::framed(Paragraph("in a box")));

		auto table = TableLayout({ 1, 1 });
		table.setCellDecorator(std::make_unique<folio::FrameCellDecorator>(true, true, false));
		TRY(table.row().element(Paragraph("left")).element(Paragraph("right")).background(folio::Colour::rgb(255, 0, 0)).push());
		doc.push(std::move(table));

		for(size_t i = 0; i < paragraphs; i++)
			doc.push(Paragraph(zpr::sprint("paragraph number {}", i)));

		auto backend = pdf::PdfBackend();
		backend.setCompressed(compress);

		return doc.render(backend);
	}

	static void test_pdf_structure(Context& ctx)
	{
		begin(ctx, "pdf file structure");

		auto fonts = folio::AfmFontBackend();
		auto result = render_sample(&fonts, /* compress: */ false, 20);
		if(not check_ok(ctx, result, "render"))
			return;

		auto pdf = as_string(result.unwrap());

		check(ctx, pdf.starts_with("%PDF-1.7"), "header");
		check(ctx, pdf.ends_with("%%EOF\n"), "trailer");
		check(ctx, contains(pdf, "/Type /Catalog"), "catalog");
		check(ctx, contains(pdf, "/Type /Pages"), "page tree");
		check(ctx, contains(pdf, "/BaseFont /Helvetica"), "the builtin font");
		check(ctx, contains(pdf, "/Encoding /WinAnsiEncoding"), "encoding");
		check(ctx, contains(pdf, "/F1"), "font resource");
		check(ctx, contains(pdf, "xref"), "cross reference table");
		check(ctx, contains(pdf, "/Producer"), "info dictionary");
		check(ctx, not contains(pdf, "/FlateDecode"), "uncompressed");

		auto pages = count(pdf, "/Type /Page\n");
		check(ctx, pages > 1, "several pages ({})", pages);

		// the kerning between A and V shows up as a TJ adjustment
		check(ctx, contains(pdf, "<41> 70.000 <56>"), "kerning");
		check(ctx, contains(pdf, "TJ"), "text");
		check(ctx, contains(pdf, "1.000 0.000 0.000 rg"), "red background");
		check(ctx, contains(pdf, " re f\n"), "filled rectangle");

		// every object in the xref table must be at the offset it claims
		auto xref = pdf.rfind("\nxref\n");
		if(check(ctx, xref != std::string::npos, "found xref"))
		{
			auto startxref = pdf.rfind("startxref\n");
			auto offset = std::stoul(pdf.substr(startxref + 10));
			check(ctx, offset == xref + 1, "startxref points at xref ({} vs {})", offset, xref + 1);

			auto first = pdf.find("n\r\n", xref);
			if(first != std::string::npos)
			{
				auto entry_offset = std::stoul(pdf.substr(first - 17, 10));
				check(ctx, pdf.compare(entry_offset, 7, "1 0 obj") == 0, "object 1 is where the xref says");
			}
		}
	}

	static void test_pdf_compressed(Context& ctx)
	{
		begin(ctx, "compressed streams");

		auto fonts = folio::AfmFontBackend();
		auto plain = render_sample(&fonts, false, 5);
		auto squashed = render_sample(&fonts, true, 5);

		if(not check_ok(ctx, plain, "uncompressed") || not check_ok(ctx, squashed, "compressed"))
			return;

		auto pdf = as_string(squashed.unwrap());
		check(ctx, contains(pdf, "/Filter /FlateDecode"), "streams are deflated");
		check(ctx, not contains(pdf, " TJ\n"), "content is not readable");
		check(ctx, squashed.unwrap().size() < plain.unwrap().size(), "smaller output");
	}

	static void test_pdf_backend_errors(Context& ctx)
	{
		begin(ctx, "pdf backend errors");

		using K = folio::Error::Kind;

		{
			auto backend = pdf::PdfBackend();
			check_err(ctx, backend.finish(), K::RenderBackend, "no pages");
		}

		{
			auto backend = pdf::PdfBackend();
			check_ok(ctx, backend.beginPage(Size2d(100, 100)), "first page");
			check_err(ctx, backend.beginPage(Size2d(100, 100)), K::RenderBackend, "page already open");
			check_err(ctx, backend.finish(), K::RenderBackend, "finish with a page open");
			check_ok(ctx, backend.endPage(), "end page");
			check_err(ctx, backend.endPage(), K::RenderBackend, "end page twice");

			check_ok(ctx, backend.finish(), "finish");
			check_err(ctx, backend.finish(), K::RenderBackend, "finish twice");
			check_err(ctx, backend.beginPage(Size2d(100, 100)), K::RenderBackend, "page after finishing");
		}

		{
			auto backend = pdf::PdfBackend();
			check_err(ctx, backend.beginPage(Size2d(0, 100)), K::RenderBackend, "empty page");
		}

		{
			// drawing outside a page is reported later
			auto backend = pdf::PdfBackend();
			backend.drawLine(folio::Position(0, 0), folio::Position(1, 1), folio::LineStyle());
			check_ok(ctx, backend.beginPage(Size2d(100, 100)), "begin page");
			check_err(ctx, backend.endPage(), K::RenderBackend, "stray draw");
		}
	}

	static void test_win_ansi(Context& ctx)
	{
		begin(ctx, "WinAnsi encoding");

		using namespace pdf::encoding;

		check(ctx, WIN_ANSI(U'A') == uint8_t('A'), "ascii");
		check(ctx, WIN_ANSI(U'\u00e9') == uint8_t(0xE9), "latin-1");
		check(ctx, WIN_ANSI(U'\u20ac') == uint8_t(0x80), "euro sign");
		check(ctx, WIN_ANSI(U'\u2014') == uint8_t(0x97), "em dash");
		check(ctx, not WIN_ANSI(U'\u4e2d').has_value(), "not encodable");
		check(ctx, not WIN_ANSI(U'\u0081').has_value(), "undefined C1 control");

		check(ctx, codepointForWinAnsi(0x80) == U'\u20ac', "euro sign back");
		check(ctx, not codepointForWinAnsi(0x81).has_value(), "undefined byte");
		check(ctx, codepointForWinAnsi('z') == U'z', "ascii back");

		// unencodable text still renders, as question marks; the layout gave the missing glyph no
		// width, so the '?' (556 units in Helvetica) has to be taken back before the next glyph
		auto fonts = folio::AfmFontBackend();
		auto settings = folio::DocumentSettings {};
		settings.paper_size = Size2d(100, 100);

		auto doc = folio::Document::create(&fonts, settings);
		if(not check_ok(ctx, doc, "create"))
			return;

		doc.unwrap().push(folio::Text("x\u4e2dx"));

		auto backend = pdf::PdfBackend();
		backend.setCompressed(false);

		auto result = doc.unwrap().render(backend);
		if(check_ok(ctx, result, "render"))
			check(ctx, contains(as_string(result.unwrap()), "[<78><3f> 556.000 <78>] TJ"), "replaced with '?'");
	}

	void test_pdf(Context& ctx)
	{
		test_pdf_structure(ctx);
		test_pdf_compressed(ctx);
		test_pdf_backend_errors(ctx);
		test_win_ansi(ctx);
	}
}
