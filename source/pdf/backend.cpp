// backend.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/file.h"
#include "pdf/font.h"
#include "pdf/page.h"
#include "pdf/path.h"
#include "pdf/text.h"
#include "pdf/units.h"
#include "pdf/writer.h"
#include "pdf/backend.h"

using folio::ErrBackend;

namespace pdf
{
	PdfBackend::PdfBackend() : m_file(std::make_unique<File>())
	{
		m_file->setProducer("folio");
	}

	PdfBackend::~PdfBackend()
	{
	}

	folio::ErrorOr<void> PdfBackend::beginPage(folio::Size2d page_size)
	{
		if(m_finished)
			return ErrBackend("document was already finished");
		if(m_current_page != nullptr)
			return ErrBackend("beginPage() called while page {} is still open", m_file->numPages());

		if(page_size.x().value() <= 0 || page_size.y().value() <= 0)
			return ErrBackend("invalid page size {.3f} x {.3f} mm", page_size.x().value(), page_size.y().value());

		m_current_page = m_file->addPage(Size2d(toPdfScalar(page_size.x()), toPdfScalar(page_size.y())));
		folio::debug("pdf", "page {}: {.3f} x {.3f} pt", m_file->numPages(), m_current_page->size().x().value(),
		    m_current_page->size().y().value());

		return folio::Ok();
	}

	Page* PdfBackend::current_page(const char* what)
	{
		if(m_current_page == nullptr && not m_draw_error.has_value())
			m_draw_error = zpr::sprint("{} issued outside of a page", what);

		return m_current_page;
	}

	const PdfFont* PdfBackend::font_for(const font::FontSource* source)
	{
		if(auto it = m_fonts.find(source); it != m_fonts.end())
			return it->second.get();

		auto font = std::make_unique<PdfFont>(m_file.get(), source, m_file->getNextFontResourceNumber());
		auto ret = font.get();

		folio::debug("pdf", "using font '{}' as /{}", source->name(), font->resourceName());
		m_fonts.emplace(source, std::move(font));

		return ret;
	}

	void PdfBackend::drawText(folio::Position baseline, const folio::TextRun& run, const folio::Style& style)
	{
		auto page = this->current_page("drawText()");
		if(page == nullptr || run.glyphs.empty())
			return;

		auto source = style.font();
		if(source == nullptr)
		{
			if(not m_draw_error.has_value())
				m_draw_error = "drawText() with a style that has no font";
			return;
		}

		auto font = this->font_for(source);
		auto font_size = style.font_size_length();

		auto text = std::make_unique<Text>();
		text->setColour(style.colour());
		text->setFont(font, toPdfScalar(font_size));
		text->moveAbs(page->convertPosition(baseline));

		// the pdf reader advances by the width of the glyph it actually shows (which, for a
		// substituted '?', is not what the layout measured); whatever the layout placed
		// differently from that becomes a TJ adjustment (in thousandths of the font size).
		auto expected = folio::Length(0);
		for(auto& glyph : run.glyphs)
		{
			auto adjust = glyph.x - expected;
			text->offset(adjust.value() / font_size.value() * PDF_GLYPH_SPACE_UNITS);

			auto byte = font->encode(glyph.codepoint);
			text->addEncoded(1, byte);

			expected = glyph.x + font_size * (font->readerAdvance(byte) / PDF_GLYPH_SPACE_UNITS);
		}

		page->addObject(std::move(text));
	}

	void PdfBackend::drawLine(folio::Position start, folio::Position end, const folio::LineStyle& line_style)
	{
		auto page = this->current_page("drawLine()");
		if(page == nullptr)
			return;

		auto path = std::make_unique<Path>(Path::PaintStyle {
		    .stroke_colour = line_style.colour,
		    .line_width = toPdfScalar(line_style.thickness),
		    .fill_colour = std::nullopt,
		});

		path->addSegment(Path::MoveTo { page->convertPosition(start) });
		path->addSegment(Path::LineTo { page->convertPosition(end) });

		page->addObject(std::move(path));
	}

	void PdfBackend::drawRect(folio::Position top_left, folio::Size2d size, const folio::Paint& paint)
	{
		auto page = this->current_page("drawRect()");
		if(page == nullptr)
			return;

		auto style = Path::PaintStyle {};
		if(paint.stroke.has_value())
		{
			style.stroke_colour = paint.stroke->colour;
			style.line_width = toPdfScalar(paint.stroke->thickness);
		}

		style.fill_colour = paint.fill;

		// pdf rectangles are anchored at their bottom-left corner
		auto bottom_left = page->convertPosition(folio::Position(top_left.x(), top_left.y() + size.y()));

		auto path = std::make_unique<Path>(std::move(style));
		path->addSegment(Path::Rectangle {
		    .start = bottom_left,
		    .size = Size2d(toPdfScalar(size.x()), toPdfScalar(size.y())),
		});

		page->addObject(std::move(path));
	}

	folio::ErrorOr<void> PdfBackend::endPage()
	{
		if(m_current_page == nullptr)
			return ErrBackend("endPage() called without an open page");

		m_current_page = nullptr;
		if(m_draw_error.has_value())
			return ErrBackend("{}", *m_draw_error);

		return folio::Ok();
	}

	folio::ErrorOr<zst::byte_buffer> PdfBackend::finish()
	{
		if(m_finished)
			return ErrBackend("document was already finished");
		if(m_current_page != nullptr)
			return ErrBackend("finish() called while page {} is still open", m_file->numPages());
		if(m_draw_error.has_value())
			return ErrBackend("{}", *m_draw_error);
		if(m_file->numPages() == 0)
			return ErrBackend("cannot write a pdf file with no pages");

		m_finished = true;
		m_file->setCompressStreams(m_compress);

		auto writer = Writer();
		m_file->write(&writer);

		auto bytes = writer.take();
		folio::log("pdf", "wrote {} pages ({} bytes)", m_file->numPages(), bytes.size());

		return folio::Ok(std::move(bytes));
	}
}
