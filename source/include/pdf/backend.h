// backend.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include "folio/render_backend.h"

#include "pdf/file.h"

namespace pdf
{
	struct Page;
	struct PdfFont;

	/*
	    Renders pages into a PDF file, which `finish` returns as bytes. Fonts are referenced as
	    simple Type1 fonts in the WinAnsi encoding; glyphs are positioned using the kerning that
	    the layout engine already applied, so the reader's own metrics only matter for the
	    glyph shapes.
	*/
	struct PdfBackend : folio::RenderBackend
	{
		PdfBackend();
		virtual ~PdfBackend() override;

		PdfBackend(const PdfBackend&) = delete;
		PdfBackend& operator=(const PdfBackend&) = delete;

		void setCompressed(bool compress) { m_compress = compress; }
		bool isCompressed() const { return m_compress; }

		virtual folio::ErrorOr<void> beginPage(folio::Size2d page_size) override;

		virtual void drawText(folio::Position baseline, const folio::TextRun& run, const folio::Style& style) override;
		virtual void drawLine(folio::Position start, folio::Position end, const folio::LineStyle& line_style) override;
		virtual void drawRect(folio::Position top_left, folio::Size2d size, const folio::Paint& paint) override;

		virtual folio::ErrorOr<void> endPage() override;
		virtual folio::ErrorOr<zst::byte_buffer> finish() override;

		size_t numPages() const { return m_file->numPages(); }

	private:
		Page* current_page(const char* what);
		const PdfFont* font_for(const font::FontSource* source);

		std::unique_ptr<File> m_file;
		util::hashmap<const font::FontSource*, std::unique_ptr<PdfFont>> m_fonts;

		Page* m_current_page = nullptr;
		std::optional<std::string> m_draw_error;

		bool m_compress = true;
		bool m_finished = false;
	};
}
