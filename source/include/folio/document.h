// document.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "folio/element.h"
#include "folio/font_backend.h"
#include "folio/page_decorator.h"
#include "folio/render_backend.h"
#include "folio/document_settings.h"

namespace folio
{
	/*
	    The root of everything. Elements are pushed onto the document in order, and `render` lays
	    them out page by page, handing the results to a render backend.

	    The font backend must outlive the document, along with every font family it resolved.
	*/
	struct Document
	{
		static ErrorOr<Document> create(FontBackend* fonts, DocumentSettings settings = {});

		~Document();
		Document(Document&&);
		Document& operator=(Document&&);

		Document(const Document&) = delete;
		Document& operator=(const Document&) = delete;

		void setPaperSize(Size2d size);
		void setPageDecorator(std::unique_ptr<PageDecorator> decorator);
		void setFontSize(double font_size);
		void setLineSpacing(double line_spacing);
		ErrorOr<void> setFontFamily(zst::str_view name);

		Document& push(Element element);

		Size2d paperSize() const { return m_paper_size; }
		const Style& style() const { return m_style; }
		const PageDecorator& pageDecorator() const { return *m_decorator; }
		const LinearLayout& contents() const { return m_root; }

		/*
		    Renders every page, then asks the backend to finish the output. If anything fails,
		    the whole render fails; whatever the backend was given so far should be thrown away.
		*/
		ErrorOr<zst::byte_buffer> render(RenderBackend& backend) const;

	private:
		Document(FontBackend* fonts, Style style, Size2d paper_size, Margins margins);

		FontBackend* m_fonts;
		Style m_style;
		Size2d m_paper_size;
		std::unique_ptr<PageDecorator> m_decorator;
		LinearLayout m_root;
	};
}
