// document.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/document.h"

#include "layout/base.h"

namespace folio
{
	ErrorOr<Document> Document::create(FontBackend* fonts, DocumentSettings settings)
	{
		if(fonts == nullptr)
			return ErrConfig("no font backend was given");

		settings = fillDefaultSettings(std::move(settings));

		auto family = fonts->resolveFamily(*settings.font_family);
		if(family.is_err())
			return ErrConfig("no usable default font family: {}", family.error().string());

		if(*settings.font_size <= 0)
			return ErrConfig("font size must be positive (got {})", *settings.font_size);

		auto style = Style();
		style.set_font_family(family.unwrap())
		    .set_font_size(*settings.font_size)
		    .set_line_spacing(*settings.line_spacing)
		    .set_colour(Colour::black())
		    .set_bold(false)
		    .set_italic(false);

		// every element's style is resolved against this one, so nothing may be left unset
		if(not style.isComplete())
			internal_error("root style is incomplete");

		return Ok(Document(fonts, std::move(style), *settings.paper_size, marginsFromSettings(settings)));
	}

	Document::Document(FontBackend* fonts, Style style, Size2d paper_size, Margins margins)
	    : m_fonts(fonts)
	    , m_style(std::move(style))
	    , m_paper_size(paper_size)
	    , m_decorator(std::make_unique<SimplePageDecorator>(margins))
	{
	}

	Document::~Document() = default;
	Document::Document(Document&&) = default;
	Document& Document::operator=(Document&&) = default;

	void Document::setPaperSize(Size2d size)
	{
		m_paper_size = size;
	}

	void Document::setPageDecorator(std::unique_ptr<PageDecorator> decorator)
	{
		if(decorator == nullptr)
			decorator = std::make_unique<SimplePageDecorator>();

		m_decorator = std::move(decorator);
	}

	void Document::setFontSize(double font_size)
	{
		m_style.set_font_size(font_size);
	}

	void Document::setLineSpacing(double line_spacing)
	{
		m_style.set_line_spacing(line_spacing);
	}

	ErrorOr<void> Document::setFontFamily(zst::str_view name)
	{
		auto family = TRY(m_fonts->resolveFamily(name));
		m_style.set_font_family(family);
		return Ok();
	}

	Document& Document::push(Element element)
	{
		m_root.push(std::move(element));
		return *this;
	}


	static ErrorOr<Size2d> content_size(Size2d paper, const Margins& margins, size_t page_num)
	{
		auto width = paper.x() - margins.horizontal();
		auto height = paper.y() - margins.vertical();

		if(width <= Length(0) || height <= Length(0))
		{
			return ErrConfig("margins leave no space for content on page {} (paper {.2f}x{.2f}mm, content {.2f}x{.2f}mm)",
			    page_num, paper.x().value(), paper.y().value(), width.value(), height.value());
		}

		return Ok(Size2d(width, height));
	}

	ErrorOr<zst::byte_buffer> Document::render(RenderBackend& backend) const
	{
		if(m_style.font_size() <= 0)
			return ErrConfig("font size must be positive (got {})", m_style.font_size());

		// check the first page before giving the backend anything.
		TRY(content_size(m_paper_size, m_decorator->margins(1), 1));

		auto ctx = layout::RenderContext { .fonts = m_fonts };
		auto cont = layout::Continuation {};

		size_t page_num = 1;
		while(true)
		{
			auto margins = m_decorator->margins(page_num);
			auto size = TRY(content_size(m_paper_size, margins, page_num));

			TRY(backend.beginPage(m_paper_size));

			auto area = Area(&backend, Position(margins.left, margins.top), size);
			if(auto header = m_decorator->header(page_num); header.has_value())
			{
				auto result = TRY(layout::render(ctx, *header, area.remainder(), m_style, nullptr));
				if(not result.isComplete())
					warn("document", "header of page {} did not fit; the rest of it was dropped", page_num);

				area.advance(result.size.y());
			}

			auto result = TRY(layout::renderLinearLayout(ctx, m_root, area.remainder(), m_style, layout::resumeOf(cont)));

			TRY(backend.endPage());
			debug("document", "finished page {}", page_num);

			if(result.isComplete())
				break;

			if(*result.continuation == cont)
				return ErrLayout("no content could be placed on page {}; some element is too large for the page", page_num);

			cont = std::move(*result.continuation);
			page_num += 1;
		}

		log("document", "rendered {} page{}", page_num, page_num == 1 ? "" : "s");
		return backend.finish();
	}
}
