// page_decorator.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include "folio/element.h"

namespace folio
{
	/*
	    Decides what each page looks like around the document's content. Both methods are called
	    once per page, with page numbers starting at 1; the header, if any, is drawn at the top of
	    the content area, and the document's content follows below it.
	*/
	struct PageDecorator
	{
		virtual ~PageDecorator();

		virtual Margins margins(size_t page_number) const = 0;
		virtual std::optional<Element> header(size_t page_number) const = 0;
	};

	struct SimplePageDecorator : PageDecorator
	{
		using HeaderFn = std::function<std::optional<Element>(size_t)>;

		SimplePageDecorator() = default;
		explicit SimplePageDecorator(Margins margins) : m_margins(margins) { }

		SimplePageDecorator& setMargins(Margins margins);
		SimplePageDecorator& setHeader(HeaderFn header);

		virtual Margins margins(size_t page_number) const override;
		virtual std::optional<Element> header(size_t page_number) const override;

	private:
		Margins m_margins {};
		HeaderFn m_header {};
	};
}
