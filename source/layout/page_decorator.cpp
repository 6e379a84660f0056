// page_decorator.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/page_decorator.h"

namespace folio
{
	PageDecorator::~PageDecorator()
	{
	}

	SimplePageDecorator& SimplePageDecorator::setMargins(Margins margins)
	{
		m_margins = margins;
		return *this;
	}

	SimplePageDecorator& SimplePageDecorator::setHeader(HeaderFn header)
	{
		m_header = std::move(header);
		return *this;
	}

	Margins SimplePageDecorator::margins([[maybe_unused]] size_t page_number) const
	{
		return m_margins;
	}

	std::optional<Element> SimplePageDecorator::header(size_t page_number) const
	{
		if(not m_header)
			return std::nullopt;

		return m_header(page_number);
	}
}
