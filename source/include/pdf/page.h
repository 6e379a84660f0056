// page.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "pdf/units.h"       // for Size2d, Position2d
#include "pdf/object.h"      // for Dictionary
#include "pdf/page_object.h" // for PageObject

namespace pdf
{
	struct File;
	struct PdfFont;

	struct Page
	{
		Page(File* file, Size2d size);

		Page(const Page&) = delete;
		Page& operator=(const Page&) = delete;

		Size2d size() const { return m_page_size; }

		// layout positions are in mm from the top-left corner; pdf positions are in points from the bottom-left.
		Position2d convertPosition(folio::Position pos) const;

		void addObject(std::unique_ptr<PageObject> obj);
		size_t numObjects() const { return m_objects.size(); }

		void useFont(const PdfFont* font) const;

		// creates the page dictionary (and its content stream)
		Dictionary* serialise(File* file) const;

	private:
		Size2d m_page_size {};
		std::vector<std::unique_ptr<PageObject>> m_objects;
		mutable std::vector<const PdfFont*> m_fonts;
	};
}
