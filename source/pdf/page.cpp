// page.cpp
// Copyright (c) 2021, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include "pdf/file.h"        // for File
#include "pdf/font.h"        // for PdfFont
#include "pdf/page.h"        // for Page
#include "pdf/units.h"       // for Size2d, Position2d
#include "pdf/object.h"      // for Name, Dictionary, Object, IndirectRef
#include "pdf/page_object.h" // for PageObject

namespace pdf
{
	Page::Page([[maybe_unused]] File* file, Size2d size) : m_page_size(size)
	{
	}

	Position2d Page::convertPosition(folio::Position pos) const
	{
		auto x = toPdfScalar(pos.x());
		auto y = toPdfScalar(pos.y());

		return Position2d(x.value(), m_page_size.y().value() - y.value());
	}

	void Page::useFont(const PdfFont* font) const
	{
		if(std::find(m_fonts.begin(), m_fonts.end(), font) == m_fonts.end())
			m_fonts.push_back(font);
	}

	void Page::addObject(std::unique_ptr<PageObject> pobj)
	{
		m_objects.push_back(std::move(pobj));
	}

	Dictionary* Page::serialise(File* file) const
	{
		auto strm = file->makeStream();
		strm->setCompressed(file->compressStreams());

		for(auto& obj : m_objects)
		{
			// ask the object to add whatever resources it needs
			obj->addResources(this);
			obj->writePdfCommands(strm);
		}

		auto resources = file->make<Dictionary>();
		if(not m_fonts.empty())
		{
			auto font_dict = file->make<Dictionary>();
			for(auto font : m_fonts)
				font_dict->add(Name(font->resourceName()), file->make<IndirectRef>(font->dictionary()));

			resources->add(names::Font, font_dict);
		}

		auto media_box = file->make<Array>(std::vector<Object*> {
		    file->make<Integer>(0),
		    file->make<Integer>(0),
		    file->make<Decimal>(m_page_size.x().value()),
		    file->make<Decimal>(m_page_size.y().value()),
		});

		return file->makeIndirect<Dictionary>(names::Page,
		    std::map<Name, Object*> {
		        { names::Resources, resources },
		        { names::MediaBox, media_box },
		        { names::Contents, file->make<IndirectRef>(strm) },
		    });
	}

	PageObject::~PageObject()
	{
	}
}
