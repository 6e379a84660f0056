// file.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/file.h"
#include "pdf/misc.h"
#include "pdf/page.h"
#include "pdf/object.h"
#include "pdf/writer.h"

namespace pdf
{
	void File::write(Writer* w)
	{
		w->writeln("%PDF-1.7");

		// add 4 non-ascii bytes to signify a binary file
		w->writeln("%\xf0\xf1\xf2\xf3");
		w->writeln();

		auto pagetree = this->create_page_tree();
		auto root = this->makeIndirect<Dictionary>(names::Catalog,
		    std::map<Name, Object*> { { names::Pages, this->make<IndirectRef>(pagetree) } });

		auto info_dict = this->makeIndirect<Dictionary>();
		if(not m_producer.empty())
			info_dict->add(names::Producer, this->make<String>(m_producer));

		// first, traverse all objects that are reachable from the root
		root->collectIndirectObjectsAndAssignIds(this);
		info_dict->collectIndirectObjectsAndAssignIds(this);

		// then write the indirect objects
		root->writeIndirectObjects(w);
		info_dict->writeIndirectObjects(w);

		auto xref_position = w->position();
		auto num_objects = m_current_id + 1;

		// note: use \r\n line endings here so that each entry is exactly 20 bytes
		w->writeln("xref");
		w->writeln("0 {}", num_objects);
		w->writeln("{010} {05} f\r", 0, 0xffff);

		for(size_t i = 1; i < num_objects; i++)
		{
			if(auto it = m_objects.find(i); it != m_objects.end())
				w->writeln("{010} {05} n\r", it->second->byteOffset(), it->second->gen());
			else
				pdf::error("object {} was never assigned", i);
		}

		w->writeln();

		auto trailer = this->make<Dictionary>(std::map<Name, Object*> {
		    { names::Size, this->make<Integer>(static_cast<int64_t>(num_objects)) },
		    { names::Info, this->make<IndirectRef>(info_dict) },
		    { names::Root, this->make<IndirectRef>(root) },
		});

		w->writeln("trailer");
		w->write(trailer);

		w->writeln();
		w->writeln("startxref");
		w->writeln("{}", xref_position);
		w->writeln("%%EOF");
	}


	Dictionary* File::create_page_tree()
	{
		// a flat tree is fine for the page counts we deal with
		auto pagetree = this->makeIndirect<Dictionary>(names::Pages,
		    std::map<Name, Object*> { { names::Count, this->make<Integer>(static_cast<int64_t>(m_pages.size())) } });

		auto array = this->make<Array>(std::vector<Object*> {});
		for(auto& page : m_pages)
		{
			auto dict = page->serialise(this);
			dict->addOrReplace(names::Parent, this->make<IndirectRef>(pagetree));

			array->append(this->make<IndirectRef>(dict));
		}

		pagetree->addOrReplace(names::Kids, array);
		return pagetree;
	}

	File::File()
	{
		m_current_id = 0;
	}

	File::~File()
	{
	}

	Stream* File::makeStream()
	{
		return this->make<Stream>(this, this->make<Dictionary>());
	}

	Page* File::addPage(Size2d size)
	{
		m_pages.push_back(std::make_unique<Page>(this, size));
		return m_pages.back().get();
	}

	Page* File::getPage(size_t num) const
	{
		if(num >= m_pages.size())
			pdf::error("page number {} is out of range (have only {})", num, m_pages.size());

		return m_pages[num].get();
	}

	void File::addObject(Object* obj)
	{
		if(not obj->isIndirect())
			pdf::error("cannot add non-indirect objects directly to a File");

		if(m_objects.find(obj->id()) != m_objects.end())
			pdf::error("object id '{}' already exists (generations not supported)", obj->id());

		m_objects.emplace(obj->id(), obj);
	}

	size_t File::getNewObjectId()
	{
		return ++m_current_id;
	}

	size_t File::getNextFontResourceNumber()
	{
		return ++m_current_font_number;
	}
}
