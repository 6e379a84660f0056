// indirect.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/file.h"
#include "pdf/misc.h"
#include "pdf/object.h"

namespace pdf
{
	void Object::collectIndirectObjectsAndAssignIds(File* file)
	{
		if(m_assigned_id)
			return;

		m_assigned_id = true;
		this->assign_children_ids(file);

		if(m_is_indirect)
		{
			m_id = file->getNewObjectId();
			m_gen = 0;

			file->addObject(this);
		}
	}

	void Object::writeIndirectObjects(Writer* w) const
	{
		if(m_written)
			return;

		m_written = true;
		this->write_indirect_children(w);

		if(not m_is_indirect)
			return;

		if(not m_assigned_id)
			pdf::error("did not assign id to indirect object?");

		this->writeFull(w);
	}

	// scalars and names have no children, so they have nothing to do.
	void Object::assign_children_ids([[maybe_unused]] File* file)
	{
	}

	void Object::write_indirect_children([[maybe_unused]] Writer* w) const
	{
	}

	void Array::assign_children_ids(File* file)
	{
		for(auto obj : m_values)
			obj->collectIndirectObjectsAndAssignIds(file);
	}

	void Dictionary::assign_children_ids(File* file)
	{
		for(auto& [_, obj] : m_values)
			obj->collectIndirectObjectsAndAssignIds(file);
	}

	void Stream::assign_children_ids(File* file)
	{
		m_dict->collectIndirectObjectsAndAssignIds(file);
	}

	void IndirectRef::assign_children_ids(File* file)
	{
		m_object->collectIndirectObjectsAndAssignIds(file);
	}

	void Array::write_indirect_children(Writer* w) const
	{
		for(auto obj : m_values)
			obj->writeIndirectObjects(w);
	}

	void Dictionary::write_indirect_children(Writer* w) const
	{
		for(auto& [_, obj] : m_values)
			obj->writeIndirectObjects(w);
	}

	void Stream::write_indirect_children(Writer* w) const
	{
		m_dict->writeIndirectObjects(w);
	}

	void IndirectRef::write_indirect_children(Writer* w) const
	{
		m_object->writeIndirectObjects(w);
	}
}
