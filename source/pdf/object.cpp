// object.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/file.h"   // for File
#include "pdf/misc.h"   // for IndirHelper, error
#include "pdf/object.h" // for Name, Dictionary, Object, Array, IndirectRef
#include "pdf/writer.h" // for Writer

namespace pdf
{
	static constexpr bool PRETTY_PRINT = false;

	IndirHelper::IndirHelper(Writer* w, const Object* obj) : w(w), indirect(obj->isIndirect())
	{
		if(indirect)
		{
			obj->m_byte_offset = w->position();
			w->writeln("{} {} obj", obj->id(), obj->gen());
		}
	}

	IndirHelper::~IndirHelper()
	{
		if(indirect)
		{
			w->writeln();
			w->writeln("endobj");
			w->writeln();
		}
	}

	Object::~Object()
	{
	}

	void Object::write(Writer* w) const
	{
		if(m_is_indirect)
			w->write("{} {} R", m_id, m_gen);
		else
			this->writeFull(w);
	}

	void Integer::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);
		w->write("{}", m_value);
	}

	void Decimal::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);

		// pdf readers do not understand exponents, so always use fixed notation
		w->write("{.4f}", m_value);
	}

	void String::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);

		// always write strings as their hexadecimal encoding
		w->write("<");
		for(char c : m_value)
			w->write("{02x}", static_cast<uint8_t>(c));

		w->write(">");
	}

	void Name::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);

		auto encode_name = [](zst::str_view sv) -> std::string {
			std::string ret;
			ret.reserve(sv.size());

			for(char c : sv)
			{
				if(c < '!' || c > '~' || c == '#' || c == '/')
					ret += zpr::sprint("#{02x}", static_cast<uint8_t>(c));

				else
					ret.push_back(c);
			}
			return ret;
		};

		w->write("/{}", encode_name(m_name));
	}

	void Array::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);
		w->write("[ ");
		for(auto obj : m_values)
		{
			obj->write(w);
			w->write(" ");
		}
		w->write("]");
	}

	void Array::append(Object* obj)
	{
		m_values.push_back(obj);
	}

	Dictionary::Dictionary(const Name& type, std::map<Name, Object*> values) : m_values(std::move(values))
	{
		m_values.insert_or_assign(names::Type, type.ptr());
	}

	void Dictionary::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);

		if(m_values.empty())
		{
			w->write("<< >>");
			return;
		}

		w->writeln("<<");
		w->nesting++;
		for(auto& [name, value] : m_values)
		{
			if(PRETTY_PRINT)
				w->write("{}", std::string(static_cast<size_t>(w->nesting) * 2, ' '));

			name.write(w);
			w->write(" ");
			value->write(w);
			w->writeln();
		}
		w->nesting--;

		if(PRETTY_PRINT)
			w->write("{}", std::string(static_cast<size_t>(w->nesting) * 2, ' '));

		w->write(">>");
	}

	void IndirectRef::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);
		w->write("{} {} R", m_object->id(), m_object->gen());
	}

	void Dictionary::add(const Name& n, Object* obj)
	{
		if(auto it = m_values.find(n); it != m_values.end())
			pdf::error("key '{}' already exists in dictionary", n.name());

		m_values.emplace(n, obj);
	}

	void Dictionary::addOrReplace(const Name& n, Object* obj)
	{
		m_values.insert_or_assign(n, obj);
	}
}
