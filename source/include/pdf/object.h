// object.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <string>
#include <vector>

#include "defs.h"

namespace pdf
{
	struct Writer;

	/*
	    PDF objects, which include: integers, real numbers, names, arrays, dictionaries, and streams.

	    Objects are created by (and owned by) a File, which frees them all when it goes away;
	    everything else refers to them with plain pointers.

	    Indirect objects are written once, at the top level of the file, and are referred to with
	    `N G R` everywhere else. Everything else is written out in full at its point of use.
	*/
	struct File;
	struct Dictionary;

	struct Object
	{
		virtual ~Object();

		// write with the default behaviour
		void write(Writer* w) const;

		void collectIndirectObjectsAndAssignIds(File* file);
		void writeIndirectObjects(Writer* w) const;

		// write the full definition (without the indirect definition), even for
		// dictionaries and streams.
		virtual void writeFull(Writer* w) const = 0;

		bool isIndirect() const { return m_is_indirect; }
		size_t byteOffset() const { return m_byte_offset; }

		size_t id() const { return m_id; }
		size_t gen() const { return m_gen; }

	protected:
		virtual void assign_children_ids(File* file);
		virtual void write_indirect_children(Writer* w) const;

		size_t m_id = 0;
		size_t m_gen = 0;

		bool m_assigned_id = false;
		mutable bool m_written = false;

		bool m_is_indirect = false;
		mutable size_t m_byte_offset = 0;

		friend struct File;
		friend struct IndirHelper;
	};

	struct Integer : Object
	{
		explicit Integer(int64_t value) : m_value(value) { }
		int64_t value() const { return m_value; }

		virtual void writeFull(Writer* w) const override;

	private:
		int64_t m_value = 0;
	};

	struct Decimal : Object
	{
		explicit Decimal(double value) : m_value(value) { }
		double value() const { return m_value; }

		virtual void writeFull(Writer* w) const override;

	private:
		double m_value = 0;
	};

	struct String : Object
	{
		explicit String(zst::str_view value) : m_value(value.str()) { }
		const std::string& value() const { return m_value; }

		virtual void writeFull(Writer* w) const override;

	private:
		std::string m_value {};
	};

	struct Name : Object
	{
		explicit Name(zst::str_view name) : m_name(name.str()) { }

		// special because our builtin names are values and not pointers
		Name* ptr() const { return const_cast<Name*>(this); }
		const std::string& name() const { return m_name; }

		virtual void writeFull(Writer* w) const override;

	private:
		std::string m_name {};
	};

	struct Array : Object
	{
		explicit Array(std::vector<Object*> values) : m_values(std::move(values)) { }

		void append(Object* obj);

		virtual void writeFull(Writer* w) const override;

	protected:
		virtual void assign_children_ids(File* file) override;
		virtual void write_indirect_children(Writer* w) const override;

	private:
		std::vector<Object*> m_values;
	};

	struct Dictionary : Object
	{
		Dictionary() { }
		explicit Dictionary(std::map<Name, Object*> values) : m_values(std::move(values)) { }
		Dictionary(const Name& type, std::map<Name, Object*> values);

		void add(const Name& n, Object* obj);
		void addOrReplace(const Name& n, Object* obj);

		virtual void writeFull(Writer* w) const override;

	protected:
		virtual void assign_children_ids(File* file) override;
		virtual void write_indirect_children(Writer* w) const override;

	private:
		std::map<Name, Object*> m_values;
	};

	// streams are always indirect; their contents are deflated when written if compression is on.
	struct Stream : Object
	{
		Stream(File* file, Dictionary* dict);

		Dictionary* dictionary() { return m_dict; }
		const Dictionary* dictionary() const { return m_dict; }

		void setCompressed(bool compressed);

		void append(zst::byte_span xs);

		size_t size() const { return m_bytes.size(); }

		virtual void writeFull(Writer* w) const override;

	protected:
		virtual void assign_children_ids(File* file) override;
		virtual void write_indirect_children(Writer* w) const override;

	private:
		File* m_file;
		zst::byte_buffer m_bytes;
		bool m_compressed = false;
		Dictionary* m_dict = nullptr;
	};

	struct IndirectRef : Object
	{
		explicit IndirectRef(Object* obj) : m_object(obj) { }

		virtual void writeFull(Writer* w) const override;

	protected:
		virtual void assign_children_ids(File* file) override;
		virtual void write_indirect_children(Writer* w) const override;

	private:
		Object* m_object;
	};


	inline bool operator<(const Name& a, const Name& b)
	{
		return a.name() < b.name();
	}

	// list of names
	namespace names
	{
		static const auto Ascent = pdf::Name("Ascent");
		static const auto BaseFont = pdf::Name("BaseFont");
		static const auto CapHeight = pdf::Name("CapHeight");
		static const auto Catalog = pdf::Name("Catalog");
		static const auto Contents = pdf::Name("Contents");
		static const auto Count = pdf::Name("Count");
		static const auto Descent = pdf::Name("Descent");
		static const auto Encoding = pdf::Name("Encoding");
		static const auto Filter = pdf::Name("Filter");
		static const auto FirstChar = pdf::Name("FirstChar");
		static const auto Flags = pdf::Name("Flags");
		static const auto FlateDecode = pdf::Name("FlateDecode");
		static const auto Font = pdf::Name("Font");
		static const auto FontBBox = pdf::Name("FontBBox");
		static const auto FontDescriptor = pdf::Name("FontDescriptor");
		static const auto FontName = pdf::Name("FontName");
		static const auto Info = pdf::Name("Info");
		static const auto ItalicAngle = pdf::Name("ItalicAngle");
		static const auto Kids = pdf::Name("Kids");
		static const auto LastChar = pdf::Name("LastChar");
		static const auto Length = pdf::Name("Length");
		static const auto MediaBox = pdf::Name("MediaBox");
		static const auto Page = pdf::Name("Page");
		static const auto Pages = pdf::Name("Pages");
		static const auto Parent = pdf::Name("Parent");
		static const auto Producer = pdf::Name("Producer");
		static const auto Resources = pdf::Name("Resources");
		static const auto Root = pdf::Name("Root");
		static const auto Size = pdf::Name("Size");
		static const auto StemV = pdf::Name("StemV");
		static const auto Subtype = pdf::Name("Subtype");
		static const auto Type = pdf::Name("Type");
		static const auto Type1 = pdf::Name("Type1");
		static const auto Widths = pdf::Name("Widths");
		static const auto WinAnsiEncoding = pdf::Name("WinAnsiEncoding");
		static const auto XHeight = pdf::Name("XHeight");
	}
}
