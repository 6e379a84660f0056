// file.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "util.h"
#include "pdf/units.h"
#include "pdf/object.h"

namespace pdf
{
	struct Page;
	struct Writer;

	/*
	    Owns every object (and page) that goes into one pdf file. Objects are allocated through
	    `make` and `makeIndirect`, and live until the file is destroyed.
	*/
	struct File
	{
		File();
		~File();

		File(const File&) = delete;
		File& operator=(const File&) = delete;

		template <typename T, typename... Args>
		T* make(Args&&... args)
		{
			auto obj = std::make_unique<T>(static_cast<Args&&>(args)...);
			auto ret = obj.get();

			m_arena.push_back(std::move(obj));
			return ret;
		}

		template <typename T, typename... Args>
		T* makeIndirect(Args&&... args)
		{
			auto ret = this->make<T>(static_cast<Args&&>(args)...);
			static_cast<Object*>(ret)->m_is_indirect = true;
			return ret;
		}

		// a new (indirect) stream with an empty dictionary
		Stream* makeStream();

		void write(Writer* w);
		void addObject(Object* obj);

		size_t getNewObjectId();
		size_t getNextFontResourceNumber();

		Page* addPage(Size2d size);
		Page* getPage(size_t page_num) const;
		size_t numPages() const { return m_pages.size(); }

		void setProducer(std::string producer) { m_producer = std::move(producer); }

		bool compressStreams() const { return m_compress_streams; }
		void setCompressStreams(bool compress) { m_compress_streams = compress; }

	private:
		Dictionary* create_page_tree();

	private:
		std::vector<std::unique_ptr<Object>> m_arena;

		size_t m_current_id = 0;
		util::hashmap<size_t, Object*> m_objects;

		std::vector<std::unique_ptr<Page>> m_pages;
		size_t m_current_font_number = 0;

		std::string m_producer;
		bool m_compress_streams = true;
	};
}
