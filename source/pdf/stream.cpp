// stream.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <libdeflate.h>

#include "pdf/file.h"   // for File
#include "pdf/misc.h"   // for error, IndirHelper
#include "pdf/object.h" // for Stream, Dictionary, Integer, Name
#include "pdf/writer.h" // for Writer

namespace pdf
{
	Stream::Stream(File* file, Dictionary* dict) : m_file(file), m_compressed(false), m_dict(dict)
	{
		m_is_indirect = true;
	}

	void Stream::setCompressed(bool compressed)
	{
		m_compressed = compressed;
	}

	static std::optional<zst::byte_buffer> deflate_bytes(zst::byte_span input)
	{
		auto compressor = libdeflate_alloc_compressor(6);
		if(compressor == nullptr)
			return std::nullopt;

		auto bound = libdeflate_zlib_compress_bound(compressor, input.size());
		auto output = std::make_unique<uint8_t[]>(bound);

		auto compressed_len = libdeflate_zlib_compress(compressor, input.data(), input.size(), output.get(), bound);
		libdeflate_free_compressor(compressor);

		if(compressed_len == 0)
			return std::nullopt;

		zst::byte_buffer ret {};
		ret.append(output.get(), compressed_len);
		return ret;
	}

	void Stream::writeFull(Writer* w) const
	{
		auto helper = IndirHelper(w, this);

		auto write_the_thing = [](Writer* wr, Dictionary* dict, zst::byte_span buf) {
			dict->writeFull(wr);

			wr->writeln();
			wr->writeln("stream\r");

			wr->writeBytes(buf.data(), buf.size());

			wr->writeln("\r");
			wr->write("endstream");
		};

		if(m_compressed)
		{
			if(auto compressed = deflate_bytes(m_bytes.span()); compressed.has_value())
			{
				m_dict->addOrReplace(names::Length, m_file->make<Integer>(static_cast<int64_t>(compressed->size())));
				m_dict->addOrReplace(names::Filter, names::FlateDecode.ptr());

				write_the_thing(w, m_dict, compressed->span());
				return;
			}

			folio::warn("pdf", "compression failed, writing stream uncompressed");
		}

		m_dict->addOrReplace(names::Length, m_file->make<Integer>(static_cast<int64_t>(m_bytes.size())));
		write_the_thing(w, m_dict, m_bytes.span());
	}

	void Stream::append(zst::byte_span xs)
	{
		m_bytes.append(xs);
	}
}
