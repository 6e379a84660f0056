// writer.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <zst/zst.h>
#include <zpr.h>
#include <cstddef>

namespace pdf
{
	struct Object;

	// accumulates the serialised file in memory; the caller decides where the bytes go.
	struct Writer
	{
		Writer() = default;

		Writer(const Writer&) = delete;
		Writer& operator=(const Writer&) = delete;

		int nesting = 0;

		size_t position() const;

		size_t write(zst::str_view sv);
		size_t writeln(zst::str_view sv);
		size_t writeln();

		void write(const Object* obj);

		size_t writeBytes(const uint8_t* bytes, size_t len);

		zst::byte_buffer take();

		template <typename... Args>
		size_t write(zst::str_view fmt, Args&&... args)
		{
			return zpr::cprint(
			    [this](const char* s, size_t l) {
				    this->write(zst::str_view(s, l));
			    },
			    fmt, static_cast<Args&&>(args)...);
		}

		template <typename... Args>
		size_t writeln(zst::str_view fmt, Args&&... args)
		{
			return this->write(fmt, static_cast<Args&&>(args)...) + this->write("\n");
		}

	private:
		zst::byte_buffer m_buffer {};
	};
}
