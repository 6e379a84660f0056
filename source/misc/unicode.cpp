// unicode.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <utf8proc.h> // for utf8proc_encode_char, utf8proc_iterate, utf8proc_category

#include "defs.h"

namespace unicode
{
	std::string utf8FromCodepoint(char32_t cp)
	{
		uint8_t buf[4] {};
		auto n = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), &buf[0]);
		if(n <= 0)
			folio::internal_error("invalid codepoint U+{04x}", static_cast<uint32_t>(cp));

		return std::string(reinterpret_cast<const char*>(&buf[0]), static_cast<size_t>(n));
	}

	std::u32string u32StringFromUtf8(std::string_view sv)
	{
		std::u32string ret {};
		ret.reserve(sv.size());

		auto ptr = reinterpret_cast<const utf8proc_uint8_t*>(sv.data());
		auto len = static_cast<utf8proc_ssize_t>(sv.size());

		while(len > 0)
		{
			utf8proc_int32_t cp = 0;
			auto read = utf8proc_iterate(ptr, len, &cp);

			// malformed sequences become U+FFFD, and we skip one byte to resynchronise
			if(read < 0)
			{
				ret.push_back(U'\uFFFD');
				ptr += 1;
				len -= 1;
				continue;
			}

			ret.push_back(static_cast<char32_t>(cp));
			ptr += read;
			len -= read;
		}

		return ret;
	}

	std::string stringFromU32String(std::u32string_view sv)
	{
		std::string ret {};
		ret.reserve(sv.size());

		for(auto cp : sv)
			ret += utf8FromCodepoint(cp);

		return ret;
	}

	bool isWhitespace(char32_t cp)
	{
		if(cp == U'\t' || cp == U'\n' || cp == U'\r')
			return true;

		return utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_ZS;
	}
}
