// win_ansi_encoding.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace pdf::encoding
{
	// codepoints for bytes 128 to 159; zero means the byte is not defined by the encoding
	static constexpr std::array<char32_t, 32> WIN_ANSI_HIGH_CONTROL = {
		U'\u20ac', 0, U'\u201a', U'\u0192', U'\u201e', U'\u2026', U'\u2020', U'\u2021', //
		U'\u02c6', U'\u2030', U'\u0160', U'\u2039', U'\u0152', 0, U'\u017d', 0,         //
		0, U'\u2018', U'\u2019', U'\u201c', U'\u201d', U'\u2022', U'\u2013', U'\u2014', //
		U'\u02dc', U'\u2122', U'\u0161', U'\u203a', U'\u0153', 0, U'\u017e', U'\u0178', //
	};

	inline std::optional<uint8_t> WIN_ANSI(char32_t cp)
	{
		if(cp < 128 || (0xa0 <= cp && cp <= 0xff))
			return static_cast<uint8_t>(cp);

		for(size_t i = 0; i < WIN_ANSI_HIGH_CONTROL.size(); i++)
		{
			if(WIN_ANSI_HIGH_CONTROL[i] != 0 && WIN_ANSI_HIGH_CONTROL[i] == cp)
				return static_cast<uint8_t>(128 + i);
		}

		return std::nullopt;
	}

	inline std::optional<char32_t> codepointForWinAnsi(uint8_t byte)
	{
		if(byte < 128 || byte >= 0xa0)
			return static_cast<char32_t>(byte);

		if(auto cp = WIN_ANSI_HIGH_CONTROL[byte - 128]; cp != 0)
			return cp;

		return std::nullopt;
	}
}
