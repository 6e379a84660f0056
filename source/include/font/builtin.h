// builtin.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <zst/zst.h>

namespace font::builtin
{
	enum class Face
	{
		Helvetica,
		HelveticaBold,
		HelveticaOblique,
		HelveticaBoldOblique,
	};

	zst::str_view getAfmData(Face face);
}
