// render_backend.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/render_backend.h"

namespace folio
{
	RenderBackend::~RenderBackend()
	{
	}

	std::u32string TextRun::text() const
	{
		std::u32string ret {};
		ret.reserve(glyphs.size());

		for(auto& g : glyphs)
			ret.push_back(g.codepoint);

		return ret;
	}
}
