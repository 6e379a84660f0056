// misc.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio> // for stderr

#include "defs.h"

namespace pdf
{
	struct Writer;
	struct Object;

	template <typename... Args>
	[[noreturn]] inline void error(const char* fmt, Args&&... args)
	{
		folio::internal_error("(pdf) {}", zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}

	// writes the `N G obj` and `endobj` around an object that is written indirectly
	struct IndirHelper
	{
		IndirHelper(Writer* w, const Object* obj);
		~IndirHelper();

		IndirHelper(IndirHelper&&) = delete;
		IndirHelper(const IndirHelper&) = delete;

		Writer* w = 0;
		bool indirect = false;
	};
}
