// defs.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cmath>
#include <filesystem>

#include <zpr.h>
#include <zst/zst.h>

#include "util.h"
#include "error.h"
#include "units.h"

namespace stdfs = std::filesystem;

namespace folio
{
	using zst::Ok;
	using zst::Err;

	using zst::Result;
}

#define __TRY(x, L) __extension__({                                       \
		auto&& __r##L = x;                                                \
		using R = std::decay_t<decltype(__r##L)>;                         \
		using V = typename R::value_type;                                 \
		using E = typename R::error_type;                                 \
		if((__r##L).is_err())                                             \
			return ::zst::Err(std::move((__r##L).error()));                \
		util::impl::extract_value_or_return_void<V, E>().extract(__r##L); \
	})

#define _TRY(x, L) __TRY(x, L)
#define TRY(x) _TRY(x, __COUNTER__)

inline void zst::error_and_exit(const char* str, size_t len)
{
	folio::internal_error("{}", zst::str_view(str, len));
}
