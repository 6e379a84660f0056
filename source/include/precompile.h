// precompile.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <map>
#include <array>
#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <variant>
#include <charconv>
#include <optional>
#include <algorithm>
#include <functional>
#include <string_view>

#include <zpr.h>
#include <zst/zst.h>
#include <ankerl/unordered_dense.h>

#include "defs.h"
