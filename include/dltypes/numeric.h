// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file numeric.h
/// @brief Fixed-width aliases for the rule language's machine-word integer types.
///
/// `usize` and `isize` in the rule language are always 64 bits wide,
/// independent of the host's pointer width.

#pragma once

#include <cstdint>

namespace dltypes {

using std_usize = std::uint64_t;
using std_isize = std::int64_t;

static_assert(sizeof(std_usize) == 8 && sizeof(std_isize) == 8);

} // namespace dltypes
