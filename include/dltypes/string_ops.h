// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file string_ops.h
/// @brief String building helpers called from generated expression code.
///
/// Both helpers take ownership of the left operand, append to it in place and
/// hand it back, so chains like `string_append(string_append(a, b), c)` reuse
/// a single buffer when the caller moves its argument in.

#pragma once

#include "api.h"

#include <string>
#include <string_view>

namespace dltypes {

/// Append a string slice onto an owned string.
[[nodiscard]] DLTYPES_API std::string string_append_str(std::string s1, std::string_view s2);

/// Append a string onto an owned string.
[[nodiscard]] DLTYPES_API std::string string_append(std::string s1, const std::string& s2);

} // namespace dltypes
