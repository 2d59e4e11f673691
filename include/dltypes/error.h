// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Exception types thrown by dltypes decoders.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>

namespace dltypes {

/// Thrown when a value cannot be decoded from its serialized representation.
///
/// Raised by every Deserializer implementation and by the Codec
/// specializations (e.g. an integer that does not fit its target type).
/// A MalformedValue aborts the enclosing document; callers never receive
/// a partially decoded container.
class DLTYPES_CLASS MalformedValue : public std::runtime_error {
public:
    explicit MalformedValue(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace dltypes
