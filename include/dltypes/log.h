// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic output for dltypes, gated by DLTYPES_VERBOSE_LOG.

#pragma once

#include "dltypes_config.h"

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace dltypes {
namespace detail {

inline void log_warning(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DLTYPES_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

inline void log_decode_error(
    std::string_view component,
    std::size_t element_index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DLTYPES_VERBOSE_LOG
    std::cerr << "[" << component << "] element " << element_index
              << " failed to decode: " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)element_index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail
} // namespace dltypes
