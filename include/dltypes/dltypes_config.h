// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file dltypes_config.h
/// @brief Centralized compile-time configuration for dltypes and its dependencies
///
/// This file configures the third-party libraries used by dltypes:
///   - immer: immutable vectors backing the serialized form of array-backed maps
///   - boost: hash combination for composite values
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All dltypes public headers already include it first.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DLTYPES_CONFIGURED)
#error "immer headers were included before dltypes/dltypes_config.h. " \
       "Please include dltypes headers before any direct immer includes."
#endif

#define DLTYPES_CONFIGURED 1

// ============================================================
// Thread Safety
// ============================================================

/// @brief Enable atomic reference counting in immer containers
///
/// Generated code converts maps on a single thread per call, so the default
/// is the non-atomic policy. Set to 1 if serialized sequences are handed
/// across threads.
#ifndef DLTYPES_ENABLE_THREAD_SAFE
#define DLTYPES_ENABLE_THREAD_SAFE 0
#endif

#if !DLTYPES_ENABLE_THREAD_SAFE && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Debug Settings (all disabled)
// ============================================================

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Logging
// ============================================================

/// @brief Verbose diagnostics on stderr
///
/// Disabled in release builds and enabled in debug builds unless set explicitly.
#ifndef DLTYPES_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DLTYPES_VERBOSE_LOG 0
#  else
#    define DLTYPES_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Decoder Limits
// ============================================================

/// @brief Maximum array/object nesting accepted by the JSON deserializer
#ifndef DLTYPES_JSON_MAX_DEPTH
#define DLTYPES_JSON_MAX_DEPTH 128
#endif

/// @brief Upper bound on capacity reserved from an element count read from input
///
/// Counts in binary documents are untrusted; containers still grow past this
/// limit, they just don't pre-allocate for it.
#ifndef DLTYPES_MAX_RESERVE
#define DLTYPES_MAX_RESERVE (1u << 16)
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DLTYPES_CONFIG_VERBOSE
#if DLTYPES_ENABLE_THREAD_SAFE
#pragma message("dltypes: Thread safety ENABLED")
#else
#pragma message("dltypes: Thread safety DISABLED (optimized for single-thread)")
#endif

#if DLTYPES_VERBOSE_LOG
#pragma message("dltypes: Verbose logging ENABLED")
#endif
#endif // DLTYPES_CONFIG_VERBOSE
