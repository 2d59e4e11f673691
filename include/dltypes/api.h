// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform DLL export/import macros for dltypes.
///
/// - Building dltypes as a SHARED library: CMake defines DLTYPES_EXPORTS (private)
///   and DLTYPES_SHARED (public), symbols marked DLTYPES_API are exported.
/// - Using the shared library: DLTYPES_SHARED propagates, symbols are imported.
/// - Static library: DLTYPES_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DLTYPES_SHARED
        #ifdef DLTYPES_EXPORTS
            #define DLTYPES_API __declspec(dllexport)
        #else
            #define DLTYPES_API __declspec(dllimport)
        #endif
    #else
        #define DLTYPES_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DLTYPES_SHARED) && defined(DLTYPES_EXPORTS)
        #define DLTYPES_API __attribute__((visibility("default")))
    #else
        #define DLTYPES_API
    #endif
#else
    #define DLTYPES_API
#endif

/// Mark a class for export (use in class declaration)
/// @example class DLTYPES_CLASS MyPublicClass { ... };
#define DLTYPES_CLASS DLTYPES_API
