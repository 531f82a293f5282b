// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#pragma once

/// @file api.h
/// @brief Export/import decoration for the configdiff library.
///
/// The build defines CONFIGDIFF_SHARED (public) and CONFIGDIFF_EXPORTS
/// (private) when configdiff is built as a shared library. Static builds
/// leave both undefined and CONFIGDIFF_API expands to nothing.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CONFIGDIFF_SHARED
        #ifdef CONFIGDIFF_EXPORTS
            #define CONFIGDIFF_API __declspec(dllexport)
        #else
            #define CONFIGDIFF_API __declspec(dllimport)
        #endif
    #else
        #define CONFIGDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(CONFIGDIFF_SHARED) && defined(CONFIGDIFF_EXPORTS)
        #define CONFIGDIFF_API __attribute__((visibility("default")))
    #else
        #define CONFIGDIFF_API
    #endif
#else
    #define CONFIGDIFF_API
#endif
