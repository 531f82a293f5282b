// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file configdiff_config.h
/// @brief Centralized compile-time configuration for configdiff and immer.
///
/// Every configdiff public header includes this file before any immer
/// header, so users of the library inherit a consistent set of immer
/// settings without defining anything themselves.
///
/// @warning Do NOT include immer headers ahead of configdiff headers in a
///          translation unit; the guard below rejects that order.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(CONFIGDIFF_CONFIGURED)
#error "immer headers were included before configdiff/configdiff_config.h. " \
       "Please include configdiff headers before any direct immer includes."
#endif

#define CONFIGDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Trees are read-only once parsed and may be shared by concurrent diff
// calls, so the default (atomic refcount) memory policy stays enabled:
// IMMER_NO_THREAD_SAFETY is deliberately left undefined here.
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Verbose Logging
//
// When CONFIGDIFF_VERBOSE_LOG is non-zero the detail::log_* helpers in
// node.h write diagnostics to stderr:
//   - failed Node::at() lookups
//   - keyed-array elements that cannot be indexed
//   - duplicate keyed-array identities (last element wins)
//
// Enabled by default in debug builds, disabled when NDEBUG is set.
// ============================================================

#ifndef CONFIGDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define CONFIGDIFF_VERBOSE_LOG 0
#  else
#    define CONFIGDIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef CONFIGDIFF_CONFIG_VERBOSE
#if CONFIGDIFF_VERBOSE_LOG
#pragma message("configdiff: verbose diagnostics ENABLED")
#else
#pragma message("configdiff: verbose diagnostics DISABLED")
#endif
#endif // CONFIGDIFF_CONFIG_VERBOSE
