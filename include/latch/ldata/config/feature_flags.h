// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for ldata_transfer
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - LDATA_HAS_*     : Local feature availability (libcurl streaming, ...)
 * - KCENON_WITH_*   : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <latch/ldata/config/feature_flags.h>
 *
 * #if LDATA_HAS_CURL
 *     auto opener = make_curl_object_opener(cfg);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define LDATA_HAS_COMMON_FEATURE_FLAGS 1
#else
#define LDATA_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// ldata_transfer Feature Flags
//==============================================================================

/**
 * @brief libcurl streaming object reads
 *
 * Set by CMake when libcurl is found (LDATA_ENABLE_CURL).
 */
#ifndef LDATA_HAS_CURL
    #if defined(LDATA_ENABLE_CURL)
        #define LDATA_HAS_CURL 1
    #else
        #define LDATA_HAS_CURL 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP API client)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system requires common_system; both must be enabled.
 */
#ifndef LDATA_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define LDATA_USE_LOGGER_SYSTEM 1
    #else
        #define LDATA_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef LDATA_PRINT_FEATURE_SUMMARY

#pragma message("=== ldata_transfer Feature Summary ===")

#if LDATA_HAS_CURL
    #pragma message("  libcurl streaming: Enabled")
#else
    #pragma message("  libcurl streaming: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if LDATA_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("======================================")

#endif // LDATA_PRINT_FEATURE_SUMMARY
