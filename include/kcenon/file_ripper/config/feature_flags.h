// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for file_ripper
 *
 * Central entry point for the ecosystem integration flags used by
 * file_ripper. Include this header to get the KCENON_WITH_* macros and
 * FILE_RIPPER_USE_LOGGER_SYSTEM.
 *
 * Usage:
 * @code
 * #include <kcenon/file_ripper/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = std::make_shared<kcenon::thread::thread_pool>("workers");
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define FILE_RIPPER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define FILE_RIPPER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * These flags are set by CMake compile definitions (BUILD_WITH_*) when the
 * matching kcenon package was found, and may also be inherited from
 * common_system's feature_flags.h. Defaults are provided for standalone use.
 */

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker and directory pools)
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

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in file_ripper
 *
 * logger_system needs common_system for its result types, so both must be
 * present before records are forwarded to it.
 */
#ifndef FILE_RIPPER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define FILE_RIPPER_USE_LOGGER_SYSTEM 1
    #else
        #define FILE_RIPPER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef FILE_RIPPER_PRINT_FEATURE_SUMMARY

#pragma message("=== file_ripper Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async fallback)")
#endif

#if FILE_RIPPER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr fallback)")
#endif

#pragma message("===================================")

#endif  // FILE_RIPPER_PRINT_FEATURE_SUMMARY
