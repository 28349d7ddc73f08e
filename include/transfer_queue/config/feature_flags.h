// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Optional integration flags for transfer_queue
 *
 * Central entry point for the TQ_* and KCENON_WITH_* feature macros.
 *
 * - KCENON_WITH_*  : kcenon ecosystem integrations (thread_system, logger_system)
 * - TQ_USE_*       : derived switches consumed by transfer_queue headers
 *
 * @code
 * #include <transfer_queue/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = adapters::thread_system_executor::create(8, "downloads");
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#define TQ_HAS_COMMON_FEATURE_FLAGS 1
#else
#define TQ_HAS_COMMON_FEATURE_FLAGS 0
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

// logger_system integration (log sink)
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
 * @brief Route transfer_queue log output through logger_system
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef TQ_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define TQ_USE_LOGGER_SYSTEM 1
    #else
        #define TQ_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef TQ_PRINT_FEATURE_SUMMARY

#pragma message("=== transfer_queue Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async worker pool)")
#endif

#if TQ_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr sink)")
#endif

#pragma message("======================================")

#endif // TQ_PRINT_FEATURE_SUMMARY
