// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for request_pipeline
 *
 * Central entry point for integration flags of the request_pipeline library.
 *
 * Feature categories:
 * - KCENON_WITH_*               : System integration flags (inherited from common_system)
 * - REQUEST_PIPELINE_USE_*      : Resolved integration switches used by this library
 *
 * Usage:
 * @code
 * #include <kcenon/request_pipeline/config/feature_flags.h>
 *
 * #if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define REQUEST_PIPELINE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define REQUEST_PIPELINE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (IMonitor bridge for metrics)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
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
 * @brief Unified flag for logger_system usage in request_pipeline
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef REQUEST_PIPELINE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define REQUEST_PIPELINE_USE_LOGGER_SYSTEM 1
    #else
        #define REQUEST_PIPELINE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef REQUEST_PIPELINE_PRINT_FEATURE_SUMMARY

#pragma message("=== Request Pipeline Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("========================================")

#endif // REQUEST_PIPELINE_PRINT_FEATURE_SUMMARY
