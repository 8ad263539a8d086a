// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for bulk_trans_system
 *
 * Central entry point for feature detection in bulk_trans_system. Include
 * this header to get the BULK_TRANS_HAS_* and KCENON_WITH_* macros.
 *
 * Feature categories:
 * - BULK_TRANS_HAS_*     : Local feature availability
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * @code
 * #include <kcenon/bulk_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_transfer_adapter::create_default(4);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BULK_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BULK_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Bulk Transfer System Feature Flags
//==============================================================================

/**
 * @brief Integrity verification support (OpenSSL)
 *
 * SHA-256 verification of copied files. OpenSSL is a required dependency,
 * so this is on unless explicitly disabled by the build.
 */
#ifndef BULK_TRANS_HAS_INTEGRITY_CHECK
    #if defined(BULK_TRANS_DISABLE_INTEGRITY_CHECK)
        #define BULK_TRANS_HAS_INTEGRITY_CHECK 0
    #else
        #define BULK_TRANS_HAS_INTEGRITY_CHECK 1
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker and enumeration pools)
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
 * @brief Unified flag for logger_system usage in bulk_transfer
 *
 * logger_system needs common_system for its result types, so both must be
 * present before records are forwarded to it.
 */
#ifndef BULK_TRANS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BULK_TRANS_USE_LOGGER_SYSTEM 1
    #else
        #define BULK_TRANS_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BULK_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Bulk Transfer System Feature Summary ===")

#if BULK_TRANS_HAS_INTEGRITY_CHECK
    #pragma message("  Integrity check (OpenSSL): Enabled")
#else
    #pragma message("  Integrity check (OpenSSL): Disabled")
#endif

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=============================================")

#endif  // BULK_TRANS_PRINT_FEATURE_SUMMARY
