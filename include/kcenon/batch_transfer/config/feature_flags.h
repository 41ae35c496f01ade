// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for batch_transfer
 *
 * Feature categories:
 * - BATCH_TRANSFER_HAS_* : Local feature availability (SFTP session adapter)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/batch_transfer/config/feature_flags.h>
 *
 * #if BATCH_TRANSFER_HAS_SFTP
 *     sftp_connector connector;
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BATCH_TRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BATCH_TRANSFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Batch Transfer Feature Flags
//==============================================================================

/**
 * @brief SFTP session support (libssh2)
 *
 * Set via CMake option BATCH_TRANSFER_ENABLE_SFTP.
 */
#ifndef BATCH_TRANSFER_HAS_SFTP
    #if defined(BATCH_TRANSFER_ENABLE_SFTP)
        #define BATCH_TRANSFER_HAS_SFTP 1
    #else
        #define BATCH_TRANSFER_HAS_SFTP 0
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

// thread_system integration (thread_pool for batch runs)
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
// Feature Summary (for debugging)
//==============================================================================

#ifdef BATCH_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Batch Transfer Feature Summary ===")

#if BATCH_TRANSFER_HAS_SFTP
    #pragma message("  SFTP (libssh2): Enabled")
#else
    #pragma message("  SFTP (libssh2): Disabled")
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

#pragma message("======================================")

#endif // BATCH_TRANSFER_PRINT_FEATURE_SUMMARY
