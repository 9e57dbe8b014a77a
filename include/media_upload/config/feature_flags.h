// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for media_upload
 *
 * Central entry point for the integration flags of the media_upload
 * library. Include this header to get the KCENON_WITH_* macros and the
 * MEDIA_UPLOAD_* helpers derived from them.
 *
 * Feature categories:
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 * - MEDIA_UPLOAD_*       : Local switches derived from the integration flags
 *
 * Usage:
 * @code
 * #include <media_upload/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto client = std::make_shared<network_http_client>();
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define MEDIA_UPLOAD_HAS_COMMON_FEATURE_FLAGS 1
#else
#define MEDIA_UPLOAD_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * @brief Ensure KCENON_WITH_* flags are always available
 *
 * These are normally set through CMake compile definitions (BUILD_WITH_*)
 * or inherited from common_system's feature_flags.h. Defaults are provided
 * for standalone builds.
 */

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client used for the upload API)
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
 * @brief Unified flag for logger_system usage in media_upload
 *
 * logger_system needs common_system, so both must be present.
 */
#ifndef MEDIA_UPLOAD_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define MEDIA_UPLOAD_USE_LOGGER_SYSTEM 1
    #else
        #define MEDIA_UPLOAD_USE_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Whether a real HTTP transport is compiled in
 *
 * Without network_system the bundled HTTP client reports every request as
 * unavailable; callers may still inject their own http_client_interface.
 */
#ifndef MEDIA_UPLOAD_HAS_HTTP_TRANSPORT
    #define MEDIA_UPLOAD_HAS_HTTP_TRANSPORT KCENON_WITH_NETWORK_SYSTEM
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef MEDIA_UPLOAD_PRINT_FEATURE_SUMMARY

#pragma message("=== Media Upload Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("====================================")

#endif // MEDIA_UPLOAD_PRINT_FEATURE_SUMMARY
