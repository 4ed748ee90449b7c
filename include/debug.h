// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file debug.h
 * @brief Compile-time guarded debug output macros
 *
 * Provides DBG_PRINT, DBG_WARN and DBG_ERROR macros that are enabled only
 * when CONFIG_DEBUG is defined (CMake option SENSEHUB_DEBUG_OUTPUT). In
 * release builds these macros compile to no-ops.
 *
 * Usage:
 *   #include "debug.h"
 *
 *   DBG_PRINT("[Module] Initialization complete\n");
 *   DBG_ERROR("[Module] Sensor read failed\n");
 *
 * Informational output goes to stdout, warnings and errors to stderr so a
 * status dump piped elsewhere stays clean.
 *
 * @note Arguments are NOT evaluated in release builds. Do not put
 *       expressions with side effects inside these macros.
 */

#ifndef SENSEHUB_DEBUG_H
#define SENSEHUB_DEBUG_H

#include <cstdio>

#ifdef CONFIG_DEBUG

/**
 * @brief Debug print macro - enabled in debug builds
 * @param fmt Printf-style format string
 * @param ... Format arguments
 */
#define DBG_PRINT(fmt, ...) printf(fmt, ##__VA_ARGS__)

/**
 * @brief Debug warning macro - enabled in debug builds
 */
#define DBG_WARN(fmt, ...) fprintf(stderr, "[WARN] " fmt, ##__VA_ARGS__)

/**
 * @brief Debug error macro - enabled in debug builds
 * @param fmt Printf-style format string
 * @param ... Format arguments
 */
#define DBG_ERROR(fmt, ...) fprintf(stderr, "[ERROR] " fmt, ##__VA_ARGS__)

#else

#define DBG_PRINT(fmt, ...) do {} while(0)
#define DBG_WARN(fmt, ...) do {} while(0)
#define DBG_ERROR(fmt, ...) do {} while(0)

#endif // CONFIG_DEBUG

#endif // SENSEHUB_DEBUG_H
