/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Platform abstraction for logging
 */

#ifndef CN_LOG_H_
#define CN_LOG_H_

#include "cn_platform.h"
#include "cn_config.h"

/* ============================================================================
 * Log levels
 * ========================================================================== */

#define CN_LOG_LEVEL_NONE 0
#define CN_LOG_LEVEL_ERR  1
#define CN_LOG_LEVEL_WRN  2
#define CN_LOG_LEVEL_INF  3
#define CN_LOG_LEVEL_DBG  4

/* ============================================================================
 * Platform-specific logging backends
 * ========================================================================== */

#if defined(CN_PLATFORM_ZEPHYR)
/* Zephyr logging */
#include <zephyr/logging/log.h>

#define CN_LOG_MODULE_REGISTER(name) LOG_MODULE_REGISTER(name, CN_LOG_LEVEL)
#define CN_LOG_ERR(...)  LOG_ERR(__VA_ARGS__)
#define CN_LOG_WRN(...)  LOG_WRN(__VA_ARGS__)
#define CN_LOG_INF(...)  LOG_INF(__VA_ARGS__)
#define CN_LOG_DBG(...)  LOG_DBG(__VA_ARGS__)

#elif defined(CN_PLATFORM_NATIVE)
/* Native POSIX - printf-based logging, filtered at compile time */
#include <stdio.h>

#define CN_LOG_MODULE_REGISTER(name) /* No-op */
#define CN_LOG_PRINT_(lvl, tag, fmt, ...) \
    do { \
        if (CN_LOG_LEVEL >= (lvl)) { \
            printf("[" tag "] " fmt "\n", ##__VA_ARGS__); \
        } \
    } while (0)

#define CN_LOG_ERR(fmt, ...)  CN_LOG_PRINT_(CN_LOG_LEVEL_ERR, "ERR", fmt, ##__VA_ARGS__)
#define CN_LOG_WRN(fmt, ...)  CN_LOG_PRINT_(CN_LOG_LEVEL_WRN, "WRN", fmt, ##__VA_ARGS__)
#define CN_LOG_INF(fmt, ...)  CN_LOG_PRINT_(CN_LOG_LEVEL_INF, "INF", fmt, ##__VA_ARGS__)
#define CN_LOG_DBG(fmt, ...)  CN_LOG_PRINT_(CN_LOG_LEVEL_DBG, "DBG", fmt, ##__VA_ARGS__)

#else
/* Bare-metal - no logging */
#define CN_LOG_MODULE_REGISTER(name) /* No-op */
#define CN_LOG_ERR(...)  /* No-op */
#define CN_LOG_WRN(...)  /* No-op */
#define CN_LOG_INF(...)  /* No-op */
#define CN_LOG_DBG(...)  /* No-op */

#endif

#endif /* CN_LOG_H_ */
