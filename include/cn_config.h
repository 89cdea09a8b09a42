/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Build-time configuration
 *
 * Every buffer in the node is sized here. Override any value with a
 * compiler definition (-DCN_TX_QUEUE_CAPACITY=64) or a Kconfig symbol.
 */

#ifndef CN_CONFIG_H_
#define CN_CONFIG_H_

/**
 * @brief Number of frames the outgoing mailbox can hold
 */
#ifndef CN_TX_QUEUE_CAPACITY
#define CN_TX_QUEUE_CAPACITY 32
#endif

/**
 * @brief SDO server transfer buffer in bytes
 *
 * Bounds the largest object that can be uploaded or downloaded. The
 * default holds one full block of 127 segments.
 */
#ifndef CN_SDO_BUFFER_SIZE
#define CN_SDO_BUFFER_SIZE 889
#endif

/**
 * @brief Default SDO timeout in milliseconds
 */
#ifndef CN_SDO_TIMEOUT_MS
#define CN_SDO_TIMEOUT_MS 1000
#endif

/**
 * @brief Block size the server requests for block downloads (1-127)
 */
#ifndef CN_SDO_BLOCK_SIZE
#define CN_SDO_BLOCK_SIZE 127
#endif

/**
 * @brief Maximum number of receive / transmit PDO channels
 */
#ifndef CN_MAX_RPDOS
#define CN_MAX_RPDOS 8
#endif

#ifndef CN_MAX_TPDOS
#define CN_MAX_TPDOS 8
#endif

/**
 * @brief Number of validator / change hooks the dictionary can hold
 */
#ifndef CN_OD_MAX_HOOKS
#define CN_OD_MAX_HOOKS 16
#endif

/**
 * @brief Native log threshold (see cn_log.h), warnings and errors by default
 */
#ifndef CN_LOG_LEVEL
#define CN_LOG_LEVEL 2
#endif

#if CN_SDO_BUFFER_SIZE < 7
#error "CN_SDO_BUFFER_SIZE must hold at least one segment"
#endif

#if CN_SDO_BLOCK_SIZE < 1 || CN_SDO_BLOCK_SIZE > 127
#error "CN_SDO_BLOCK_SIZE must be between 1 and 127"
#endif

#endif /* CN_CONFIG_H_ */
