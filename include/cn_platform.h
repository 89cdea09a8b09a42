/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Platform abstraction layer for the CANopen node.
 * Allows building and testing without an RTOS.
 */

#ifndef CN_PLATFORM_H_
#define CN_PLATFORM_H_

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Platform detection */
#if defined(__ZEPHYR__)
    #define CN_PLATFORM_ZEPHYR 1
#elif defined(__linux__) || defined(__APPLE__)
    #define CN_PLATFORM_NATIVE 1
#else
    #define CN_PLATFORM_BAREMETAL 1
#endif

/* ============================================================================
 * Time API
 * ============================================================================ */

/**
 * @brief Get current monotonic time in microseconds
 * @return Microseconds since an arbitrary fixed point
 */
uint64_t cn_platform_get_time_us(void);

/* ============================================================================
 * Mutex API
 *
 * The node takes the mutex around every protocol step and the mailbox takes
 * its own around push/pull. Locks must be re-entrant for the owning context,
 * because application callbacks run with the node lock held and may call
 * back into the node.
 * ============================================================================ */

#if defined(CN_PLATFORM_NATIVE)
#include <pthread.h>

struct cn_mutex {
    pthread_mutex_t mutex;
};

#elif defined(CN_PLATFORM_ZEPHYR)
#include <zephyr/kernel.h>

struct cn_mutex {
    struct k_mutex mutex;
};

#else
/* Bare metal: the port implements the functions below with an interrupt
 * mask and keeps the previous mask in the structure. */
struct cn_mutex {
    uint32_t saved_state;
    uint32_t depth;
};
#endif

typedef struct cn_mutex cn_mutex_t;

/**
 * @brief Initialize a recursive mutex
 * @param mutex Pointer to mutex structure
 * @return 0 on success, negative errno on failure
 */
int cn_mutex_init(cn_mutex_t *mutex);

/**
 * @brief Lock a mutex (blocking, re-entrant for the owner)
 * @param mutex Pointer to mutex structure
 * @return 0 on success, negative errno on failure
 */
int cn_mutex_lock(cn_mutex_t *mutex);

/**
 * @brief Unlock a mutex
 * @param mutex Pointer to mutex structure
 * @return 0 on success, negative errno on failure
 */
int cn_mutex_unlock(cn_mutex_t *mutex);

/**
 * @brief Destroy a mutex
 * @param mutex Pointer to mutex structure
 */
void cn_mutex_destroy(cn_mutex_t *mutex);

#ifdef __cplusplus
}

namespace cn {

/**
 * @brief Scoped lock over a platform mutex
 */
class MutexGuard {
public:
    explicit MutexGuard(cn_mutex_t *mutex) : mutex_(mutex) { cn_mutex_lock(mutex_); }
    ~MutexGuard() { cn_mutex_unlock(mutex_); }

    MutexGuard(const MutexGuard &) = delete;
    MutexGuard &operator=(const MutexGuard &) = delete;

private:
    cn_mutex_t *mutex_;
};

}  // namespace cn
#endif

#endif /* CN_PLATFORM_H_ */
