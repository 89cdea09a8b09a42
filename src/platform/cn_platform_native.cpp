/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Native POSIX platform implementation (Linux, macOS)
 */

#include "cn_platform.h"

#if defined(CN_PLATFORM_NATIVE)

#include <errno.h>
#include <time.h>

extern "C" {

uint64_t cn_platform_get_time_us(void)
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000000ULL + (uint64_t)ts.tv_nsec / 1000ULL;
}

int cn_mutex_init(cn_mutex_t *mutex)
{
    if (!mutex) {
        return -EINVAL;
    }

    pthread_mutexattr_t attr;
    int ret = pthread_mutexattr_init(&attr);
    if (ret != 0) {
        return -ret;
    }
    ret = pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_RECURSIVE);
    if (ret == 0) {
        ret = pthread_mutex_init(&mutex->mutex, &attr);
    }
    pthread_mutexattr_destroy(&attr);
    return -ret;
}

int cn_mutex_lock(cn_mutex_t *mutex)
{
    if (!mutex) {
        return -EINVAL;
    }
    return -pthread_mutex_lock(&mutex->mutex);
}

int cn_mutex_unlock(cn_mutex_t *mutex)
{
    if (!mutex) {
        return -EINVAL;
    }
    return -pthread_mutex_unlock(&mutex->mutex);
}

void cn_mutex_destroy(cn_mutex_t *mutex)
{
    if (mutex) {
        pthread_mutex_destroy(&mutex->mutex);
    }
}

}  /* extern "C" */

#endif /* CN_PLATFORM_NATIVE */
