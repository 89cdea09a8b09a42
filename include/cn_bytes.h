/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Little-endian byte helpers
 *
 * CANopen carries every multi-byte value little-endian, on the wire and in
 * dictionary storage. These helpers are independent of host byte order.
 */

#ifndef CN_BYTES_H_
#define CN_BYTES_H_

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <type_traits>

namespace cn {
namespace bytes {

inline uint16_t get_u16(const uint8_t *p)
{
    return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}

inline uint32_t get_u32(const uint8_t *p)
{
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) |
           ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

inline void put_u16(uint8_t *p, uint16_t value)
{
    p[0] = (uint8_t)(value & 0xFF);
    p[1] = (uint8_t)(value >> 8);
}

inline void put_u32(uint8_t *p, uint32_t value)
{
    p[0] = (uint8_t)(value & 0xFF);
    p[1] = (uint8_t)((value >> 8) & 0xFF);
    p[2] = (uint8_t)((value >> 16) & 0xFF);
    p[3] = (uint8_t)(value >> 24);
}

/**
 * @brief Read up to 8 little-endian bytes as an unsigned integer
 */
inline uint64_t get_uint(const uint8_t *p, size_t len)
{
    uint64_t value = 0;
    for (size_t i = len; i > 0; i--) {
        value = (value << 8) | p[i - 1];
    }
    return value;
}

/**
 * @brief Read up to 8 little-endian bytes as a sign-extended integer
 */
inline int64_t get_int(const uint8_t *p, size_t len)
{
    uint64_t value = get_uint(p, len);
    if (len > 0 && len < 8 && (p[len - 1] & 0x80)) {
        value |= ~0ULL << (len * 8);
    }
    return (int64_t)value;
}

inline void put_uint(uint8_t *p, size_t len, uint64_t value)
{
    for (size_t i = 0; i < len; i++) {
        p[i] = (uint8_t)(value & 0xFF);
        value >>= 8;
    }
}

/**
 * @brief Decode a trivially copyable value (integer, bool or float)
 */
template <typename T>
T get_le(const uint8_t *p)
{
    static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                  "unsupported width");

    uint64_t raw = get_uint(p, sizeof(T));
    T value;
    if constexpr (sizeof(T) == 1) {
        uint8_t v = (uint8_t)raw;
        memcpy(&value, &v, sizeof(T));
    } else if constexpr (sizeof(T) == 2) {
        uint16_t v = (uint16_t)raw;
        memcpy(&value, &v, sizeof(T));
    } else if constexpr (sizeof(T) == 4) {
        uint32_t v = (uint32_t)raw;
        memcpy(&value, &v, sizeof(T));
    } else {
        memcpy(&value, &raw, sizeof(T));
    }
    return value;
}

template <typename T>
void put_le(uint8_t *p, T value)
{
    static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                  "unsupported width");

    uint64_t raw;
    if constexpr (sizeof(T) == 1) {
        uint8_t v;
        memcpy(&v, &value, sizeof(T));
        raw = v;
    } else if constexpr (sizeof(T) == 2) {
        uint16_t v;
        memcpy(&v, &value, sizeof(T));
        raw = v;
    } else if constexpr (sizeof(T) == 4) {
        uint32_t v;
        memcpy(&v, &value, sizeof(T));
        raw = v;
    } else {
        memcpy(&raw, &value, sizeof(T));
    }
    put_uint(p, sizeof(T), raw);
}

}  // namespace bytes
}  // namespace cn

#endif /* CN_BYTES_H_ */
