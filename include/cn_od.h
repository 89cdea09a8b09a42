/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Object dictionary
 *
 * Typed, access-controlled storage over a static table of objects. The
 * table (indices, sub-indices, types, sizes and storage) is produced at
 * build time and never changes shape; only values mutate. Every access is
 * checked completely before a byte is stored.
 */

#ifndef CN_OD_H_
#define CN_OD_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"
#include "cn_bytes.h"
#include "cn_config.h"

/* ============================================================================
 * Sub-object flags
 * ============================================================================ */

#define CN_SUB_PDO_MAPPABLE       (1U << 0)  /**< May be referenced by a PDO mapping */
#define CN_SUB_PERSIST            (1U << 1)  /**< Included in stored parameter images */
#define CN_SUB_NODE_ID_RELATIVE   (1U << 2)  /**< Default has the node id added on load */
#define CN_SUB_HAS_RANGE          (1U << 3)  /**< min/max apply to written values */

namespace cn {

/**
 * @brief CANopen data types (CiA 301 static data type indices)
 */
enum class DataType : uint8_t {
    Boolean = 0x01,
    Int8 = 0x02,
    Int16 = 0x03,
    Int32 = 0x04,
    UInt8 = 0x05,
    UInt16 = 0x06,
    UInt32 = 0x07,
    Real32 = 0x08,
    VisibleString = 0x09,
    OctetString = 0x0A,
    Int64 = 0x15,
    UInt64 = 0x1B,
};

enum class AccessType : uint8_t {
    ReadOnly,
    WriteOnly,
    ReadWrite,
    Const,
};

enum class ObjectCode : uint8_t {
    Var = 7,
    Array = 8,     /**< Sub 0 holds the number of entries */
    Record = 9,
};

/**
 * @brief One addressable value of an object
 *
 * Storage holds `size` bytes, little-endian for numeric types. A null
 * default means all zeroes.
 */
struct SubObject {
    uint8_t sub;
    DataType data_type;
    AccessType access;
    uint8_t flags;                  /**< CN_SUB_* */
    uint16_t size;                  /**< Storage size in bytes */
    uint8_t *data;                  /**< Storage, `size` bytes */
    const uint8_t *default_value;   /**< `size` bytes or nullptr */
    int64_t min;                    /**< Inclusive, with CN_SUB_HAS_RANGE */
    int64_t max;                    /**< Inclusive, with CN_SUB_HAS_RANGE */
};

struct Object {
    uint16_t index;
    ObjectCode code;
    SubObject *subs;                /**< Sorted by sub-index */
    uint8_t num_subs;
};

/**
 * @brief Validator run before a write is stored
 * @return SdoAbort::Ok to accept, any other code to refuse the write
 */
typedef SdoAbort (*OdValidateFn)(void *ctx, uint16_t index, uint8_t sub,
                                 const uint8_t *data, size_t len);

/**
 * @brief Listener run after a write was stored
 */
typedef void (*OdChangeFn)(void *ctx, uint16_t index, uint8_t sub);

/**
 * @brief Byte sink used when serializing persistent values
 * @return 0 on success, negative errno to stop serialization
 */
typedef int (*OdSinkFn)(void *ctx, const uint8_t *data, size_t len);

/* Record header in a serialized image: index (LE), sub, length (LE) */
#define CN_OD_RECORD_HEADER_SIZE 5

class ObjectDictionary {
public:
    ObjectDictionary();

    /**
     * @brief Attach and validate the object table
     *
     * Indices and sub-indices must be strictly ascending, every sub needs
     * storage, and sizes must agree with the data types.
     *
     * @param objects Object table, sorted by index
     * @param count Number of objects
     * @return 0 on success, -EINVAL on a malformed table
     */
    int init(Object *objects, size_t count);

    /**
     * @brief Read a value through the SDO access rules
     *
     * Visible strings report their length up to the first NUL.
     *
     * @param index Object index
     * @param sub Sub-index
     * @param buf Destination buffer
     * @param cap Capacity of buf
     * @param len Output: number of bytes copied
     * @return SdoAbort::Ok or the abort code describing the failure
     */
    SdoAbort read(uint16_t index, uint8_t sub, uint8_t *buf, size_t cap, size_t *len) const;

    /**
     * @brief Write a value through the SDO access rules
     *
     * Runs access, length, value and validator checks, then stores and
     * notifies change listeners. Nothing is stored when a check fails.
     */
    SdoAbort write(uint16_t index, uint8_t sub, const uint8_t *data, size_t len);

    /**
     * @brief PDO access: skips access rules and validators, keeps length
     * and value checks
     */
    SdoAbort read_mapped(uint16_t index, uint8_t sub, uint8_t *buf, size_t cap,
                         size_t *len) const;
    SdoAbort write_mapped(uint16_t index, uint8_t sub, const uint8_t *data, size_t len);

    /**
     * @brief Register a validator and/or change listener over an index range
     * @return 0 on success, -EINVAL on bad arguments, -ENOMEM when the
     *         hook table is full
     */
    int add_hook(uint16_t first, uint16_t last, OdValidateFn validate,
                 OdChangeFn on_change, void *ctx);

    /**
     * @brief Reload default values for every object in [first, last]
     *
     * No change listeners run. Subs flagged CN_SUB_NODE_ID_RELATIVE get
     * node_id added when it is a configured id.
     */
    void restore_defaults(uint16_t first, uint16_t last, uint8_t node_id);

    /**
     * @brief Stream every CN_SUB_PERSIST value to a sink
     * @return 0 on success, the sink's error otherwise
     */
    int serialize(OdSinkFn sink, void *ctx) const;

    /**
     * @brief Load an image produced by serialize()
     *
     * Unknown and size-mismatched records are skipped, as are records
     * outside [first, last]. The image is checked for truncation before
     * anything is loaded.
     *
     * @return 0 on success, -EINVAL on a truncated image
     */
    int restore(const uint8_t *data, size_t len, uint16_t first = 0x0000,
                uint16_t last = 0xFFFF);

    const Object *find_object(uint16_t index) const;
    const SubObject *find(uint16_t index, uint8_t sub) const;

    size_t object_count() const { return count_; }

    template <typename T>
    SdoAbort read_value(uint16_t index, uint8_t sub, T *value) const
    {
        uint8_t buf[sizeof(T)];
        size_t len = 0;
        SdoAbort ret = read(index, sub, buf, sizeof(buf), &len);
        if (ret != SdoAbort::Ok) {
            return ret;
        }
        if (len != sizeof(T)) {
            return SdoAbort::DataTypeMismatch;
        }
        *value = bytes::get_le<T>(buf);
        return SdoAbort::Ok;
    }

    template <typename T>
    SdoAbort write_value(uint16_t index, uint8_t sub, T value)
    {
        uint8_t buf[sizeof(T)];
        bytes::put_le<T>(buf, value);
        return write(index, sub, buf, sizeof(buf));
    }

private:
    struct Hook {
        uint16_t first;
        uint16_t last;
        OdValidateFn validate;
        OdChangeFn on_change;
        void *ctx;
    };

    SdoAbort lookup(uint16_t index, uint8_t sub, const SubObject **entry) const;
    SdoAbort copy_out(const SubObject *entry, uint8_t *buf, size_t cap, size_t *len) const;
    SdoAbort check_value(const SubObject *entry, const uint8_t *data, size_t len) const;
    void store(SubObject *entry, const uint8_t *data, size_t len);
    void notify_change(uint16_t index, uint8_t sub);

    Object *objects_;
    size_t count_;
    Hook hooks_[CN_OD_MAX_HOOKS];
    size_t num_hooks_;
};

/**
 * @brief Width in bytes of a fixed-size type, 0 for strings
 */
size_t data_type_size(DataType type);

}  // namespace cn

#endif /* CN_OD_H_ */
