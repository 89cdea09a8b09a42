/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Object dictionary implementation
 */

#include "cn_od.h"
#include "cn_log.h"
#include <errno.h>
#include <string.h>

CN_LOG_MODULE_REGISTER(cn_od);

namespace cn {

size_t data_type_size(DataType type)
{
    switch (type) {
    case DataType::Boolean:
    case DataType::Int8:
    case DataType::UInt8:
        return 1;
    case DataType::Int16:
    case DataType::UInt16:
        return 2;
    case DataType::Int32:
    case DataType::UInt32:
    case DataType::Real32:
        return 4;
    case DataType::Int64:
    case DataType::UInt64:
        return 8;
    case DataType::VisibleString:
    case DataType::OctetString:
        return 0;
    }
    return 0;
}

static bool is_signed(DataType type)
{
    return type == DataType::Int8 || type == DataType::Int16 ||
           type == DataType::Int32 || type == DataType::Int64;
}

static bool is_integer(DataType type)
{
    return is_signed(type) || type == DataType::UInt8 || type == DataType::UInt16 ||
           type == DataType::UInt32 || type == DataType::UInt64;
}

static size_t current_length(const SubObject *entry)
{
    if (entry->data_type == DataType::VisibleString) {
        const void *nul = memchr(entry->data, 0, entry->size);
        if (nul) {
            return (size_t)((const uint8_t *)nul - entry->data);
        }
    }
    return entry->size;
}

ObjectDictionary::ObjectDictionary()
    : objects_(nullptr), count_(0), hooks_(), num_hooks_(0)
{
}

/* ============================================================================
 * Table validation
 * ============================================================================ */

int ObjectDictionary::init(Object *objects, size_t count)
{
    if (!objects && count > 0) {
        return -EINVAL;
    }

    for (size_t i = 0; i < count; i++) {
        const Object &obj = objects[i];

        if (i > 0 && obj.index <= objects[i - 1].index) {
            CN_LOG_ERR("OD: index 0x%04X out of order", obj.index);
            return -EINVAL;
        }
        if (!obj.subs || obj.num_subs == 0) {
            CN_LOG_ERR("OD: 0x%04X has no sub-objects", obj.index);
            return -EINVAL;
        }
        if (obj.code == ObjectCode::Var && obj.num_subs != 1) {
            CN_LOG_ERR("OD: VAR 0x%04X must have exactly one sub", obj.index);
            return -EINVAL;
        }
        if (obj.code == ObjectCode::Array &&
            (obj.subs[0].sub != 0 || obj.subs[0].data_type != DataType::UInt8)) {
            CN_LOG_ERR("OD: ARRAY 0x%04X needs a UNSIGNED8 sub 0", obj.index);
            return -EINVAL;
        }

        for (uint8_t s = 0; s < obj.num_subs; s++) {
            const SubObject &sub = obj.subs[s];

            if (s > 0 && sub.sub <= obj.subs[s - 1].sub) {
                CN_LOG_ERR("OD: 0x%04X sub %u out of order", obj.index, sub.sub);
                return -EINVAL;
            }
            if (!sub.data || sub.size == 0) {
                CN_LOG_ERR("OD: 0x%04X sub %u has no storage", obj.index, sub.sub);
                return -EINVAL;
            }
            size_t width = data_type_size(sub.data_type);
            if (width != 0 && width != sub.size) {
                CN_LOG_ERR("OD: 0x%04X sub %u size %u does not match type",
                           obj.index, sub.sub, sub.size);
                return -EINVAL;
            }
            if ((sub.flags & CN_SUB_HAS_RANGE) &&
                (!is_integer(sub.data_type) || sub.min > sub.max)) {
                CN_LOG_ERR("OD: 0x%04X sub %u has an invalid range", obj.index, sub.sub);
                return -EINVAL;
            }
        }
    }

    objects_ = objects;
    count_ = count;
    num_hooks_ = 0;
    return 0;
}

/* ============================================================================
 * Lookup
 * ============================================================================ */

const Object *ObjectDictionary::find_object(uint16_t index) const
{
    size_t lo = 0;
    size_t hi = count_;

    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (objects_[mid].index == index) {
            return &objects_[mid];
        }
        if (objects_[mid].index < index) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return nullptr;
}

const SubObject *ObjectDictionary::find(uint16_t index, uint8_t sub) const
{
    const SubObject *entry = nullptr;
    if (lookup(index, sub, &entry) != SdoAbort::Ok) {
        return nullptr;
    }
    return entry;
}

SdoAbort ObjectDictionary::lookup(uint16_t index, uint8_t sub,
                                  const SubObject **entry) const
{
    const Object *obj = find_object(index);
    if (!obj) {
        return SdoAbort::ObjectDoesNotExist;
    }

    for (uint8_t s = 0; s < obj->num_subs; s++) {
        if (obj->subs[s].sub == sub) {
            *entry = &obj->subs[s];
            return SdoAbort::Ok;
        }
        if (obj->subs[s].sub > sub) {
            break;
        }
    }
    return SdoAbort::SubIndexDoesNotExist;
}

/* ============================================================================
 * Read
 * ============================================================================ */

SdoAbort ObjectDictionary::copy_out(const SubObject *entry, uint8_t *buf, size_t cap,
                                    size_t *len) const
{
    size_t n = current_length(entry);
    if (n > cap) {
        return SdoAbort::OutOfMemory;
    }
    if (n > 0) {
        memcpy(buf, entry->data, n);
    }
    if (len) {
        *len = n;
    }
    return SdoAbort::Ok;
}

SdoAbort ObjectDictionary::read(uint16_t index, uint8_t sub, uint8_t *buf, size_t cap,
                                size_t *len) const
{
    const SubObject *entry = nullptr;
    SdoAbort ret = lookup(index, sub, &entry);
    if (ret != SdoAbort::Ok) {
        return ret;
    }
    if (entry->access == AccessType::WriteOnly) {
        return SdoAbort::WriteOnly;
    }
    return copy_out(entry, buf, cap, len);
}

SdoAbort ObjectDictionary::read_mapped(uint16_t index, uint8_t sub, uint8_t *buf,
                                       size_t cap, size_t *len) const
{
    const SubObject *entry = nullptr;
    SdoAbort ret = lookup(index, sub, &entry);
    if (ret != SdoAbort::Ok) {
        return ret;
    }
    return copy_out(entry, buf, cap, len);
}

/* ============================================================================
 * Write
 * ============================================================================ */

SdoAbort ObjectDictionary::check_value(const SubObject *entry, const uint8_t *data,
                                       size_t len) const
{
    if (len > entry->size) {
        return SdoAbort::LengthTooHigh;
    }
    if (len < entry->size && entry->data_type != DataType::VisibleString) {
        return SdoAbort::LengthTooLow;
    }
    if (len > 0 && !data) {
        return SdoAbort::GeneralError;
    }

    if (entry->data_type == DataType::Boolean && data[0] > 1) {
        return SdoAbort::InvalidValue;
    }

    if (entry->flags & CN_SUB_HAS_RANGE) {
        if (is_signed(entry->data_type)) {
            int64_t value = bytes::get_int(data, len);
            if (value > entry->max) {
                return SdoAbort::ValueTooHigh;
            }
            if (value < entry->min) {
                return SdoAbort::ValueTooLow;
            }
        } else {
            uint64_t value = bytes::get_uint(data, len);
            if (entry->max >= 0 && value > (uint64_t)entry->max) {
                return SdoAbort::ValueTooHigh;
            }
            if (entry->min > 0 && value < (uint64_t)entry->min) {
                return SdoAbort::ValueTooLow;
            }
        }
    }
    return SdoAbort::Ok;
}

void ObjectDictionary::store(SubObject *entry, const uint8_t *data, size_t len)
{
    if (len > 0) {
        memcpy(entry->data, data, len);
    }
    if (len < entry->size) {
        memset(entry->data + len, 0, entry->size - len);
    }
}

void ObjectDictionary::notify_change(uint16_t index, uint8_t sub)
{
    for (size_t i = 0; i < num_hooks_; i++) {
        const Hook &hook = hooks_[i];
        if (hook.on_change && index >= hook.first && index <= hook.last) {
            hook.on_change(hook.ctx, index, sub);
        }
    }
}

SdoAbort ObjectDictionary::write(uint16_t index, uint8_t sub, const uint8_t *data,
                                 size_t len)
{
    const SubObject *found = nullptr;
    SdoAbort ret = lookup(index, sub, &found);
    if (ret != SdoAbort::Ok) {
        return ret;
    }
    if (found->access == AccessType::ReadOnly || found->access == AccessType::Const) {
        return SdoAbort::ReadOnly;
    }

    ret = check_value(found, data, len);
    if (ret != SdoAbort::Ok) {
        return ret;
    }

    for (size_t i = 0; i < num_hooks_; i++) {
        const Hook &hook = hooks_[i];
        if (hook.validate && index >= hook.first && index <= hook.last) {
            ret = hook.validate(hook.ctx, index, sub, data, len);
            if (ret != SdoAbort::Ok) {
                CN_LOG_DBG("OD: write 0x%04X:%u refused (0x%08X)", index, sub,
                           (unsigned)abort_code_value(ret));
                return ret;
            }
        }
    }

    store(const_cast<SubObject *>(found), data, len);
    notify_change(index, sub);
    return SdoAbort::Ok;
}

SdoAbort ObjectDictionary::write_mapped(uint16_t index, uint8_t sub,
                                        const uint8_t *data, size_t len)
{
    const SubObject *found = nullptr;
    SdoAbort ret = lookup(index, sub, &found);
    if (ret != SdoAbort::Ok) {
        return ret;
    }

    ret = check_value(found, data, len);
    if (ret != SdoAbort::Ok) {
        return ret;
    }

    store(const_cast<SubObject *>(found), data, len);
    notify_change(index, sub);
    return SdoAbort::Ok;
}

/* ============================================================================
 * Hooks
 * ============================================================================ */

int ObjectDictionary::add_hook(uint16_t first, uint16_t last, OdValidateFn validate,
                               OdChangeFn on_change, void *ctx)
{
    if (first > last || (!validate && !on_change)) {
        return -EINVAL;
    }
    if (num_hooks_ >= CN_OD_MAX_HOOKS) {
        CN_LOG_ERR("OD: hook table full");
        return -ENOMEM;
    }

    Hook &hook = hooks_[num_hooks_++];
    hook.first = first;
    hook.last = last;
    hook.validate = validate;
    hook.on_change = on_change;
    hook.ctx = ctx;
    return 0;
}

/* ============================================================================
 * Defaults and persistence
 * ============================================================================ */

void ObjectDictionary::restore_defaults(uint16_t first, uint16_t last, uint8_t node_id)
{
    for (size_t i = 0; i < count_; i++) {
        Object &obj = objects_[i];
        if (obj.index < first || obj.index > last) {
            continue;
        }

        for (uint8_t s = 0; s < obj.num_subs; s++) {
            SubObject &sub = obj.subs[s];
            if (sub.default_value) {
                memcpy(sub.data, sub.default_value, sub.size);
            } else {
                memset(sub.data, 0, sub.size);
            }

            if ((sub.flags & CN_SUB_NODE_ID_RELATIVE) && node_id_is_configured(node_id) &&
                sub.size <= 8) {
                uint64_t value = bytes::get_uint(sub.data, sub.size);
                bytes::put_uint(sub.data, sub.size, value + node_id);
            }
        }
    }
}

int ObjectDictionary::serialize(OdSinkFn sink, void *ctx) const
{
    if (!sink) {
        return -EINVAL;
    }

    for (size_t i = 0; i < count_; i++) {
        const Object &obj = objects_[i];
        for (uint8_t s = 0; s < obj.num_subs; s++) {
            const SubObject &sub = obj.subs[s];
            if (!(sub.flags & CN_SUB_PERSIST)) {
                continue;
            }

            uint8_t header[CN_OD_RECORD_HEADER_SIZE];
            bytes::put_u16(&header[0], obj.index);
            header[2] = sub.sub;
            bytes::put_u16(&header[3], sub.size);

            int ret = sink(ctx, header, sizeof(header));
            if (ret == 0) {
                ret = sink(ctx, sub.data, sub.size);
            }
            if (ret < 0) {
                CN_LOG_WRN("OD: serialize stopped at 0x%04X:%u (%d)", obj.index, sub.sub, ret);
                return ret;
            }
        }
    }
    return 0;
}

int ObjectDictionary::restore(const uint8_t *data, size_t len, uint16_t first, uint16_t last)
{
    if (!data && len > 0) {
        return -EINVAL;
    }

    /* Walk the whole image once so a truncated one loads nothing */
    size_t pos = 0;
    while (pos < len) {
        if (len - pos < CN_OD_RECORD_HEADER_SIZE) {
            return -EINVAL;
        }
        size_t rec_len = bytes::get_u16(&data[pos + 3]);
        pos += CN_OD_RECORD_HEADER_SIZE;
        if (len - pos < rec_len) {
            return -EINVAL;
        }
        pos += rec_len;
    }

    pos = 0;
    while (pos < len) {
        uint16_t index = bytes::get_u16(&data[pos]);
        uint8_t sub = data[pos + 2];
        size_t rec_len = bytes::get_u16(&data[pos + 3]);
        pos += CN_OD_RECORD_HEADER_SIZE;

        if (index < first || index > last) {
            pos += rec_len;
            continue;
        }

        const SubObject *entry = find(index, sub);
        if (!entry || entry->size != rec_len) {
            CN_LOG_WRN("OD: skipping stored record 0x%04X:%u", index, sub);
        } else {
            memcpy(entry->data, &data[pos], rec_len);
        }
        pos += rec_len;
    }
    return 0;
}

}  // namespace cn
