/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * PDO engine implementation
 */

#include "cn_pdo.h"
#include "cn_bytes.h"
#include "cn_log.h"
#include <errno.h>
#include <string.h>

CN_LOG_MODULE_REGISTER(cn_pdo);

#define PDO_CONFIG_FIRST    CANOPEN_OBJ_RPDO_COMM_BASE
#define PDO_CONFIG_LAST     (CANOPEN_OBJ_TPDO_MAP_BASE + 0x1FF)

namespace cn {

static inline uint16_t mapping_index(uint32_t entry)
{
    return (uint16_t)(entry >> 16);
}

static inline uint8_t mapping_sub(uint32_t entry)
{
    return (uint8_t)((entry >> 8) & 0xFF);
}

static inline uint8_t mapping_bits(uint32_t entry)
{
    return (uint8_t)(entry & 0xFF);
}

static inline bool is_event_driven(uint8_t type)
{
    return type >= CN_PDO_TYPE_EVENT_MANUFACTURER;
}

static inline bool is_synchronous(uint8_t type)
{
    return type <= CN_PDO_TYPE_SYNC_MAX;
}

PdoEngine::PdoEngine()
    : od_(nullptr), mailbox_(nullptr), operational_(false), now_us_(0),
      rpdos_(), tpdos_(), num_rpdos_(0), num_tpdos_(0)
{
}

int PdoEngine::init(ObjectDictionary *od, Mailbox *mailbox)
{
    if (!od || !mailbox) {
        return -EINVAL;
    }

    od_ = od;
    mailbox_ = mailbox;
    operational_ = false;
    memset(rpdos_, 0, sizeof(rpdos_));
    memset(tpdos_, 0, sizeof(tpdos_));

    num_rpdos_ = 0;
    while (num_rpdos_ < CN_MAX_RPDOS &&
           od_->find_object((uint16_t)(CANOPEN_OBJ_RPDO_COMM_BASE + num_rpdos_)) &&
           od_->find_object((uint16_t)(CANOPEN_OBJ_RPDO_MAP_BASE + num_rpdos_))) {
        num_rpdos_++;
    }

    num_tpdos_ = 0;
    while (num_tpdos_ < CN_MAX_TPDOS &&
           od_->find_object((uint16_t)(CANOPEN_OBJ_TPDO_COMM_BASE + num_tpdos_)) &&
           od_->find_object((uint16_t)(CANOPEN_OBJ_TPDO_MAP_BASE + num_tpdos_))) {
        num_tpdos_++;
    }

    int ret = od_->add_hook(PDO_CONFIG_FIRST, PDO_CONFIG_LAST, validate_hook,
                            config_changed_hook, this);
    if (ret != 0) {
        return ret;
    }
    ret = od_->add_hook(0x0000, 0xFFFF, nullptr, value_changed_hook, this);
    if (ret != 0) {
        return ret;
    }

    CN_LOG_INF("PDO: %u RPDOs, %u TPDOs", (unsigned)num_rpdos_, (unsigned)num_tpdos_);
    return 0;
}

/* ============================================================================
 * Configuration
 * ============================================================================ */

bool PdoEngine::read_config(uint16_t index, uint8_t sub, uint32_t *value) const
{
    uint8_t buf[4];
    size_t len = 0;
    if (od_->read_mapped(index, sub, buf, sizeof(buf), &len) != SdoAbort::Ok) {
        return false;
    }
    *value = (uint32_t)bytes::get_uint(buf, len);
    return true;
}

bool PdoEngine::locate(uint16_t index, bool *tx, bool *mapping, size_t *n) const
{
    struct Area {
        uint16_t base;
        bool tx;
        bool mapping;
        size_t count;
    };
    const Area areas[] = {
        {CANOPEN_OBJ_RPDO_COMM_BASE, false, false, num_rpdos_},
        {CANOPEN_OBJ_RPDO_MAP_BASE, false, true, num_rpdos_},
        {CANOPEN_OBJ_TPDO_COMM_BASE, true, false, num_tpdos_},
        {CANOPEN_OBJ_TPDO_MAP_BASE, true, true, num_tpdos_},
    };

    for (const Area &area : areas) {
        if (index >= area.base && index < area.base + area.count) {
            *tx = area.tx;
            *mapping = area.mapping;
            *n = index - area.base;
            return true;
        }
    }
    return false;
}

SdoAbort PdoEngine::check_mapping(const uint32_t *entries, uint8_t count,
                                  uint8_t *length) const
{
    unsigned total_bits = 0;

    for (uint8_t i = 0; i < count; i++) {
        uint32_t entry = entries[i];
        const SubObject *target = od_->find(mapping_index(entry), mapping_sub(entry));

        if (!target || !(target->flags & CN_SUB_PDO_MAPPABLE)) {
            return SdoAbort::CannotMapToPdo;
        }
        if (mapping_bits(entry) == 0 || mapping_bits(entry) != target->size * 8U) {
            return SdoAbort::GeneralParameterIncompatibility;
        }

        total_bits += mapping_bits(entry);
        if (total_bits > CN_PDO_MAX_BITS) {
            return SdoAbort::PdoLengthExceeded;
        }
    }

    if (length) {
        *length = (uint8_t)(total_bits / 8);
    }
    return SdoAbort::Ok;
}

int PdoEngine::read_channel(bool tx, size_t n, PdoChannel *out) const
{
    PdoChannel &pdo = *out;
    uint16_t comm = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_COMM_BASE : CANOPEN_OBJ_RPDO_COMM_BASE) + n);
    uint16_t map = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_MAP_BASE : CANOPEN_OBJ_RPDO_MAP_BASE) + n);

    memset(&pdo, 0, sizeof(pdo));

    uint32_t cob_id = 0;
    uint32_t type = 0;
    uint32_t inhibit = 0;
    uint32_t timer = 0;
    uint32_t count = 0;

    if (!read_config(comm, CN_PDO_COMM_COB_ID, &cob_id) ||
        !read_config(comm, CN_PDO_COMM_TRANSMISSION, &type) ||
        !read_config(map, 0, &count)) {
        CN_LOG_ERR("PDO: 0x%04X/0x%04X incomplete", comm, map);
        return -EINVAL;
    }
    /* Optional entries */
    if (!read_config(comm, CN_PDO_COMM_INHIBIT, &inhibit)) {
        inhibit = 0;
    }
    if (!read_config(comm, CN_PDO_COMM_EVENT_TIMER, &timer)) {
        timer = 0;
    }

    if (count > CN_PDO_MAX_MAPPINGS) {
        CN_LOG_ERR("PDO: 0x%04X maps %u entries", map, (unsigned)count);
        return -EINVAL;
    }
    for (uint8_t i = 0; i < count; i++) {
        if (!read_config(map, (uint8_t)(i + 1), &pdo.mappings[i])) {
            CN_LOG_ERR("PDO: 0x%04X sub %u missing", map, i + 1);
            return -EINVAL;
        }
    }

    SdoAbort ret = check_mapping(pdo.mappings, (uint8_t)count, &pdo.length);
    if (ret != SdoAbort::Ok) {
        CN_LOG_ERR("PDO: 0x%04X mapping rejected (0x%08X)", map,
                   (unsigned)abort_code_value(ret));
        return -EINVAL;
    }

    pdo.num_mappings = (uint8_t)count;
    pdo.extended = (cob_id & CANOPEN_COB_ID_EXTENDED) != 0;
    pdo.can_id = cob_id & (pdo.extended ? CANOPEN_COB_ID_EXT_MASK : CANOPEN_COB_ID_STD_MASK);
    pdo.transmission_type = (uint8_t)type;
    pdo.inhibit_100us = (uint16_t)inhibit;
    pdo.event_timer_ms = (uint16_t)timer;
    pdo.valid = (cob_id & CANOPEN_COB_ID_INVALID) == 0;
    pdo.timer_deadline_us = now_us_ + (uint64_t)pdo.event_timer_ms * 1000ULL;

    CN_LOG_DBG("PDO: %cPDO%u id 0x%X type %u len %u %s", tx ? 'T' : 'R',
               (unsigned)(n + 1), (unsigned)pdo.can_id, pdo.transmission_type,
               pdo.length, pdo.valid ? "enabled" : "disabled");
    return 0;
}

int PdoEngine::load_channel(bool tx, size_t n)
{
    PdoChannel &pdo = tx ? tpdos_[n] : rpdos_[n];
    PdoChannel next;

    if (read_channel(tx, n, &next) != 0) {
        memset(&pdo, 0, sizeof(pdo));
        return -EINVAL;
    }

    /* Reconfigured while enabled: transmission state carries over */
    if (pdo.valid && next.valid) {
        next.sync_count = pdo.sync_count;
        next.due = pdo.due;
        next.event_pending = pdo.event_pending;
        next.has_sent = pdo.has_sent;
        next.last_tx_us = pdo.last_tx_us;
        next.rx_buffered = pdo.rx_buffered;
        memcpy(next.rx_data, pdo.rx_data, sizeof(next.rx_data));
        if (next.event_timer_ms == pdo.event_timer_ms) {
            next.timer_deadline_us = pdo.timer_deadline_us;
        }
    }

    pdo = next;
    return 0;
}

int PdoEngine::reload()
{
    int ret = 0;

    for (size_t n = 0; n < num_rpdos_; n++) {
        if (load_channel(false, n) != 0) {
            ret = -EINVAL;
        }
    }
    for (size_t n = 0; n < num_tpdos_; n++) {
        if (load_channel(true, n) != 0) {
            ret = -EINVAL;
        }
    }
    return ret;
}

/* ============================================================================
 * Configuration validators
 * ============================================================================ */

SdoAbort PdoEngine::validate_hook(void *ctx, uint16_t index, uint8_t sub,
                                  const uint8_t *data, size_t len)
{
    return static_cast<PdoEngine *>(ctx)->validate(index, sub, data, len);
}

void PdoEngine::config_changed_hook(void *ctx, uint16_t index, uint8_t sub)
{
    PdoEngine *self = static_cast<PdoEngine *>(ctx);
    bool tx = false;
    bool mapping = false;
    size_t n = 0;

    (void)sub;
    if (self->locate(index, &tx, &mapping, &n) && self->load_channel(tx, n) != 0) {
        CN_LOG_WRN("PDO: %cPDO%u disabled after write to 0x%04X", tx ? 'T' : 'R',
                   (unsigned)(n + 1), index);
    }
}

void PdoEngine::value_changed_hook(void *ctx, uint16_t index, uint8_t sub)
{
    static_cast<PdoEngine *>(ctx)->on_value_changed(index, sub);
}

SdoAbort PdoEngine::validate(uint16_t index, uint8_t sub, const uint8_t *data, size_t len)
{
    bool tx = false;
    bool mapping = false;
    size_t n = 0;

    if (!locate(index, &tx, &mapping, &n) || len == 0 || len > 4) {
        return SdoAbort::Ok;
    }

    uint32_t value = (uint32_t)bytes::get_uint(data, len);
    return mapping ? validate_mapping(tx, n, sub, value) : validate_comm(tx, n, sub, value);
}

SdoAbort PdoEngine::validate_comm(bool tx, size_t n, uint8_t sub, uint32_t value)
{
    uint16_t comm = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_COMM_BASE : CANOPEN_OBJ_RPDO_COMM_BASE) + n);
    uint16_t map = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_MAP_BASE : CANOPEN_OBJ_RPDO_MAP_BASE) + n);
    uint32_t current = 0;

    if (!read_config(comm, CN_PDO_COMM_COB_ID, &current)) {
        return SdoAbort::GeneralInternalIncompatibility;
    }
    bool enabled = (current & CANOPEN_COB_ID_INVALID) == 0;

    switch (sub) {
    case CN_PDO_COMM_COB_ID: {
        bool extended = (value & CANOPEN_COB_ID_EXTENDED) != 0;
        if (!extended && (value & CANOPEN_COB_ID_EXT_MASK & ~CANOPEN_COB_ID_STD_MASK)) {
            return SdoAbort::InvalidValue;
        }

        bool enabling = (value & CANOPEN_COB_ID_INVALID) == 0;
        const uint32_t id_bits = CANOPEN_COB_ID_EXT_MASK | CANOPEN_COB_ID_EXTENDED;
        if (enabled && enabling && (value & id_bits) != (current & id_bits)) {
            return SdoAbort::InvalidValue;
        }

        if (enabling && !enabled) {
            uint32_t count = 0;
            uint32_t entries[CN_PDO_MAX_MAPPINGS];
            if (!read_config(map, 0, &count) || count > CN_PDO_MAX_MAPPINGS) {
                return SdoAbort::PdoLengthExceeded;
            }
            for (uint8_t i = 0; i < count; i++) {
                if (!read_config(map, (uint8_t)(i + 1), &entries[i])) {
                    return SdoAbort::GeneralInternalIncompatibility;
                }
            }
            return check_mapping(entries, (uint8_t)count, nullptr);
        }
        return SdoAbort::Ok;
    }

    case CN_PDO_COMM_TRANSMISSION:
        if (value > CN_PDO_TYPE_SYNC_MAX && value < CN_PDO_TYPE_EVENT_MANUFACTURER) {
            return SdoAbort::InvalidValue;
        }
        return SdoAbort::Ok;

    case CN_PDO_COMM_INHIBIT:
        if (tx && enabled) {
            return SdoAbort::InvalidValue;
        }
        return SdoAbort::Ok;

    default:
        return SdoAbort::Ok;
    }
}

SdoAbort PdoEngine::validate_mapping(bool tx, size_t n, uint8_t sub, uint32_t value)
{
    uint16_t comm = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_COMM_BASE : CANOPEN_OBJ_RPDO_COMM_BASE) + n);
    uint16_t map = (uint16_t)((tx ? CANOPEN_OBJ_TPDO_MAP_BASE : CANOPEN_OBJ_RPDO_MAP_BASE) + n);
    uint32_t cob_id = 0;
    uint32_t count = 0;

    if (!read_config(comm, CN_PDO_COMM_COB_ID, &cob_id) || !read_config(map, 0, &count)) {
        return SdoAbort::GeneralInternalIncompatibility;
    }

    /* The mapping may only change while the PDO is disabled */
    if ((cob_id & CANOPEN_COB_ID_INVALID) == 0) {
        return SdoAbort::UnsupportedAccess;
    }

    if (sub == 0) {
        if (value > CN_PDO_MAX_MAPPINGS) {
            return SdoAbort::PdoLengthExceeded;
        }
        uint32_t entries[CN_PDO_MAX_MAPPINGS];
        for (uint8_t i = 0; i < value; i++) {
            if (!read_config(map, (uint8_t)(i + 1), &entries[i])) {
                return SdoAbort::CannotMapToPdo;
            }
        }
        return check_mapping(entries, (uint8_t)value, nullptr);
    }

    /* Entries are edited with the mapping switched off (sub 0 = 0) */
    if (count != 0) {
        return SdoAbort::UnsupportedAccess;
    }
    if (value == 0) {
        return SdoAbort::Ok;
    }
    return check_mapping(&value, 1, nullptr);
}

/* ============================================================================
 * Runtime
 * ============================================================================ */

void PdoEngine::set_operational(bool operational, uint64_t now_us)
{
    now_us_ = now_us;
    operational_ = operational;

    for (size_t n = 0; n < num_rpdos_; n++) {
        rpdos_[n].rx_buffered = false;
    }
    for (size_t n = 0; n < num_tpdos_; n++) {
        PdoChannel &pdo = tpdos_[n];
        pdo.due = false;
        pdo.event_pending = false;
        pdo.sync_count = 0;
        pdo.has_sent = false;
        pdo.timer_deadline_us = now_us + (uint64_t)pdo.event_timer_ms * 1000ULL;
    }
}

void PdoEngine::on_value_changed(uint16_t index, uint8_t sub)
{
    if (!operational_ || (index >= PDO_CONFIG_FIRST && index <= PDO_CONFIG_LAST)) {
        return;
    }

    for (size_t n = 0; n < num_tpdos_; n++) {
        PdoChannel &pdo = tpdos_[n];
        if (!pdo.valid) {
            continue;
        }
        for (uint8_t i = 0; i < pdo.num_mappings; i++) {
            if (mapping_index(pdo.mappings[i]) == index && mapping_sub(pdo.mappings[i]) == sub) {
                trigger_event(pdo);
                break;
            }
        }
    }
}

void PdoEngine::trigger_event(PdoChannel &pdo)
{
    if (pdo.transmission_type == CN_PDO_TYPE_SYNC_ACYCLIC) {
        pdo.event_pending = true;
        return;
    }
    if (!is_event_driven(pdo.transmission_type)) {
        return;
    }

    uint64_t inhibit_us = (uint64_t)pdo.inhibit_100us * 100ULL;
    if (!pdo.has_sent || inhibit_us == 0 || now_us_ >= pdo.last_tx_us + inhibit_us) {
        pdo.due = true;
    } else {
        /* Inside the inhibit window: one frame at the boundary for the whole burst */
        pdo.event_pending = true;
    }
}

bool PdoEngine::on_frame(const Frame &frame, uint64_t now_us)
{
    now_us_ = now_us;
    if (!operational_ || frame.rtr) {
        return false;
    }

    for (size_t n = 0; n < num_rpdos_; n++) {
        PdoChannel &pdo = rpdos_[n];
        if (!pdo.valid || pdo.can_id != frame.id || pdo.extended != frame.extended) {
            continue;
        }

        if (frame.len < pdo.length) {
            CN_LOG_WRN("PDO: RPDO%u frame too short (%u < %u)", (unsigned)(n + 1),
                       frame.len, pdo.length);
            return true;
        }

        if (is_synchronous(pdo.transmission_type)) {
            memcpy(pdo.rx_data, frame.data, sizeof(pdo.rx_data));
            pdo.rx_buffered = true;
        } else {
            apply_rpdo(pdo, frame.data);
        }
        return true;
    }
    return false;
}

void PdoEngine::apply_rpdo(PdoChannel &pdo, const uint8_t *data)
{
    size_t offset = 0;

    for (uint8_t i = 0; i < pdo.num_mappings; i++) {
        uint32_t entry = pdo.mappings[i];
        size_t len = mapping_bits(entry) / 8;
        SdoAbort ret = od_->write_mapped(mapping_index(entry), mapping_sub(entry),
                                         &data[offset], len);
        if (ret != SdoAbort::Ok) {
            CN_LOG_WRN("PDO: RPDO write to 0x%04X:%u failed (0x%08X)", mapping_index(entry),
                       mapping_sub(entry), (unsigned)abort_code_value(ret));
        }
        offset += len;
    }
}

void PdoEngine::on_sync(uint64_t now_us)
{
    now_us_ = now_us;
    if (!operational_) {
        return;
    }

    for (size_t n = 0; n < num_rpdos_; n++) {
        PdoChannel &pdo = rpdos_[n];
        if (pdo.valid && pdo.rx_buffered) {
            pdo.rx_buffered = false;
            apply_rpdo(pdo, pdo.rx_data);
        }
    }

    for (size_t n = 0; n < num_tpdos_; n++) {
        PdoChannel &pdo = tpdos_[n];
        if (!pdo.valid || !is_synchronous(pdo.transmission_type)) {
            continue;
        }

        if (pdo.transmission_type == CN_PDO_TYPE_SYNC_ACYCLIC) {
            if (pdo.event_pending) {
                pdo.event_pending = false;
                pdo.due = true;
            }
        } else if (++pdo.sync_count >= pdo.transmission_type) {
            pdo.sync_count = 0;
            pdo.due = true;
        }
    }
}

void PdoEngine::on_tick(uint64_t now_us)
{
    now_us_ = now_us;
    if (!operational_) {
        return;
    }

    for (size_t n = 0; n < num_tpdos_; n++) {
        PdoChannel &pdo = tpdos_[n];
        if (!pdo.valid || !is_event_driven(pdo.transmission_type)) {
            continue;
        }

        uint64_t inhibit_us = (uint64_t)pdo.inhibit_100us * 100ULL;
        if (pdo.event_pending && now_us >= pdo.last_tx_us + inhibit_us) {
            pdo.event_pending = false;
            pdo.due = true;
        }

        if (pdo.event_timer_ms != 0 && now_us >= pdo.timer_deadline_us) {
            pdo.timer_deadline_us = now_us + (uint64_t)pdo.event_timer_ms * 1000ULL;
            trigger_event(pdo);
        }
    }
}

void PdoEngine::transmit(PdoChannel &pdo, uint64_t now_us)
{
    uint8_t payload[8] = {0};
    size_t offset = 0;

    for (uint8_t i = 0; i < pdo.num_mappings; i++) {
        uint32_t entry = pdo.mappings[i];
        size_t len = 0;
        SdoAbort ret = od_->read_mapped(mapping_index(entry), mapping_sub(entry),
                                        &payload[offset], sizeof(payload) - offset, &len);
        if (ret != SdoAbort::Ok) {
            CN_LOG_WRN("PDO: TPDO read of 0x%04X:%u failed (0x%08X)", mapping_index(entry),
                       mapping_sub(entry), (unsigned)abort_code_value(ret));
        }
        offset += mapping_bits(entry) / 8;
    }

    Frame frame = make_frame(pdo.can_id, payload, pdo.length);
    frame.extended = pdo.extended;
    if (mailbox_->push(frame) != 0) {
        CN_LOG_DBG("PDO: TPDO 0x%X not queued", (unsigned)pdo.can_id);
    }

    pdo.due = false;
    pdo.event_pending = false;
    pdo.has_sent = true;
    pdo.last_tx_us = now_us;
    pdo.timer_deadline_us = now_us + (uint64_t)pdo.event_timer_ms * 1000ULL;
}

void PdoEngine::flush(uint64_t now_us)
{
    now_us_ = now_us;
    if (!operational_) {
        return;
    }

    for (size_t n = 0; n < num_tpdos_; n++) {
        if (tpdos_[n].valid && tpdos_[n].due) {
            transmit(tpdos_[n], now_us);
        }
    }
}

}  // namespace cn
