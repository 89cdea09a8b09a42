/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * PDO engine
 *
 * Receive and transmit PDOs configured by the standard communication
 * (0x1400 / 0x1800) and mapping (0x1600 / 0x1A00) objects. The engine
 * validates configuration writes through dictionary validators and
 * re-reads a channel after every accepted write.
 */

#ifndef CN_PDO_H_
#define CN_PDO_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"
#include "cn_config.h"
#include "cn_od.h"
#include "cn_mailbox.h"

#define CN_PDO_MAX_MAPPINGS     8
#define CN_PDO_MAX_BITS         64

/* Transmission types */
#define CN_PDO_TYPE_SYNC_ACYCLIC    0
#define CN_PDO_TYPE_SYNC_MAX        240
#define CN_PDO_TYPE_EVENT_MANUFACTURER 254
#define CN_PDO_TYPE_EVENT_PROFILE   255

/* Communication record sub-indices */
#define CN_PDO_COMM_COB_ID          1
#define CN_PDO_COMM_TRANSMISSION    2
#define CN_PDO_COMM_INHIBIT         3
#define CN_PDO_COMM_EVENT_TIMER     5

namespace cn {

/**
 * @brief Decoded PDO channel with its runtime state
 */
struct PdoChannel {
    /* Configuration */
    bool valid;                 /**< COB-ID enabled and mapping consistent */
    uint32_t can_id;
    bool extended;
    uint8_t transmission_type;
    uint16_t inhibit_100us;
    uint16_t event_timer_ms;
    uint8_t num_mappings;
    uint32_t mappings[CN_PDO_MAX_MAPPINGS];
    uint8_t length;             /**< Mapped length in bytes */

    /* Runtime */
    uint8_t sync_count;
    bool due;                   /**< Queue at the next flush */
    bool event_pending;         /**< Change waiting for SYNC or inhibit */
    bool has_sent;
    uint64_t last_tx_us;
    uint64_t timer_deadline_us;
    bool rx_buffered;
    uint8_t rx_data[8];
};

class PdoEngine {
public:
    PdoEngine();

    /**
     * @brief Discover the channels and register configuration hooks
     *
     * Channel n exists when its communication and mapping objects are both
     * present, numbered without gaps from 0.
     *
     * @return 0 on success, negative errno on failure
     */
    int init(ObjectDictionary *od, Mailbox *mailbox);

    /**
     * @brief Re-read every channel from the dictionary
     * @return 0 on success, -EINVAL if a mapping is inconsistent (that
     *         channel stays disabled)
     */
    int reload();

    /**
     * @brief Enable or disable PDO traffic (Operational state)
     *
     * Disabling clears every due, pending and buffered PDO.
     */
    void set_operational(bool operational, uint64_t now_us);
    bool operational() const { return operational_; }

    /** Record the time used for changes made outside on_* calls */
    void set_time(uint64_t now_us) { now_us_ = now_us; }

    /**
     * @brief Offer a received frame to the RPDOs
     * @return true if the frame matched an RPDO
     */
    bool on_frame(const Frame &frame, uint64_t now_us);

    void on_sync(uint64_t now_us);
    void on_tick(uint64_t now_us);

    /**
     * @brief Queue every due TPDO, lowest PDO number first
     */
    void flush(uint64_t now_us);

    size_t num_rpdos() const { return num_rpdos_; }
    size_t num_tpdos() const { return num_tpdos_; }
    const PdoChannel &rpdo(size_t n) const { return rpdos_[n]; }
    const PdoChannel &tpdo(size_t n) const { return tpdos_[n]; }

private:
    static SdoAbort validate_hook(void *ctx, uint16_t index, uint8_t sub,
                                  const uint8_t *data, size_t len);
    static void config_changed_hook(void *ctx, uint16_t index, uint8_t sub);
    static void value_changed_hook(void *ctx, uint16_t index, uint8_t sub);

    SdoAbort validate(uint16_t index, uint8_t sub, const uint8_t *data, size_t len);
    SdoAbort validate_comm(bool tx, size_t n, uint8_t sub, uint32_t value);
    SdoAbort validate_mapping(bool tx, size_t n, uint8_t sub, uint32_t value);
    SdoAbort check_mapping(const uint32_t *entries, uint8_t count, uint8_t *length) const;
    bool locate(uint16_t index, bool *tx, bool *mapping, size_t *n) const;
    int read_channel(bool tx, size_t n, PdoChannel *out) const;
    int load_channel(bool tx, size_t n);
    void on_value_changed(uint16_t index, uint8_t sub);
    void trigger_event(PdoChannel &pdo);
    void apply_rpdo(PdoChannel &pdo, const uint8_t *data);
    void transmit(PdoChannel &pdo, uint64_t now_us);
    bool read_config(uint16_t index, uint8_t sub, uint32_t *value) const;

    ObjectDictionary *od_;
    Mailbox *mailbox_;
    bool operational_;
    uint64_t now_us_;

    PdoChannel rpdos_[CN_MAX_RPDOS];
    PdoChannel tpdos_[CN_MAX_TPDOS];
    size_t num_rpdos_;
    size_t num_tpdos_;
};

}  // namespace cn

#endif /* CN_PDO_H_ */
