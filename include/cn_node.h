/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * CANopen node
 *
 * Owns the object dictionary, NMT state machine, SDO server, PDO engine and
 * outgoing mailbox of one device, and routes received frames to them.
 *
 * Usage:
 *   1. Define the object table (normally generated from the device
 *      description) and a NodeCallbacks set.
 *   2. Call init() once.
 *   3. Call on_frame() for every received frame and on_tick() periodically
 *      (every 1-10 ms); both are safe to call from different contexts.
 *   4. When tx_notify fires, pull() frames until it returns -EAGAIN and
 *      hand them to the CAN driver.
 *
 * Callbacks run synchronously with the node lock held and must not block.
 * They may call back into the node.
 */

#ifndef CN_NODE_H_
#define CN_NODE_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"
#include "cn_config.h"
#include "cn_platform.h"
#include "cn_od.h"
#include "cn_nmt.h"
#include "cn_sdo_server.h"
#include "cn_pdo.h"
#include "cn_mailbox.h"

namespace cn {

/**
 * @brief Run-time settings
 */
struct NodeConfig {
    uint8_t node_id;            /**< 1-127, or 255 for unconfigured */
    bool auto_start;            /**< Enter Operational after boot */
    uint32_t sdo_timeout_ms;    /**< 0 selects CN_SDO_TIMEOUT_MS */
};

/**
 * @brief Application callback set, every member optional
 */
struct NodeCallbacks {
    void *ctx;

    /** Before application defaults are reloaded (power-on, NMT reset node) */
    void (*reset_app)(void *ctx);
    /** Before communication defaults are reloaded (NMT reset communication) */
    void (*reset_comms)(void *ctx);

    void (*enter_preoperational)(void *ctx);
    void (*enter_operational)(void *ctx);
    void (*enter_stopped)(void *ctx);

    /** The mailbox went from empty to non-empty */
    void (*tx_notify)(void *ctx);

    /**
     * Load stored values for [first, last] after defaults were applied,
     * typically with ObjectDictionary::restore(). Return 0 or negative errno.
     */
    int (*restore_objects)(void *ctx, ObjectDictionary &od, uint16_t first, uint16_t last);

    /**
     * Persist values, typically with ObjectDictionary::serialize(). Enables
     * the store-parameters object (0x1010). Return 0 or negative errno.
     */
    int (*store_objects)(void *ctx, const ObjectDictionary &od);
};

class Node {
public:
    Node();
    ~Node();

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    /**
     * @brief Bring the node up in Initialisation
     *
     * Validates the object table, invokes reset_app, loads defaults and any
     * stored values. The first on_tick() completes the boot.
     *
     * @param config Run-time settings
     * @param objects Object table, sorted by index
     * @param count Number of objects
     * @param callbacks Callback set, may be nullptr
     * @return 0 on success, -EINVAL on an invalid table, node id or PDO
     *         default configuration
     */
    int init(const NodeConfig &config, Object *objects, size_t count,
             const NodeCallbacks *callbacks);

    /**
     * @brief Process one received frame
     */
    void on_frame(const Frame &frame, uint64_t now_us);

    /**
     * @brief Advance timers: boot, heartbeat, SDO deadline, PDO timers
     */
    void on_tick(uint64_t now_us);

    /**
     * @brief Take the next frame to transmit
     * @return 0 on success, -EAGAIN when nothing is queued
     */
    int pull(Frame *frame);

    /**
     * @brief Dictionary access for the application, under the node lock
     *
     * Same rules as an SDO access. Writes to values mapped into
     * event-driven TPDOs queue those PDOs immediately.
     */
    SdoAbort read(uint16_t index, uint8_t sub, uint8_t *buf, size_t cap, size_t *len);
    SdoAbort write(uint16_t index, uint8_t sub, const uint8_t *data, size_t len);

    template <typename T>
    SdoAbort read_value(uint16_t index, uint8_t sub, T *value)
    {
        MutexGuard lock(&mutex_);
        return od_.read_value(index, sub, value);
    }

    template <typename T>
    SdoAbort write_value(uint16_t index, uint8_t sub, T value)
    {
        uint8_t buf[sizeof(T)];
        bytes::put_le<T>(buf, value);
        return write(index, sub, buf, sizeof(buf));
    }

    /**
     * @brief Update a process value owned by the application
     *
     * Bypasses the access type, so read-only values published to the
     * network can be set. Length and range checks still apply, and
     * event-driven TPDOs mapping the value are queued as for write().
     */
    SdoAbort set_value(uint16_t index, uint8_t sub, const uint8_t *data, size_t len);

    template <typename T>
    SdoAbort set_value(uint16_t index, uint8_t sub, T value)
    {
        uint8_t buf[sizeof(T)];
        bytes::put_le<T>(buf, value);
        return set_value(index, sub, buf, sizeof(buf));
    }

    NmtState nmt_state() const;
    uint8_t node_id() const;

    /**
     * @brief Change the node id and perform a communication reset
     * @return 0 on success, -EINVAL for an id outside 1-127 and 255
     */
    int set_node_id(uint8_t node_id);

    uint32_t rx_message_count() const;
    uint32_t tx_dropped() const;

    /** Direct access for setup code; not locked */
    ObjectDictionary &dictionary() { return od_; }

    /** SDO server state, for diagnostics */
    SdoState sdo_state() const;

private:
    static SdoAbort validate_store(void *ctx, uint16_t index, uint8_t sub,
                                   const uint8_t *data, size_t len);
    static void store_requested(void *ctx, uint16_t index, uint8_t sub);
    static void heartbeat_changed(void *ctx, uint16_t index, uint8_t sub);

    void load_defaults(uint16_t first, uint16_t last);
    void complete_boot(uint64_t now_us);
    void handle_nmt(NmtCommand command);
    void change_state(NmtCommand command);
    void reset(bool application);
    void update_store_object();
    void process_store();
    uint32_t sync_cob_id() const;
    bool configured() const { return node_id_is_configured(node_id_); }
    void push(const Frame &frame);
    void finish_step();

    NodeConfig config_;
    NodeCallbacks callbacks_;
    uint8_t node_id_;

    ObjectDictionary od_;
    NmtStateMachine nmt_;
    SdoServer sdo_;
    PdoEngine pdo_;
    Mailbox mailbox_;

    bool boot_pending_;
    bool store_pending_;
    uint64_t now_us_;
    uint32_t rx_count_;

    mutable cn_mutex_t mutex_;
    bool mutex_ready_;
};

}  // namespace cn

#endif /* CN_NODE_H_ */
