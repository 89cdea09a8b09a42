/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * CANopen node: frame dispatch and NMT coordination
 */

#include "cn_node.h"
#include "cn_bytes.h"
#include "cn_log.h"
#include <errno.h>
#include <string.h>

CN_LOG_MODULE_REGISTER(cn_node);

#define NODE_DICTIONARY_FIRST   0x0000
#define NODE_DICTIONARY_LAST    0xFFFF

namespace cn {

Node::Node()
    : config_(), callbacks_(), node_id_(CANOPEN_NODE_ID_UNCONFIGURED), od_(), nmt_(),
      sdo_(), pdo_(), mailbox_(), boot_pending_(false), store_pending_(false),
      now_us_(0), rx_count_(0), mutex_(), mutex_ready_(false)
{
}

Node::~Node()
{
    if (mutex_ready_) {
        cn_mutex_destroy(&mutex_);
    }
}

/* ============================================================================
 * Initialisation
 * ============================================================================ */

int Node::init(const NodeConfig &config, Object *objects, size_t count,
               const NodeCallbacks *callbacks)
{
    if (!node_id_is_configured(config.node_id) &&
        config.node_id != CANOPEN_NODE_ID_UNCONFIGURED) {
        CN_LOG_ERR("Node: invalid node id %u", config.node_id);
        return -EINVAL;
    }

    if (!mutex_ready_) {
        int ret = cn_mutex_init(&mutex_);
        if (ret != 0) {
            CN_LOG_ERR("Node: mutex init failed (%d)", ret);
            return ret;
        }
        mutex_ready_ = true;
    }

    MutexGuard lock(&mutex_);

    config_ = config;
    callbacks_ = callbacks ? *callbacks : NodeCallbacks();
    node_id_ = config.node_id;
    boot_pending_ = false;
    store_pending_ = false;
    now_us_ = 0;
    rx_count_ = 0;

    int ret = od_.init(objects, count);
    if (ret != 0) {
        return ret;
    }
    ret = mailbox_.init(callbacks_.tx_notify, callbacks_.ctx);
    if (ret != 0) {
        return ret;
    }

    if (od_.find(CANOPEN_OBJ_STORE_PARAMETERS, 1)) {
        ret = od_.add_hook(CANOPEN_OBJ_STORE_PARAMETERS, CANOPEN_OBJ_STORE_PARAMETERS,
                           validate_store, store_requested, this);
        if (ret != 0) {
            return ret;
        }
    }
    ret = od_.add_hook(CANOPEN_OBJ_HEARTBEAT_PRODUCER, CANOPEN_OBJ_HEARTBEAT_PRODUCER,
                       nullptr, heartbeat_changed, this);
    if (ret != 0) {
        return ret;
    }

    ret = sdo_.init(&od_, &mailbox_, node_id_, config.sdo_timeout_ms);
    if (ret != 0) {
        return ret;
    }
    ret = pdo_.init(&od_, &mailbox_);
    if (ret != 0) {
        return ret;
    }

    nmt_.enter_initialisation();
    if (callbacks_.reset_app) {
        callbacks_.reset_app(callbacks_.ctx);
    }
    load_defaults(NODE_DICTIONARY_FIRST, NODE_DICTIONARY_LAST);

    if (pdo_.reload() != 0) {
        CN_LOG_ERR("Node: invalid PDO configuration");
        return -EINVAL;
    }

    boot_pending_ = true;
    CN_LOG_INF("Node: initialised, id %u, %u objects", node_id_, (unsigned)count);
    return 0;
}

void Node::load_defaults(uint16_t first, uint16_t last)
{
    od_.restore_defaults(first, last, node_id_);
    update_store_object();

    if (callbacks_.restore_objects) {
        int ret = callbacks_.restore_objects(callbacks_.ctx, od_, first, last);
        if (ret < 0) {
            CN_LOG_WRN("Node: restoring stored objects failed (%d)", ret);
        }
        update_store_object();
    }
}

void Node::complete_boot(uint64_t now_us)
{
    boot_pending_ = false;
    if (!nmt_.complete_boot()) {
        return;
    }

    if (configured()) {
        push(NmtStateMachine::boot_up_frame(node_id_));
    }

    uint16_t period_ms = 0;
    if (od_.read_value(CANOPEN_OBJ_HEARTBEAT_PRODUCER, 0, &period_ms) != SdoAbort::Ok) {
        period_ms = 0;
    }
    nmt_.set_heartbeat_period(period_ms, now_us);

    CN_LOG_INF("Node %u: boot complete", node_id_);
    if (callbacks_.enter_preoperational) {
        callbacks_.enter_preoperational(callbacks_.ctx);
    }

    if (config_.auto_start) {
        change_state(NmtCommand::Start);
    }
}

/* ============================================================================
 * NMT
 * ============================================================================ */

void Node::handle_nmt(NmtCommand command)
{
    switch (command) {
    case NmtCommand::ResetApp:
        reset(true);
        break;
    case NmtCommand::ResetComms:
        reset(false);
        break;
    default:
        change_state(command);
        break;
    }
}

void Node::change_state(NmtCommand command)
{
    NmtState before = nmt_.state();
    if (!nmt_.apply(command)) {
        return;
    }
    NmtState after = nmt_.state();

    if (before == NmtState::Operational) {
        pdo_.set_operational(false, now_us_);
    }

    switch (after) {
    case NmtState::Operational:
        pdo_.set_operational(true, now_us_);
        if (callbacks_.enter_operational) {
            callbacks_.enter_operational(callbacks_.ctx);
        }
        break;
    case NmtState::Stopped:
        /* No SDO in Stopped: a transfer in progress is dropped */
        sdo_.reset();
        if (callbacks_.enter_stopped) {
            callbacks_.enter_stopped(callbacks_.ctx);
        }
        break;
    case NmtState::PreOperational:
        if (callbacks_.enter_preoperational) {
            callbacks_.enter_preoperational(callbacks_.ctx);
        }
        break;
    case NmtState::Initialisation:
        break;
    }
}

void Node::reset(bool application)
{
    CN_LOG_INF("Node %u: reset %s", node_id_, application ? "application" : "communication");

    if (application && callbacks_.reset_app) {
        callbacks_.reset_app(callbacks_.ctx);
    } else if (!application && callbacks_.reset_comms) {
        callbacks_.reset_comms(callbacks_.ctx);
    }

    pdo_.set_operational(false, now_us_);
    sdo_.reset();
    sdo_.set_node_id(node_id_);
    store_pending_ = false;

    nmt_.enter_initialisation();
    boot_pending_ = true;

    if (application) {
        load_defaults(NODE_DICTIONARY_FIRST, NODE_DICTIONARY_LAST);
    } else {
        load_defaults(CANOPEN_COMM_AREA_FIRST, CANOPEN_COMM_AREA_LAST);
    }

    if (pdo_.reload() != 0) {
        CN_LOG_ERR("Node %u: PDO configuration invalid after reset", node_id_);
    }
}

/* ============================================================================
 * Dictionary hooks
 * ============================================================================ */

SdoAbort Node::validate_store(void *ctx, uint16_t index, uint8_t sub,
                              const uint8_t *data, size_t len)
{
    Node *self = static_cast<Node *>(ctx);

    (void)index;
    if (sub != 1) {
        return SdoAbort::Ok;
    }
    if (!self->callbacks_.store_objects) {
        return SdoAbort::DataCannotBeTransferred;
    }
    if (len != 4 || bytes::get_u32(data) != CANOPEN_STORE_SIGNATURE) {
        return SdoAbort::DataCannotBeTransferred;
    }
    return SdoAbort::Ok;
}

void Node::store_requested(void *ctx, uint16_t index, uint8_t sub)
{
    (void)index;
    if (sub == 1) {
        static_cast<Node *>(ctx)->store_pending_ = true;
    }
}

void Node::heartbeat_changed(void *ctx, uint16_t index, uint8_t sub)
{
    Node *self = static_cast<Node *>(ctx);
    uint16_t period_ms = 0;

    (void)sub;
    if (self->boot_pending_) {
        return;
    }
    if (self->od_.read_value(index, 0, &period_ms) == SdoAbort::Ok) {
        self->nmt_.set_heartbeat_period(period_ms, self->now_us_);
    }
}

void Node::update_store_object()
{
    const SubObject *entry = od_.find(CANOPEN_OBJ_STORE_PARAMETERS, 1);
    if (entry && entry->size == 4) {
        /* Bit 0: the device saves parameters on command */
        bytes::put_u32(entry->data, callbacks_.store_objects ? 1 : 0);
    }
}

void Node::process_store()
{
    if (!store_pending_) {
        return;
    }
    store_pending_ = false;
    update_store_object();

    if (callbacks_.store_objects) {
        int ret = callbacks_.store_objects(callbacks_.ctx, od_);
        if (ret < 0) {
            CN_LOG_ERR("Node %u: storing objects failed (%d)", node_id_, ret);
        }
    }
}

/* ============================================================================
 * Entry points
 * ============================================================================ */

uint32_t Node::sync_cob_id() const
{
    uint32_t cob_id = CANOPEN_FC_SYNC;
    if (od_.find(CANOPEN_OBJ_COB_ID_SYNC, 0) &&
        od_.read_value(CANOPEN_OBJ_COB_ID_SYNC, 0, &cob_id) != SdoAbort::Ok) {
        cob_id = CANOPEN_FC_SYNC;
    }
    return cob_id;
}

void Node::push(const Frame &frame)
{
    if (mailbox_.push(frame) != 0) {
        CN_LOG_DBG("Node %u: frame 0x%03X not queued", node_id_, (unsigned)frame.id);
    }
}

void Node::finish_step()
{
    if (configured()) {
        pdo_.flush(now_us_);
    }
    process_store();
}

void Node::on_frame(const Frame &frame, uint64_t now_us)
{
    MutexGuard lock(&mutex_);

    now_us_ = now_us;
    pdo_.set_time(now_us);
    rx_count_++;

    if (boot_pending_) {
        return;
    }

    if (frame.id == CANOPEN_FC_NMT && !frame.extended) {
        NmtCommand command;
        if (NmtStateMachine::parse_command(frame, node_id_, &command)) {
            handle_nmt(command);
        }
        finish_step();
        return;
    }

    if (!configured()) {
        return;
    }

    NmtState state = nmt_.state();
    uint32_t sync = sync_cob_id();
    bool sync_extended = (sync & CANOPEN_COB_ID_EXTENDED) != 0;
    uint32_t sync_id = sync & (sync_extended ? CANOPEN_COB_ID_EXT_MASK : CANOPEN_COB_ID_STD_MASK);

    if (frame.id == sync_id && frame.extended == sync_extended && !frame.rtr) {
        if (state == NmtState::Operational) {
            pdo_.on_sync(now_us);
        }
    } else if (frame.id == build_cob_id(CANOPEN_FC_RSDO, node_id_) && !frame.extended) {
        if (state == NmtState::PreOperational || state == NmtState::Operational) {
            sdo_.on_request(frame, now_us);
        }
    } else if (state == NmtState::Operational) {
        pdo_.on_frame(frame, now_us);
    }

    finish_step();
}

void Node::on_tick(uint64_t now_us)
{
    MutexGuard lock(&mutex_);

    now_us_ = now_us;
    pdo_.set_time(now_us);

    if (boot_pending_) {
        complete_boot(now_us);
    }

    sdo_.on_tick(now_us);

    if (nmt_.heartbeat_due(now_us) && configured()) {
        push(nmt_.heartbeat_frame(node_id_));
    }

    pdo_.on_tick(now_us);
    finish_step();
}

int Node::pull(Frame *frame)
{
    return mailbox_.pull(frame);
}

/* ============================================================================
 * Application access
 * ============================================================================ */

SdoAbort Node::read(uint16_t index, uint8_t sub, uint8_t *buf, size_t cap, size_t *len)
{
    MutexGuard lock(&mutex_);
    return od_.read(index, sub, buf, cap, len);
}

SdoAbort Node::write(uint16_t index, uint8_t sub, const uint8_t *data, size_t len)
{
    MutexGuard lock(&mutex_);

    SdoAbort ret = od_.write(index, sub, data, len);
    if (ret == SdoAbort::Ok) {
        finish_step();
    }
    return ret;
}

SdoAbort Node::set_value(uint16_t index, uint8_t sub, const uint8_t *data, size_t len)
{
    MutexGuard lock(&mutex_);

    SdoAbort ret = od_.write_mapped(index, sub, data, len);
    if (ret == SdoAbort::Ok) {
        finish_step();
    }
    return ret;
}

NmtState Node::nmt_state() const
{
    MutexGuard lock(&mutex_);
    return nmt_.state();
}

uint8_t Node::node_id() const
{
    MutexGuard lock(&mutex_);
    return node_id_;
}

int Node::set_node_id(uint8_t node_id)
{
    if (!node_id_is_configured(node_id) && node_id != CANOPEN_NODE_ID_UNCONFIGURED) {
        return -EINVAL;
    }

    MutexGuard lock(&mutex_);
    node_id_ = node_id;
    config_.node_id = node_id;
    reset(false);
    return 0;
}

uint32_t Node::rx_message_count() const
{
    MutexGuard lock(&mutex_);
    return rx_count_;
}

uint32_t Node::tx_dropped() const
{
    return mailbox_.dropped();
}

SdoState Node::sdo_state() const
{
    MutexGuard lock(&mutex_);
    return sdo_.state();
}

}  // namespace cn
