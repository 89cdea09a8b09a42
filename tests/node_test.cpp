/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Google Test tests for the node: dispatch, NMT coordination, persistence
 */

#include <gtest/gtest.h>
#include <cerrno>
#include <cstring>
#include <vector>

#include "cn_node.h"
#include "test_od.h"

using namespace cn;
using namespace cn_test;

// ============================================================================
// Application callbacks
// ============================================================================

struct AppLog {
    Node *node = nullptr;
    int reset_app = 0;
    int reset_comms = 0;
    int preop = 0;
    int op = 0;
    int stopped = 0;
    int notify = 0;
    int stores = 0;
    int restores = 0;
    uint16_t heartbeat_at_reset = 0xFFFF;
    std::vector<uint8_t> image;
};

static void on_reset_app(void *ctx) {
    static_cast<AppLog *>(ctx)->reset_app++;
}

static void on_reset_comms(void *ctx) {
    auto *log = static_cast<AppLog *>(ctx);
    log->reset_comms++;
    log->node->dictionary().read_value(0x1017, 0, &log->heartbeat_at_reset);
}

static void on_preop(void *ctx) {
    static_cast<AppLog *>(ctx)->preop++;
}

static void on_op(void *ctx) {
    static_cast<AppLog *>(ctx)->op++;
}

static void on_stopped(void *ctx) {
    static_cast<AppLog *>(ctx)->stopped++;
}

static void on_notify(void *ctx) {
    static_cast<AppLog *>(ctx)->notify++;
}

static int image_sink(void *ctx, const uint8_t *data, size_t len) {
    auto *image = static_cast<std::vector<uint8_t> *>(ctx);
    image->insert(image->end(), data, data + len);
    return 0;
}

static int on_store(void *ctx, const ObjectDictionary &od) {
    auto *log = static_cast<AppLog *>(ctx);
    log->stores++;
    log->image.clear();
    return od.serialize(image_sink, &log->image);
}

static int on_restore(void *ctx, ObjectDictionary &od, uint16_t first, uint16_t last) {
    auto *log = static_cast<AppLog *>(ctx);
    log->restores++;
    return od.restore(log->image.data(), log->image.size(), first, last);
}

// ============================================================================
// Test Fixture
// ============================================================================

class NodeTest : public ::testing::Test {
protected:
    static inline constexpr uint8_t NODE_ID = 0x10;
    static inline constexpr uint64_t T0 = 1000000;
    static inline constexpr uint64_t MS = 1000;

    TestDictionary dict;
    Node node;
    AppLog log;
    NodeCallbacks callbacks = {};

    void SetUp() override {
        log.node = &node;
        callbacks.ctx = &log;
        callbacks.reset_app = on_reset_app;
        callbacks.reset_comms = on_reset_comms;
        callbacks.enter_preoperational = on_preop;
        callbacks.enter_operational = on_op;
        callbacks.enter_stopped = on_stopped;
        callbacks.tx_notify = on_notify;
    }

    int init(uint8_t node_id = NODE_ID, bool auto_start = false) {
        NodeConfig config = {};
        config.node_id = node_id;
        config.auto_start = auto_start;
        return node.init(config, dict.objects(), dict.count(), &callbacks);
    }

    void boot(uint8_t node_id = NODE_ID, bool auto_start = false) {
        ASSERT_EQ(init(node_id, auto_start), 0);
        node.on_tick(T0);
        drain(node);
    }

    std::vector<Frame> deliver(const Frame &frame, uint64_t now_us = T0) {
        node.on_frame(frame, now_us);
        return drain(node);
    }

    std::vector<Frame> sync(uint64_t now_us = T0) {
        return deliver(make_frame(CANOPEN_FC_SYNC, nullptr, 0), now_us);
    }

    std::vector<Frame> nmt(NmtCommand command, uint8_t target = NODE_ID) {
        return deliver(nmt_command(command, target));
    }
};

// ============================================================================
// Boot Tests
// ============================================================================

TEST_F(NodeTest, InitRejectsBadNodeId) {
    EXPECT_EQ(init(0), -EINVAL);
    EXPECT_EQ(init(128), -EINVAL);
}

TEST_F(NodeTest, InitRejectsBadTable) {
    dict.objects()[1].index = 0x0FFF;
    EXPECT_EQ(init(), -EINVAL);
}

TEST_F(NodeTest, BootUpOnFirstTick) {
    ASSERT_EQ(init(), 0);
    EXPECT_EQ(node.nmt_state(), NmtState::Initialisation);
    EXPECT_EQ(log.reset_app, 1);
    EXPECT_TRUE(drain(node).empty());

    node.on_tick(T0);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x710u);
    EXPECT_EQ(frames[0].len, 1);
    EXPECT_EQ(frames[0].data[0], 0x00);

    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);
    EXPECT_EQ(log.preop, 1);
    EXPECT_EQ(log.notify, 1);
}

TEST_F(NodeTest, FramesIgnoredUntilBooted) {
    ASSERT_EQ(init(), 0);
    node.on_frame(nmt_command(NmtCommand::Start, NODE_ID), T0);
    EXPECT_EQ(node.nmt_state(), NmtState::Initialisation);
    EXPECT_EQ(node.rx_message_count(), 1u);

    node.on_tick(T0);
    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);
}

TEST_F(NodeTest, AutoStart) {
    boot(NODE_ID, true);
    EXPECT_EQ(node.nmt_state(), NmtState::Operational);
    EXPECT_EQ(log.op, 1);
    EXPECT_EQ(sync().size(), 1u);
}

TEST_F(NodeTest, ProducerHeartbeatFromDictionary) {
    ASSERT_EQ(init(), 0);
    ASSERT_EQ(node.write_value<uint16_t>(0x1017, 0, 50), SdoAbort::Ok);
    node.on_tick(T0);
    drain(node);

    node.on_tick(T0 + 49 * MS);
    EXPECT_TRUE(drain(node).empty());

    node.on_tick(T0 + 50 * MS);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x710u);
    EXPECT_EQ(frames[0].data[0], 0x7F);
}

// ============================================================================
// NMT Tests
// ============================================================================

TEST_F(NodeTest, StartStopPreOperational) {
    boot();

    nmt(NmtCommand::Start);
    EXPECT_EQ(node.nmt_state(), NmtState::Operational);
    EXPECT_EQ(log.op, 1);

    nmt(NmtCommand::Stop);
    EXPECT_EQ(node.nmt_state(), NmtState::Stopped);
    EXPECT_EQ(log.stopped, 1);

    nmt(NmtCommand::EnterPreOperational);
    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);
    EXPECT_EQ(log.preop, 2);
}

TEST_F(NodeTest, BroadcastAndForeignCommands) {
    boot();

    nmt(NmtCommand::Start, 0x11);
    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);

    nmt(NmtCommand::Start, 0x00);
    EXPECT_EQ(node.nmt_state(), NmtState::Operational);
}

TEST_F(NodeTest, StoppedSilencesPdoAndSdo) {
    boot();
    nmt(NmtCommand::Start);
    EXPECT_EQ(sync().size(), 1u);

    nmt(NmtCommand::Stop);
    EXPECT_TRUE(sync().empty());
    EXPECT_TRUE(deliver(sdo_request(NODE_ID, 0x40, 0x1000, 0)).empty());

    nmt(NmtCommand::Start);
    EXPECT_EQ(sync().size(), 1u);
}

TEST_F(NodeTest, StopDropsSdoSession) {
    boot();
    deliver(sdo_request(NODE_ID, 0x21, IDX_LABEL, 0, 10));
    EXPECT_EQ(node.sdo_state(), SdoState::DownloadSegmented);

    nmt(NmtCommand::Stop);
    EXPECT_EQ(node.sdo_state(), SdoState::Idle);
}

TEST_F(NodeTest, ResetCommunication) {
    boot();
    node.write_value<uint16_t>(0x1017, 0, 100);
    node.write_value<uint16_t>(IDX_PROCESS, 1, 5);
    nmt(NmtCommand::Start);

    EXPECT_TRUE(nmt(NmtCommand::ResetComms).empty());
    EXPECT_EQ(log.reset_comms, 1);
    EXPECT_EQ(log.heartbeat_at_reset, 100);
    EXPECT_EQ(node.nmt_state(), NmtState::Initialisation);

    node.on_tick(T0 + MS);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x710u);
    EXPECT_EQ(frames[0].data[0], 0x00);
    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);

    uint16_t heartbeat = 1;
    uint16_t process = 0;
    node.read_value(0x1017, 0, &heartbeat);
    node.read_value(IDX_PROCESS, 1, &process);
    EXPECT_EQ(heartbeat, 0);
    EXPECT_EQ(process, 5);

    node.on_tick(T0 + 500 * MS);
    EXPECT_TRUE(drain(node).empty());
}

TEST_F(NodeTest, ResetApplication) {
    boot();
    node.write_value<uint16_t>(IDX_PROCESS, 1, 5);

    nmt(NmtCommand::ResetApp);
    EXPECT_EQ(log.reset_app, 2);
    EXPECT_EQ(log.reset_comms, 0);

    node.on_tick(T0 + MS);
    EXPECT_EQ(drain(node).size(), 1u);

    uint16_t process = 1;
    node.read_value(IDX_PROCESS, 1, &process);
    EXPECT_EQ(process, 0);
}

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(NodeTest, TpdoFollowsSdoWrite) {
    boot();
    nmt(NmtCommand::Start);

    auto frames = sync(T0 + MS);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x190u);
    EXPECT_EQ(frames[0].len, 2);
    EXPECT_EQ(frames[0].data[0], 0x00);
    EXPECT_EQ(frames[0].data[1], 0x00);

    frames = deliver(sdo_request(NODE_ID, 0x2B, IDX_PROCESS, 1, 1234), T0 + 2 * MS);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x590u);
    EXPECT_EQ(frames[0].data[0], 0x60);

    frames = sync(T0 + 3 * MS);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0xD2);
    EXPECT_EQ(frames[0].data[1], 0x04);
}

TEST_F(NodeTest, SdoServedInPreOperational) {
    boot();
    auto frames = deliver(sdo_request(NODE_ID, 0x40, 0x1000, 0));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x43);
    EXPECT_EQ(bytes::get_u32(&frames[0].data[4]), 0x191u);
}

TEST_F(NodeTest, SdoForOtherNodeIgnored) {
    boot();
    EXPECT_TRUE(deliver(sdo_request(0x11, 0x40, 0x1000, 0)).empty());
}

TEST_F(NodeTest, SdoTimeout) {
    boot();
    deliver(sdo_request(NODE_ID, 0x21, IDX_LABEL, 0, 10));

    node.on_tick(T0 + 1000 * MS);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x80);
    EXPECT_EQ(bytes::get_u32(&frames[0].data[4]), abort_code_value(SdoAbort::SdoTimeout));
}

TEST_F(NodeTest, HeartbeatFollowsSdoWrite) {
    boot();
    deliver(sdo_request(NODE_ID, 0x2B, 0x1017, 0, 100), T0 + MS);

    node.on_tick(T0 + 100 * MS);
    EXPECT_TRUE(drain(node).empty());

    node.on_tick(T0 + 101 * MS);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x710u);
    EXPECT_EQ(frames[0].data[0], 0x7F);

    nmt(NmtCommand::Start);
    node.on_tick(T0 + 201 * MS);
    frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x05);
}

TEST_F(NodeTest, RpdoOnlyInOperational) {
    boot();
    const uint8_t data[2] = {0x34, 0x12};

    deliver(make_frame(0x210, data, 2));
    EXPECT_EQ(dict.command_target[0], 0);

    nmt(NmtCommand::Start);
    deliver(make_frame(0x210, data, 2));

    uint16_t value = 0;
    node.read_value(IDX_COMMAND, 1, &value);
    EXPECT_EQ(value, 0x1234);
}

TEST_F(NodeTest, SyncObjectSelectsIdentifier) {
    boot();
    ASSERT_EQ(node.write_value<uint32_t>(0x1005, 0, 0x81), SdoAbort::Ok);
    nmt(NmtCommand::Start);

    EXPECT_TRUE(sync().empty());
    EXPECT_EQ(deliver(make_frame(0x081, nullptr, 0)).size(), 1u);
}

TEST_F(NodeTest, ApplicationWriteTriggersEventPdo) {
    boot();
    nmt(NmtCommand::Start);
    ASSERT_EQ(node.write_value<uint8_t>(0x1800, 2, 255), SdoAbort::Ok);

    ASSERT_EQ(node.write_value<uint16_t>(IDX_PROCESS, 1, 77), SdoAbort::Ok);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x190u);
    EXPECT_EQ(frames[0].data[0], 77);
}

TEST_F(NodeTest, ApplicationSetValueTriggersEventPdo) {
    boot();
    ASSERT_EQ(node.write_value<uint32_t>(0x1A01, 1, map_entry(IDX_COMMAND, 2, 8)), SdoAbort::Ok);
    ASSERT_EQ(node.write_value<uint8_t>(0x1A01, 0, 1), SdoAbort::Ok);
    ASSERT_EQ(node.write_value<uint32_t>(0x1801, 1, 0x290), SdoAbort::Ok);
    nmt(NmtCommand::Start);

    /* Read-only to the network */
    EXPECT_EQ(node.write_value<uint8_t>(IDX_COMMAND, 2, 7), SdoAbort::ReadOnly);
    EXPECT_TRUE(drain(node).empty());

    ASSERT_EQ(node.set_value<uint8_t>(IDX_COMMAND, 2, 7), SdoAbort::Ok);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x290u);
    EXPECT_EQ(frames[0].len, 1);
    EXPECT_EQ(frames[0].data[0], 7);
    EXPECT_EQ(dict.command_status[0], 7);
}

TEST_F(NodeTest, ApplicationSetValueChecksValue) {
    boot();
    EXPECT_EQ(node.set_value<uint16_t>(IDX_COMMAND, 2, 7), SdoAbort::LengthTooHigh);
    EXPECT_EQ(node.set_value<int16_t>(IDX_COMMAND, 3, 200), SdoAbort::ValueTooHigh);
    EXPECT_EQ(node.set_value<uint8_t>(0x3000, 0, 1), SdoAbort::ObjectDoesNotExist);
    EXPECT_EQ(dict.command_status[0], 0);
}

TEST_F(NodeTest, ApplicationWriteFollowsAccessRules) {
    boot();
    EXPECT_EQ(node.write_value<uint32_t>(0x1000, 0, 1), SdoAbort::ReadOnly);

    uint8_t buf[4];
    size_t len = 0;
    EXPECT_EQ(node.read(IDX_SECRET, 0, buf, sizeof(buf), &len), SdoAbort::WriteOnly);
}

TEST_F(NodeTest, RxCountAndDrops) {
    ASSERT_EQ(init(), 0);
    node.on_tick(T0);

    for (int i = 0; i < 40; i++) {
        node.on_frame(sdo_request(NODE_ID, 0x40, 0x1000, 0), T0);
    }
    EXPECT_EQ(node.rx_message_count(), 40u);
    EXPECT_EQ(node.tx_dropped(), 40u + 1u - Mailbox::CAPACITY);
    EXPECT_EQ(drain(node).size(), Mailbox::CAPACITY);
}

// ============================================================================
// Node Id Tests
// ============================================================================

TEST_F(NodeTest, UnconfiguredNodeStaysQuiet) {
    ASSERT_EQ(init(CANOPEN_NODE_ID_UNCONFIGURED), 0);
    node.on_tick(T0);
    EXPECT_TRUE(drain(node).empty());
    EXPECT_EQ(node.nmt_state(), NmtState::PreOperational);

    uint32_t cob_id = 0;
    node.read_value(0x1800, 1, &cob_id);
    EXPECT_EQ(cob_id, 0x180u);

    nmt(NmtCommand::Start, 0x00);
    EXPECT_EQ(node.nmt_state(), NmtState::Operational);
    EXPECT_TRUE(sync().empty());

    node.write_value<uint16_t>(0x1017, 0, 10);
    node.on_tick(T0 + 100 * MS);
    EXPECT_TRUE(drain(node).empty());
}

TEST_F(NodeTest, SetNodeId) {
    ASSERT_EQ(init(CANOPEN_NODE_ID_UNCONFIGURED), 0);
    node.on_tick(T0);

    EXPECT_EQ(node.set_node_id(0), -EINVAL);
    EXPECT_EQ(node.set_node_id(200), -EINVAL);

    ASSERT_EQ(node.set_node_id(0x20), 0);
    EXPECT_EQ(node.node_id(), 0x20);
    EXPECT_EQ(log.reset_comms, 1);
    EXPECT_EQ(node.nmt_state(), NmtState::Initialisation);

    node.on_tick(T0 + MS);
    auto frames = drain(node);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x720u);

    uint32_t cob_id = 0;
    node.read_value(0x1800, 1, &cob_id);
    EXPECT_EQ(cob_id, 0x1A0u);

    frames = deliver(sdo_request(0x20, 0x40, 0x1000, 0));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, 0x5A0u);
}

// ============================================================================
// Store Parameters Tests
// ============================================================================

TEST_F(NodeTest, StoreUnsupportedWithoutCallback) {
    boot();

    uint32_t flags = 0xFF;
    node.read_value(0x1010, 1, &flags);
    EXPECT_EQ(flags, 0u);

    auto frames = deliver(sdo_request(NODE_ID, 0x23, 0x1010, 1, CANOPEN_STORE_SIGNATURE));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x80);
    EXPECT_EQ(bytes::get_u32(&frames[0].data[4]),
              abort_code_value(SdoAbort::DataCannotBeTransferred));
}

TEST_F(NodeTest, StoreRequiresSignature) {
    callbacks.store_objects = on_store;
    boot();

    uint32_t flags = 0;
    node.read_value(0x1010, 1, &flags);
    EXPECT_EQ(flags, 1u);

    auto frames = deliver(sdo_request(NODE_ID, 0x23, 0x1010, 1, 0x12345678));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x80);
    EXPECT_EQ(log.stores, 0);
}

TEST_F(NodeTest, StoredValuesSurviveReset) {
    callbacks.store_objects = on_store;
    callbacks.restore_objects = on_restore;
    boot();
    EXPECT_EQ(log.restores, 1);

    deliver(sdo_request(NODE_ID, 0x2B, 0x1017, 0, 250));
    auto frames = deliver(sdo_request(NODE_ID, 0x23, 0x1010, 1, CANOPEN_STORE_SIGNATURE));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].data[0], 0x60);
    EXPECT_EQ(log.stores, 1);
    EXPECT_FALSE(log.image.empty());

    uint32_t flags = 0;
    node.read_value(0x1010, 1, &flags);
    EXPECT_EQ(flags, 1u);

    node.write_value<uint16_t>(0x1017, 0, 0);
    nmt(NmtCommand::ResetApp);
    EXPECT_EQ(log.restores, 2);

    uint16_t heartbeat = 0;
    node.read_value(0x1017, 0, &heartbeat);
    EXPECT_EQ(heartbeat, 250);

    node.on_tick(T0 + MS);
    drain(node);
    node.on_tick(T0 + 251 * MS);
    EXPECT_EQ(drain(node).size(), 1u);
}
