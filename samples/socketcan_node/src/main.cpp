/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * CANopen node on a Linux SocketCAN interface
 *
 * Usage: socketcan_node <interface> [node-id] [store-file]
 *
 *   ip link add dev vcan0 type vcan && ip link set up vcan0
 *   socketcan_node vcan0 16 /tmp/node16.bin
 *
 * Object 0x2000:1 counts seconds since start and is sent in TPDO1 on every
 * SYNC. 0x2001:1 is received through RPDO1.
 */

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <linux/can.h>
#include <linux/can/raw.h>

#include "cn_node.h"
#include "cn_log.h"

CN_LOG_MODULE_REGISTER(socketcan_node);

using namespace cn;

/* ============================================================================
 * Object table
 * ============================================================================ */

namespace {

const uint8_t kDeviceType[] = {0x91, 0x01, 0x00, 0x00};
const uint8_t kDeviceName[16] = {'s', 'o', 'c', 'k', 'e', 't', 'c', 'a', 'n', '-', 'n', 'o',
                                 'd', 'e'};
const uint8_t kSyncCobId[] = {0x80, 0x00, 0x00, 0x00};
const uint8_t kHeartbeat[] = {0xE8, 0x03};                  /* 1000 ms */
const uint8_t kOne[] = {1};
const uint8_t kFour[] = {4};
const uint8_t kFive[] = {5};
const uint8_t kVendor[] = {0x00, 0x00, 0x00, 0x00};
const uint8_t kProduct[] = {0x01, 0x00, 0x00, 0x00};
const uint8_t kRpdo1CobId[] = {0x00, 0x02, 0x00, 0x00};     /* 0x200 + node id */
const uint8_t kTpdo1CobId[] = {0x80, 0x01, 0x00, 0x00};     /* 0x180 + node id */
const uint8_t kTypeEvent[] = {255};
const uint8_t kTypeSync[] = {1};
const uint8_t kRpdo1Entry[] = {0x10, 0x01, 0x01, 0x20};     /* 0x2001:1, 16 bits */
const uint8_t kTpdo1Entry[] = {0x20, 0x01, 0x00, 0x20};     /* 0x2000:1, 32 bits */

struct Storage {
    uint8_t device_type[4];
    uint8_t error_register[1];
    uint8_t sync_cob_id[4];
    uint8_t device_name[16];
    uint8_t store_count[1];
    uint8_t store_all[4];
    uint8_t heartbeat_ms[2];
    uint8_t identity_count[1];
    uint8_t identity[4][4];
    uint8_t rpdo_highest[1];
    uint8_t rpdo_cob_id[4];
    uint8_t rpdo_type[1];
    uint8_t rpdo_inhibit[2];
    uint8_t rpdo_event_timer[2];
    uint8_t rpdo_count[1];
    uint8_t rpdo_entry[4];
    uint8_t tpdo_highest[1];
    uint8_t tpdo_cob_id[4];
    uint8_t tpdo_type[1];
    uint8_t tpdo_inhibit[2];
    uint8_t tpdo_event_timer[2];
    uint8_t tpdo_count[1];
    uint8_t tpdo_entry[4];
    uint8_t uptime_count[1];
    uint8_t uptime[4];
    uint8_t setpoint_count[1];
    uint8_t setpoint[2];
};

Storage s;

#define RW AccessType::ReadWrite
#define RO AccessType::ReadOnly
#define PERSIST CN_SUB_PERSIST

SubObject sub_1000[] = {
    {0, DataType::UInt32, RO, 0, 4, s.device_type, kDeviceType, 0, 0},
};
SubObject sub_1001[] = {
    {0, DataType::UInt8, RO, 0, 1, s.error_register, nullptr, 0, 0},
};
SubObject sub_1005[] = {
    {0, DataType::UInt32, RW, PERSIST, 4, s.sync_cob_id, kSyncCobId, 0, 0},
};
SubObject sub_1008[] = {
    {0, DataType::VisibleString, AccessType::Const, 0, 16, s.device_name, kDeviceName, 0, 0},
};
SubObject sub_1010[] = {
    {0, DataType::UInt8, RO, 0, 1, s.store_count, kOne, 0, 0},
    {1, DataType::UInt32, RW, 0, 4, s.store_all, nullptr, 0, 0},
};
SubObject sub_1017[] = {
    {0, DataType::UInt16, RW, PERSIST, 2, s.heartbeat_ms, kHeartbeat, 0, 0},
};
SubObject sub_1018[] = {
    {0, DataType::UInt8, RO, 0, 1, s.identity_count, kFour, 0, 0},
    {1, DataType::UInt32, RO, 0, 4, s.identity[0], kVendor, 0, 0},
    {2, DataType::UInt32, RO, 0, 4, s.identity[1], kProduct, 0, 0},
    {3, DataType::UInt32, RO, 0, 4, s.identity[2], nullptr, 0, 0},
    {4, DataType::UInt32, RO, 0, 4, s.identity[3], nullptr, 0, 0},
};
SubObject sub_1400[] = {
    {0, DataType::UInt8, RO, 0, 1, s.rpdo_highest, kFive, 0, 0},
    {1, DataType::UInt32, RW, CN_SUB_NODE_ID_RELATIVE | PERSIST, 4, s.rpdo_cob_id, kRpdo1CobId,
     0, 0},
    {2, DataType::UInt8, RW, PERSIST, 1, s.rpdo_type, kTypeEvent, 0, 0},
    {3, DataType::UInt16, RW, PERSIST, 2, s.rpdo_inhibit, nullptr, 0, 0},
    {5, DataType::UInt16, RW, PERSIST, 2, s.rpdo_event_timer, nullptr, 0, 0},
};
SubObject sub_1600[] = {
    {0, DataType::UInt8, RW, PERSIST, 1, s.rpdo_count, kOne, 0, 0},
    {1, DataType::UInt32, RW, PERSIST, 4, s.rpdo_entry, kRpdo1Entry, 0, 0},
};
SubObject sub_1800[] = {
    {0, DataType::UInt8, RO, 0, 1, s.tpdo_highest, kFive, 0, 0},
    {1, DataType::UInt32, RW, CN_SUB_NODE_ID_RELATIVE | PERSIST, 4, s.tpdo_cob_id, kTpdo1CobId,
     0, 0},
    {2, DataType::UInt8, RW, PERSIST, 1, s.tpdo_type, kTypeSync, 0, 0},
    {3, DataType::UInt16, RW, PERSIST, 2, s.tpdo_inhibit, nullptr, 0, 0},
    {5, DataType::UInt16, RW, PERSIST, 2, s.tpdo_event_timer, nullptr, 0, 0},
};
SubObject sub_1a00[] = {
    {0, DataType::UInt8, RW, PERSIST, 1, s.tpdo_count, kOne, 0, 0},
    {1, DataType::UInt32, RW, PERSIST, 4, s.tpdo_entry, kTpdo1Entry, 0, 0},
};
SubObject sub_2000[] = {
    {0, DataType::UInt8, RO, 0, 1, s.uptime_count, kOne, 0, 0},
    {1, DataType::UInt32, RO, CN_SUB_PDO_MAPPABLE, 4, s.uptime, nullptr, 0, 0},
};
SubObject sub_2001[] = {
    {0, DataType::UInt8, RO, 0, 1, s.setpoint_count, kOne, 0, 0},
    {1, DataType::UInt16, RW, CN_SUB_PDO_MAPPABLE | PERSIST, 2, s.setpoint, nullptr, 0, 0},
};

#undef RW
#undef RO
#undef PERSIST

#define OBJ(idx, code, subs) {idx, ObjectCode::code, subs, sizeof(subs) / sizeof(subs[0])}

Object objects[] = {
    OBJ(0x1000, Var, sub_1000),
    OBJ(0x1001, Var, sub_1001),
    OBJ(0x1005, Var, sub_1005),
    OBJ(0x1008, Var, sub_1008),
    OBJ(0x1010, Array, sub_1010),
    OBJ(0x1017, Var, sub_1017),
    OBJ(0x1018, Record, sub_1018),
    OBJ(0x1400, Record, sub_1400),
    OBJ(0x1600, Array, sub_1600),
    OBJ(0x1800, Record, sub_1800),
    OBJ(0x1A00, Array, sub_1a00),
    OBJ(0x2000, Record, sub_2000),
    OBJ(0x2001, Record, sub_2001),
};

#undef OBJ

/* ============================================================================
 * Application
 * ============================================================================ */

struct App {
    Node node;
    int sock;
    const char *store_path;
    uint16_t last_setpoint;
};

volatile sig_atomic_t running = 1;

void on_signal(int)
{
    running = 0;
}

int write_file(void *ctx, const uint8_t *data, size_t len)
{
    FILE *file = static_cast<FILE *>(ctx);
    return fwrite(data, 1, len, file) == len ? 0 : -EIO;
}

int store_objects(void *ctx, const ObjectDictionary &od)
{
    App *app = static_cast<App *>(ctx);
    FILE *file = fopen(app->store_path, "wb");
    if (!file) {
        int err = errno;
        CN_LOG_ERR("Cannot open %s: %s", app->store_path, strerror(err));
        return -err;
    }

    int ret = od.serialize(write_file, file);
    if (fclose(file) != 0 && ret == 0) {
        ret = -EIO;
    }
    CN_LOG_INF("Stored parameters to %s (%d)", app->store_path, ret);
    return ret;
}

int restore_objects(void *ctx, ObjectDictionary &od, uint16_t first, uint16_t last)
{
    App *app = static_cast<App *>(ctx);
    FILE *file = fopen(app->store_path, "rb");
    if (!file) {
        /* Nothing stored yet */
        return errno == ENOENT ? 0 : -errno;
    }

    uint8_t image[512];
    size_t len = fread(image, 1, sizeof(image), file);
    fclose(file);

    int ret = od.restore(image, len, first, last);
    if (ret != 0) {
        CN_LOG_WRN("Stored image in %s rejected (%d)", app->store_path, ret);
    }
    return ret;
}

void enter_operational(void *)
{
    CN_LOG_INF("Operational");
}

void enter_stopped(void *)
{
    CN_LOG_INF("Stopped");
}

void reset_app(void *)
{
    memset(s.uptime, 0, sizeof(s.uptime));
}

/* ============================================================================
 * SocketCAN
 * ============================================================================ */

int open_socket(const char *ifname)
{
    int sock = socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (sock < 0) {
        int err = errno;
        CN_LOG_ERR("socket: %s", strerror(err));
        return -err;
    }

    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, ifname, IFNAMSIZ - 1);
    if (ioctl(sock, SIOCGIFINDEX, &ifr) < 0) {
        int err = errno;
        CN_LOG_ERR("Unknown interface %s: %s", ifname, strerror(err));
        close(sock);
        return -err;
    }

    struct sockaddr_can addr;
    memset(&addr, 0, sizeof(addr));
    addr.can_family = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;
    if (bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        CN_LOG_ERR("bind %s: %s", ifname, strerror(err));
        close(sock);
        return -err;
    }

    return sock;
}

bool from_socketcan(const struct can_frame &in, Frame *out)
{
    if (in.can_id & CAN_ERR_FLAG) {
        return false;
    }

    memset(out, 0, sizeof(*out));
    out->extended = (in.can_id & CAN_EFF_FLAG) != 0;
    out->rtr = (in.can_id & CAN_RTR_FLAG) != 0;
    out->id = in.can_id & (out->extended ? CAN_EFF_MASK : CAN_SFF_MASK);
    out->len = in.can_dlc > 8 ? 8 : in.can_dlc;
    memcpy(out->data, in.data, out->len);
    return true;
}

void to_socketcan(const Frame &in, struct can_frame *out)
{
    memset(out, 0, sizeof(*out));
    out->can_id = in.id;
    if (in.extended) {
        out->can_id |= CAN_EFF_FLAG;
    }
    if (in.rtr) {
        out->can_id |= CAN_RTR_FLAG;
    }
    out->can_dlc = in.len;
    memcpy(out->data, in.data, in.len);
}

void flush(App &app)
{
    Frame frame;
    while (app.node.pull(&frame) == 0) {
        struct can_frame out;
        to_socketcan(frame, &out);
        if (write(app.sock, &out, sizeof(out)) != (ssize_t)sizeof(out)) {
            CN_LOG_WRN("TX 0x%03x failed: %s", (unsigned)frame.id, strerror(errno));
        }
    }
}

void receive(App &app)
{
    struct can_frame in;
    ssize_t n;
    while ((n = recv(app.sock, &in, sizeof(in), MSG_DONTWAIT)) == (ssize_t)sizeof(in)) {
        Frame frame;
        if (from_socketcan(in, &frame)) {
            app.node.on_frame(frame, cn_platform_get_time_us());
        }
    }
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        CN_LOG_WRN("RX failed: %s", strerror(errno));
    }
}

void update_process(App &app, uint64_t start_us, uint64_t now_us)
{
    uint32_t uptime = (uint32_t)((now_us - start_us) / 1000000ULL);
    SdoAbort ret = app.node.set_value<uint32_t>(0x2000, 1, uptime);
    if (ret != SdoAbort::Ok) {
        CN_LOG_WRN("Uptime update failed: 0x%08X", (unsigned)abort_code_value(ret));
    }

    uint16_t setpoint = 0;
    if (app.node.read_value<uint16_t>(0x2001, 1, &setpoint) == SdoAbort::Ok &&
        setpoint != app.last_setpoint) {
        CN_LOG_INF("Setpoint %u", setpoint);
        app.last_setpoint = setpoint;
    }
}

}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2) {
        fprintf(stderr, "usage: %s <interface> [node-id] [store-file]\n", argv[0]);
        return 2;
    }

    static App app;
    app.store_path = argc > 3 ? argv[3] : nullptr;
    app.last_setpoint = 0;

    long node_id = argc > 2 ? strtol(argv[2], nullptr, 0) : 0x10;
    if (node_id < 1 || node_id > 127) {
        fprintf(stderr, "node id must be 1-127\n");
        return 2;
    }

    app.sock = open_socket(argv[1]);
    if (app.sock < 0) {
        return 1;
    }

    NodeCallbacks callbacks = {};
    callbacks.ctx = &app;
    callbacks.reset_app = reset_app;
    callbacks.enter_operational = enter_operational;
    callbacks.enter_stopped = enter_stopped;
    if (app.store_path) {
        callbacks.store_objects = store_objects;
        callbacks.restore_objects = restore_objects;
    }

    NodeConfig config = {};
    config.node_id = (uint8_t)node_id;
    config.auto_start = false;

    int ret = app.node.init(config, objects, sizeof(objects) / sizeof(objects[0]), &callbacks);
    if (ret != 0) {
        CN_LOG_ERR("Node init failed: %d", ret);
        close(app.sock);
        return 1;
    }

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);

    CN_LOG_INF("Node 0x%02x on %s", (unsigned)node_id, argv[1]);

    const uint64_t start_us = cn_platform_get_time_us();
    struct pollfd pfd = {app.sock, POLLIN, 0};

    while (running) {
        ret = poll(&pfd, 1, 1);
        if (ret < 0 && errno != EINTR) {
            CN_LOG_ERR("poll: %s", strerror(errno));
            break;
        }
        if (ret > 0 && (pfd.revents & POLLIN)) {
            receive(app);
        }

        uint64_t now = cn_platform_get_time_us();
        update_process(app, start_us, now);
        app.node.on_tick(now);
        flush(app);
    }

    CN_LOG_INF("Shutting down");
    close(app.sock);
    return 0;
}
