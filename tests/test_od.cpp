/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Hand-written object dictionary shared by the tests
 */

#include "test_od.h"
#include <string.h>

using cn::AccessType;
using cn::DataType;
using cn::ObjectCode;

namespace cn_test {

/* Defaults, little-endian */
static const uint8_t kDeviceType[] = {0x91, 0x01, 0x00, 0x00};
static const uint8_t kSyncCobId[] = {0x80, 0x00, 0x00, 0x00};
static const uint8_t kDeviceName[16] = {'c', 'n', '-', 't', 'e', 's', 't'};
static const uint8_t kOne[] = {1};
static const uint8_t kFour[] = {4};
static const uint8_t kFive[] = {5};
static const uint8_t kThree[] = {3};
static const uint8_t kTwo[] = {2};
static const uint8_t kVendor[] = {0xD2, 0x04, 0x00, 0x00};
static const uint8_t kProduct[] = {0x01, 0x00, 0x00, 0x00};
static const uint8_t kRevision[] = {0x02, 0x00, 0x01, 0x00};
static const uint8_t kSerial[] = {0x78, 0x56, 0x34, 0x12};

static const uint8_t kRpdo1CobId[] = {0x00, 0x02, 0x00, 0x00};   /* 0x200 + $NODEID */
static const uint8_t kRpdo2CobId[] = {0x00, 0x03, 0x00, 0x80};   /* 0x300 + $NODEID, disabled */
static const uint8_t kTpdo1CobId[] = {0x80, 0x01, 0x00, 0x00};   /* 0x180 + $NODEID */
static const uint8_t kTpdo2CobId[] = {0x80, 0x02, 0x00, 0x80};   /* 0x280 + $NODEID, disabled */
static const uint8_t kTypeEvent[] = {255};
static const uint8_t kTypeSyncAcyclic[] = {0};
static const uint8_t kTypeSyncEvery[] = {1};
static const uint8_t kTypeEventManufacturer[] = {254};

static const uint8_t kRpdo1Entry[] = {0x10, 0x01, 0x01, 0x20};   /* 0x2001:1, 16 bits */
static const uint8_t kRpdo2Entry[] = {0x20, 0x02, 0x00, 0x20};   /* 0x2000:2, 32 bits */
static const uint8_t kTpdo1Entry[] = {0x10, 0x01, 0x00, 0x20};   /* 0x2000:1, 16 bits */

static const uint8_t kLabel[LABEL_SIZE] = {'h', 'e', 'l', 'l', 'o'};

TestDictionary::TestDictionary()
    : num_subs_(0), num_objects_(0)
{
    /* Storage is filled by ObjectDictionary::restore_defaults() */
    begin(0x1000, ObjectCode::Var);
    add(0, DataType::UInt32, AccessType::ReadOnly, 0, 4, device_type, kDeviceType);

    begin(0x1001, ObjectCode::Var);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, error_register);

    begin(0x1005, ObjectCode::Var);
    add(0, DataType::UInt32, AccessType::ReadWrite, CN_SUB_PERSIST, 4, sync_cob_id,
        kSyncCobId);

    begin(0x1008, ObjectCode::Var);
    add(0, DataType::VisibleString, AccessType::Const, 0, sizeof(device_name), device_name,
        kDeviceName);

    begin(0x1010, ObjectCode::Array);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, store_count, kOne);
    add(1, DataType::UInt32, AccessType::ReadWrite, 0, 4, store_all);

    begin(0x1017, ObjectCode::Var);
    add(0, DataType::UInt16, AccessType::ReadWrite, CN_SUB_PERSIST, 2, heartbeat_ms);

    begin(0x1018, ObjectCode::Record);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, identity_count, kFour);
    add(1, DataType::UInt32, AccessType::ReadOnly, 0, 4, identity[0], kVendor);
    add(2, DataType::UInt32, AccessType::ReadOnly, 0, 4, identity[1], kProduct);
    add(3, DataType::UInt32, AccessType::ReadOnly, 0, 4, identity[2], kRevision);
    add(4, DataType::UInt32, AccessType::ReadOnly, 0, 4, identity[3], kSerial);

    add_pdo_comm(0x1400, rpdo_comm[0], kRpdo1CobId, kTypeEvent);
    add_pdo_comm(0x1401, rpdo_comm[1], kRpdo2CobId, kTypeSyncAcyclic);
    add_pdo_map(0x1600, rpdo_map[0], kOne, kRpdo1Entry);
    add_pdo_map(0x1601, rpdo_map[1], kOne, kRpdo2Entry);
    add_pdo_comm(0x1800, tpdo_comm[0], kTpdo1CobId, kTypeSyncEvery);
    add_pdo_comm(0x1801, tpdo_comm[1], kTpdo2CobId, kTypeEventManufacturer);
    add_pdo_map(0x1A00, tpdo_map[0], kOne, kTpdo1Entry);
    add_pdo_map(0x1A01, tpdo_map[1], nullptr, nullptr);

    begin(IDX_PROCESS, ObjectCode::Record);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, process_count, kTwo);
    add(1, DataType::UInt16, AccessType::ReadWrite, CN_SUB_PDO_MAPPABLE, 2, process_value);
    add(2, DataType::UInt32, AccessType::ReadWrite, CN_SUB_PDO_MAPPABLE, 4, process_wide);

    begin(IDX_COMMAND, ObjectCode::Record);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, command_count, kThree);
    add(1, DataType::UInt16, AccessType::ReadWrite, CN_SUB_PDO_MAPPABLE, 2, command_target);
    add(2, DataType::UInt8, AccessType::ReadOnly, CN_SUB_PDO_MAPPABLE, 1, command_status);
    add(3, DataType::Int16, AccessType::ReadWrite, CN_SUB_HAS_RANGE | CN_SUB_PERSIST, 2,
        command_limited, nullptr, -100, 100);

    begin(IDX_ENABLE, ObjectCode::Var);
    add(0, DataType::Boolean, AccessType::ReadWrite, 0, 1, enable);

    begin(IDX_LABEL, ObjectCode::Var);
    add(0, DataType::VisibleString, AccessType::ReadWrite, CN_SUB_PERSIST, LABEL_SIZE, label,
        kLabel);

    begin(IDX_SECRET, ObjectCode::Var);
    add(0, DataType::UInt32, AccessType::WriteOnly, 0, 4, secret);

    begin(IDX_BLOB, ObjectCode::Var);
    add(0, DataType::OctetString, AccessType::ReadWrite, 0, BLOB_SIZE, blob);

    begin(IDX_TOTAL, ObjectCode::Var);
    add(0, DataType::Int64, AccessType::ReadWrite, CN_SUB_PDO_MAPPABLE, 8, total);

    begin(IDX_HUGE, ObjectCode::Var);
    add(0, DataType::OctetString, AccessType::ReadWrite, 0, HUGE_SIZE, huge);
}

void TestDictionary::begin(uint16_t index, ObjectCode code)
{
    cn::Object &obj = objects_[num_objects_++];
    obj.index = index;
    obj.code = code;
    obj.subs = &subs_[num_subs_];
    obj.num_subs = 0;
}

void TestDictionary::add(uint8_t sub, DataType type, AccessType access, uint8_t flags,
                         uint16_t size, uint8_t *data, const uint8_t *default_value,
                         int64_t min, int64_t max)
{
    subs_[num_subs_++] = cn::SubObject{sub, type, access, flags, size, data, default_value,
                                       min, max};
    objects_[num_objects_ - 1].num_subs++;
}

void TestDictionary::add_pdo_comm(uint16_t index, PdoComm &comm, const uint8_t *cob_id,
                                  const uint8_t *type)
{
    begin(index, ObjectCode::Record);
    add(0, DataType::UInt8, AccessType::ReadOnly, 0, 1, comm.highest_sub, kFive);
    add(1, DataType::UInt32, AccessType::ReadWrite, CN_SUB_NODE_ID_RELATIVE | CN_SUB_PERSIST,
        4, comm.cob_id, cob_id);
    add(2, DataType::UInt8, AccessType::ReadWrite, CN_SUB_PERSIST, 1, comm.type, type);
    add(3, DataType::UInt16, AccessType::ReadWrite, CN_SUB_PERSIST, 2, comm.inhibit);
    add(5, DataType::UInt16, AccessType::ReadWrite, CN_SUB_PERSIST, 2, comm.event_timer);
}

void TestDictionary::add_pdo_map(uint16_t index, PdoMap &map, const uint8_t *count,
                                 const uint8_t *first_entry)
{
    begin(index, ObjectCode::Array);
    add(0, DataType::UInt8, AccessType::ReadWrite, CN_SUB_PERSIST, 1, map.count, count);
    for (uint8_t i = 0; i < 8; i++) {
        add((uint8_t)(i + 1), DataType::UInt32, AccessType::ReadWrite, CN_SUB_PERSIST, 4,
            map.entries[i], i == 0 ? first_entry : nullptr);
    }
}

/* ============================================================================
 * Frame helpers
 * ============================================================================ */

std::vector<cn::Frame> drain(cn::Node &node)
{
    std::vector<cn::Frame> frames;
    cn::Frame frame;
    while (node.pull(&frame) == 0) {
        frames.push_back(frame);
    }
    return frames;
}

std::vector<cn::Frame> drain(cn::Mailbox &mailbox)
{
    std::vector<cn::Frame> frames;
    cn::Frame frame;
    while (mailbox.pull(&frame) == 0) {
        frames.push_back(frame);
    }
    return frames;
}

cn::Frame frame8(uint32_t id, uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3, uint8_t b4,
                 uint8_t b5, uint8_t b6, uint8_t b7)
{
    const uint8_t data[8] = {b0, b1, b2, b3, b4, b5, b6, b7};
    return cn::make_frame(id, data, 8);
}

cn::Frame sdo_request(uint8_t node_id, uint8_t command, uint16_t index, uint8_t sub,
                      uint32_t value)
{
    return frame8(CANOPEN_FC_RSDO + node_id, command, (uint8_t)(index & 0xFF),
                  (uint8_t)(index >> 8), sub, (uint8_t)(value & 0xFF),
                  (uint8_t)((value >> 8) & 0xFF), (uint8_t)((value >> 16) & 0xFF),
                  (uint8_t)(value >> 24));
}

cn::Frame nmt_command(cn::NmtCommand command, uint8_t node_id)
{
    const uint8_t data[2] = {(uint8_t)command, node_id};
    return cn::make_frame(CANOPEN_FC_NMT, data, 2);
}

}  // namespace cn_test
