/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * CANopen (CiA 301) protocol definitions
 *
 * Frame type, function codes, NMT states and commands, SDO command
 * specifiers and abort codes shared by every module of the node.
 */

#ifndef CN_CANOPEN_H_
#define CN_CANOPEN_H_

#include <stdint.h>
#include <stddef.h>
#include <string.h>

/* CANopen Function Codes (bits 7-10 of an 11-bit COB-ID) */
#define CANOPEN_FC_NMT          0x000   /* Network Management */
#define CANOPEN_FC_SYNC         0x080   /* SYNC */
#define CANOPEN_FC_TPDO1        0x180   /* Transmit PDO 1 */
#define CANOPEN_FC_RPDO1        0x200   /* Receive PDO 1 */
#define CANOPEN_FC_TPDO2        0x280   /* Transmit PDO 2 */
#define CANOPEN_FC_RPDO2        0x300   /* Receive PDO 2 */
#define CANOPEN_FC_TPDO3        0x380   /* Transmit PDO 3 */
#define CANOPEN_FC_RPDO3        0x400   /* Receive PDO 3 */
#define CANOPEN_FC_TPDO4        0x480   /* Transmit PDO 4 */
#define CANOPEN_FC_RPDO4        0x500   /* Receive PDO 4 */
#define CANOPEN_FC_TSDO         0x580   /* Transmit SDO (server response) */
#define CANOPEN_FC_RSDO         0x600   /* Receive SDO (client request) */
#define CANOPEN_FC_HEARTBEAT    0x700   /* Heartbeat / boot-up */

/* Standard communication objects */
#define CANOPEN_OBJ_DEVICE_TYPE         0x1000
#define CANOPEN_OBJ_ERROR_REGISTER      0x1001
#define CANOPEN_OBJ_COB_ID_SYNC         0x1005
#define CANOPEN_OBJ_DEVICE_NAME         0x1008
#define CANOPEN_OBJ_STORE_PARAMETERS    0x1010
#define CANOPEN_OBJ_HEARTBEAT_PRODUCER  0x1017
#define CANOPEN_OBJ_IDENTITY            0x1018
#define CANOPEN_OBJ_RPDO_COMM_BASE      0x1400
#define CANOPEN_OBJ_RPDO_MAP_BASE       0x1600
#define CANOPEN_OBJ_TPDO_COMM_BASE      0x1800
#define CANOPEN_OBJ_TPDO_MAP_BASE       0x1A00
#define CANOPEN_COMM_AREA_FIRST         0x1000
#define CANOPEN_COMM_AREA_LAST          0x1FFF

/* "save" written little-endian to 0x1010 */
#define CANOPEN_STORE_SIGNATURE         0x65766173UL

/* COB-ID flag bits used by PDO and SYNC objects */
#define CANOPEN_COB_ID_INVALID          0x80000000UL
#define CANOPEN_COB_ID_NO_RTR           0x40000000UL
#define CANOPEN_COB_ID_EXTENDED         0x20000000UL
#define CANOPEN_COB_ID_STD_MASK         0x000007FFUL
#define CANOPEN_COB_ID_EXT_MASK         0x1FFFFFFFUL

/* Node ID range */
#define CANOPEN_NODE_ID_MIN             1
#define CANOPEN_NODE_ID_MAX             127
#define CANOPEN_NODE_ID_UNCONFIGURED    255

/* SDO client command specifiers (bits 7-5 of byte 0) */
#define CANOPEN_SDO_CCS_DOWNLOAD_SEGMENT    0
#define CANOPEN_SDO_CCS_DOWNLOAD_INITIATE   1
#define CANOPEN_SDO_CCS_UPLOAD_INITIATE     2
#define CANOPEN_SDO_CCS_UPLOAD_SEGMENT      3
#define CANOPEN_SDO_CS_ABORT                4
#define CANOPEN_SDO_CCS_BLOCK_UPLOAD        5
#define CANOPEN_SDO_CCS_BLOCK_DOWNLOAD      6

/* SDO server command specifiers */
#define CANOPEN_SDO_SCS_UPLOAD_SEGMENT      0
#define CANOPEN_SDO_SCS_DOWNLOAD_SEGMENT    1
#define CANOPEN_SDO_SCS_UPLOAD_INITIATE     2
#define CANOPEN_SDO_SCS_DOWNLOAD_INITIATE   3
#define CANOPEN_SDO_SCS_BLOCK_DOWNLOAD      5
#define CANOPEN_SDO_SCS_BLOCK_UPLOAD        6

/* Block transfer sub-commands (bits 1-0 of byte 0) */
#define CANOPEN_SDO_BLOCK_INITIATE          0
#define CANOPEN_SDO_BLOCK_END               1
#define CANOPEN_SDO_BLOCK_ACK               2
#define CANOPEN_SDO_BLOCK_START             3

namespace cn {

/**
 * @brief CAN frame as handed to and taken from the node
 */
struct Frame {
    uint32_t id;        /**< 11-bit or 29-bit identifier */
    bool extended;      /**< 29-bit identifier */
    bool rtr;           /**< Remote transmission request */
    uint8_t len;        /**< Payload length, 0-8 */
    uint8_t data[8];    /**< Payload, unused bytes zero */
};

/**
 * @brief Build a standard-identifier frame
 */
inline Frame make_frame(uint32_t id, const uint8_t *data, uint8_t len)
{
    Frame frame = {};
    frame.id = id;
    frame.len = len > 8 ? 8 : len;
    if (data && frame.len) {
        memcpy(frame.data, data, frame.len);
    }
    return frame;
}

/**
 * @brief NMT states, encoded as in the heartbeat frame
 */
enum class NmtState : uint8_t {
    Initialisation = 0,
    Stopped = 4,
    Operational = 5,
    PreOperational = 127,
};

/**
 * @brief NMT command specifiers
 */
enum class NmtCommand : uint8_t {
    Start = 1,
    Stop = 2,
    EnterPreOperational = 128,
    ResetApp = 129,
    ResetComms = 130,
};

/**
 * @brief SDO abort codes (CiA 301, table 22)
 *
 * Used as the result type of every dictionary access; Ok means success.
 */
enum class SdoAbort : uint32_t {
    Ok = 0,
    ToggleNotAlternated = 0x05030000,
    SdoTimeout = 0x05040000,
    InvalidCommandSpecifier = 0x05040001,
    InvalidBlockSize = 0x05040002,
    InvalidSequenceNumber = 0x05040003,
    CrcError = 0x05040004,
    OutOfMemory = 0x05040005,
    UnsupportedAccess = 0x06010000,
    WriteOnly = 0x06010001,
    ReadOnly = 0x06010002,
    ObjectDoesNotExist = 0x06020000,
    CannotMapToPdo = 0x06040041,
    PdoLengthExceeded = 0x06040042,
    GeneralParameterIncompatibility = 0x06040043,
    GeneralInternalIncompatibility = 0x06040047,
    HardwareError = 0x06060000,
    DataTypeMismatch = 0x06070010,
    LengthTooHigh = 0x06070012,
    LengthTooLow = 0x06070013,
    SubIndexDoesNotExist = 0x06090011,
    InvalidValue = 0x06090030,
    ValueTooHigh = 0x06090031,
    ValueTooLow = 0x06090032,
    GeneralError = 0x08000000,
    DataCannotBeTransferred = 0x08000020,
    LocalControl = 0x08000021,
    DeviceState = 0x08000022,
};

/**
 * @brief Abort code as carried in bytes 4-7 of an abort frame
 */
inline uint32_t abort_code_value(SdoAbort abort)
{
    return static_cast<uint32_t>(abort);
}

/* Utility functions for COB-ID construction */
inline uint32_t build_cob_id(uint32_t function_code, uint8_t node_id)
{
    return function_code + node_id;
}

inline bool node_id_is_configured(uint8_t node_id)
{
    return node_id >= CANOPEN_NODE_ID_MIN && node_id <= CANOPEN_NODE_ID_MAX;
}

}  // namespace cn

#endif /* CN_CANOPEN_H_ */
