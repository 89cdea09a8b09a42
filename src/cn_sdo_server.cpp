/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * SDO server implementation (CiA 301 section 7.2.4)
 */

#include "cn_sdo_server.h"
#include "cn_bytes.h"
#include "cn_log.h"
#include <errno.h>
#include <string.h>

CN_LOG_MODULE_REGISTER(cn_sdo);

#define SDO_CS(cs)                 ((uint8_t)((cs) << 5))

/* Byte 0 of an abort frame, both directions */
#define SDO_ABORT_COMMAND          SDO_CS(CANOPEN_SDO_CS_ABORT)

/* Server responses */
#define SDO_FLAG_SIZE              0x01
#define SDO_FLAG_EXPEDITED         0x02
#define SDO_BLOCK_FLAG_SIZE        0x02
#define SDO_BLOCK_FLAG_CRC         0x04

#define SDO_RESP_DOWNLOAD_INITIATE SDO_CS(CANOPEN_SDO_SCS_DOWNLOAD_INITIATE)
#define SDO_RESP_DOWNLOAD_SEGMENT  SDO_CS(CANOPEN_SDO_SCS_DOWNLOAD_SEGMENT)
#define SDO_RESP_UPLOAD_SEGMENT    SDO_CS(CANOPEN_SDO_SCS_UPLOAD_SEGMENT)
#define SDO_RESP_UPLOAD_EXPEDITED  (SDO_CS(CANOPEN_SDO_SCS_UPLOAD_INITIATE) | \
                                    SDO_FLAG_EXPEDITED | SDO_FLAG_SIZE)
#define SDO_RESP_UPLOAD_SEGMENTED  (SDO_CS(CANOPEN_SDO_SCS_UPLOAD_INITIATE) | SDO_FLAG_SIZE)
#define SDO_RESP_BLOCK_DL_INITIATE (SDO_CS(CANOPEN_SDO_SCS_BLOCK_DOWNLOAD) | \
                                    SDO_BLOCK_FLAG_CRC | CANOPEN_SDO_BLOCK_INITIATE)
#define SDO_RESP_BLOCK_DL_ACK      (SDO_CS(CANOPEN_SDO_SCS_BLOCK_DOWNLOAD) | CANOPEN_SDO_BLOCK_ACK)
#define SDO_RESP_BLOCK_DL_END      (SDO_CS(CANOPEN_SDO_SCS_BLOCK_DOWNLOAD) | CANOPEN_SDO_BLOCK_END)
#define SDO_RESP_BLOCK_UL_INITIATE (SDO_CS(CANOPEN_SDO_SCS_BLOCK_UPLOAD) | SDO_BLOCK_FLAG_CRC | \
                                    SDO_BLOCK_FLAG_SIZE | CANOPEN_SDO_BLOCK_INITIATE)
#define SDO_RESP_BLOCK_UL_END      (SDO_CS(CANOPEN_SDO_SCS_BLOCK_UPLOAD) | CANOPEN_SDO_BLOCK_END)

namespace cn {

uint16_t sdo_crc16(const uint8_t *data, size_t len, uint16_t crc)
{
    for (size_t i = 0; i < len; i++) {
        crc ^= (uint16_t)data[i] << 8;
        for (int bit = 0; bit < 8; bit++) {
            if (crc & 0x8000) {
                crc = (uint16_t)((crc << 1) ^ 0x1021);
            } else {
                crc = (uint16_t)(crc << 1);
            }
        }
    }
    return crc;
}

static inline uint8_t command_specifier(uint8_t b0)
{
    return b0 >> 5;
}

static bool is_initiate(uint8_t b0)
{
    switch (command_specifier(b0)) {
    case CANOPEN_SDO_CCS_DOWNLOAD_INITIATE:
    case CANOPEN_SDO_CCS_UPLOAD_INITIATE:
        return true;
    case CANOPEN_SDO_CCS_BLOCK_UPLOAD:
        return (b0 & 0x03) == CANOPEN_SDO_BLOCK_INITIATE;
    case CANOPEN_SDO_CCS_BLOCK_DOWNLOAD:
        return (b0 & 0x01) == CANOPEN_SDO_BLOCK_INITIATE;
    default:
        return false;
    }
}

static void put_multiplexer(uint8_t *resp, uint16_t index, uint8_t sub)
{
    bytes::put_u16(&resp[1], index);
    resp[3] = sub;
}

SdoServer::SdoServer()
    : od_(nullptr), mailbox_(nullptr), node_id_(0), timeout_ms_(CN_SDO_TIMEOUT_MS),
      state_(SdoState::Idle), index_(0), sub_(0), size_known_(false), size_(0),
      offset_(0), toggle_(0), deadline_us_(0), crc_enabled_(false), blksize_(0),
      seqno_(0), block_segments_(0), last_segment_(false), buffer_()
{
}

int SdoServer::init(ObjectDictionary *od, Mailbox *mailbox, uint8_t node_id,
                    uint32_t timeout_ms)
{
    if (!od || !mailbox) {
        return -EINVAL;
    }

    od_ = od;
    mailbox_ = mailbox;
    node_id_ = node_id;
    timeout_ms_ = timeout_ms ? timeout_ms : CN_SDO_TIMEOUT_MS;
    reset();
    return 0;
}

void SdoServer::reset()
{
    state_ = SdoState::Idle;
    size_known_ = false;
    size_ = 0;
    offset_ = 0;
    toggle_ = 0;
    seqno_ = 0;
    block_segments_ = 0;
    last_segment_ = false;
}

/* ============================================================================
 * Output helpers
 * ============================================================================ */

void SdoServer::send(const uint8_t data[8])
{
    Frame frame = make_frame(build_cob_id(CANOPEN_FC_TSDO, node_id_), data, 8);
    if (mailbox_->push(frame) != 0) {
        CN_LOG_WRN("SDO: response 0x%02X for 0x%04X:%u dropped", data[0], index_, sub_);
    }
}

void SdoServer::send_abort(uint16_t index, uint8_t sub, SdoAbort code)
{
    uint8_t resp[8] = {SDO_ABORT_COMMAND};
    put_multiplexer(resp, index, sub);
    bytes::put_u32(&resp[4], abort_code_value(code));
    send(resp);
}

void SdoServer::abort(SdoAbort code)
{
    CN_LOG_INF("SDO: abort 0x%04X:%u code 0x%08X", index_, sub_,
               (unsigned)abort_code_value(code));
    send_abort(index_, sub_, code);
    reset();
}

void SdoServer::arm_deadline(uint64_t now_us)
{
    deadline_us_ = now_us + (uint64_t)timeout_ms_ * 1000ULL;
}

SdoAbort SdoServer::check_writable(uint16_t index, uint8_t sub) const
{
    if (!od_->find_object(index)) {
        return SdoAbort::ObjectDoesNotExist;
    }
    const SubObject *entry = od_->find(index, sub);
    if (!entry) {
        return SdoAbort::SubIndexDoesNotExist;
    }
    if (entry->access == AccessType::ReadOnly || entry->access == AccessType::Const) {
        return SdoAbort::ReadOnly;
    }
    return SdoAbort::Ok;
}

/* ============================================================================
 * Dispatch
 * ============================================================================ */

void SdoServer::on_request(const Frame &request, uint64_t now_us)
{
    if (request.len < 8) {
        CN_LOG_DBG("SDO: ignoring short request (%u bytes)", request.len);
        return;
    }

    uint8_t b0 = request.data[0];
    uint8_t cs = command_specifier(b0);

    if (b0 == SDO_ABORT_COMMAND) {
        if (busy()) {
            CN_LOG_INF("SDO: client aborted 0x%04X:%u (0x%08X)", index_, sub_,
                       (unsigned)bytes::get_u32(&request.data[4]));
            reset();
        }
        return;
    }

    switch (state_) {
    case SdoState::Idle:
        handle_idle(request, now_us);
        return;

    case SdoState::DownloadSegmented:
        if (cs == CANOPEN_SDO_CCS_DOWNLOAD_SEGMENT) {
            download_segment(request, now_us);
            return;
        }
        break;

    case SdoState::UploadSegmented:
        if (cs == CANOPEN_SDO_CCS_UPLOAD_SEGMENT) {
            upload_segment(request, now_us);
            return;
        }
        break;

    case SdoState::BlockDownload:
        /* Every frame in a sub-block is a sequenced segment */
        block_download_segment(request, now_us);
        return;

    case SdoState::BlockDownloadEnd:
        if (cs == CANOPEN_SDO_CCS_BLOCK_DOWNLOAD && (b0 & 0x01) == CANOPEN_SDO_BLOCK_END) {
            block_download_end(request);
            return;
        }
        break;

    case SdoState::BlockUploadInitiated:
        if (cs == CANOPEN_SDO_CCS_BLOCK_UPLOAD && (b0 & 0x03) == CANOPEN_SDO_BLOCK_START) {
            block_upload_start(request, now_us);
            return;
        }
        break;

    case SdoState::BlockUploadStreaming:
        if (cs == CANOPEN_SDO_CCS_BLOCK_UPLOAD && (b0 & 0x03) == CANOPEN_SDO_BLOCK_ACK) {
            block_upload_ack(request, now_us);
            return;
        }
        break;

    case SdoState::BlockUploadEnd:
        if (cs == CANOPEN_SDO_CCS_BLOCK_UPLOAD && (b0 & 0x03) == CANOPEN_SDO_BLOCK_END) {
            CN_LOG_DBG("SDO: block upload of 0x%04X:%u complete", index_, sub_);
            reset();
            return;
        }
        break;
    }

    /* Only one session: a second initiate is refused, not queued */
    if (is_initiate(b0)) {
        abort(SdoAbort::GeneralError);
    } else {
        abort(SdoAbort::InvalidCommandSpecifier);
    }
}

void SdoServer::handle_idle(const Frame &request, uint64_t now_us)
{
    uint8_t b0 = request.data[0];

    switch (command_specifier(b0)) {
    case CANOPEN_SDO_CCS_DOWNLOAD_INITIATE:
        initiate_download(request, now_us);
        return;
    case CANOPEN_SDO_CCS_UPLOAD_INITIATE:
        initiate_upload(request, now_us);
        return;
    case CANOPEN_SDO_CCS_BLOCK_UPLOAD:
        if ((b0 & 0x03) == CANOPEN_SDO_BLOCK_INITIATE) {
            initiate_block_upload(request, now_us);
            return;
        }
        break;
    case CANOPEN_SDO_CCS_BLOCK_DOWNLOAD:
        if ((b0 & 0x01) == CANOPEN_SDO_BLOCK_INITIATE) {
            initiate_block_download(request, now_us);
            return;
        }
        break;
    default:
        break;
    }

    /* No session: a segment or sub-command carries no multiplexer */
    send_abort(0, 0, SdoAbort::InvalidCommandSpecifier);
}

/* ============================================================================
 * Expedited and segmented download
 * ============================================================================ */

void SdoServer::initiate_download(const Frame &request, uint64_t now_us)
{
    const uint8_t *data = request.data;
    bool expedited = (data[0] & SDO_FLAG_EXPEDITED) != 0;
    bool size_indicated = (data[0] & SDO_FLAG_SIZE) != 0;
    uint8_t unused = (data[0] >> 2) & 0x03;

    index_ = bytes::get_u16(&data[1]);
    sub_ = data[3];

    if (expedited) {
        size_t len = 4;
        if (size_indicated) {
            len = 4 - unused;
        } else {
            const SubObject *entry = od_->find(index_, sub_);
            if (entry && entry->size < 4) {
                len = entry->size;
            }
        }

        SdoAbort ret = od_->write(index_, sub_, &data[4], len);
        if (ret != SdoAbort::Ok) {
            abort(ret);
            return;
        }

        uint8_t resp[8] = {SDO_RESP_DOWNLOAD_INITIATE};
        put_multiplexer(resp, index_, sub_);
        reset();
        send(resp);
        return;
    }

    SdoAbort ret = check_writable(index_, sub_);
    if (ret != SdoAbort::Ok) {
        abort(ret);
        return;
    }

    size_known_ = size_indicated;
    size_ = size_indicated ? bytes::get_u32(&data[4]) : 0;
    if (size_known_ && size_ > CN_SDO_BUFFER_SIZE) {
        abort(SdoAbort::OutOfMemory);
        return;
    }

    offset_ = 0;
    toggle_ = 0;
    state_ = SdoState::DownloadSegmented;
    arm_deadline(now_us);

    uint8_t resp[8] = {SDO_RESP_DOWNLOAD_INITIATE};
    put_multiplexer(resp, index_, sub_);
    send(resp);
}

void SdoServer::download_segment(const Frame &request, uint64_t now_us)
{
    const uint8_t *data = request.data;
    uint8_t toggle = (data[0] >> 4) & 0x01;
    size_t count = CN_SDO_SEGMENT_DATA - ((data[0] >> 1) & 0x07);
    bool last = (data[0] & 0x01) != 0;

    if (toggle != toggle_) {
        abort(SdoAbort::ToggleNotAlternated);
        return;
    }
    if (offset_ + count > CN_SDO_BUFFER_SIZE) {
        abort(SdoAbort::OutOfMemory);
        return;
    }
    if (size_known_ && offset_ + count > size_) {
        abort(SdoAbort::LengthTooHigh);
        return;
    }

    memcpy(&buffer_[offset_], &data[1], count);
    offset_ += count;

    uint8_t resp[8] = {(uint8_t)(SDO_RESP_DOWNLOAD_SEGMENT | (toggle_ << 4))};
    toggle_ ^= 1;

    if (last) {
        if (size_known_ && offset_ != size_) {
            abort(SdoAbort::LengthTooLow);
            return;
        }
        SdoAbort ret = od_->write(index_, sub_, buffer_, offset_);
        if (ret != SdoAbort::Ok) {
            abort(ret);
            return;
        }
        reset();
    } else {
        arm_deadline(now_us);
    }

    send(resp);
}

/* ============================================================================
 * Expedited and segmented upload
 * ============================================================================ */

void SdoServer::initiate_upload(const Frame &request, uint64_t now_us)
{
    index_ = bytes::get_u16(&request.data[1]);
    sub_ = request.data[3];

    size_t len = 0;
    SdoAbort ret = od_->read(index_, sub_, buffer_, sizeof(buffer_), &len);
    if (ret != SdoAbort::Ok) {
        abort(ret);
        return;
    }

    size_ = len;
    offset_ = 0;
    toggle_ = 0;
    send_upload_initiate_response(now_us);
}

void SdoServer::send_upload_initiate_response(uint64_t now_us)
{
    uint8_t resp[8] = {0};
    put_multiplexer(resp, index_, sub_);

    if (size_ > 0 && size_ <= 4) {
        resp[0] = (uint8_t)(SDO_RESP_UPLOAD_EXPEDITED | ((4 - size_) << 2));
        memcpy(&resp[4], buffer_, size_);
        reset();
    } else {
        resp[0] = SDO_RESP_UPLOAD_SEGMENTED;
        bytes::put_u32(&resp[4], (uint32_t)size_);
        state_ = SdoState::UploadSegmented;
        arm_deadline(now_us);
    }

    send(resp);
}

void SdoServer::upload_segment(const Frame &request, uint64_t now_us)
{
    uint8_t toggle = (request.data[0] >> 4) & 0x01;
    if (toggle != toggle_) {
        abort(SdoAbort::ToggleNotAlternated);
        return;
    }

    size_t count = size_ - offset_;
    if (count > CN_SDO_SEGMENT_DATA) {
        count = CN_SDO_SEGMENT_DATA;
    }
    bool last = offset_ + count >= size_;

    uint8_t resp[8] = {0};
    resp[0] = (uint8_t)(SDO_RESP_UPLOAD_SEGMENT | (toggle_ << 4) |
                        ((CN_SDO_SEGMENT_DATA - count) << 1) | (last ? 1 : 0));
    memcpy(&resp[1], &buffer_[offset_], count);

    offset_ += count;
    toggle_ ^= 1;

    if (last) {
        reset();
    } else {
        arm_deadline(now_us);
    }

    send(resp);
}

/* ============================================================================
 * Block upload
 * ============================================================================ */

static uint8_t segments_for(size_t remaining, uint8_t blksize)
{
    size_t segments = remaining == 0 ? 1 : (remaining + CN_SDO_SEGMENT_DATA - 1) /
                                               CN_SDO_SEGMENT_DATA;
    return (uint8_t)(segments < blksize ? segments : blksize);
}

void SdoServer::initiate_block_upload(const Frame &request, uint64_t now_us)
{
    const uint8_t *data = request.data;
    bool crc = (data[0] & SDO_BLOCK_FLAG_CRC) != 0;
    uint8_t blksize = data[4];
    uint8_t pst = data[5];

    index_ = bytes::get_u16(&data[1]);
    sub_ = data[3];

    if (blksize == 0 || blksize > 127) {
        abort(SdoAbort::InvalidBlockSize);
        return;
    }

    size_t len = 0;
    SdoAbort ret = od_->read(index_, sub_, buffer_, sizeof(buffer_), &len);
    if (ret != SdoAbort::Ok) {
        abort(ret);
        return;
    }

    size_ = len;
    offset_ = 0;
    toggle_ = 0;

    /* Protocol switch: small values go back to a normal upload */
    if (pst != 0 && size_ <= pst) {
        send_upload_initiate_response(now_us);
        return;
    }

    crc_enabled_ = crc;
    blksize_ = blksize;
    seqno_ = 0;
    state_ = SdoState::BlockUploadInitiated;
    arm_deadline(now_us);

    uint8_t resp[8] = {SDO_RESP_BLOCK_UL_INITIATE};
    put_multiplexer(resp, index_, sub_);
    bytes::put_u32(&resp[4], (uint32_t)size_);
    send(resp);
}

void SdoServer::block_upload_start(const Frame &request, uint64_t now_us)
{
    (void)request;
    state_ = SdoState::BlockUploadStreaming;
    seqno_ = 0;
    block_segments_ = segments_for(size_ - offset_, blksize_);
    arm_deadline(now_us);
    block_upload_stream();
}

void SdoServer::block_upload_stream()
{
    while (seqno_ < block_segments_ && mailbox_->free_slots() > 0) {
        size_t pos = offset_ + (size_t)seqno_ * CN_SDO_SEGMENT_DATA;
        size_t count = 0;
        if (pos < size_) {
            count = size_ - pos;
            if (count > CN_SDO_SEGMENT_DATA) {
                count = CN_SDO_SEGMENT_DATA;
            }
        }
        bool last = pos + count >= size_;

        uint8_t seg[8] = {0};
        seg[0] = (uint8_t)((last ? 0x80 : 0x00) | (seqno_ + 1));
        if (count > 0) {
            memcpy(&seg[1], &buffer_[pos], count);
        }
        send(seg);
        seqno_++;
    }
}

void SdoServer::block_upload_ack(const Frame &request, uint64_t now_us)
{
    uint8_t ackseq = request.data[1];
    uint8_t next_blksize = request.data[2];

    if (ackseq > seqno_) {
        abort(SdoAbort::InvalidSequenceNumber);
        return;
    }

    bool block_has_last =
        offset_ + (size_t)block_segments_ * CN_SDO_SEGMENT_DATA >= size_;

    if (block_has_last && ackseq == block_segments_) {
        uint8_t unused = (uint8_t)((CN_SDO_SEGMENT_DATA - size_ % CN_SDO_SEGMENT_DATA) %
                                   CN_SDO_SEGMENT_DATA);
        if (size_ == 0) {
            unused = CN_SDO_SEGMENT_DATA;
        }

        uint8_t resp[8] = {(uint8_t)(SDO_RESP_BLOCK_UL_END | (unused << 2))};
        uint16_t crc = crc_enabled_ ? sdo_crc16(buffer_, size_) : 0;
        bytes::put_u16(&resp[1], crc);

        offset_ = size_;
        state_ = SdoState::BlockUploadEnd;
        arm_deadline(now_us);
        send(resp);
        return;
    }

    if (next_blksize == 0 || next_blksize > 127) {
        abort(SdoAbort::InvalidBlockSize);
        return;
    }

    /* Segments after ackseq are resent as the start of the next sub-block */
    offset_ += (size_t)ackseq * CN_SDO_SEGMENT_DATA;
    if (offset_ > size_) {
        offset_ = size_;
    }
    if (ackseq < block_segments_) {
        CN_LOG_DBG("SDO: block upload resending from segment %u", ackseq + 1);
    }

    blksize_ = next_blksize;
    seqno_ = 0;
    block_segments_ = segments_for(size_ - offset_, blksize_);
    arm_deadline(now_us);
    block_upload_stream();
}

/* ============================================================================
 * Block download
 * ============================================================================ */

void SdoServer::initiate_block_download(const Frame &request, uint64_t now_us)
{
    const uint8_t *data = request.data;
    bool crc = (data[0] & SDO_BLOCK_FLAG_CRC) != 0;
    bool size_indicated = (data[0] & SDO_BLOCK_FLAG_SIZE) != 0;

    index_ = bytes::get_u16(&data[1]);
    sub_ = data[3];

    SdoAbort ret = check_writable(index_, sub_);
    if (ret != SdoAbort::Ok) {
        abort(ret);
        return;
    }

    size_known_ = size_indicated;
    size_ = size_indicated ? bytes::get_u32(&data[4]) : 0;
    if (size_known_ && size_ > CN_SDO_BUFFER_SIZE) {
        abort(SdoAbort::OutOfMemory);
        return;
    }

    size_t max_block = CN_SDO_BUFFER_SIZE / CN_SDO_SEGMENT_DATA;
    crc_enabled_ = crc;
    blksize_ = (uint8_t)(max_block < CN_SDO_BLOCK_SIZE ? max_block : CN_SDO_BLOCK_SIZE);
    offset_ = 0;
    seqno_ = 0;
    last_segment_ = false;
    state_ = SdoState::BlockDownload;
    arm_deadline(now_us);

    uint8_t resp[8] = {SDO_RESP_BLOCK_DL_INITIATE};
    put_multiplexer(resp, index_, sub_);
    resp[4] = blksize_;
    send(resp);
}

void SdoServer::block_download_segment(const Frame &request, uint64_t now_us)
{
    const uint8_t *data = request.data;
    uint8_t seq = data[0] & 0x7F;
    bool last = (data[0] & 0x80) != 0;

    if (seq == 0 || seq > blksize_) {
        abort(SdoAbort::InvalidSequenceNumber);
        return;
    }

    if (seq == seqno_ + 1) {
        size_t room = CN_SDO_BUFFER_SIZE - offset_;
        if (room == 0 || (room < CN_SDO_SEGMENT_DATA && !last)) {
            abort(SdoAbort::OutOfMemory);
            return;
        }
        memcpy(&buffer_[offset_], &data[1],
               room < CN_SDO_SEGMENT_DATA ? room : CN_SDO_SEGMENT_DATA);
        /* Counts the padding of the last segment, removed at the end request */
        offset_ += CN_SDO_SEGMENT_DATA;
        seqno_ = seq;
        if (last) {
            last_segment_ = true;
        }
        arm_deadline(now_us);
    } else {
        CN_LOG_DBG("SDO: block segment %u out of sequence (expected %u)", seq, seqno_ + 1);
    }

    /* End of the client's sub-block: acknowledge the last in-order segment */
    if (last || seq == blksize_) {
        uint8_t resp[8] = {SDO_RESP_BLOCK_DL_ACK};
        resp[1] = seqno_;
        resp[2] = blksize_;
        seqno_ = 0;
        if (last_segment_) {
            state_ = SdoState::BlockDownloadEnd;
        }
        send(resp);
    }
}

void SdoServer::block_download_end(const Frame &request)
{
    uint8_t unused = (request.data[0] >> 2) & 0x07;
    if (unused > offset_) {
        abort(SdoAbort::GeneralError);
        return;
    }

    size_t total = offset_ - unused;
    if (total > CN_SDO_BUFFER_SIZE) {
        abort(SdoAbort::OutOfMemory);
        return;
    }
    if (size_known_ && total != size_) {
        abort(total > size_ ? SdoAbort::LengthTooHigh : SdoAbort::LengthTooLow);
        return;
    }
    if (crc_enabled_) {
        uint16_t crc = bytes::get_u16(&request.data[1]);
        if (sdo_crc16(buffer_, total) != crc) {
            abort(SdoAbort::CrcError);
            return;
        }
    }

    SdoAbort ret = od_->write(index_, sub_, buffer_, total);
    if (ret != SdoAbort::Ok) {
        abort(ret);
        return;
    }

    uint8_t resp[8] = {SDO_RESP_BLOCK_DL_END};
    reset();
    send(resp);
}

/* ============================================================================
 * Deadline
 * ============================================================================ */

void SdoServer::on_tick(uint64_t now_us)
{
    if (state_ == SdoState::Idle) {
        return;
    }

    if (now_us >= deadline_us_) {
        CN_LOG_WRN("SDO: transfer of 0x%04X:%u timed out", index_, sub_);
        abort(SdoAbort::SdoTimeout);
        return;
    }

    if (state_ == SdoState::BlockUploadStreaming) {
        block_upload_stream();
    }
}

}  // namespace cn
