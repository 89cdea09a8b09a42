/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * SDO server
 *
 * One server session over the object dictionary, supporting expedited,
 * segmented, block upload and block download transfers. Requests arrive on
 * 0x600 + node id; responses are queued to the mailbox on 0x580 + node id.
 *
 * Downloads are assembled in the transfer buffer and written to the
 * dictionary in one access after the last frame, so an aborted download
 * never changes a value. Uploads copy the value when the transfer is
 * initiated.
 */

#ifndef CN_SDO_SERVER_H_
#define CN_SDO_SERVER_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"
#include "cn_config.h"
#include "cn_od.h"
#include "cn_mailbox.h"

/* Payload bytes per segment */
#define CN_SDO_SEGMENT_DATA 7

namespace cn {

enum class SdoState : uint8_t {
    Idle,
    DownloadSegmented,
    UploadSegmented,
    BlockDownload,          /**< Receiving sub-block segments */
    BlockDownloadEnd,       /**< Last segment seen, waiting for end request */
    BlockUploadInitiated,   /**< Waiting for the client's start command */
    BlockUploadStreaming,   /**< Sending a sub-block / waiting for its ack */
    BlockUploadEnd,         /**< End sent, waiting for the client's confirmation */
};

/**
 * @brief CRC-16/CCITT as used by block transfers (poly 0x1021, init 0)
 */
uint16_t sdo_crc16(const uint8_t *data, size_t len, uint16_t crc = 0);

class SdoServer {
public:
    SdoServer();

    /**
     * @brief Bind the server to its dictionary and output mailbox
     * @param od Object dictionary served
     * @param mailbox Responses are pushed here
     * @param node_id Own node id, selects the response COB-ID
     * @param timeout_ms Deadline for every expected client frame
     * @return 0 on success, -EINVAL on null arguments
     */
    int init(ObjectDictionary *od, Mailbox *mailbox, uint8_t node_id, uint32_t timeout_ms);

    void set_node_id(uint8_t node_id) { node_id_ = node_id; }

    /**
     * @brief Process one request frame
     */
    void on_request(const Frame &request, uint64_t now_us);

    /**
     * @brief Check the deadline and continue a pending block upload
     */
    void on_tick(uint64_t now_us);

    /**
     * @brief Drop the current session without sending an abort
     */
    void reset();

    SdoState state() const { return state_; }
    bool busy() const { return state_ != SdoState::Idle; }

private:
    void handle_idle(const Frame &request, uint64_t now_us);
    void initiate_download(const Frame &request, uint64_t now_us);
    void initiate_upload(const Frame &request, uint64_t now_us);
    void initiate_block_upload(const Frame &request, uint64_t now_us);
    void initiate_block_download(const Frame &request, uint64_t now_us);
    void download_segment(const Frame &request, uint64_t now_us);
    void upload_segment(const Frame &request, uint64_t now_us);
    void block_download_segment(const Frame &request, uint64_t now_us);
    void block_download_end(const Frame &request);
    void block_upload_start(const Frame &request, uint64_t now_us);
    void block_upload_ack(const Frame &request, uint64_t now_us);
    void block_upload_stream();
    void send_upload_initiate_response(uint64_t now_us);

    SdoAbort check_writable(uint16_t index, uint8_t sub) const;
    void send(const uint8_t data[8]);
    void send_abort(uint16_t index, uint8_t sub, SdoAbort code);
    void abort(SdoAbort code);
    void arm_deadline(uint64_t now_us);

    ObjectDictionary *od_;
    Mailbox *mailbox_;
    uint8_t node_id_;
    uint32_t timeout_ms_;

    SdoState state_;
    uint16_t index_;
    uint8_t sub_;
    bool size_known_;
    size_t size_;           /**< Total transfer size */
    size_t offset_;         /**< Bytes moved so far */
    uint8_t toggle_;
    uint64_t deadline_us_;

    /* Block transfer */
    bool crc_enabled_;
    uint8_t blksize_;
    uint8_t seqno_;         /**< Download: last in-order segment; upload: segments sent */
    uint8_t block_segments_;/**< Upload: segments in the current sub-block */
    bool last_segment_;     /**< Download: segment with c=1 received */

    uint8_t buffer_[CN_SDO_BUFFER_SIZE];
};

}  // namespace cn

#endif /* CN_SDO_SERVER_H_ */
