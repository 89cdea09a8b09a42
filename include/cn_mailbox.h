/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Outgoing frame mailbox
 *
 * Bounded FIFO between the protocol engine (producer) and the application
 * send loop (consumer). Pushing never blocks: a full mailbox drops the new
 * frame and counts it.
 */

#ifndef CN_MAILBOX_H_
#define CN_MAILBOX_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"
#include "cn_config.h"
#include "cn_platform.h"

namespace cn {

/**
 * @brief Called when the mailbox goes from empty to non-empty
 */
typedef void (*MailboxNotifyFn)(void *ctx);

/**
 * @brief Mailbox statistics
 */
struct MailboxStats {
    /** Frames accepted by push() */
    uint32_t frames_pushed;
    /** Frames handed out by pull() */
    uint32_t frames_pulled;
    /** Frames dropped because the mailbox was full */
    uint32_t frames_dropped;
    /** Peak number of queued frames */
    uint32_t peak_usage;
};

class Mailbox {
public:
    static constexpr size_t CAPACITY = CN_TX_QUEUE_CAPACITY;

    Mailbox();
    ~Mailbox();

    Mailbox(const Mailbox &) = delete;
    Mailbox &operator=(const Mailbox &) = delete;

    /**
     * @brief Prepare the mailbox and its lock
     * @param notify Edge notification, may be nullptr
     * @param ctx Passed to notify
     * @return 0 on success, negative errno on failure
     */
    int init(MailboxNotifyFn notify, void *ctx);

    /**
     * @brief Queue a frame
     *
     * The notify callback runs outside the lock, only for the push that
     * made the mailbox non-empty.
     *
     * @return 0 on success, -ENOSPC when full (frame dropped)
     */
    int push(const Frame &frame);

    /**
     * @brief Take the oldest frame
     * @return 0 on success, -EAGAIN when empty
     */
    int pull(Frame *frame);

    size_t count() const;
    size_t free_slots() const;
    uint32_t dropped() const;
    MailboxStats stats() const;

private:
    Frame frames_[CAPACITY];
    size_t read_idx_;
    size_t write_idx_;
    size_t count_;
    MailboxStats stats_;
    MailboxNotifyFn notify_;
    void *notify_ctx_;
    mutable cn_mutex_t mutex_;
    bool mutex_ready_;
};

}  // namespace cn

#endif /* CN_MAILBOX_H_ */
