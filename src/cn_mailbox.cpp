/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * Outgoing frame mailbox implementation
 */

#include "cn_mailbox.h"
#include "cn_log.h"
#include <errno.h>
#include <string.h>

CN_LOG_MODULE_REGISTER(cn_mailbox);

namespace cn {

Mailbox::Mailbox()
    : frames_(), read_idx_(0), write_idx_(0), count_(0), stats_(),
      notify_(nullptr), notify_ctx_(nullptr), mutex_(), mutex_ready_(false)
{
}

Mailbox::~Mailbox()
{
    if (mutex_ready_) {
        cn_mutex_destroy(&mutex_);
    }
}

int Mailbox::init(MailboxNotifyFn notify, void *ctx)
{
    if (!mutex_ready_) {
        int ret = cn_mutex_init(&mutex_);
        if (ret != 0) {
            CN_LOG_ERR("Mailbox: mutex init failed (%d)", ret);
            return ret;
        }
        mutex_ready_ = true;
    }

    MutexGuard lock(&mutex_);
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
    memset(&stats_, 0, sizeof(stats_));
    notify_ = notify;
    notify_ctx_ = ctx;
    return 0;
}

int Mailbox::push(const Frame &frame)
{
    bool became_ready = false;

    {
        MutexGuard lock(&mutex_);

        if (count_ >= CAPACITY) {
            stats_.frames_dropped++;
            CN_LOG_WRN("Mailbox full, dropping frame 0x%03X", (unsigned)frame.id);
            return -ENOSPC;
        }

        frames_[write_idx_] = frame;
        write_idx_ = (write_idx_ + 1) % CAPACITY;
        count_++;

        stats_.frames_pushed++;
        if (count_ > stats_.peak_usage) {
            stats_.peak_usage = (uint32_t)count_;
        }
        became_ready = (count_ == 1);
    }

    if (became_ready && notify_) {
        notify_(notify_ctx_);
    }
    return 0;
}

int Mailbox::pull(Frame *frame)
{
    if (!frame) {
        return -EINVAL;
    }

    MutexGuard lock(&mutex_);

    if (count_ == 0) {
        return -EAGAIN;
    }

    *frame = frames_[read_idx_];
    read_idx_ = (read_idx_ + 1) % CAPACITY;
    count_--;
    stats_.frames_pulled++;
    return 0;
}

size_t Mailbox::count() const
{
    MutexGuard lock(&mutex_);
    return count_;
}

size_t Mailbox::free_slots() const
{
    MutexGuard lock(&mutex_);
    return CAPACITY - count_;
}

uint32_t Mailbox::dropped() const
{
    MutexGuard lock(&mutex_);
    return stats_.frames_dropped;
}

MailboxStats Mailbox::stats() const
{
    MutexGuard lock(&mutex_);
    return stats_;
}

}  // namespace cn
