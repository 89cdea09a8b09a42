/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * NMT slave state machine and heartbeat producer
 */

#include "cn_nmt.h"
#include "cn_log.h"

CN_LOG_MODULE_REGISTER(cn_nmt);

namespace cn {

const char *nmt_state_name(NmtState state)
{
    switch (state) {
    case NmtState::Initialisation:
        return "Initialisation";
    case NmtState::Stopped:
        return "Stopped";
    case NmtState::Operational:
        return "Operational";
    case NmtState::PreOperational:
        return "PreOperational";
    }
    return "Unknown";
}

NmtStateMachine::NmtStateMachine()
    : state_(NmtState::Initialisation), heartbeat_ms_(0), next_heartbeat_us_(0)
{
}

bool NmtStateMachine::parse_command(const Frame &frame, uint8_t node_id,
                                    NmtCommand *command)
{
    if (frame.id != CANOPEN_FC_NMT || frame.extended || frame.rtr || frame.len < 2) {
        return false;
    }

    uint8_t target = frame.data[1];
    if (target != 0 && target != node_id) {
        return false;
    }

    switch (frame.data[0]) {
    case (uint8_t)NmtCommand::Start:
    case (uint8_t)NmtCommand::Stop:
    case (uint8_t)NmtCommand::EnterPreOperational:
    case (uint8_t)NmtCommand::ResetApp:
    case (uint8_t)NmtCommand::ResetComms:
        *command = (NmtCommand)frame.data[0];
        return true;
    default:
        CN_LOG_DBG("NMT: unknown command 0x%02X", frame.data[0]);
        return false;
    }
}

void NmtStateMachine::enter_initialisation()
{
    state_ = NmtState::Initialisation;
    heartbeat_ms_ = 0;
    next_heartbeat_us_ = 0;
}

bool NmtStateMachine::complete_boot()
{
    if (state_ != NmtState::Initialisation) {
        return false;
    }
    state_ = NmtState::PreOperational;
    return true;
}

bool NmtStateMachine::apply(NmtCommand command)
{
    if (state_ == NmtState::Initialisation) {
        return false;
    }

    NmtState next = state_;
    switch (command) {
    case NmtCommand::Start:
        next = NmtState::Operational;
        break;
    case NmtCommand::Stop:
        next = NmtState::Stopped;
        break;
    case NmtCommand::EnterPreOperational:
        next = NmtState::PreOperational;
        break;
    case NmtCommand::ResetApp:
    case NmtCommand::ResetComms:
        return false;
    }

    if (next == state_) {
        return false;
    }

    CN_LOG_INF("NMT: %s -> %s", nmt_state_name(state_), nmt_state_name(next));
    state_ = next;
    return true;
}

void NmtStateMachine::set_heartbeat_period(uint16_t period_ms, uint64_t now_us)
{
    heartbeat_ms_ = period_ms;
    next_heartbeat_us_ = now_us + (uint64_t)period_ms * 1000ULL;
}

bool NmtStateMachine::heartbeat_due(uint64_t now_us)
{
    if (heartbeat_ms_ == 0 || state_ == NmtState::Initialisation) {
        return false;
    }
    if (now_us < next_heartbeat_us_) {
        return false;
    }

    uint64_t period_us = (uint64_t)heartbeat_ms_ * 1000ULL;
    next_heartbeat_us_ += period_us;
    /* Ticks stalled for more than a period: restart the schedule */
    if (next_heartbeat_us_ <= now_us) {
        next_heartbeat_us_ = now_us + period_us;
    }
    return true;
}

Frame NmtStateMachine::heartbeat_frame(uint8_t node_id) const
{
    uint8_t payload = (uint8_t)state_;
    return make_frame(build_cob_id(CANOPEN_FC_HEARTBEAT, node_id), &payload, 1);
}

Frame NmtStateMachine::boot_up_frame(uint8_t node_id)
{
    uint8_t payload = 0;
    return make_frame(build_cob_id(CANOPEN_FC_HEARTBEAT, node_id), &payload, 1);
}

}  // namespace cn
