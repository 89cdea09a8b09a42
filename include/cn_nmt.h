/*
 * Copyright (c) 2026 CANopen Node
 * SPDX-License-Identifier: Apache-2.0
 *
 * NMT slave state machine and heartbeat producer
 */

#ifndef CN_NMT_H_
#define CN_NMT_H_

#include <stdint.h>
#include <stddef.h>
#include "cn_canopen.h"

namespace cn {

class NmtStateMachine {
public:
    NmtStateMachine();

    NmtState state() const { return state_; }

    /**
     * @brief Decode an NMT command frame (COB-ID 0x000)
     *
     * @param frame Received frame
     * @param node_id Own node id, commands for other nodes are rejected
     * @param command Output: decoded command
     * @return true when the frame is a command addressed to this node
     *         (directly or by broadcast)
     */
    static bool parse_command(const Frame &frame, uint8_t node_id, NmtCommand *command);

    /**
     * @brief Enter Initialisation (power-on and both resets)
     */
    void enter_initialisation();

    /**
     * @brief Leave Initialisation for PreOperational
     * @return true if the node was in Initialisation
     */
    bool complete_boot();

    /**
     * @brief Apply a state command (Start, Stop, EnterPreOperational)
     *
     * Reset commands and every command received in Initialisation are
     * not state changes and return false.
     *
     * @return true if the state changed
     */
    bool apply(NmtCommand command);

    /**
     * @brief Set the heartbeat producer time
     * @param period_ms Period in milliseconds, 0 disables the heartbeat
     * @param now_us Current time, the first heartbeat is one period later
     */
    void set_heartbeat_period(uint16_t period_ms, uint64_t now_us);
    uint16_t heartbeat_period() const { return heartbeat_ms_; }

    /**
     * @brief Check whether a heartbeat is due and schedule the next one
     */
    bool heartbeat_due(uint64_t now_us);

    Frame heartbeat_frame(uint8_t node_id) const;
    static Frame boot_up_frame(uint8_t node_id);

private:
    NmtState state_;
    uint16_t heartbeat_ms_;
    uint64_t next_heartbeat_us_;
};

const char *nmt_state_name(NmtState state);

}  // namespace cn

#endif /* CN_NMT_H_ */
