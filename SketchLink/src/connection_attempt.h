// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <cstdint>
#include <mutex>

/**
 * @brief ConnectionAttempt - ownership of one pending GATT open
 *
 * The caller waits for the open with a timeout while the stack reports it
 * from its own task, so either side can act first:
 * - open arrives while PENDING: accepted, state becomes OPEN
 * - caller gives up first: state returns to IDLE and a later open is
 *   refused, so the link it created must be closed by the stack task
 * - caller gives up after the open: abandon() returns OPEN and the caller
 *   closes the link itself
 */
class ConnectionAttempt {
public:
    enum class State : uint8_t {
        IDLE = 0,
        PENDING = 1,
        OPEN = 2
    };

    ConnectionAttempt() : state_(State::IDLE) {}

    void begin();

    // From the stack task. False means nobody is waiting for this link.
    bool accept_open();

    // Connect finished; the link (if any) now belongs to the connection.
    void complete();

    // Connect failed or timed out. Returns the state at the moment of
    // giving up.
    State abandon();

    State state() const;

private:
    mutable std::mutex mutex_;
    State state_;
};

const char* connection_attempt_state_name(ConnectionAttempt::State state);
