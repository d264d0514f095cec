// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "connection_attempt.h"

void ConnectionAttempt::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::PENDING;
}

bool ConnectionAttempt::accept_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::PENDING) {
        return false;
    }
    state_ = State::OPEN;
    return true;
}

void ConnectionAttempt::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::IDLE;
}

ConnectionAttempt::State ConnectionAttempt::abandon() {
    std::lock_guard<std::mutex> lock(mutex_);
    State previous = state_;
    state_ = State::IDLE;
    return previous;
}

ConnectionAttempt::State ConnectionAttempt::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

const char* connection_attempt_state_name(ConnectionAttempt::State state) {
    switch (state) {
    case ConnectionAttempt::State::IDLE:    return "idle";
    case ConnectionAttempt::State::PENDING: return "pending";
    case ConnectionAttempt::State::OPEN:    return "open";
    }
    return "unknown";
}
