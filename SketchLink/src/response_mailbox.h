// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

// Printable ASCII of a notification, trimmed. Other bytes are dropped.
std::string notification_text(const uint8_t* data, size_t len);

/**
 * @brief ResponseMailbox - text notifications received from the projector
 *
 * Filled from the Bluedroid callback task, read by whoever waits for a
 * handshake reply ("OK", "Done"). Holds at most MAX_RESPONSES entries;
 * the oldest is dropped first.
 */
class ResponseMailbox {
public:
    static constexpr size_t MAX_RESPONSES = 32;

    void post(const std::string& text);
    void clear();

    // True once any stored response contains needle (case-insensitive).
    bool contains(const std::string& needle) const;
    bool wait_for(const std::string& needle, uint32_t timeout_ms);

    size_t size() const;

private:
    bool contains_locked(const std::string& needle) const;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<std::string> responses_;
};
