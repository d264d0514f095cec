// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "response_mailbox.h"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace {

std::string lowercase(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string notification_text(const uint8_t* data, size_t len) {
    std::string text;
    for (size_t i = 0; i < len; ++i) {
        if (data[i] >= 0x20 && data[i] < 0x7F) {
            text.push_back(static_cast<char>(data[i]));
        } else if (data[i] == '\n' || data[i] == '\r' || data[i] == '\t') {
            text.push_back(' ');
        }
    }
    size_t first = text.find_first_not_of(' ');
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(' ');
    return text.substr(first, last - first + 1);
}

void ResponseMailbox::post(const std::string& text) {
    if (text.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (responses_.size() >= MAX_RESPONSES) {
            responses_.pop_front();
        }
        responses_.push_back(text);
    }
    cond_.notify_all();
}

void ResponseMailbox::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.clear();
}

bool ResponseMailbox::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contains_locked(needle);
}

bool ResponseMailbox::wait_for(const std::string& needle, uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cond_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this, &needle] { return contains_locked(needle); });
}

size_t ResponseMailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

bool ResponseMailbox::contains_locked(const std::string& needle) const {
    const std::string wanted = lowercase(needle);
    for (const auto& response : responses_) {
        if (lowercase(response).find(wanted) != std::string::npos) {
            return true;
        }
    }
    return false;
}
