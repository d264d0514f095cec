// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Records every write attempt; attempts listed in `failures` return the
// scripted status instead of being delivered.
class FakeBleLink : public BleLink {
public:
    explicit FakeBleLink(size_t max_write = 244) : max_write_(max_write), connected_(true) {}

    LinkStatus write(const uint8_t* data, size_t len) override {
        size_t attempt;
        LinkStatus status = LinkStatus::OK;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = attempts.size();
            attempts.emplace_back(data, data + len);
            auto it = failures.find(attempt);
            if (!connected_) {
                status = LinkStatus::DISCONNECTED;
            } else if (len > max_write_) {
                status = LinkStatus::TOO_LONG;
            } else if (it != failures.end()) {
                status = it->second;
            } else {
                received.insert(received.end(), data, data + len);
                delivered.emplace_back(data, data + len);
            }
        }
        if (on_write) {
            on_write(attempt, status);
        }
        return status;
    }

    size_t max_write_size() const override { return connected_ ? max_write_ : 0; }
    bool is_connected() const override { return connected_; }

    void set_connected(bool connected) { connected_ = connected; }

    std::vector<std::vector<uint8_t>> attempts;     // every call, in order
    std::vector<std::vector<uint8_t>> delivered;    // calls that returned OK
    std::vector<uint8_t> received;                  // concatenated delivered bytes
    std::map<size_t, LinkStatus> failures;          // attempt index -> status
    std::function<void(size_t attempt, LinkStatus status)> on_write;

private:
    std::mutex mutex_;
    size_t max_write_;
    bool connected_;
};

// Hands out queued advertisements, then reports silence for the whole
// requested timeout like a real scanner would.
class FakeAdvertisementSource : public AdvertisementSource {
public:
    void add(const std::string& name, uint8_t last_address_byte, int8_t rssi = -60) {
        Advertisement adv;
        adv.name = name;
        for (int i = 0; i < 6; ++i) {
            adv.address[i] = static_cast<uint8_t>(0xA0 + i);
        }
        adv.address[5] = last_address_byte;
        adv.address_type = 0;
        adv.rssi = rssi;
        queue_.push_back(adv);
    }

    bool next(Advertisement& out, uint32_t timeout_ms) override {
        polls++;
        if (queue_.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return false;
        }
        out = queue_.front();
        queue_.pop_front();
        return true;
    }

    size_t polls = 0;

private:
    std::deque<Advertisement> queue_;
};
