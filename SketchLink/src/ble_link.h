// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Outcome of a single bounded write on the link.
enum class LinkStatus {
    OK = 0,
    WRITE_ERROR = 1,     // timeout or stack rejected the write, retryable
    DISCONNECTED = 2,    // link is gone, not retryable
    TOO_LONG = 3         // payload exceeds max_write_size()
};

struct Advertisement {
    std::string name;
    uint8_t address[6];
    uint8_t address_type;
    int8_t rssi;
};

/**
 * @brief Device Handle - one discovered and (possibly) connected peripheral
 *
 * Owned by the transport. Characteristic handles are zero until the
 * connection has resolved them.
 */
struct DeviceHandle {
    std::string name;
    uint8_t address[6];
    uint8_t address_type;
    uint16_t mtu;
    uint16_t write_char_handle;
    uint16_t notify_char_handle;    // 0 when the characteristic has no NOTIFY
};

/**
 * @brief BleLink - the write side of a connected GATT characteristic
 *
 * A returned LinkStatus::OK only means the frame was delivered at the link
 * layer. The peripheral never acknowledges that it processed the data.
 */
class BleLink {
public:
    virtual ~BleLink() = default;

    virtual LinkStatus write(const uint8_t* data, size_t len) = 0;
    virtual size_t max_write_size() const = 0;
    virtual bool is_connected() const = 0;
};

/**
 * @brief Source of advertisement reports during a scan
 *
 * next() blocks for at most timeout_ms and returns false when nothing
 * arrived in that time.
 */
class AdvertisementSource {
public:
    virtual ~AdvertisementSource() = default;

    virtual bool next(Advertisement& out, uint32_t timeout_ms) = 0;
};

const char* link_status_name(LinkStatus status);
