// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "device_scanner.h"
#include <cctype>
#include <chrono>
#include <cstring>

std::string normalize_device_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '_' || c == '-') {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool device_name_matches(const std::string& advertised, const std::string& filter) {
    if (advertised.empty()) {
        return false;
    }
    const std::string needle = normalize_device_name(filter);
    if (needle.empty()) {
        return true;
    }
    return normalize_device_name(advertised).find(needle) != std::string::npos;
}

ErrorKind scan_for_device(AdvertisementSource& source, const std::string& filter,
                          uint32_t timeout_ms, DeviceHandle& out) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        auto now = clock::now();
        if (now >= deadline) {
            return ErrorKind::NOT_FOUND;
        }
        uint32_t remaining = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

        Advertisement adv;
        if (!source.next(adv, remaining)) {
            continue;
        }
        if (!device_name_matches(adv.name, filter)) {
            continue;
        }

        out.name = adv.name;
        memcpy(out.address, adv.address, sizeof(out.address));
        out.address_type = adv.address_type;
        out.mtu = 23;
        out.write_char_handle = 0;
        out.notify_char_handle = 0;
        return ErrorKind::NONE;
    }
}
