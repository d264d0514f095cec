// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include "sketch_errors.h"
#include <cstdint>
#include <string>

/**
 * Advertised-name matching.
 *
 * Both sides are lowercased and stripped of spaces, underscores and hyphens
 * before a substring test, so "smART Sketcher" matches "smART Sketcher 2.0"
 * as well as the "smART_Sketcher2.0" spelling seen on some firmware. An
 * empty filter matches any device that advertises a name.
 */
std::string normalize_device_name(const std::string& name);
bool device_name_matches(const std::string& advertised, const std::string& filter);

/**
 * Consume advertisement reports from source until one matches filter or
 * timeout_ms has elapsed. On a match the name, address and address type of
 * out are filled in and ErrorKind::NONE is returned; otherwise
 * ErrorKind::NOT_FOUND.
 */
ErrorKind scan_for_device(AdvertisementSource& source, const std::string& filter,
                          uint32_t timeout_ms, DeviceHandle& out);
