// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "image_encoder.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ==================== PROJECTOR CONSTANTS ====================
// Observed on "smART Sketcher 2.0" firmware; the device publishes no
// documentation, so these are confirmed against real hardware only.

// Service 0000FFE0-0000-1000-8000-00805F9B34FB
static constexpr uint16_t SKETCHER_SERVICE_UUID16 = 0xFFE0;
// Characteristic 0000FFE3-0000-1000-8000-00805F9B34FB (WRITE_NR | NOTIFY)
static constexpr uint16_t SKETCHER_CHAR_UUID16 = 0xFFE3;

static constexpr uint16_t PROJECTOR_WIDTH = 160;
static constexpr uint16_t PROJECTOR_HEIGHT = 120;
static constexpr PixelMode PROJECTOR_PIXEL_MODE = PixelMode::RGB565;

static constexpr uint16_t BLE_DEFAULT_MTU = 23;
static constexpr uint16_t BLE_LOCAL_MTU = 517;
static constexpr uint8_t ATT_HEADER_SIZE = 3;
// =============================================================

/**
 * @brief Runtime settings
 *
 * Compiled-in defaults below; SettingsStore overlays values saved in NVS.
 * Every field is addressable by key from the shell's "config" command.
 */
struct SketchSettings {
    std::string name_filter = "smART Sketcher";
    uint32_t scan_timeout_ms = 5000;
    uint32_t connect_timeout_ms = 10000;
    uint32_t write_timeout_ms = 2000;
    bool write_with_response = false;

    uint32_t chunk_size = 80;
    uint32_t frame_delay_ms = 10;
    uint32_t max_retries = 3;
    uint32_t retry_delay_ms = 20;
    uint32_t ready_timeout_ms = 10000;
    uint32_t done_timeout_ms = 20000;

    FitPolicy fit = FitPolicy::LETTERBOX;
    PixelMode mode = PROJECTOR_PIXEL_MODE;
    bool reverse_payload = true;

    std::string boot_image;     // uploaded once after boot when non-empty
};

// Keys accepted by get_setting/set_setting, in display order.
const std::vector<const char*>& setting_keys();

bool get_setting(const SketchSettings& settings, const std::string& key, std::string& value);
bool set_setting(SketchSettings& settings, const std::string& key, const std::string& value);

// "key=value" lines in setting_keys() order; used as the persisted form.
std::string serialize_settings(const SketchSettings& settings);
// Applies every valid line, skips unknown keys and bad values. Returns the
// number of settings applied.
size_t apply_serialized_settings(SketchSettings& settings, const std::string& text);
