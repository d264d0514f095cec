// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "sketch_config.h"
#include "esp_err.h"

/**
 * @brief SettingsStore - SketchSettings persisted in NVS
 *
 * All settings are stored as one "key=value" text entry; NVS keys are
 * limited to 15 characters, which several setting keys exceed. nvs_flash
 * must be initialized before use.
 */
class SettingsStore {
public:
    static constexpr const char* NVS_NAMESPACE = "sketchlink";
    static constexpr const char* NVS_KEY = "settings";

    // Overlay stored values onto settings. Missing entry is not an error.
    esp_err_t load(SketchSettings& settings);
    esp_err_t save(const SketchSettings& settings);
    esp_err_t erase();
};
