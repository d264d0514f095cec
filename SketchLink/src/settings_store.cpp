// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "settings_store.h"
#include "esp_log.h"
#include "nvs.h"
#include <string>

static const char* TAG = "SettingsStore";

esp_err_t SettingsStore::load(SketchSettings& settings) {
    nvs_handle_t handle = 0;
    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        ESP_LOGI(TAG, "No stored settings, using defaults");
        return ESP_OK;
    }
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "nvs_open failed: %s", esp_err_to_name(err));
        return err;
    }

    size_t len = 0;
    err = nvs_get_str(handle, NVS_KEY, nullptr, &len);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        nvs_close(handle);
        ESP_LOGI(TAG, "No stored settings, using defaults");
        return ESP_OK;
    }
    if (err != ESP_OK || len == 0) {
        nvs_close(handle);
        ESP_LOGW(TAG, "nvs_get_str failed: %s", esp_err_to_name(err));
        return err != ESP_OK ? err : ESP_ERR_INVALID_SIZE;
    }

    std::string text(len, '\0');
    err = nvs_get_str(handle, NVS_KEY, &text[0], &len);
    nvs_close(handle);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "nvs_get_str failed: %s", esp_err_to_name(err));
        return err;
    }
    // len includes the terminator
    text.resize(len > 0 ? len - 1 : 0);

    size_t applied = apply_serialized_settings(settings, text);
    ESP_LOGI(TAG, "Loaded %d stored settings", (int)applied);
    return ESP_OK;
}

esp_err_t SettingsStore::save(const SketchSettings& settings) {
    nvs_handle_t handle = 0;
    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(err));
        return err;
    }

    std::string text = serialize_settings(settings);
    err = nvs_set_str(handle, NVS_KEY, text.c_str());
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nvs_set_str failed: %s", esp_err_to_name(err));
        nvs_close(handle);
        return err;
    }

    err = nvs_commit(handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nvs_commit failed: %s", esp_err_to_name(err));
    } else {
        ESP_LOGI(TAG, "Settings saved (%d bytes)", (int)text.size());
    }
    nvs_close(handle);
    return err;
}

esp_err_t SettingsStore::erase() {
    nvs_handle_t handle = 0;
    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        return err;
    }
    err = nvs_erase_key(handle, NVS_KEY);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        err = ESP_OK;
    }
    if (err == ESP_OK) {
        err = nvs_commit(handle);
    }
    nvs_close(handle);
    return err;
}
