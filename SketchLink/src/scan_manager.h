// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include "esp_gap_ble_api.h"
#include "esp_bt_defs.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/queue.h"
#include <cstdint>

/**
 * @brief ScanManager - GAP scanning for the central role
 *
 * Scan results arrive on the Bluedroid task and are copied into a FreeRTOS
 * queue; next() drains that queue from the caller's task. Reports without
 * a local name are dropped since matching is name based.
 */
class ScanManager : public AdvertisementSource {
public:
    ScanManager();
    ~ScanManager() override;

    // Create the result queue and configure scan parameters (GAP must be registered)
    esp_err_t init();

    // Handle GAP events
    void handle_gap_event(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param);

    // Start/stop scanning
    esp_err_t start_scanning(uint32_t duration_ms);
    esp_err_t stop_scanning();

    bool next(Advertisement& out, uint32_t timeout_ms) override;

    bool is_scanning() const { return scanning_; }

private:
    static constexpr size_t RESULT_QUEUE_LENGTH = 16;
    static constexpr size_t MAX_NAME_LENGTH = 31;
    static constexpr uint32_t PARAMS_TIMEOUT_MS = 2000;

    // Event group bits
    static constexpr EventBits_t PARAMS_SET_BIT = (1 << 0);
    static constexpr EventBits_t SCAN_STARTED_BIT = (1 << 1);
    static constexpr EventBits_t SCAN_START_FAILED_BIT = (1 << 2);
    static constexpr EventBits_t SCAN_STOPPED_BIT = (1 << 3);

    // Fixed-size copy of one report, safe to pass through a FreeRTOS queue
    struct ScanReport {
        char name[MAX_NAME_LENGTH + 1];
        esp_bd_addr_t address;
        uint8_t address_type;
        int8_t rssi;
    };

    QueueHandle_t results_;
    EventGroupHandle_t events_;
    esp_ble_scan_params_t scan_params_;
    volatile bool scanning_;

    // Helper methods
    void setup_scan_params();
    void handle_scan_result(esp_ble_gap_cb_param_t *param);
    static bool resolve_name(esp_ble_gap_cb_param_t *param, char* name, size_t size);
};
