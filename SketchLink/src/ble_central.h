// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include "connection_attempt.h"
#include "scan_manager.h"
#include "esp_gattc_api.h"
#include "esp_gap_ble_api.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/semphr.h"
#include <atomic>
#include <string>

/* ######### SAMPLE CODE

    BLECentral central;
    ESP_ERROR_CHECK(central.init());

    DeviceHandle device;
    if (central.scan("smART Sketcher", 5000, device) != ESP_OK) {
        ESP_LOGE(TAG, "Projector not found");
        return;
    }
    if (central.connect(device, 10000) != ESP_OK) {
        ESP_LOGE(TAG, "Connection failed");
        return;
    }

    const uint8_t hello[] = {0x01, 0x00};
    central.write(hello, sizeof(hello));
    central.disconnect();

*/

/**
 * @brief BLECentral - Bluedroid GATT client for the projector
 *
 * Connection sequence (each step completes on the Bluedroid task and is
 * awaited by the caller through the event group):
 * 1. esp_ble_gattc_open, direct connection; no security request, no bonding
 * 2. MTU exchange (local MTU 517)
 * 3. Service discovery, search for service 0xFFE0
 * 4. Resolve characteristic 0xFFE3; missing -> ESP_ERR_NOT_FOUND
 * 5. If the characteristic notifies: register for notify and write its CCCD
 *
 * Writes are serialized by a mutex and each waits for ESP_GATTC_WRITE_CHAR_EVT.
 * That event only reports link-layer delivery; the projector acknowledges
 * nothing at the application level.
 *
 * The projector accepts any initiator; nothing on the device side signals
 * that a connection was made.
 */
class BLECentral : public BleLink {
public:
    static constexpr uint16_t APP_ID = 0;

    // Called on the Bluedroid task; keep it short
    typedef void (*NotificationCallback)(const uint8_t* data, uint16_t len, void* ctx);

    BLECentral();
    ~BLECentral() override;

    // Initialization
    esp_err_t init();

    // Discovery and connection lifecycle
    esp_err_t scan(const std::string& name_filter, uint32_t timeout_ms, DeviceHandle& out);
    esp_err_t connect(const DeviceHandle& device, uint32_t timeout_ms);
    esp_err_t disconnect();

    // BleLink
    LinkStatus write(const uint8_t* data, size_t len) override;
    size_t max_write_size() const override;
    bool is_connected() const override { return connected_.load(); }

    // Configuration
    void set_write_timeout(uint32_t timeout_ms) { write_timeout_ms_ = timeout_ms; }
    void set_write_with_response(bool with_response);
    void set_notification_callback(NotificationCallback callback, void* ctx);

    const DeviceHandle& get_device() const { return device_; }

    // Event handlers (static callbacks for ESP-IDF)
    static void gattc_event_handler(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if, esp_ble_gattc_cb_param_t *param);
    static void gap_event_handler(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param);

    // Singleton access
    static BLECentral* get_instance() { return instance_; }

private:
    static BLECentral* instance_;

    static constexpr uint32_t REGISTER_TIMEOUT_MS = 2000;
    static constexpr uint32_t MTU_TIMEOUT_MS = 1000;
    static constexpr uint32_t CLOSE_TIMEOUT_MS = 3000;

    // Event group bits
    static constexpr EventBits_t APP_REGISTERED_BIT = (1 << 0);
    static constexpr EventBits_t OPEN_DONE_BIT = (1 << 1);
    static constexpr EventBits_t OPEN_FAILED_BIT = (1 << 2);
    static constexpr EventBits_t SEARCH_DONE_BIT = (1 << 3);
    static constexpr EventBits_t SEARCH_FAILED_BIT = (1 << 4);
    static constexpr EventBits_t MTU_DONE_BIT = (1 << 5);
    static constexpr EventBits_t NOTIFY_READY_BIT = (1 << 6);
    static constexpr EventBits_t NOTIFY_FAILED_BIT = (1 << 7);
    static constexpr EventBits_t WRITE_DONE_BIT = (1 << 8);
    static constexpr EventBits_t DISCONNECTED_BIT = (1 << 9);
    static constexpr EventBits_t UNCONGESTED_BIT = (1 << 10);

    ScanManager scan_manager_;
    EventGroupHandle_t events_;
    SemaphoreHandle_t write_lock_;

    bool initialized_;
    esp_gatt_if_t gattc_if_;
    uint16_t conn_id_;
    std::atomic<bool> connected_;
    ConnectionAttempt attempt_;
    DeviceHandle device_;

    // Service search state
    bool service_found_;
    uint16_t service_start_handle_;
    uint16_t service_end_handle_;
    esp_gatt_char_prop_t char_properties_;

    // Write state
    esp_gatt_write_type_t write_type_;
    uint32_t write_timeout_ms_;
    volatile esp_gatt_status_t write_status_;

    NotificationCallback notification_callback_;
    void* notification_ctx_;

    // Internal event handling
    void handle_gattc_event(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if, esp_ble_gattc_cb_param_t *param);
    void handle_gap_event(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param);

    void handle_open_event(esp_ble_gattc_cb_param_t *param);
    void handle_search_complete_event(esp_ble_gattc_cb_param_t *param);
    void handle_reg_for_notify_event(esp_ble_gattc_cb_param_t *param);
    void handle_notify_event(esp_ble_gattc_cb_param_t *param);
    void handle_disconnect_event(esp_ble_gattc_cb_param_t *param);

    // Initialization helpers
    esp_err_t init_bluetooth_stack();
    esp_err_t register_callbacks();

    // Connection helpers
    bool resolve_write_characteristic();
    esp_err_t enable_notifications(uint32_t timeout_ms);
    void reset_connection_state();
    void abandon_connect();
};
