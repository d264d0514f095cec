// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "scan_manager.h"
#include "esp_log.h"
#include <cstring>

static const char* TAG = "ScanManager";

ScanManager::ScanManager() : results_(nullptr), events_(nullptr), scanning_(false) {
    setup_scan_params();
}

ScanManager::~ScanManager() {
    if (results_) {
        vQueueDelete(results_);
        results_ = nullptr;
    }
    if (events_) {
        vEventGroupDelete(events_);
        events_ = nullptr;
    }
}

esp_err_t ScanManager::init() {
    if (!results_) {
        results_ = xQueueCreate(RESULT_QUEUE_LENGTH, sizeof(ScanReport));
    }
    if (!events_) {
        events_ = xEventGroupCreate();
    }
    if (!results_ || !events_) {
        ESP_LOGE(TAG, "Failed to allocate scan queue/event group");
        return ESP_ERR_NO_MEM;
    }

    esp_err_t ret = esp_ble_gap_set_scan_params(&scan_params_);
    if (ret) {
        ESP_LOGE(TAG, "set scan params failed, error code = %x", ret);
        return ret;
    }
    return ESP_OK;
}

void ScanManager::handle_gap_event(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param) {
    switch (event) {
    case ESP_GAP_BLE_SCAN_PARAM_SET_COMPLETE_EVT:
        if (param->scan_param_cmpl.status != ESP_BT_STATUS_SUCCESS) {
            ESP_LOGE(TAG, "Scan param set failed, status %d", param->scan_param_cmpl.status);
        } else {
            ESP_LOGI(TAG, "Scan parameters set");
            xEventGroupSetBits(events_, PARAMS_SET_BIT);
        }
        break;

    case ESP_GAP_BLE_SCAN_START_COMPLETE_EVT:
        if (param->scan_start_cmpl.status != ESP_BT_STATUS_SUCCESS) {
            ESP_LOGE(TAG, "Scan start failed, status %d", param->scan_start_cmpl.status);
            scanning_ = false;
            xEventGroupSetBits(events_, SCAN_START_FAILED_BIT);
        } else {
            ESP_LOGI(TAG, "Scan start successfully");
            xEventGroupSetBits(events_, SCAN_STARTED_BIT);
        }
        break;

    case ESP_GAP_BLE_SCAN_RESULT_EVT:
        if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_RES_EVT) {
            handle_scan_result(param);
        } else if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_CMPL_EVT) {
            ESP_LOGI(TAG, "Scan window elapsed");
            scanning_ = false;
            xEventGroupSetBits(events_, SCAN_STOPPED_BIT);
        }
        break;

    case ESP_GAP_BLE_SCAN_STOP_COMPLETE_EVT:
        if (param->scan_stop_cmpl.status != ESP_BT_STATUS_SUCCESS) {
            ESP_LOGE(TAG, "Scan stop failed, status %d", param->scan_stop_cmpl.status);
        } else {
            ESP_LOGI(TAG, "Scan stop successfully");
        }
        scanning_ = false;
        xEventGroupSetBits(events_, SCAN_STOPPED_BIT);
        break;

    case ESP_GAP_BLE_UPDATE_CONN_PARAMS_EVT:
        ESP_LOGI(TAG, "Connection params update, status %d, conn_int %d, latency %d, timeout %d",
                 param->update_conn_params.status,
                 param->update_conn_params.conn_int,
                 param->update_conn_params.latency,
                 param->update_conn_params.timeout);
        break;

    case ESP_GAP_BLE_SET_PKT_LENGTH_COMPLETE_EVT:
        ESP_LOGI(TAG, "Packet length update, status %d, rx %d, tx %d",
                 param->pkt_data_length_cmpl.status,
                 param->pkt_data_length_cmpl.params.rx_len,
                 param->pkt_data_length_cmpl.params.tx_len);
        break;

    default:
        break;
    }
}

esp_err_t ScanManager::start_scanning(uint32_t duration_ms) {
    EventBits_t bits = xEventGroupWaitBits(events_, PARAMS_SET_BIT, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(PARAMS_TIMEOUT_MS));
    if (!(bits & PARAMS_SET_BIT)) {
        ESP_LOGE(TAG, "Scan parameters were never accepted");
        return ESP_ERR_INVALID_STATE;
    }

    // Stale reports from an earlier scan must not satisfy this one
    xQueueReset(results_);
    xEventGroupClearBits(events_, SCAN_STARTED_BIT | SCAN_START_FAILED_BIT | SCAN_STOPPED_BIT);

    // The controller counts in whole seconds; stop_scanning() ends it early
    uint32_t duration_s = (duration_ms + 999) / 1000 + 1;
    esp_err_t ret = esp_ble_gap_start_scanning(duration_s);
    if (ret) {
        ESP_LOGE(TAG, "start scanning failed, error code = %x", ret);
        return ret;
    }

    bits = xEventGroupWaitBits(events_, SCAN_STARTED_BIT | SCAN_START_FAILED_BIT, pdFALSE, pdFALSE,
                               pdMS_TO_TICKS(PARAMS_TIMEOUT_MS));
    if (!(bits & SCAN_STARTED_BIT)) {
        return ESP_FAIL;
    }
    scanning_ = true;
    return ESP_OK;
}

esp_err_t ScanManager::stop_scanning() {
    if (!scanning_) {
        return ESP_OK;
    }
    esp_err_t ret = esp_ble_gap_stop_scanning();
    if (ret) {
        ESP_LOGE(TAG, "stop scanning failed, error code = %x", ret);
        return ret;
    }
    xEventGroupWaitBits(events_, SCAN_STOPPED_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(PARAMS_TIMEOUT_MS));
    return ESP_OK;
}

bool ScanManager::next(Advertisement& out, uint32_t timeout_ms) {
    ScanReport report;
    if (xQueueReceive(results_, &report, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        return false;
    }
    out.name = report.name;
    memcpy(out.address, report.address, sizeof(out.address));
    out.address_type = report.address_type;
    out.rssi = report.rssi;
    return true;
}

void ScanManager::setup_scan_params() {
    scan_params_ = {
        .scan_type = BLE_SCAN_TYPE_ACTIVE,
        .own_addr_type = BLE_ADDR_TYPE_PUBLIC,
        .scan_filter_policy = BLE_SCAN_FILTER_ALLOW_ALL,
        .scan_interval = 0x50,
        .scan_window = 0x30,
        .scan_duplicate = BLE_SCAN_DUPLICATE_DISABLE,
    };
}

void ScanManager::handle_scan_result(esp_ble_gap_cb_param_t *param) {
    ScanReport report = {};
    if (!resolve_name(param, report.name, sizeof(report.name))) {
        return;
    }
    memcpy(report.address, param->scan_rst.bda, sizeof(esp_bd_addr_t));
    report.address_type = static_cast<uint8_t>(param->scan_rst.ble_addr_type);
    report.rssi = static_cast<int8_t>(param->scan_rst.rssi);

    ESP_LOGD(TAG, "Advertisement: %s (" ESP_BD_ADDR_STR ") rssi %d",
             report.name, ESP_BD_ADDR_HEX(report.address), report.rssi);

    // Drop when full; the scan loop only needs one match
    xQueueSend(results_, &report, 0);
}

bool ScanManager::resolve_name(esp_ble_gap_cb_param_t *param, char* name, size_t size) {
    uint8_t name_len = 0;
    uint8_t* adv_name = esp_ble_resolve_adv_data(param->scan_rst.ble_adv,
                                                 ESP_BLE_AD_TYPE_NAME_CMPL, &name_len);
    if (!adv_name || name_len == 0) {
        adv_name = esp_ble_resolve_adv_data(param->scan_rst.ble_adv,
                                            ESP_BLE_AD_TYPE_NAME_SHORT, &name_len);
    }
    if (!adv_name || name_len == 0) {
        return false;
    }
    size_t copy = name_len < size - 1 ? name_len : size - 1;
    memcpy(name, adv_name, copy);
    name[copy] = '\0';
    return true;
}
