// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "ble_central.h"
#include "device_scanner.h"
#include "sketch_config.h"
#include "esp_log.h"
#include "esp_bt.h"
#include "esp_bt_main.h"
#include "esp_bt_device.h"
#include "esp_gatt_common_api.h"
#include <cstring>

// Uncomment for per-frame write logging (impacts throughput)
// #define FRAME_LOGGING

#ifdef FRAME_LOGGING
    #define FRAME_LOG(tag, format, ...) ESP_LOGI(tag, format, ##__VA_ARGS__)
#else
    #define FRAME_LOG(tag, format, ...) do {} while(0)
#endif

static const char* TAG = "BLECentral";

// Static instance for singleton pattern
BLECentral* BLECentral::instance_ = nullptr;

BLECentral::BLECentral()
    : events_(nullptr), write_lock_(nullptr), initialized_(false),
      gattc_if_(ESP_GATT_IF_NONE), conn_id_(0), connected_(false),
      service_found_(false), service_start_handle_(0), service_end_handle_(0), char_properties_(0),
      write_type_(ESP_GATT_WRITE_TYPE_NO_RSP), write_timeout_ms_(2000), write_status_(ESP_GATT_OK),
      notification_callback_(nullptr), notification_ctx_(nullptr) {
    device_ = {};
    device_.mtu = BLE_DEFAULT_MTU;
    instance_ = this;
}

BLECentral::~BLECentral() {
    disconnect();
    if (write_lock_) {
        vSemaphoreDelete(write_lock_);
        write_lock_ = nullptr;
    }
    if (events_) {
        vEventGroupDelete(events_);
        events_ = nullptr;
    }
    instance_ = nullptr;
}

esp_err_t BLECentral::init() {
    if (initialized_) {
        ESP_LOGW(TAG, "BLE Central already initialized");
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Initializing BLE Central");

    events_ = xEventGroupCreate();
    write_lock_ = xSemaphoreCreateMutex();
    if (!events_ || !write_lock_) {
        ESP_LOGE(TAG, "Failed to allocate synchronization primitives");
        return ESP_ERR_NO_MEM;
    }

    esp_err_t ret = init_bluetooth_stack();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize Bluetooth stack");
        return ret;
    }

    ret = register_callbacks();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register callbacks");
        return ret;
    }

    ret = esp_ble_gattc_app_register(APP_ID);
    if (ret) {
        ESP_LOGE(TAG, "gattc app register error, error code = %x", ret);
        return ret;
    }
    EventBits_t bits = xEventGroupWaitBits(events_, APP_REGISTERED_BIT, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(REGISTER_TIMEOUT_MS));
    if (!(bits & APP_REGISTERED_BIT)) {
        ESP_LOGE(TAG, "GATTC application registration timed out");
        return ESP_ERR_TIMEOUT;
    }

    // Set local MTU
    esp_err_t mtu_ret = esp_ble_gatt_set_local_mtu(BLE_LOCAL_MTU);
    if (mtu_ret) {
        ESP_LOGE(TAG, "set local MTU failed, error code = %x", mtu_ret);
    }

    ret = scan_manager_.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize scanning: %s", esp_err_to_name(ret));
        return ret;
    }

    initialized_ = true;
    ESP_LOGI(TAG, "BLE Central initialized successfully");
    return ESP_OK;
}

esp_err_t BLECentral::scan(const std::string& name_filter, uint32_t timeout_ms, DeviceHandle& out) {
    if (!initialized_) {
        ESP_LOGE(TAG, "BLE Central not initialized");
        return ESP_ERR_INVALID_STATE;
    }

    ESP_LOGI(TAG, "Scanning %lu ms for \"%s\"", (unsigned long)timeout_ms, name_filter.c_str());
    esp_err_t ret = scan_manager_.start_scanning(timeout_ms);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start scan: %s", esp_err_to_name(ret));
        return ret;
    }

    ErrorKind result = scan_for_device(scan_manager_, name_filter, timeout_ms, out);

    esp_err_t stop_ret = scan_manager_.stop_scanning();
    if (stop_ret != ESP_OK) {
        ESP_LOGW(TAG, "Failed to stop scan: %s", esp_err_to_name(stop_ret));
    }

    if (result != ErrorKind::NONE) {
        ESP_LOGW(TAG, "No device matching \"%s\" within %lu ms", name_filter.c_str(), (unsigned long)timeout_ms);
        return ESP_ERR_NOT_FOUND;
    }

    ESP_LOGI(TAG, "Found: %s (" ESP_BD_ADDR_STR ")", out.name.c_str(), ESP_BD_ADDR_HEX(out.address));
    return ESP_OK;
}

esp_err_t BLECentral::connect(const DeviceHandle& device, uint32_t timeout_ms) {
    if (!initialized_) {
        ESP_LOGE(TAG, "BLE Central not initialized");
        return ESP_ERR_INVALID_STATE;
    }
    if (connected_) {
        ESP_LOGW(TAG, "Already connected, closing previous connection first");
        disconnect();
    }

    reset_connection_state();
    device_ = device;
    device_.mtu = BLE_DEFAULT_MTU;
    xEventGroupClearBits(events_, OPEN_DONE_BIT | OPEN_FAILED_BIT | SEARCH_DONE_BIT | SEARCH_FAILED_BIT |
                                  MTU_DONE_BIT | NOTIFY_READY_BIT | NOTIFY_FAILED_BIT | WRITE_DONE_BIT |
                                  DISCONNECTED_BIT);
    xEventGroupSetBits(events_, UNCONGESTED_BIT);

    ESP_LOGI(TAG, "Connecting to " ESP_BD_ADDR_STR " (no pairing)", ESP_BD_ADDR_HEX(device_.address));
    attempt_.begin();
    esp_err_t ret = esp_ble_gattc_open(gattc_if_, device_.address,
                                       static_cast<esp_ble_addr_type_t>(device_.address_type), true);
    if (ret) {
        ESP_LOGE(TAG, "gattc open failed, error code = %x", ret);
        attempt_.abandon();
        return ret;
    }

    // Open and service search are reported together; a drop aborts both
    EventBits_t bits = xEventGroupWaitBits(events_, SEARCH_DONE_BIT | SEARCH_FAILED_BIT | OPEN_FAILED_BIT | DISCONNECTED_BIT,
                                           pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
    if (bits & (OPEN_FAILED_BIT | DISCONNECTED_BIT)) {
        ESP_LOGE(TAG, "Link dropped during connection handshake");
        attempt_.abandon();
        reset_connection_state();
        return ESP_FAIL;
    }
    if (bits & SEARCH_FAILED_BIT) {
        ESP_LOGE(TAG, "Write characteristic 0x%04X not found - wrong device or firmware", SKETCHER_CHAR_UUID16);
        abandon_connect();
        return ESP_ERR_NOT_FOUND;
    }
    if (!(bits & SEARCH_DONE_BIT)) {
        ESP_LOGE(TAG, "Connection handshake timed out after %lu ms", (unsigned long)timeout_ms);
        abandon_connect();
        return ESP_ERR_TIMEOUT;
    }
    attempt_.complete();

    // MTU exchange normally finished long before the service search
    bits = xEventGroupWaitBits(events_, MTU_DONE_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(MTU_TIMEOUT_MS));
    if (!(bits & MTU_DONE_BIT)) {
        ESP_LOGW(TAG, "MTU exchange not confirmed, using %d", device_.mtu);
    }

    if (char_properties_ & ESP_GATT_CHAR_PROP_BIT_NOTIFY) {
        ret = enable_notifications(timeout_ms);
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Notifications unavailable (%s), continuing send-only", esp_err_to_name(ret));
        }
    }

    ESP_LOGI(TAG, "Connected: %s, MTU %d, write handle %d, notify handle %d",
             device_.name.c_str(), device_.mtu, device_.write_char_handle, device_.notify_char_handle);
    return ESP_OK;
}

esp_err_t BLECentral::disconnect() {
    if (!connected_) {
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Disconnecting from " ESP_BD_ADDR_STR, ESP_BD_ADDR_HEX(device_.address));
    esp_err_t ret = esp_ble_gattc_close(gattc_if_, conn_id_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "gattc close failed: %s", esp_err_to_name(ret));
        reset_connection_state();
        return ret;
    }

    EventBits_t bits = xEventGroupWaitBits(events_, DISCONNECTED_BIT, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(CLOSE_TIMEOUT_MS));
    if (!(bits & DISCONNECTED_BIT)) {
        ESP_LOGW(TAG, "Disconnect event not received, dropping connection state");
    }
    reset_connection_state();
    return ESP_OK;
}

LinkStatus BLECentral::write(const uint8_t* data, size_t len) {
    if (!connected_) {
        return LinkStatus::DISCONNECTED;
    }
    if (len > max_write_size()) {
        ESP_LOGE(TAG, "Write of %d bytes exceeds limit %d", (int)len, (int)max_write_size());
        return LinkStatus::TOO_LONG;
    }

    if (xSemaphoreTake(write_lock_, pdMS_TO_TICKS(write_timeout_ms_)) != pdTRUE) {
        return LinkStatus::WRITE_ERROR;
    }

    LinkStatus status = LinkStatus::OK;
    EventBits_t bits = xEventGroupWaitBits(events_, UNCONGESTED_BIT | DISCONNECTED_BIT, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(write_timeout_ms_));
    if (bits & DISCONNECTED_BIT) {
        status = LinkStatus::DISCONNECTED;
    } else if (!(bits & UNCONGESTED_BIT)) {
        ESP_LOGW(TAG, "Link stayed congested for %lu ms", (unsigned long)write_timeout_ms_);
        status = LinkStatus::WRITE_ERROR;
    } else {
        xEventGroupClearBits(events_, WRITE_DONE_BIT);
        esp_err_t ret = esp_ble_gattc_write_char(gattc_if_, conn_id_, device_.write_char_handle,
                                                 static_cast<uint16_t>(len), const_cast<uint8_t*>(data),
                                                 write_type_, ESP_GATT_AUTH_REQ_NONE);
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "write_char rejected: %s", esp_err_to_name(ret));
            status = LinkStatus::WRITE_ERROR;
        } else {
            bits = xEventGroupWaitBits(events_, WRITE_DONE_BIT | DISCONNECTED_BIT, pdFALSE, pdFALSE,
                                       pdMS_TO_TICKS(write_timeout_ms_));
            if (bits & DISCONNECTED_BIT) {
                status = LinkStatus::DISCONNECTED;
            } else if (!(bits & WRITE_DONE_BIT)) {
                ESP_LOGW(TAG, "Write timed out after %lu ms", (unsigned long)write_timeout_ms_);
                status = LinkStatus::WRITE_ERROR;
            } else if (write_status_ != ESP_GATT_OK) {
                ESP_LOGW(TAG, "Write failed, status 0x%02x", write_status_);
                status = LinkStatus::WRITE_ERROR;
            }
        }
    }

    xSemaphoreGive(write_lock_);
    FRAME_LOG(TAG, "write %d bytes -> %s", (int)len, link_status_name(status));
    return status;
}

size_t BLECentral::max_write_size() const {
    if (!connected_ || device_.mtu <= ATT_HEADER_SIZE) {
        return 0;
    }
    return device_.mtu - ATT_HEADER_SIZE;
}

void BLECentral::set_write_with_response(bool with_response) {
    write_type_ = with_response ? ESP_GATT_WRITE_TYPE_RSP : ESP_GATT_WRITE_TYPE_NO_RSP;
}

void BLECentral::set_notification_callback(NotificationCallback callback, void* ctx) {
    notification_ctx_ = ctx;
    notification_callback_ = callback;
}

// Static callback wrappers
void BLECentral::gattc_event_handler(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if, esp_ble_gattc_cb_param_t *param) {
    if (instance_) {
        instance_->handle_gattc_event(event, gattc_if, param);
    }
}

void BLECentral::gap_event_handler(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param) {
    if (instance_) {
        instance_->handle_gap_event(event, param);
    }
}

void BLECentral::handle_gattc_event(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if, esp_ble_gattc_cb_param_t *param) {
    if (event == ESP_GATTC_REG_EVT) {
        if (param->reg.status == ESP_GATT_OK) {
            gattc_if_ = gattc_if;
            ESP_LOGI(TAG, "GATTC app registered, app_id %d, gattc_if %d", param->reg.app_id, gattc_if);
            xEventGroupSetBits(events_, APP_REGISTERED_BIT);
        } else {
            ESP_LOGE(TAG, "Reg app failed, app_id %04x, status %d", param->reg.app_id, param->reg.status);
        }
        return;
    }

    // Events for other interfaces are not ours
    if (gattc_if != ESP_GATT_IF_NONE && gattc_if != gattc_if_) {
        return;
    }

    switch (event) {
    case ESP_GATTC_CONNECT_EVT:
        ESP_LOGI(TAG, "🔗 Link up (conn_id: %d)", param->connect.conn_id);
        break;

    case ESP_GATTC_OPEN_EVT:
        handle_open_event(param);
        break;

    case ESP_GATTC_CFG_MTU_EVT:
        if (param->cfg_mtu.status != ESP_GATT_OK) {
            ESP_LOGW(TAG, "MTU exchange failed, status %d", param->cfg_mtu.status);
        } else {
            ESP_LOGI(TAG, "MTU exchange, MTU %d", param->cfg_mtu.mtu);
            device_.mtu = param->cfg_mtu.mtu;
        }
        xEventGroupSetBits(events_, MTU_DONE_BIT);
        break;

    case ESP_GATTC_DIS_SRVC_CMPL_EVT: {
        if (param->dis_srvc_cmpl.status != ESP_GATT_OK) {
            ESP_LOGE(TAG, "Service discovery failed, status %d", param->dis_srvc_cmpl.status);
            xEventGroupSetBits(events_, SEARCH_FAILED_BIT);
            break;
        }
        esp_bt_uuid_t service_uuid;
        service_uuid.len = ESP_UUID_LEN_16;
        service_uuid.uuid.uuid16 = SKETCHER_SERVICE_UUID16;
        esp_err_t ret = esp_ble_gattc_search_service(gattc_if_, conn_id_, &service_uuid);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Service search failed: %s", esp_err_to_name(ret));
            xEventGroupSetBits(events_, SEARCH_FAILED_BIT);
        }
        break;
    }

    case ESP_GATTC_SEARCH_RES_EVT:
        if (param->search_res.srvc_id.uuid.len == ESP_UUID_LEN_16 &&
            param->search_res.srvc_id.uuid.uuid.uuid16 == SKETCHER_SERVICE_UUID16) {
            service_found_ = true;
            service_start_handle_ = param->search_res.start_handle;
            service_end_handle_ = param->search_res.end_handle;
            ESP_LOGI(TAG, "Service 0x%04X found, handles %d-%d", SKETCHER_SERVICE_UUID16,
                     service_start_handle_, service_end_handle_);
        }
        break;

    case ESP_GATTC_SEARCH_CMPL_EVT:
        handle_search_complete_event(param);
        break;

    case ESP_GATTC_REG_FOR_NOTIFY_EVT:
        handle_reg_for_notify_event(param);
        break;

    case ESP_GATTC_WRITE_DESCR_EVT:
        if (param->write.status != ESP_GATT_OK) {
            ESP_LOGE(TAG, "CCCD write failed, status 0x%02x", param->write.status);
            xEventGroupSetBits(events_, NOTIFY_FAILED_BIT);
        } else {
            ESP_LOGI(TAG, "Notifications enabled");
            xEventGroupSetBits(events_, NOTIFY_READY_BIT);
        }
        break;

    case ESP_GATTC_WRITE_CHAR_EVT:
        write_status_ = param->write.status;
        xEventGroupSetBits(events_, WRITE_DONE_BIT);
        break;

    case ESP_GATTC_CONGEST_EVT:
        if (param->congest.congested) {
            xEventGroupClearBits(events_, UNCONGESTED_BIT);
        } else {
            xEventGroupSetBits(events_, UNCONGESTED_BIT);
        }
        break;

    case ESP_GATTC_NOTIFY_EVT:
        handle_notify_event(param);
        break;

    case ESP_GATTC_DISCONNECT_EVT:
        handle_disconnect_event(param);
        break;

    default:
        break;
    }
}

void BLECentral::handle_gap_event(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param) {
    // Delegate to scan manager
    scan_manager_.handle_gap_event(event, param);
}

void BLECentral::handle_open_event(esp_ble_gattc_cb_param_t *param) {
    if (param->open.status != ESP_GATT_OK) {
        ESP_LOGE(TAG, "Open failed, status %d", param->open.status);
        xEventGroupSetBits(events_, OPEN_FAILED_BIT);
        return;
    }

    if (!attempt_.accept_open()) {
        // connect() already gave up on this link
        ESP_LOGW(TAG, "Late open (conn_id %d) after connect was abandoned, closing it", param->open.conn_id);
        esp_err_t ret = esp_ble_gattc_close(gattc_if_, param->open.conn_id);
        if (ret) {
            ESP_LOGE(TAG, "Closing late connection failed, error code = %x", ret);
        }
        return;
    }

    conn_id_ = param->open.conn_id;
    device_.mtu = param->open.mtu;
    connected_ = true;
    ESP_LOGI(TAG, "Open success, conn_id %d, MTU %d", conn_id_, param->open.mtu);

    esp_err_t ret = esp_ble_gattc_send_mtu_req(gattc_if_, conn_id_);
    if (ret) {
        ESP_LOGW(TAG, "MTU request failed, error code = %x", ret);
        xEventGroupSetBits(events_, MTU_DONE_BIT);
    }
    xEventGroupSetBits(events_, OPEN_DONE_BIT);
}

void BLECentral::handle_search_complete_event(esp_ble_gattc_cb_param_t *param) {
    if (param->search_cmpl.status != ESP_GATT_OK) {
        ESP_LOGE(TAG, "Service search failed, status %d", param->search_cmpl.status);
        xEventGroupSetBits(events_, SEARCH_FAILED_BIT);
        return;
    }
    if (!service_found_) {
        ESP_LOGE(TAG, "Service 0x%04X not present", SKETCHER_SERVICE_UUID16);
        xEventGroupSetBits(events_, SEARCH_FAILED_BIT);
        return;
    }
    if (!resolve_write_characteristic()) {
        xEventGroupSetBits(events_, SEARCH_FAILED_BIT);
        return;
    }
    xEventGroupSetBits(events_, SEARCH_DONE_BIT);
}

void BLECentral::handle_reg_for_notify_event(esp_ble_gattc_cb_param_t *param) {
    if (param->reg_for_notify.status != ESP_GATT_OK) {
        ESP_LOGE(TAG, "Register for notify failed, status %d", param->reg_for_notify.status);
        xEventGroupSetBits(events_, NOTIFY_FAILED_BIT);
        return;
    }

    esp_bt_uuid_t cccd_uuid;
    cccd_uuid.len = ESP_UUID_LEN_16;
    cccd_uuid.uuid.uuid16 = ESP_GATT_UUID_CHAR_CLIENT_CONFIG;

    esp_gattc_descr_elem_t descr = {};
    uint16_t count = 1;
    esp_gatt_status_t status = esp_ble_gattc_get_descr_by_char_handle(gattc_if_, conn_id_,
                                                                      param->reg_for_notify.handle,
                                                                      cccd_uuid, &descr, &count);
    if (status != ESP_GATT_OK || count == 0) {
        ESP_LOGE(TAG, "CCCD not found for handle %d", param->reg_for_notify.handle);
        xEventGroupSetBits(events_, NOTIFY_FAILED_BIT);
        return;
    }

    uint8_t notify_enable[2] = {0x01, 0x00};
    esp_err_t ret = esp_ble_gattc_write_char_descr(gattc_if_, conn_id_, descr.handle,
                                                   sizeof(notify_enable), notify_enable,
                                                   ESP_GATT_WRITE_TYPE_RSP, ESP_GATT_AUTH_REQ_NONE);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "CCCD write failed: %s", esp_err_to_name(ret));
        xEventGroupSetBits(events_, NOTIFY_FAILED_BIT);
    }
}

void BLECentral::handle_notify_event(esp_ble_gattc_cb_param_t *param) {
    FRAME_LOG(TAG, "Notification: handle %d, %d bytes", param->notify.handle, param->notify.value_len);
    if (notification_callback_) {
        notification_callback_(param->notify.value, param->notify.value_len, notification_ctx_);
    }
}

void BLECentral::handle_disconnect_event(esp_ble_gattc_cb_param_t *param) {
    ESP_LOGI(TAG, "🔌 Disconnected, remote " ESP_BD_ADDR_STR ", reason 0x%02x",
             ESP_BD_ADDR_HEX(param->disconnect.remote_bda), param->disconnect.reason);
    if (connected_ && param->disconnect.conn_id != conn_id_) {
        // A refused late connection closing, not ours
        return;
    }
    connected_ = false;
    xEventGroupSetBits(events_, DISCONNECTED_BIT);
}

esp_err_t BLECentral::init_bluetooth_stack() {
    ESP_LOGI(TAG, "Initializing Bluetooth stack");

    esp_err_t ret = esp_bt_controller_mem_release(ESP_BT_MODE_CLASSIC_BT);
    if (ret) {
        ESP_LOGE(TAG, "Failed to release Classic BT memory");
        return ret;
    }

    esp_bt_controller_config_t bt_cfg = BT_CONTROLLER_INIT_CONFIG_DEFAULT();
    ret = esp_bt_controller_init(&bt_cfg);
    if (ret) {
        ESP_LOGE(TAG, "Initialize controller failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = esp_bt_controller_enable(ESP_BT_MODE_BLE);
    if (ret) {
        ESP_LOGE(TAG, "Enable controller failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = esp_bluedroid_init();
    if (ret) {
        ESP_LOGE(TAG, "Init bluetooth failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = esp_bluedroid_enable();
    if (ret) {
        ESP_LOGE(TAG, "Enable bluetooth failed: %s", esp_err_to_name(ret));
        return ret;
    }

    return ESP_OK;
}

esp_err_t BLECentral::register_callbacks() {
    ESP_LOGI(TAG, "Registering callbacks");

    esp_err_t ret = esp_ble_gattc_register_callback(gattc_event_handler);
    if (ret) {
        ESP_LOGE(TAG, "gattc register error, error code = %x", ret);
        return ret;
    }

    ret = esp_ble_gap_register_callback(gap_event_handler);
    if (ret) {
        ESP_LOGE(TAG, "gap register error, error code = %x", ret);
        return ret;
    }

    return ESP_OK;
}

bool BLECentral::resolve_write_characteristic() {
    uint16_t count = 0;
    esp_gatt_status_t status = esp_ble_gattc_get_attr_count(gattc_if_, conn_id_, ESP_GATT_DB_CHARACTERISTIC,
                                                            service_start_handle_, service_end_handle_,
                                                            ESP_GATT_ILLEGAL_HANDLE, &count);
    if (status != ESP_GATT_OK || count == 0) {
        ESP_LOGE(TAG, "No characteristics in service (status %d)", status);
        return false;
    }

    esp_bt_uuid_t char_uuid;
    char_uuid.len = ESP_UUID_LEN_16;
    char_uuid.uuid.uuid16 = SKETCHER_CHAR_UUID16;

    esp_gattc_char_elem_t elem = {};
    count = 1;
    status = esp_ble_gattc_get_char_by_uuid(gattc_if_, conn_id_, service_start_handle_, service_end_handle_,
                                            char_uuid, &elem, &count);
    if (status != ESP_GATT_OK || count == 0) {
        ESP_LOGE(TAG, "Characteristic 0x%04X missing (status %d)", SKETCHER_CHAR_UUID16, status);
        return false;
    }

    char_properties_ = elem.properties;
    device_.write_char_handle = elem.char_handle;
    ESP_LOGI(TAG, "Characteristic 0x%04X: handle %d, props 0x%02X", SKETCHER_CHAR_UUID16,
             elem.char_handle, elem.properties);
    return true;
}

esp_err_t BLECentral::enable_notifications(uint32_t timeout_ms) {
    esp_err_t ret = esp_ble_gattc_register_for_notify(gattc_if_, device_.address, device_.write_char_handle);
    if (ret != ESP_OK) {
        return ret;
    }

    EventBits_t bits = xEventGroupWaitBits(events_, NOTIFY_READY_BIT | NOTIFY_FAILED_BIT | DISCONNECTED_BIT,
                                           pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
    if (bits & NOTIFY_READY_BIT) {
        device_.notify_char_handle = device_.write_char_handle;
        return ESP_OK;
    }
    return (bits & (NOTIFY_FAILED_BIT | DISCONNECTED_BIT)) ? ESP_FAIL : ESP_ERR_TIMEOUT;
}

void BLECentral::abandon_connect() {
    ConnectionAttempt::State state = attempt_.abandon();
    ESP_LOGI(TAG, "Abandoning connect, attempt was %s", connection_attempt_state_name(state));
    if (state == ConnectionAttempt::State::PENDING) {
        // No open event yet: cancel the pending direct connection. If it
        // still completes, handle_open_event closes it.
        esp_err_t ret = esp_ble_gap_disconnect(device_.address);
        if (ret) {
            ESP_LOGW(TAG, "Cancelling pending open failed, error code = %x", ret);
        }
        reset_connection_state();
        return;
    }
    if (state == ConnectionAttempt::State::OPEN) {
        // The open handler may still be filling in the connection
        xEventGroupWaitBits(events_, OPEN_DONE_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(CLOSE_TIMEOUT_MS));
    }
    disconnect();
}

void BLECentral::reset_connection_state() {
    connected_ = false;
    conn_id_ = 0;
    service_found_ = false;
    service_start_handle_ = 0;
    service_end_handle_ = 0;
    char_properties_ = 0;
    device_.mtu = BLE_DEFAULT_MTU;
    device_.write_char_handle = 0;
    device_.notify_char_handle = 0;
}
