/****************************************************************************
*
* SKETCHLINK - ESP32 BLE client for the smART Sketcher 2.0 projector
*
* Finds the projector by its advertised name, connects without pairing and
* uploads images from SPIFFS or raw commands typed on the serial console.
* An image named by the "boot_image" setting is uploaded once at startup.
*
****************************************************************************/

#include <cstdio>
#include <cstdlib>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_system.h"
#include "esp_log.h"
#include "nvs_flash.h"
#include "esp_heap_caps.h"

// SketchLink components
#include <ble_central.h>
#include <image_loader.h>
#include <interactive_shell.h>
#include <settings_store.h>
#include <sketch_config.h>

#define TAG "SKETCHLINK"

static void log_memory_status(const char* label) {
    uint32_t free_heap = heap_caps_get_free_size(MALLOC_CAP_DEFAULT);
    uint32_t free_internal = heap_caps_get_free_size(MALLOC_CAP_INTERNAL);
    uint32_t free_spiram = heap_caps_get_free_size(MALLOC_CAP_SPIRAM);

    ESP_LOGI(TAG, "📊 MEMORY STATUS %s:", label);
    ESP_LOGI(TAG, "  Free heap (total): %lu bytes (%.1f KB)", free_heap, free_heap / 1024.0f);
    ESP_LOGI(TAG, "  Free internal RAM: %lu bytes (%.1f KB)", free_internal, free_internal / 1024.0f);
    ESP_LOGI(TAG, "  Free SPIRAM: %lu bytes (%.1f KB)", free_spiram, free_spiram / 1024.0f);
}

extern "C" {
    void app_main(void);
}

void app_main(void) {
    ESP_LOGI(TAG, "Starting SketchLink");

    // Initialize NVS
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        ret = nvs_flash_init();
    }
    ESP_ERROR_CHECK(ret);

    // Images live on SPIFFS; the shell still works without it
    ret = ImageLoader::mount_storage();
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Image storage unavailable, uploads will fail: %s", esp_err_to_name(ret));
    }

    SketchSettings settings;
    SettingsStore store;
    ret = store.load(settings);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Using default settings: %s", esp_err_to_name(ret));
    }

    BLECentral central;
    ret = central.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize BLE central: %s", esp_err_to_name(ret));
        return;
    }

    InteractiveShell shell(central, settings, store);
    ret = shell.init();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize shell: %s", esp_err_to_name(ret));
        return;
    }

    log_memory_status("AT STARTUP");

    if (!settings.boot_image.empty()) {
        ESP_LOGI(TAG, "Uploading boot image %s", settings.boot_image.c_str());
        int code = shell.upload(settings.boot_image, settings.fit, settings.mode);
        ESP_LOGI(TAG, "Boot image upload finished with exit code %d", code);
    }

    int code = shell.run();
    ESP_LOGI(TAG, "Shell exited with code %d", code);
    log_memory_status("AFTER SHELL");

    // Nothing left to do; keep the task alive so objects on this stack stay valid
    while (true) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
