// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "image_loader.h"
#include "esp_log.h"
#include "esp_heap_caps.h"
#include "esp_spiffs.h"
#include "esp_rom_tjpgd.h"
#include <cstdio>
#include <cstring>

static const char* TAG = "ImageLoader";

namespace {

struct JpegSource {
    const uint8_t* data;
    size_t len;
    size_t pos;
    RgbImage* image;
};

uint32_t jpeg_input(esp_rom_tjpgd_dec_t* dec, uint8_t* buf, uint32_t len) {
    JpegSource* src = static_cast<JpegSource*>(dec->device);
    size_t remaining = src->len - src->pos;
    if (len > remaining) {
        len = static_cast<uint32_t>(remaining);
    }
    // A null buffer asks the decoder to skip input
    if (buf) {
        memcpy(buf, src->data + src->pos, len);
    }
    src->pos += len;
    return len;
}

uint32_t jpeg_output(esp_rom_tjpgd_dec_t* dec, void* bitmap, esp_rom_tjpgd_rect_t* rect) {
    JpegSource* src = static_cast<JpegSource*>(dec->device);
    RgbImage& image = *src->image;
    const uint8_t* pixels = static_cast<const uint8_t*>(bitmap);
    size_t rect_width = rect->right - rect->left + 1;

    for (uint16_t y = rect->top; y <= rect->bottom; y++) {
        if (y >= image.height) {
            break;
        }
        uint16_t right = rect->right < image.width ? rect->right : image.width - 1;
        if (rect->left > right) {
            continue;
        }
        const uint8_t* row = pixels + (static_cast<size_t>(y - rect->top) * rect_width) * 3;
        memcpy(image.at(rect->left, y), row, static_cast<size_t>(right - rect->left + 1) * 3);
    }
    return 1;   // continue
}

} // namespace

esp_err_t ImageLoader::mount_storage() {
    esp_vfs_spiffs_conf_t conf = {
        .base_path = SPIFFS_BASE_PATH,
        .partition_label = nullptr,
        .max_files = 4,
        .format_if_mount_failed = false
    };

    esp_err_t ret = esp_vfs_spiffs_register(&conf);
    if (ret != ESP_OK) {
        if (ret == ESP_FAIL) {
            ESP_LOGE(TAG, "Failed to mount SPIFFS at %s", SPIFFS_BASE_PATH);
        } else if (ret == ESP_ERR_NOT_FOUND) {
            ESP_LOGE(TAG, "No SPIFFS partition found");
        } else {
            ESP_LOGE(TAG, "SPIFFS init failed: %s", esp_err_to_name(ret));
        }
        return ret;
    }

    size_t total = 0;
    size_t used = 0;
    if (esp_spiffs_info(nullptr, &total, &used) == ESP_OK) {
        ESP_LOGI(TAG, "SPIFFS mounted: %d of %d bytes used", (int)used, (int)total);
    }
    return ESP_OK;
}

std::string ImageLoader::resolve_path(const std::string& path) {
    if (!path.empty() && path[0] == '/') {
        return path;
    }
    return std::string(SPIFFS_BASE_PATH) + "/" + path;
}

ErrorKind ImageLoader::load(const std::string& path, uint16_t min_width, uint16_t min_height, RgbImage& out) {
    std::string full_path = resolve_path(path);

    size_t len = 0;
    uint8_t* data = read_file(full_path, len);
    if (!data) {
        return ErrorKind::ENCODING_ERROR;
    }

    ErrorKind result = ErrorKind::ENCODING_ERROR;
    switch (detect_image_format(data, len)) {
    case ImageFormat::JPEG:
        result = decode_jpeg(data, len, min_width, min_height, out);
        break;
    case ImageFormat::PNG:
        result = decode_png(data, len, out);
        if (result != ErrorKind::NONE) {
            ESP_LOGE(TAG, "PNG decode failed: %s", full_path.c_str());
        }
        break;
    case ImageFormat::PPM:
    case ImageFormat::PGM:
        result = decode_pnm(data, len, out);
        if (result != ErrorKind::NONE) {
            ESP_LOGE(TAG, "Malformed PNM file: %s", full_path.c_str());
        }
        break;
    default:
        ESP_LOGE(TAG, "Unsupported image format: %s", full_path.c_str());
        break;
    }

    heap_caps_free(data);

    if (result == ErrorKind::NONE) {
        ESP_LOGI(TAG, "Loaded %s: %dx%d", full_path.c_str(), out.width, out.height);
    }
    return result;
}

uint8_t* ImageLoader::read_file(const std::string& path, size_t& len) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        ESP_LOGE(TAG, "Cannot open %s", path.c_str());
        return nullptr;
    }

    fseek(file, 0, SEEK_END);
    long size = ftell(file);
    fseek(file, 0, SEEK_SET);
    if (size <= 0 || static_cast<size_t>(size) > MAX_FILE_SIZE) {
        ESP_LOGE(TAG, "Invalid file size %ld (max %d)", size, (int)MAX_FILE_SIZE);
        fclose(file);
        return nullptr;
    }

    // Prefer PSRAM for the raw file when the board has it
    uint8_t* data = static_cast<uint8_t*>(heap_caps_malloc_prefer(size, 2, MALLOC_CAP_SPIRAM, MALLOC_CAP_DEFAULT));
    if (!data) {
        ESP_LOGE(TAG, "Failed to allocate %ld bytes for %s", size, path.c_str());
        fclose(file);
        return nullptr;
    }

    size_t read = fread(data, 1, size, file);
    fclose(file);
    if (read != static_cast<size_t>(size)) {
        ESP_LOGE(TAG, "Short read on %s: %d of %ld bytes", path.c_str(), (int)read, size);
        heap_caps_free(data);
        return nullptr;
    }

    len = read;
    return data;
}

ErrorKind ImageLoader::decode_jpeg(const uint8_t* data, size_t len, uint16_t min_width, uint16_t min_height,
                                   RgbImage& out) {
    void* work = heap_caps_malloc(JPEG_WORK_SIZE, MALLOC_CAP_DEFAULT);
    if (!work) {
        ESP_LOGE(TAG, "Failed to allocate JPEG work area");
        return ErrorKind::ENCODING_ERROR;
    }

    JpegSource src = {data, len, 0, &out};
    esp_rom_tjpgd_dec_t dec;
    esp_rom_tjpgd_result_t res = esp_rom_tjpgd_prepare(&dec, jpeg_input, work, JPEG_WORK_SIZE, &src);
    if (res != JDR_OK) {
        ESP_LOGE(TAG, "JPEG header rejected (error %d)", res);
        heap_caps_free(work);
        return ErrorKind::ENCODING_ERROR;
    }

    uint8_t scale = jpeg_scale_for(dec.width, dec.height, min_width, min_height);
    uint16_t width = jpeg_scaled_side(dec.width, scale);
    uint16_t height = jpeg_scaled_side(dec.height, scale);
    ESP_LOGI(TAG, "JPEG %dx%d, decoding at 1/%d -> %dx%d", dec.width, dec.height, 1 << scale, width, height);

    if (!decoded_size_ok(width, height) ||
        static_cast<size_t>(width) * height * 3 > heap_caps_get_largest_free_block(MALLOC_CAP_DEFAULT)) {
        ESP_LOGE(TAG, "No room for a %dx%d raster", width, height);
        heap_caps_free(work);
        return ErrorKind::ENCODING_ERROR;
    }
    out = RgbImage(width, height);

    res = esp_rom_tjpgd_decomp(&dec, jpeg_output, scale);
    heap_caps_free(work);
    if (res != JDR_OK) {
        ESP_LOGE(TAG, "JPEG decode failed (error %d)", res);
        out = RgbImage();
        return ErrorKind::ENCODING_ERROR;
    }
    return ErrorKind::NONE;
}
