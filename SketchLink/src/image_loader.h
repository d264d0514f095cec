// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "image_decoder.h"
#include "image_encoder.h"
#include "sketch_errors.h"
#include "esp_err.h"
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief ImageLoader - reads source images from SPIFFS into an RgbImage
 *
 * Supported files:
 * - JPEG (baseline), decoded by the TJpgDec copy in ROM. The decoder can
 *   only downscale by 1/2, 1/4 or 1/8; the largest factor that still
 *   covers min_width x min_height is used so big photos fit in RAM.
 * - PNG through libpng, decoded at full size (at most MAX_DECODED_PIXELS)
 * - Binary PPM (P6) and PGM (P5)
 *
 * Relative paths are resolved against SPIFFS_BASE_PATH.
 */
class ImageLoader {
public:
    static constexpr const char* SPIFFS_BASE_PATH = "/spiffs";
    static constexpr size_t MAX_FILE_SIZE = 512 * 1024;

    // Mount the SPIFFS partition at SPIFFS_BASE_PATH
    static esp_err_t mount_storage();

    static std::string resolve_path(const std::string& path);

    ErrorKind load(const std::string& path, uint16_t min_width, uint16_t min_height, RgbImage& out);

private:
    static constexpr size_t JPEG_WORK_SIZE = 3100;

    uint8_t* read_file(const std::string& path, size_t& len);
    ErrorKind decode_jpeg(const uint8_t* data, size_t len, uint16_t min_width, uint16_t min_height,
                          RgbImage& out);
};
