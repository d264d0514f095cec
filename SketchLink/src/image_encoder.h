// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "sketch_errors.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// Decoded source raster, RGB888, row-major, no row padding.
struct RgbImage {
    uint16_t width = 0;
    uint16_t height = 0;
    std::vector<uint8_t> pixels;

    RgbImage() = default;
    RgbImage(uint16_t w, uint16_t h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 3, 0) {}

    uint8_t* at(uint16_t x, uint16_t y) { return &pixels[(static_cast<size_t>(y) * width + x) * 3]; }
    const uint8_t* at(uint16_t x, uint16_t y) const { return &pixels[(static_cast<size_t>(y) * width + x) * 3]; }
};

/**
 * @brief ImageEncoder - converts a source raster to the projector's row format
 *
 * Pipeline:
 * 1. Fit: map the source onto target_width x target_height
 *    - LETTERBOX: scale to fit, center, fill the bars with the background colour
 *    - CROP: scale to fill, keep the center
 *    - STRETCH: ignore aspect ratio
 * 2. Resample with an integer box filter (area average per target pixel,
 *    nearest sample when upscaling)
 * 3. Reduce colour depth to the requested PixelMode
 * 4. Serialize rows top to bottom, each exactly row_length bytes
 *
 * Every step uses integer arithmetic only, so identical input always yields
 * byte-identical output.
 *
 * Row formats:
 * - RGB565: 2 bytes per pixel, little-endian (native projector format)
 * - GRAY8:  1 byte per pixel, luma = (77R + 150G + 29B) >> 8
 * - MONO1:  1 bit per pixel, ceil(width / 8) bytes, set bit = lit pixel,
 *           unused trailing bits are zero
 */
enum class PixelMode : uint8_t {
    RGB565 = 0,
    GRAY8 = 1,
    MONO1 = 2
};

enum class FitPolicy : uint8_t {
    LETTERBOX = 0,
    CROP = 1,
    STRETCH = 2
};

enum class DitherMode : uint8_t {
    BAYER_4X4 = 0,
    THRESHOLD = 1
};

struct EncoderOptions {
    FitPolicy fit = FitPolicy::LETTERBOX;
    DitherMode dither = DitherMode::BAYER_4X4;
    uint8_t threshold = 128;            // MONO1 with DitherMode::THRESHOLD
    bool msb_first = true;              // MONO1 bit order within a byte
    uint8_t background[3] = {0, 0, 0};  // letterbox bars
};

struct EncodedImage {
    uint16_t width = 0;
    uint16_t height = 0;
    PixelMode mode = PixelMode::RGB565;
    size_t row_length = 0;
    std::vector<std::vector<uint8_t>> rows;

    size_t payload_size() const { return row_length * rows.size(); }
};

size_t row_length_for(PixelMode mode, uint16_t width);

ErrorKind encode_image(const RgbImage& image, uint16_t target_width, uint16_t target_height,
                       PixelMode mode, const EncoderOptions& options, EncodedImage& out);

// Concatenate rows into one buffer. The projector expects the RGB565 buffer
// byte-reversed; without reversal the picture shows up rotated by 180 degrees.
std::vector<uint8_t> device_payload(const EncodedImage& image, bool reverse);

const char* pixel_mode_name(PixelMode mode);
const char* fit_policy_name(FitPolicy fit);
bool parse_pixel_mode(const char* text, PixelMode& out);
bool parse_fit_policy(const char* text, FitPolicy& out);
