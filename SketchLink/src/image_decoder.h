// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "image_encoder.h"
#include "sketch_errors.h"
#include <cstddef>
#include <cstdint>

enum class ImageFormat : uint8_t {
    UNKNOWN = 0,
    JPEG = 1,
    PPM = 2,    // P6, binary RGB
    PGM = 3,    // P5, binary greyscale
    PNG = 4
};

// Largest raster any decoder will allocate. Keeps width * height * 3 well
// inside 32 bits.
static constexpr uint32_t MAX_DECODED_PIXELS = 4096u * 4096u;

bool decoded_size_ok(uint32_t width, uint32_t height);

// Sniff the container format from the first bytes of a file.
ImageFormat detect_image_format(const uint8_t* data, size_t len);

// Binary PPM (P6) and PGM (P5) with 8-bit samples. Header comments are
// skipped; samples are rescaled to 0..255 when maxval is below 255.
ErrorKind decode_pnm(const uint8_t* data, size_t len, RgbImage& out);

// Any PNG libpng reads (palette, grey, 16-bit, interlaced), converted to
// 8-bit sRGB. Transparent pixels are composited onto black.
ErrorKind decode_png(const uint8_t* data, size_t len, RgbImage& out);

// TJpgDec output scale, 0..3 for 1/1..1/8: the largest reduction that keeps
// both sides at or above the minimum.
uint8_t jpeg_scale_for(uint16_t width, uint16_t height, uint16_t min_width, uint16_t min_height);

// TJpgDec drops the remainder when it scales, so sides are floored.
inline uint16_t jpeg_scaled_side(uint16_t side, uint8_t scale) {
    return static_cast<uint16_t>(side >> scale);
}
