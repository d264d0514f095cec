// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "image_decoder.h"
#include <png.h>
#include <cctype>
#include <cstring>

namespace {

class HeaderReader {
public:
    HeaderReader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

    bool read_uint(uint32_t& value) {
        skip_whitespace_and_comments();
        if (pos_ >= len_ || !isdigit(data_[pos_])) {
            return false;
        }
        uint64_t v = 0;
        while (pos_ < len_ && isdigit(data_[pos_])) {
            v = v * 10 + (data_[pos_] - '0');
            if (v > 0xFFFF) {
                return false;
            }
            ++pos_;
        }
        value = static_cast<uint32_t>(v);
        return true;
    }

    // Exactly one whitespace byte separates maxval from the raster.
    bool end_header() {
        if (pos_ >= len_ || !isspace(data_[pos_])) {
            return false;
        }
        ++pos_;
        return true;
    }

    size_t position() const { return pos_; }

private:
    void skip_whitespace_and_comments() {
        while (pos_ < len_) {
            if (isspace(data_[pos_])) {
                ++pos_;
            } else if (data_[pos_] == '#') {
                while (pos_ < len_ && data_[pos_] != '\n') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_;
};

} // namespace

bool decoded_size_ok(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0 || width > 0xFFFF || height > 0xFFFF) {
        return false;
    }
    return static_cast<uint64_t>(width) * height <= MAX_DECODED_PIXELS;
}

ImageFormat detect_image_format(const uint8_t* data, size_t len) {
    static const uint8_t png_signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (len >= sizeof(png_signature) && memcmp(data, png_signature, sizeof(png_signature)) == 0) {
        return ImageFormat::PNG;
    }
    if (len >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    if (len >= 2 && data[0] == 'P') {
        if (data[1] == '6') {
            return ImageFormat::PPM;
        }
        if (data[1] == '5') {
            return ImageFormat::PGM;
        }
    }
    return ImageFormat::UNKNOWN;
}

ErrorKind decode_pnm(const uint8_t* data, size_t len, RgbImage& out) {
    ImageFormat format = detect_image_format(data, len);
    if (format != ImageFormat::PPM && format != ImageFormat::PGM) {
        return ErrorKind::ENCODING_ERROR;
    }

    HeaderReader reader(data + 2, len - 2);
    uint32_t width, height, maxval;
    if (!reader.read_uint(width) || !reader.read_uint(height) || !reader.read_uint(maxval) ||
        !reader.end_header()) {
        return ErrorKind::ENCODING_ERROR;
    }
    if (width == 0 || height == 0 || maxval == 0 || maxval > 255) {
        return ErrorKind::ENCODING_ERROR;
    }

    if (!decoded_size_ok(width, height)) {
        return ErrorKind::ENCODING_ERROR;
    }

    const size_t channels = (format == ImageFormat::PPM) ? 3 : 1;
    const size_t offset = 2 + reader.position();
    // 64-bit so a huge header cannot wrap past a short raster on 32-bit targets
    const uint64_t pixel_count = static_cast<uint64_t>(width) * height;
    if (pixel_count > (len - offset) / channels) {
        return ErrorKind::ENCODING_ERROR;
    }

    const uint8_t* raster = data + offset;
    out = RgbImage(static_cast<uint16_t>(width), static_cast<uint16_t>(height));
    for (size_t i = 0; i < static_cast<size_t>(width) * height; ++i) {
        for (size_t c = 0; c < 3; ++c) {
            uint32_t sample = raster[i * channels + (channels == 3 ? c : 0)];
            if (sample > maxval) {
                sample = maxval;
            }
            out.pixels[i * 3 + c] = static_cast<uint8_t>((sample * 255 + maxval / 2) / maxval);
        }
    }
    return ErrorKind::NONE;
}

ErrorKind decode_png(const uint8_t* data, size_t len, RgbImage& out) {
    if (detect_image_format(data, len) != ImageFormat::PNG) {
        return ErrorKind::ENCODING_ERROR;
    }

    png_image image;
    memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, data, len)) {
        return ErrorKind::ENCODING_ERROR;
    }
    if (!decoded_size_ok(image.width, image.height)) {
        png_image_free(&image);
        return ErrorKind::ENCODING_ERROR;
    }

    image.format = PNG_FORMAT_RGB;
    const png_color background = {0, 0, 0};
    out = RgbImage(static_cast<uint16_t>(image.width), static_cast<uint16_t>(image.height));
    if (!png_image_finish_read(&image, &background, out.pixels.data(), 0, nullptr)) {
        png_image_free(&image);
        out = RgbImage();
        return ErrorKind::ENCODING_ERROR;
    }
    return ErrorKind::NONE;
}

uint8_t jpeg_scale_for(uint16_t width, uint16_t height, uint16_t min_width, uint16_t min_height) {
    uint8_t scale = 0;
    while (scale < 3 && jpeg_scaled_side(width, scale + 1) >= min_width &&
           jpeg_scaled_side(height, scale + 1) >= min_height) {
        scale++;
    }
    return scale;
}
