// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "image_encoder.h"
#include <algorithm>
#include <cstring>

namespace {

struct Rect {
    uint32_t x;
    uint32_t y;
    uint32_t w;
    uint32_t h;
};

// 4x4 ordered dither matrix, values 0..15
constexpr uint8_t BAYER_4X4[4][4] = {
    { 0,  8,  2, 10},
    {12,  4, 14,  6},
    { 3, 11,  1,  9},
    {15,  7, 13,  5}
};

uint32_t scaled(uint32_t value, uint32_t num, uint32_t den) {
    uint32_t v = static_cast<uint32_t>((static_cast<uint64_t>(value) * num + den / 2) / den);
    return v == 0 ? 1 : v;
}

void compute_fit(uint32_t sw, uint32_t sh, uint32_t tw, uint32_t th, FitPolicy fit,
                 Rect& src, Rect& dst) {
    src = {0, 0, sw, sh};
    dst = {0, 0, tw, th};

    // Source is at least as wide (relative to height) as the target
    const bool source_wider = static_cast<uint64_t>(sw) * th >= static_cast<uint64_t>(sh) * tw;

    switch (fit) {
    case FitPolicy::LETTERBOX:
        if (source_wider) {
            dst.h = std::min(th, scaled(sh, tw, sw));
            dst.y = (th - dst.h) / 2;
        } else {
            dst.w = std::min(tw, scaled(sw, th, sh));
            dst.x = (tw - dst.w) / 2;
        }
        break;
    case FitPolicy::CROP:
        if (source_wider) {
            src.w = std::min(sw, scaled(sh, tw, th));
            src.x = (sw - src.w) / 2;
        } else {
            src.h = std::min(sh, scaled(sw, th, tw));
            src.y = (sh - src.h) / 2;
        }
        break;
    case FitPolicy::STRETCH:
        break;
    }
}

// Half-open source span [first, last) covered by target cell i of n.
void cell_span(uint32_t origin, uint32_t extent, uint32_t i, uint32_t n,
               uint32_t& first, uint32_t& last) {
    first = origin + static_cast<uint32_t>(static_cast<uint64_t>(i) * extent / n);
    last = origin + static_cast<uint32_t>(static_cast<uint64_t>(i + 1) * extent / n);
    if (last <= first) {
        last = first + 1;
    }
}

void resample(const RgbImage& image, const Rect& src, const Rect& dst, RgbImage& canvas) {
    std::vector<uint32_t> x_first(dst.w), x_last(dst.w);
    for (uint32_t i = 0; i < dst.w; ++i) {
        cell_span(src.x, src.w, i, dst.w, x_first[i], x_last[i]);
    }

    for (uint32_t j = 0; j < dst.h; ++j) {
        uint32_t y_first, y_last;
        cell_span(src.y, src.h, j, dst.h, y_first, y_last);

        for (uint32_t i = 0; i < dst.w; ++i) {
            uint32_t sum[3] = {0, 0, 0};
            uint32_t count = 0;
            for (uint32_t y = y_first; y < y_last; ++y) {
                const uint8_t* px = image.at(static_cast<uint16_t>(x_first[i]), static_cast<uint16_t>(y));
                for (uint32_t x = x_first[i]; x < x_last[i]; ++x) {
                    sum[0] += px[0];
                    sum[1] += px[1];
                    sum[2] += px[2];
                    px += 3;
                    ++count;
                }
            }
            uint8_t* out = canvas.at(static_cast<uint16_t>(dst.x + i), static_cast<uint16_t>(dst.y + j));
            out[0] = static_cast<uint8_t>((sum[0] + count / 2) / count);
            out[1] = static_cast<uint8_t>((sum[1] + count / 2) / count);
            out[2] = static_cast<uint8_t>((sum[2] + count / 2) / count);
        }
    }
}

inline uint8_t luma(const uint8_t* px) {
    return static_cast<uint8_t>((77u * px[0] + 150u * px[1] + 29u * px[2]) >> 8);
}

void serialize_row(const RgbImage& canvas, uint16_t y, PixelMode mode,
                   const EncoderOptions& options, std::vector<uint8_t>& row) {
    switch (mode) {
    case PixelMode::RGB565:
        for (uint16_t x = 0; x < canvas.width; ++x) {
            const uint8_t* px = canvas.at(x, y);
            uint16_t value = static_cast<uint16_t>(((px[0] >> 3) << 11) | ((px[1] >> 2) << 5) | (px[2] >> 3));
            row[x * 2] = static_cast<uint8_t>(value & 0xFF);
            row[x * 2 + 1] = static_cast<uint8_t>(value >> 8);
        }
        break;

    case PixelMode::GRAY8:
        for (uint16_t x = 0; x < canvas.width; ++x) {
            row[x] = luma(canvas.at(x, y));
        }
        break;

    case PixelMode::MONO1:
        for (uint16_t x = 0; x < canvas.width; ++x) {
            uint8_t gray = luma(canvas.at(x, y));
            uint32_t level = options.dither == DitherMode::THRESHOLD
                ? options.threshold
                : BAYER_4X4[y & 3][x & 3] * 16u + 8u;
            if (gray > level) {
                uint8_t bit = options.msb_first ? static_cast<uint8_t>(0x80 >> (x & 7))
                                                : static_cast<uint8_t>(1 << (x & 7));
                row[x >> 3] |= bit;
            }
        }
        break;
    }
}

} // namespace

size_t row_length_for(PixelMode mode, uint16_t width) {
    switch (mode) {
    case PixelMode::RGB565: return static_cast<size_t>(width) * 2;
    case PixelMode::GRAY8:  return width;
    case PixelMode::MONO1:  return (static_cast<size_t>(width) + 7) / 8;
    }
    return 0;
}

ErrorKind encode_image(const RgbImage& image, uint16_t target_width, uint16_t target_height,
                       PixelMode mode, const EncoderOptions& options, EncodedImage& out) {
    if (image.width == 0 || image.height == 0 || target_width == 0 || target_height == 0) {
        return ErrorKind::ENCODING_ERROR;
    }
    if (image.pixels.size() < static_cast<size_t>(image.width) * image.height * 3) {
        return ErrorKind::ENCODING_ERROR;
    }

    Rect src, dst;
    compute_fit(image.width, image.height, target_width, target_height, options.fit, src, dst);

    RgbImage canvas(target_width, target_height);
    for (size_t i = 0; i < canvas.pixels.size(); i += 3) {
        memcpy(&canvas.pixels[i], options.background, 3);
    }
    resample(image, src, dst, canvas);

    out.width = target_width;
    out.height = target_height;
    out.mode = mode;
    out.row_length = row_length_for(mode, target_width);
    out.rows.assign(target_height, std::vector<uint8_t>(out.row_length, 0));
    for (uint16_t y = 0; y < target_height; ++y) {
        serialize_row(canvas, y, mode, options, out.rows[y]);
    }
    return ErrorKind::NONE;
}

std::vector<uint8_t> device_payload(const EncodedImage& image, bool reverse) {
    std::vector<uint8_t> payload;
    payload.reserve(image.payload_size());
    for (const auto& row : image.rows) {
        payload.insert(payload.end(), row.begin(), row.end());
    }
    if (reverse) {
        std::reverse(payload.begin(), payload.end());
    }
    return payload;
}

const char* pixel_mode_name(PixelMode mode) {
    switch (mode) {
    case PixelMode::RGB565: return "rgb565";
    case PixelMode::GRAY8:  return "gray8";
    case PixelMode::MONO1:  return "mono1";
    }
    return "unknown";
}

const char* fit_policy_name(FitPolicy fit) {
    switch (fit) {
    case FitPolicy::LETTERBOX: return "letterbox";
    case FitPolicy::CROP:      return "crop";
    case FitPolicy::STRETCH:   return "stretch";
    }
    return "unknown";
}

bool parse_pixel_mode(const char* text, PixelMode& out) {
    if (strcmp(text, "rgb565") == 0) {
        out = PixelMode::RGB565;
    } else if (strcmp(text, "gray8") == 0) {
        out = PixelMode::GRAY8;
    } else if (strcmp(text, "mono1") == 0) {
        out = PixelMode::MONO1;
    } else {
        return false;
    }
    return true;
}

bool parse_fit_policy(const char* text, FitPolicy& out) {
    if (strcmp(text, "letterbox") == 0) {
        out = FitPolicy::LETTERBOX;
    } else if (strcmp(text, "crop") == 0) {
        out = FitPolicy::CROP;
    } else if (strcmp(text, "stretch") == 0) {
        out = FitPolicy::STRETCH;
    } else {
        return false;
    }
    return true;
}
