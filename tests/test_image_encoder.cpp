// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "image_encoder.h"
#include "sketch_config.h"
#include <gtest/gtest.h>
#include <bitset>

namespace {

RgbImage solid_image(uint16_t w, uint16_t h, uint8_t r, uint8_t g, uint8_t b) {
    RgbImage image(w, h);
    for (size_t i = 0; i < image.pixels.size(); i += 3) {
        image.pixels[i] = r;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = b;
    }
    return image;
}

RgbImage gradient_image(uint16_t w, uint16_t h) {
    RgbImage image(w, h);
    for (uint16_t y = 0; y < h; ++y) {
        for (uint16_t x = 0; x < w; ++x) {
            uint8_t* px = image.at(x, y);
            px[0] = static_cast<uint8_t>(x * 255 / (w - 1));
            px[1] = static_cast<uint8_t>(y * 255 / (h - 1));
            px[2] = static_cast<uint8_t>((x + y) & 0xFF);
        }
    }
    return image;
}

// Three vertical bands: red, green, blue
RgbImage banded_image(uint16_t band_width, uint16_t h) {
    RgbImage image(band_width * 3, h);
    for (uint16_t y = 0; y < h; ++y) {
        for (uint16_t x = 0; x < image.width; ++x) {
            uint8_t* px = image.at(x, y);
            px[x / band_width] = 255;
        }
    }
    return image;
}

} // namespace

TEST(ImageEncoder, EncodingIsDeterministic) {
    RgbImage image = gradient_image(64, 48);
    for (PixelMode mode : {PixelMode::RGB565, PixelMode::GRAY8, PixelMode::MONO1}) {
        EncodedImage first, second;
        ASSERT_EQ(encode_image(image, 40, 40, mode, EncoderOptions(), first), ErrorKind::NONE);
        ASSERT_EQ(encode_image(image, 40, 40, mode, EncoderOptions(), second), ErrorKind::NONE);
        EXPECT_EQ(first.rows, second.rows) << pixel_mode_name(mode);
    }
}

TEST(ImageEncoder, MonoTargetHasFixedRowLength) {
    RgbImage image = gradient_image(640, 480);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 128, 128, PixelMode::MONO1, EncoderOptions(), encoded), ErrorKind::NONE);

    EXPECT_EQ(encoded.width, 128);
    EXPECT_EQ(encoded.height, 128);
    EXPECT_EQ(encoded.mode, PixelMode::MONO1);
    EXPECT_EQ(encoded.row_length, 16u);
    ASSERT_EQ(encoded.rows.size(), 128u);
    for (const auto& row : encoded.rows) {
        EXPECT_EQ(row.size(), 16u);
    }
    EXPECT_EQ(encoded.payload_size(), 2048u);
}

TEST(ImageEncoder, LetterboxPadsWithBackground) {
    RgbImage image = solid_image(640, 480, 255, 255, 255);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 128, 128, PixelMode::GRAY8, EncoderOptions(), encoded), ErrorKind::NONE);

    // 4:3 content scaled to 128x96, centered vertically
    for (size_t y = 0; y < 128; ++y) {
        uint8_t expected = (y >= 16 && y < 112) ? 255 : 0;
        for (uint8_t value : encoded.rows[y]) {
            ASSERT_EQ(value, expected) << "row " << y;
        }
    }
}

TEST(ImageEncoder, LetterboxUsesConfiguredBackgroundColour) {
    RgbImage image = solid_image(20, 10, 0, 0, 0);
    EncoderOptions options;
    options.background[0] = 255;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 10, 10, PixelMode::RGB565, options, encoded), ErrorKind::NONE);

    // Content is 10x5 at y = 2 (rounded down)
    EXPECT_EQ(encoded.rows[0][0], 0x00);
    EXPECT_EQ(encoded.rows[0][1], 0xF8);
    EXPECT_EQ(encoded.rows[4][0], 0x00);
    EXPECT_EQ(encoded.rows[4][1], 0x00);
}

TEST(ImageEncoder, CropKeepsCenter) {
    RgbImage image = banded_image(10, 10);
    EncoderOptions options;
    options.fit = FitPolicy::CROP;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 10, 10, PixelMode::RGB565, options, encoded), ErrorKind::NONE);

    // Only the green band survives: 0x07E0 little-endian
    for (const auto& row : encoded.rows) {
        for (size_t i = 0; i < row.size(); i += 2) {
            ASSERT_EQ(row[i], 0xE0);
            ASSERT_EQ(row[i + 1], 0x07);
        }
    }
}

TEST(ImageEncoder, StretchCoversWholeTarget) {
    RgbImage image = banded_image(10, 10);
    EncoderOptions options;
    options.fit = FitPolicy::STRETCH;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 3, 2, PixelMode::RGB565, options, encoded), ErrorKind::NONE);

    const std::vector<uint8_t> expected = {0x00, 0xF8, 0xE0, 0x07, 0x1F, 0x00};
    EXPECT_EQ(encoded.rows[0], expected);
    EXPECT_EQ(encoded.rows[1], expected);
}

TEST(ImageEncoder, Rgb565IsLittleEndian) {
    RgbImage image = solid_image(1, 1, 0x12, 0x34, 0x56);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 1, 1, PixelMode::RGB565, EncoderOptions(), encoded), ErrorKind::NONE);

    // r5 = 2, g6 = 13, b5 = 10 -> 0x11AA
    ASSERT_EQ(encoded.rows[0].size(), 2u);
    EXPECT_EQ(encoded.rows[0][0], 0xAA);
    EXPECT_EQ(encoded.rows[0][1], 0x11);
}

TEST(ImageEncoder, Gray8UsesIntegerLuma) {
    RgbImage image = solid_image(2, 2, 100, 150, 200);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 2, 2, PixelMode::GRAY8, EncoderOptions(), encoded), ErrorKind::NONE);

    EXPECT_EQ(encoded.rows[0][0], 140);
    EXPECT_EQ(encoded.rows[1][1], 140);
}

TEST(ImageEncoder, BoxFilterAveragesSourceCells) {
    RgbImage image(2, 1);
    image.at(0, 0)[0] = 0;
    image.at(1, 0)[0] = 200;
    EncoderOptions options;
    options.fit = FitPolicy::STRETCH;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 1, 1, PixelMode::GRAY8, options, encoded), ErrorKind::NONE);

    // Averaged red 100 -> luma (77 * 100) >> 8
    EXPECT_EQ(encoded.rows[0][0], 30);
}

TEST(ImageEncoder, MonoPaddingBitsAreZero) {
    RgbImage image = solid_image(10, 2, 255, 255, 255);
    EncoderOptions options;
    options.fit = FitPolicy::STRETCH;
    options.dither = DitherMode::THRESHOLD;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 10, 2, PixelMode::MONO1, options, encoded), ErrorKind::NONE);

    ASSERT_EQ(encoded.row_length, 2u);
    EXPECT_EQ(encoded.rows[0], (std::vector<uint8_t>{0xFF, 0xC0}));
}

TEST(ImageEncoder, MonoLsbFirstBitOrder) {
    RgbImage image = solid_image(3, 1, 255, 255, 255);
    EncoderOptions options;
    options.dither = DitherMode::THRESHOLD;
    options.msb_first = false;
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 3, 1, PixelMode::MONO1, options, encoded), ErrorKind::NONE);

    EXPECT_EQ(encoded.rows[0][0], 0x07);
}

TEST(ImageEncoder, BayerDitherLightsHalfOfMidGray) {
    RgbImage image = solid_image(8, 8, 128, 128, 128);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, 8, 8, PixelMode::MONO1, EncoderOptions(), encoded), ErrorKind::NONE);

    size_t lit = 0;
    for (const auto& row : encoded.rows) {
        lit += std::bitset<8>(row[0]).count();
    }
    EXPECT_EQ(lit, 32u);
}

TEST(ImageEncoder, ZeroAreaIsEncodingError) {
    EncodedImage encoded;
    EXPECT_EQ(encode_image(RgbImage(), 10, 10, PixelMode::RGB565, EncoderOptions(), encoded),
              ErrorKind::ENCODING_ERROR);

    RgbImage image = solid_image(4, 4, 1, 2, 3);
    EXPECT_EQ(encode_image(image, 0, 10, PixelMode::RGB565, EncoderOptions(), encoded), ErrorKind::ENCODING_ERROR);
    EXPECT_EQ(encode_image(image, 10, 0, PixelMode::GRAY8, EncoderOptions(), encoded), ErrorKind::ENCODING_ERROR);

    image.pixels.resize(10);
    EXPECT_EQ(encode_image(image, 10, 10, PixelMode::GRAY8, EncoderOptions(), encoded), ErrorKind::ENCODING_ERROR);
}

TEST(ImageEncoder, DevicePayloadReversesWholeBuffer) {
    EncodedImage encoded;
    encoded.width = 1;
    encoded.height = 2;
    encoded.row_length = 2;
    encoded.rows = {{0x01, 0x02}, {0x03, 0x04}};

    EXPECT_EQ(device_payload(encoded, false), (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(device_payload(encoded, true), (std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01}));
}

TEST(ImageEncoder, ProjectorFrameBufferSize) {
    RgbImage image = gradient_image(320, 240);
    EncodedImage encoded;

    ASSERT_EQ(encode_image(image, PROJECTOR_WIDTH, PROJECTOR_HEIGHT, PROJECTOR_PIXEL_MODE, EncoderOptions(), encoded),
              ErrorKind::NONE);

    EXPECT_EQ(device_payload(encoded, true).size(), 160u * 120u * 2u);
}

TEST(ImageEncoder, ModeAndFitNames) {
    PixelMode mode;
    FitPolicy fit;
    EXPECT_TRUE(parse_pixel_mode("mono1", mode));
    EXPECT_EQ(mode, PixelMode::MONO1);
    EXPECT_FALSE(parse_pixel_mode("rgb888", mode));
    EXPECT_TRUE(parse_fit_policy("crop", fit));
    EXPECT_EQ(fit, FitPolicy::CROP);
    EXPECT_FALSE(parse_fit_policy("zoom", fit));
    EXPECT_STREQ(pixel_mode_name(PixelMode::GRAY8), "gray8");
    EXPECT_STREQ(fit_policy_name(FitPolicy::LETTERBOX), "letterbox");
}
