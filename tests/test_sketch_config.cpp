// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "sketch_config.h"
#include <gtest/gtest.h>

TEST(SketchSettings, DefaultsMatchProjector) {
    SketchSettings settings;
    EXPECT_EQ(settings.name_filter, "smART Sketcher");
    EXPECT_EQ(settings.chunk_size, 80u);
    EXPECT_EQ(settings.frame_delay_ms, 10u);
    EXPECT_EQ(settings.ready_timeout_ms, 10000u);
    EXPECT_EQ(settings.done_timeout_ms, 20000u);
    EXPECT_EQ(settings.fit, FitPolicy::LETTERBOX);
    EXPECT_EQ(settings.mode, PixelMode::RGB565);
    EXPECT_TRUE(settings.reverse_payload);
    EXPECT_FALSE(settings.write_with_response);
    EXPECT_TRUE(settings.boot_image.empty());
}

TEST(SketchSettings, EveryKeyIsReadable) {
    SketchSettings settings;
    std::string value;
    EXPECT_EQ(setting_keys().size(), 15u);
    for (const char* key : setting_keys()) {
        EXPECT_TRUE(get_setting(settings, key, value)) << key;
    }
    EXPECT_FALSE(get_setting(settings, "no_such_key", value));
}

TEST(SketchSettings, SetAndGetTypedValues) {
    SketchSettings settings;
    std::string value;

    EXPECT_TRUE(set_setting(settings, "chunk_size", "180"));
    EXPECT_EQ(settings.chunk_size, 180u);
    ASSERT_TRUE(get_setting(settings, "chunk_size", value));
    EXPECT_EQ(value, "180");

    EXPECT_TRUE(set_setting(settings, "write_with_response", "on"));
    EXPECT_TRUE(settings.write_with_response);
    ASSERT_TRUE(get_setting(settings, "write_with_response", value));
    EXPECT_EQ(value, "true");

    EXPECT_TRUE(set_setting(settings, "fit", "crop"));
    EXPECT_EQ(settings.fit, FitPolicy::CROP);
    EXPECT_TRUE(set_setting(settings, "mode", "mono1"));
    EXPECT_EQ(settings.mode, PixelMode::MONO1);

    EXPECT_TRUE(set_setting(settings, "name_filter", "smART Sketcher 2.0"));
    EXPECT_EQ(settings.name_filter, "smART Sketcher 2.0");
}

TEST(SketchSettings, RejectsInvalidValues) {
    SketchSettings settings;
    EXPECT_FALSE(set_setting(settings, "chunk_size", "0"));
    EXPECT_FALSE(set_setting(settings, "chunk_size", "515"));
    EXPECT_FALSE(set_setting(settings, "chunk_size", "-1"));
    EXPECT_FALSE(set_setting(settings, "scan_timeout_ms", "5s"));
    EXPECT_FALSE(set_setting(settings, "scan_timeout_ms", ""));
    EXPECT_FALSE(set_setting(settings, "reverse_payload", "maybe"));
    EXPECT_FALSE(set_setting(settings, "mode", "rgb888"));
    EXPECT_FALSE(set_setting(settings, "unknown", "1"));

    EXPECT_EQ(settings.chunk_size, 80u);
    EXPECT_EQ(settings.scan_timeout_ms, 5000u);
    EXPECT_TRUE(settings.reverse_payload);
}

TEST(SketchSettings, LargestChunkFitsOneWrite) {
    SketchSettings settings;
    EXPECT_TRUE(set_setting(settings, "chunk_size", "514"));
    EXPECT_EQ(settings.chunk_size, 514u);
}

TEST(SketchSettings, SerializedFormRestoresChangedValues) {
    SketchSettings original;
    original.name_filter = "Sketcher";
    original.chunk_size = 160;
    original.mode = PixelMode::GRAY8;
    original.reverse_payload = false;
    original.boot_image = "logo.jpg";

    SketchSettings restored;
    EXPECT_EQ(apply_serialized_settings(restored, serialize_settings(original)), setting_keys().size());

    EXPECT_EQ(restored.name_filter, "Sketcher");
    EXPECT_EQ(restored.chunk_size, 160u);
    EXPECT_EQ(restored.mode, PixelMode::GRAY8);
    EXPECT_FALSE(restored.reverse_payload);
    EXPECT_EQ(restored.boot_image, "logo.jpg");
}

TEST(SketchSettings, SerializedFormSkipsBadLines) {
    SketchSettings settings;
    size_t applied = apply_serialized_settings(settings,
        "chunk_size=100\nbogus=1\nframe_delay_ms=abc\n=5\nno_equals\nmax_retries=5");

    EXPECT_EQ(applied, 2u);
    EXPECT_EQ(settings.chunk_size, 100u);
    EXPECT_EQ(settings.max_retries, 5u);
    EXPECT_EQ(settings.frame_delay_ms, 10u);
}
