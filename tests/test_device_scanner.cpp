// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "device_scanner.h"
#include "fake_ble_link.h"
#include <gtest/gtest.h>
#include <chrono>

TEST(DeviceName, NormalizationIgnoresCaseAndSeparators) {
    EXPECT_EQ(normalize_device_name("smART_Sketcher-2.0"), "smartsketcher2.0");
    EXPECT_EQ(normalize_device_name("smART Sketcher 2.0"), "smartsketcher2.0");
    EXPECT_EQ(normalize_device_name(""), "");
}

TEST(DeviceName, FilterMatchesAdvertisedVariants) {
    EXPECT_TRUE(device_name_matches("smART Sketcher 2.0", "smART Sketcher"));
    EXPECT_TRUE(device_name_matches("smART_Sketcher2.0", "smART Sketcher"));
    EXPECT_TRUE(device_name_matches("smART Sketcher 2.0", "smART Sketcher 2.0"));
    EXPECT_FALSE(device_name_matches("smART Projector", "smART Sketcher"));
    EXPECT_FALSE(device_name_matches("Sketcher", "smART Sketcher"));
}

TEST(DeviceName, EmptyFilterMatchesAnyNamedDevice) {
    EXPECT_TRUE(device_name_matches("anything", ""));
    EXPECT_FALSE(device_name_matches("", ""));
}

TEST(ScanForDevice, ReturnsFirstMatchingAdvertisement) {
    FakeAdvertisementSource source;
    source.add("Heart Rate", 0x01);
    source.add("smART Sketcher 2.0", 0x42, -55);
    source.add("smART Sketcher 2.0", 0x43);

    DeviceHandle handle = {};
    ErrorKind result = scan_for_device(source, "smART Sketcher", 1000, handle);

    ASSERT_EQ(result, ErrorKind::NONE);
    EXPECT_EQ(handle.name, "smART Sketcher 2.0");
    EXPECT_EQ(handle.address[0], 0xA0);
    EXPECT_EQ(handle.address[5], 0x42);
    EXPECT_EQ(handle.mtu, 23);
    EXPECT_EQ(handle.write_char_handle, 0);
    EXPECT_EQ(handle.notify_char_handle, 0);
    EXPECT_EQ(source.polls, 2u);
}

TEST(ScanForDevice, NotFoundAfterTimeout) {
    FakeAdvertisementSource source;
    source.add("Heart Rate", 0x01);
    source.add("Keyboard", 0x02);

    DeviceHandle handle = {};
    auto start = std::chrono::steady_clock::now();
    ErrorKind result = scan_for_device(source, "smART Sketcher", 100, handle);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result, ErrorKind::NOT_FOUND);
    EXPECT_GE(elapsed, 100);
    EXPECT_LT(elapsed, 2000);
    EXPECT_TRUE(handle.name.empty());
}

TEST(ScanForDevice, ZeroTimeoutDoesNotPoll) {
    FakeAdvertisementSource source;
    source.add("smART Sketcher 2.0", 0x42);

    DeviceHandle handle = {};
    EXPECT_EQ(scan_for_device(source, "smART Sketcher", 0, handle), ErrorKind::NOT_FOUND);
    EXPECT_EQ(source.polls, 0u);
}
