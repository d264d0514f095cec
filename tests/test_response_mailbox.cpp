// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "response_mailbox.h"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

TEST(NotificationText, KeepsPrintableAsciiAndTrims) {
    const uint8_t data[] = {0x00, ' ', 'O', 'K', '\r', '\n', 0xFF};
    EXPECT_EQ(notification_text(data, sizeof(data)), "OK");

    const uint8_t binary[] = {0x01, 0x02, 0xFE};
    EXPECT_EQ(notification_text(binary, sizeof(binary)), "");

    const uint8_t lines[] = {'a', '\n', 'b'};
    EXPECT_EQ(notification_text(lines, sizeof(lines)), "a b");
}

TEST(ResponseMailbox, MatchesCaseInsensitiveSubstring) {
    ResponseMailbox mailbox;
    mailbox.post("Image Done!");

    EXPECT_TRUE(mailbox.contains("done"));
    EXPECT_TRUE(mailbox.contains("DONE"));
    EXPECT_FALSE(mailbox.contains("OK"));
}

TEST(ResponseMailbox, IgnoresEmptyAndClears) {
    ResponseMailbox mailbox;
    mailbox.post("");
    EXPECT_EQ(mailbox.size(), 0u);

    mailbox.post("OK");
    EXPECT_EQ(mailbox.size(), 1u);
    mailbox.clear();
    EXPECT_EQ(mailbox.size(), 0u);
    EXPECT_FALSE(mailbox.contains("OK"));
}

TEST(ResponseMailbox, DropsOldestWhenFull) {
    ResponseMailbox mailbox;
    mailbox.post("first");
    for (size_t i = 0; i < ResponseMailbox::MAX_RESPONSES; ++i) {
        mailbox.post("filler " + std::to_string(i));
    }

    EXPECT_EQ(mailbox.size(), ResponseMailbox::MAX_RESPONSES);
    EXPECT_FALSE(mailbox.contains("first"));
    EXPECT_TRUE(mailbox.contains("filler 31"));
}

TEST(ResponseMailbox, WaitWakesOnPostFromAnotherThread) {
    ResponseMailbox mailbox;
    std::thread poster([&mailbox] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        mailbox.post("busy");
        mailbox.post("OK");
    });

    EXPECT_TRUE(mailbox.wait_for("ok", 2000));
    poster.join();
}

TEST(ResponseMailbox, WaitTimesOut) {
    ResponseMailbox mailbox;
    mailbox.post("busy");

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(mailbox.wait_for("Done", 50));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_GE(elapsed, 50);
}
