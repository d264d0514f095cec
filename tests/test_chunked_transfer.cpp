// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "chunked_transfer.h"
#include "sketcher_protocol.h"
#include "fake_ble_link.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

std::vector<uint8_t> make_payload(size_t len) {
    std::vector<uint8_t> payload(len);
    for (size_t i = 0; i < len; ++i) {
        payload[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return payload;
}

} // namespace

TEST(SplitFrames, ContiguousIndicesAndSingleFinalFrame) {
    std::vector<uint8_t> payload = make_payload(10000);
    std::vector<TransferFrame> frames;
    ASSERT_TRUE(split_frames(payload.data(), payload.size(), 180, frames));

    ASSERT_EQ(frames.size(), 56u);
    std::vector<uint8_t> joined;
    for (size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].sequence, i);
        EXPECT_LE(frames[i].length, 180u);
        EXPECT_EQ(frames[i].is_final, i + 1 == frames.size());
        joined.insert(joined.end(), frames[i].data, frames[i].data + frames[i].length);
    }
    EXPECT_EQ(frames.back().length, 100u);
    EXPECT_EQ(joined, payload);
}

TEST(SplitFrames, RejectsNonPositiveFrameSize) {
    std::vector<uint8_t> payload = make_payload(16);
    std::vector<TransferFrame> frames;
    EXPECT_FALSE(split_frames(payload.data(), payload.size(), 0, frames));
    EXPECT_FALSE(split_frames(payload.data(), payload.size(), -5, frames));
    EXPECT_TRUE(frames.empty());
}

TEST(ChunkedTransfer, DeliversPayloadInOrder) {
    FakeBleLink link(20);
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(1000);

    TransferResult result = transfer.transfer(payload, 20, TransferOptions());

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.status, TransferStatus::COMPLETED);
    EXPECT_EQ(result.total_frames, 50u);
    EXPECT_EQ(result.frames_sent, 50u);
    EXPECT_EQ(link.received, payload);
    EXPECT_EQ(link.attempts.size(), 50u);
}

TEST(ChunkedTransfer, NonPositiveFrameSizeIsConfigError) {
    FakeBleLink link;
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(64);

    for (int32_t frame_size : {0, -1, -100}) {
        TransferResult result = transfer.transfer(payload, frame_size, TransferOptions());
        EXPECT_EQ(result.status, TransferStatus::FAILED);
        EXPECT_EQ(result.last_error.kind, ErrorKind::CONFIG_ERROR);
        EXPECT_EQ(result.frames_sent, 0u);
    }
    EXPECT_TRUE(link.attempts.empty());
}

TEST(ChunkedTransfer, FrameLargerThanLinkIsConfigError) {
    FakeBleLink link(20);
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(64);

    TransferResult result = transfer.transfer(payload, 21, TransferOptions());

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.kind, ErrorKind::CONFIG_ERROR);
    EXPECT_TRUE(link.attempts.empty());
}

TEST(ChunkedTransfer, EmptyPayloadIsConfigError) {
    FakeBleLink link;
    ChunkedTransfer transfer(link);

    TransferResult result = transfer.transfer(std::vector<uint8_t>(), 20, TransferOptions());

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.kind, ErrorKind::CONFIG_ERROR);
}

TEST(ChunkedTransfer, ResendsIdenticalFrameAfterWriteError) {
    FakeBleLink link(20);
    link.failures[10] = LinkStatus::WRITE_ERROR;
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(400);

    TransferResult result = transfer.transfer(payload, 20, TransferOptions());

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(link.attempts.size(), 21u);
    EXPECT_EQ(link.attempts[10], link.attempts[11]);
    EXPECT_EQ(link.attempts[10], std::vector<uint8_t>(payload.begin() + 200, payload.begin() + 220));
    EXPECT_EQ(link.received, payload);
}

TEST(ChunkedTransfer, ExhaustedRetryBudgetFails) {
    FakeBleLink link(20);
    // Frame 3 fails on the first attempt and all three resends
    for (size_t attempt = 3; attempt <= 6; ++attempt) {
        link.failures[attempt] = LinkStatus::WRITE_ERROR;
    }
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(200);
    TransferOptions options;
    options.max_retries = 3;

    TransferResult result = transfer.transfer(payload, 20, options);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.kind, ErrorKind::WRITE_ERROR);
    EXPECT_EQ(result.last_error.frame_index, 3u);
    EXPECT_EQ(result.last_error.link_status, LinkStatus::WRITE_ERROR);
    EXPECT_EQ(result.frames_sent, 3u);
    EXPECT_EQ(link.attempts.size(), 7u);
    EXPECT_EQ(transfer_failure_kind(result), ErrorKind::TRANSFER_FAILED);
}

TEST(ChunkedTransfer, RecoversOnLastAllowedRetry) {
    FakeBleLink link(20);
    for (size_t attempt = 0; attempt < 3; ++attempt) {
        link.failures[attempt] = LinkStatus::WRITE_ERROR;
    }
    ChunkedTransfer transfer(link);
    TransferOptions options;
    options.max_retries = 3;

    TransferResult result = transfer.transfer(make_payload(40), 20, options);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(link.attempts.size(), 5u);
}

TEST(ChunkedTransfer, DisconnectIsNotRetried) {
    FakeBleLink link(20);
    link.failures[2] = LinkStatus::DISCONNECTED;
    ChunkedTransfer transfer(link);

    TransferResult result = transfer.transfer(make_payload(200), 20, TransferOptions());

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.link_status, LinkStatus::DISCONNECTED);
    EXPECT_EQ(result.last_error.frame_index, 2u);
    EXPECT_EQ(link.attempts.size(), 3u);
}

TEST(ChunkedTransfer, CancelStopsAfterCurrentFrame) {
    FakeBleLink link(20);
    std::atomic<bool> cancel(false);
    link.on_write = [&cancel](size_t attempt, LinkStatus) {
        if (attempt == 4) {
            cancel = true;
        }
    };
    ChunkedTransfer transfer(link);
    TransferOptions options;
    options.cancel = &cancel;

    TransferResult result = transfer.transfer(make_payload(200), 20, options);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.kind, ErrorKind::CANCELLED);
    EXPECT_EQ(result.last_error.frame_index, 5u);
    EXPECT_EQ(result.frames_sent, 5u);
    EXPECT_EQ(result.last_sent_frame(), 4);
    EXPECT_EQ(link.attempts.size(), 5u);
    EXPECT_FALSE(transfer.in_progress());
}

TEST(ChunkedTransfer, CancelBeforeFirstFrameSendsNothing) {
    FakeBleLink link(20);
    std::atomic<bool> cancel(true);
    ChunkedTransfer transfer(link);
    TransferOptions options;
    options.cancel = &cancel;

    TransferResult result = transfer.transfer(make_payload(100), 20, options);

    EXPECT_EQ(result.last_error.kind, ErrorKind::CANCELLED);
    EXPECT_EQ(result.last_error.frame_index, 0u);
    EXPECT_EQ(result.last_sent_frame(), -1);
    EXPECT_TRUE(link.attempts.empty());
}

TEST(ChunkedTransfer, LinkAlreadyDownIsDisconnectedWriteError) {
    FakeBleLink link(20);
    link.set_connected(false);
    ChunkedTransfer transfer(link);

    TransferResult result = transfer.transfer(make_payload(100), 20, TransferOptions());

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.last_error.kind, ErrorKind::WRITE_ERROR);
    EXPECT_EQ(result.last_error.link_status, LinkStatus::DISCONNECTED);
    EXPECT_EQ(result.frames_sent, 0u);
    EXPECT_TRUE(link.attempts.empty());
}

TEST(ChunkedTransfer, SecondTransferWhileBusyIsRejected) {
    FakeBleLink link(20);
    std::atomic<bool> first_write_started(false);
    std::atomic<bool> release(false);
    link.on_write = [&](size_t attempt, LinkStatus) {
        if (attempt == 0) {
            first_write_started = true;
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
    };
    ChunkedTransfer transfer(link);
    std::vector<uint8_t> payload = make_payload(100);

    TransferResult first;
    std::thread worker([&] { first = transfer.transfer(payload, 20, TransferOptions()); });
    while (!first_write_started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(transfer.in_progress());
    TransferResult second = transfer.transfer(payload, 20, TransferOptions());

    release = true;
    worker.join();

    EXPECT_EQ(second.status, TransferStatus::FAILED);
    EXPECT_EQ(second.last_error.kind, ErrorKind::BUSY);
    EXPECT_EQ(second.frames_sent, 0u);
    EXPECT_TRUE(first.ok());
    EXPECT_EQ(link.attempts.size(), 5u);
}

TEST(ChunkedTransfer, ReportsProgressAfterEachFrame) {
    FakeBleLink link(20);
    ChunkedTransfer transfer(link);
    std::vector<std::pair<uint32_t, uint32_t>> reports;
    TransferOptions options;
    options.progress = [&reports](uint32_t sent, uint32_t total) { reports.emplace_back(sent, total); };

    TransferResult result = transfer.transfer(make_payload(50), 20, options);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0], std::make_pair(1u, 3u));
    EXPECT_EQ(reports[2], std::make_pair(3u, 3u));
}

TEST(ChunkedTransfer, FrameDelayPacesConsecutiveFrames) {
    FakeBleLink link(20);
    ChunkedTransfer transfer(link);
    TransferOptions options;
    options.frame_delay_ms = 5;

    auto start = std::chrono::steady_clock::now();
    TransferResult result = transfer.transfer(make_payload(100), 20, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.ok());
    // Four pauses between five frames
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 20);
}

TEST(TransferSession, StatusNeverRegresses) {
    TransferSession session(3);
    EXPECT_EQ(session.status(), TransferStatus::PENDING);
    EXPECT_FALSE(session.advance(TransferStatus::COMPLETED));
    EXPECT_TRUE(session.advance(TransferStatus::IN_PROGRESS));
    EXPECT_FALSE(session.advance(TransferStatus::PENDING));
    EXPECT_TRUE(session.advance(TransferStatus::COMPLETED));
    EXPECT_FALSE(session.advance(TransferStatus::FAILED));
    EXPECT_FALSE(session.advance(TransferStatus::IN_PROGRESS));
    EXPECT_EQ(session.status(), TransferStatus::COMPLETED);
}

TEST(TransferSession, TracksRetriesPerFrame) {
    TransferSession session(4);
    session.record_retry(2);
    session.record_retry(2);
    EXPECT_EQ(session.retries(2), 2u);
    EXPECT_EQ(session.retries(0), 0u);
    EXPECT_EQ(session.retries(99), 0u);
}
