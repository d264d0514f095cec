// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include "sketch_errors.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

/**
 * @brief ChunkedTransfer - ordered, retrying frame sender over a BleLink
 *
 * Protocol Flow:
 * 1. A link that is already down fails as WRITE_ERROR / DISCONNECTED;
 *    otherwise validate frame_size (1..link.max_write_size()) and payload
 * 2. Split the payload into frames 0..N-1, frame N-1 flagged final
 * 3. For each frame in order:
 *    - write it; on WRITE_ERROR resend the same bytes up to max_retries times
 *    - DISCONNECTED or TOO_LONG abandons the transfer immediately
 *    - check the cancel flag, then wait frame_delay_ms before the next frame
 * 4. COMPLETED once every frame was delivered at the link layer
 *
 * Link-layer delivery is the strongest signal available: the projector
 * never confirms that it processed a frame, and there is no backpressure
 * other than pacing.
 *
 * The payload is opaque; image data and shell commands travel the same way.
 */
enum class TransferStatus : uint8_t {
    PENDING = 0,
    IN_PROGRESS = 1,
    COMPLETED = 2,
    FAILED = 3
};

struct TransferFrame {
    uint32_t sequence;
    const uint8_t* data;    // view into the payload, valid while the payload lives
    size_t length;
    bool is_final;
};

// frame_index is the frame that was not delivered: the failing frame, or
// the first unsent frame after a cancel. The last delivered frame is
// TransferResult::last_sent_frame().
struct TransferError {
    ErrorKind kind = ErrorKind::NONE;
    uint32_t frame_index = 0;
    LinkStatus link_status = LinkStatus::OK;
};

struct TransferResult {
    TransferStatus status = TransferStatus::PENDING;
    uint32_t frames_sent = 0;
    uint32_t total_frames = 0;
    TransferError last_error;

    bool ok() const { return status == TransferStatus::COMPLETED; }
    // -1 when no frame went out
    int64_t last_sent_frame() const { return static_cast<int64_t>(frames_sent) - 1; }
};

typedef std::function<void(uint32_t frames_sent, uint32_t total_frames)> TransferProgressCallback;

struct TransferOptions {
    uint32_t max_retries = 3;           // resends per frame after the first attempt
    uint32_t frame_delay_ms = 0;        // pause between consecutive frames
    uint32_t retry_delay_ms = 0;        // pause before a resend
    const std::atomic<bool>* cancel = nullptr;
    TransferProgressCallback progress;
};

// In-flight bookkeeping for one transfer call. Status only moves forward.
class TransferSession {
public:
    explicit TransferSession(uint32_t total_frames);

    bool advance(TransferStatus next);

    TransferStatus status() const { return status_; }
    uint32_t total_frames() const { return total_frames_; }
    uint32_t next_index() const { return next_index_; }
    uint32_t retries(uint32_t index) const { return index < retries_.size() ? retries_[index] : 0; }

    void record_retry(uint32_t index) { retries_[index]++; }
    void mark_sent() { next_index_++; }

private:
    uint32_t total_frames_;
    uint32_t next_index_;
    std::vector<uint32_t> retries_;
    TransferStatus status_;
};

// Returns false (and leaves frames empty) for frame_size <= 0 or an empty payload.
bool split_frames(const uint8_t* payload, size_t len, int32_t frame_size,
                  std::vector<TransferFrame>& frames);

class ChunkedTransfer {
public:
    explicit ChunkedTransfer(BleLink& link);

    TransferResult transfer(const uint8_t* payload, size_t len, int32_t frame_size,
                            const TransferOptions& options);
    TransferResult transfer(const std::vector<uint8_t>& payload, int32_t frame_size,
                            const TransferOptions& options) {
        return transfer(payload.data(), payload.size(), frame_size, options);
    }

    bool in_progress() const { return busy_.load(); }

private:
    BleLink& link_;
    std::mutex mutex_;
    std::atomic<bool> busy_;

    LinkStatus send_frame(const TransferFrame& frame, TransferSession& session,
                          const TransferOptions& options);
};

const char* transfer_status_name(TransferStatus status);
