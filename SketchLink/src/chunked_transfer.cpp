// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "chunked_transfer.h"
#include <chrono>
#include <thread>

namespace {

void pause_ms(uint32_t ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

class BusyFlag {
public:
    explicit BusyFlag(std::atomic<bool>& flag) : flag_(flag) { flag_.store(true); }
    ~BusyFlag() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // namespace

TransferSession::TransferSession(uint32_t total_frames)
    : total_frames_(total_frames), next_index_(0), retries_(total_frames, 0),
      status_(TransferStatus::PENDING) {
}

bool TransferSession::advance(TransferStatus next) {
    switch (status_) {
    case TransferStatus::PENDING:
        if (next != TransferStatus::IN_PROGRESS && next != TransferStatus::FAILED) {
            return false;
        }
        break;
    case TransferStatus::IN_PROGRESS:
        if (next != TransferStatus::COMPLETED && next != TransferStatus::FAILED) {
            return false;
        }
        break;
    case TransferStatus::COMPLETED:
    case TransferStatus::FAILED:
        return false;
    }
    status_ = next;
    return true;
}

bool split_frames(const uint8_t* payload, size_t len, int32_t frame_size,
                  std::vector<TransferFrame>& frames) {
    frames.clear();
    if (frame_size <= 0 || len == 0 || payload == nullptr) {
        return false;
    }

    const size_t step = static_cast<size_t>(frame_size);
    const size_t count = (len + step - 1) / step;
    frames.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        size_t offset = i * step;
        size_t length = (len - offset < step) ? (len - offset) : step;
        frames.push_back({static_cast<uint32_t>(i), payload + offset, length, i + 1 == count});
    }
    return true;
}

ChunkedTransfer::ChunkedTransfer(BleLink& link) : link_(link), busy_(false) {
}

TransferResult ChunkedTransfer::transfer(const uint8_t* payload, size_t len, int32_t frame_size,
                                         const TransferOptions& options) {
    TransferResult result;

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        result.status = TransferStatus::FAILED;
        result.last_error.kind = ErrorKind::BUSY;
        return result;
    }
    BusyFlag busy(busy_);

    if (!link_.is_connected()) {
        result.status = TransferStatus::FAILED;
        result.last_error.kind = ErrorKind::WRITE_ERROR;
        result.last_error.link_status = LinkStatus::DISCONNECTED;
        return result;
    }

    std::vector<TransferFrame> frames;
    if (frame_size <= 0 || static_cast<size_t>(frame_size) > link_.max_write_size() ||
        !split_frames(payload, len, frame_size, frames)) {
        result.status = TransferStatus::FAILED;
        result.last_error.kind = ErrorKind::CONFIG_ERROR;
        return result;
    }

    TransferSession session(static_cast<uint32_t>(frames.size()));
    result.total_frames = session.total_frames();
    session.advance(TransferStatus::IN_PROGRESS);

    for (const TransferFrame& frame : frames) {
        if (options.cancel && options.cancel->load()) {
            session.advance(TransferStatus::FAILED);
            result.last_error.kind = ErrorKind::CANCELLED;
            result.last_error.frame_index = frame.sequence;
            break;
        }

        if (frame.sequence > 0) {
            pause_ms(options.frame_delay_ms);
        }

        LinkStatus status = send_frame(frame, session, options);
        if (status != LinkStatus::OK) {
            session.advance(TransferStatus::FAILED);
            result.last_error.kind = ErrorKind::WRITE_ERROR;
            result.last_error.frame_index = frame.sequence;
            result.last_error.link_status = status;
            break;
        }

        session.mark_sent();
        if (options.progress) {
            options.progress(session.next_index(), session.total_frames());
        }
    }

    if (session.status() == TransferStatus::IN_PROGRESS) {
        session.advance(TransferStatus::COMPLETED);
    }

    result.status = session.status();
    result.frames_sent = session.next_index();
    return result;
}

LinkStatus ChunkedTransfer::send_frame(const TransferFrame& frame, TransferSession& session,
                                       const TransferOptions& options) {
    uint32_t attempt = 0;
    while (true) {
        LinkStatus status = link_.write(frame.data, frame.length);
        if (status == LinkStatus::OK) {
            return status;
        }
        // Only transient write errors are worth another attempt
        if (status != LinkStatus::WRITE_ERROR || attempt >= options.max_retries) {
            return status;
        }
        attempt++;
        session.record_retry(frame.sequence);
        pause_ms(options.retry_delay_ms);
    }
}

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
    case TransferStatus::PENDING:     return "pending";
    case TransferStatus::IN_PROGRESS: return "in_progress";
    case TransferStatus::COMPLETED:   return "completed";
    case TransferStatus::FAILED:      return "failed";
    }
    return "unknown";
}
