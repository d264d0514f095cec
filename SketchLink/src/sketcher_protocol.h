// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "ble_link.h"
#include "chunked_transfer.h"
#include "response_mailbox.h"
#include "sketch_config.h"
#include <atomic>
#include <cstdint>
#include <vector>

/**
 * @brief SketcherProtocol - image upload handshake for the smART Sketcher 2.0
 *
 * Everything goes over the single characteristic 0xFFE3 (WRITE_NR / NOTIFY).
 *
 * Protocol Flow:
 * 1. Host -> Device: SEND_IMAGE command (8 bytes)
 * 2. Device -> Host: notification containing "OK"
 * 3. Host -> Device: raw image payload in frames of chunk_size bytes,
 *    paced by frame_delay_ms (no per-frame header, no acknowledgment)
 * 4. Device -> Host: notification containing "Done" once the picture is shown
 *
 * A missing "Done" is only reported: the device sometimes shows the image
 * without sending it.
 *
 * Message Formats:
 * - SEND_IMAGE: [0x01][0x00][0x00][0x00][chunk_size LE16][mode LE16 = 0x0002]
 * - Image payload: RGB565 little-endian, 160x120, whole buffer byte-reversed
 */
class SketcherProtocol {
public:
    enum class CommandType : uint8_t {
        SEND_IMAGE = 0x01
    };

    static constexpr size_t SEND_IMAGE_COMMAND_SIZE = 8;
    static constexpr uint16_t SEND_IMAGE_MODE = 0x0002;
    static constexpr const char* READY_RESPONSE = "OK";
    static constexpr const char* DONE_RESPONSE = "Done";

    struct UploadResult {
        TransferResult transfer;
        bool device_ready = false;
        bool done_received = false;
        uint16_t frame_size = 0;

        ErrorKind error() const;
        bool ok() const { return error() == ErrorKind::NONE; }
    };

    SketcherProtocol(BleLink& link, ResponseMailbox& mailbox, ChunkedTransfer& transfer);

    // Frame size for image data: the configured chunk size, capped by the link.
    uint16_t frame_size_for(const SketchSettings& settings) const;

    UploadResult upload(const std::vector<uint8_t>& payload, const SketchSettings& settings,
                        const std::atomic<bool>* cancel = nullptr,
                        TransferProgressCallback progress = nullptr);

    // Short shell command: a single frame whenever it fits one write.
    TransferResult send_command(const std::vector<uint8_t>& bytes, const SketchSettings& settings);

private:
    BleLink& link_;
    ResponseMailbox& mailbox_;
    ChunkedTransfer& transfer_;
};

std::vector<uint8_t> build_send_image_command(uint16_t chunk_size);

// Caller-facing failure kind: an exhausted write budget is TRANSFER_FAILED.
ErrorKind transfer_failure_kind(const TransferResult& result);
