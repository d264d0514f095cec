// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "sketcher_protocol.h"
#include <algorithm>

std::vector<uint8_t> build_send_image_command(uint16_t chunk_size) {
    std::vector<uint8_t> command(SketcherProtocol::SEND_IMAGE_COMMAND_SIZE, 0x00);
    command[0] = static_cast<uint8_t>(SketcherProtocol::CommandType::SEND_IMAGE);
    command[4] = static_cast<uint8_t>(chunk_size & 0xFF);
    command[5] = static_cast<uint8_t>(chunk_size >> 8);
    command[6] = static_cast<uint8_t>(SketcherProtocol::SEND_IMAGE_MODE & 0xFF);
    command[7] = static_cast<uint8_t>(SketcherProtocol::SEND_IMAGE_MODE >> 8);
    return command;
}

ErrorKind transfer_failure_kind(const TransferResult& result) {
    if (result.ok()) {
        return ErrorKind::NONE;
    }
    if (result.last_error.kind == ErrorKind::WRITE_ERROR) {
        return ErrorKind::TRANSFER_FAILED;
    }
    return result.last_error.kind == ErrorKind::NONE ? ErrorKind::TRANSFER_FAILED : result.last_error.kind;
}

ErrorKind SketcherProtocol::UploadResult::error() const {
    if (!device_ready) {
        // The command itself never made it out
        if (transfer.status == TransferStatus::FAILED) {
            return transfer_failure_kind(transfer);
        }
        return ErrorKind::DEVICE_NOT_READY;
    }
    return transfer_failure_kind(transfer);
}

SketcherProtocol::SketcherProtocol(BleLink& link, ResponseMailbox& mailbox, ChunkedTransfer& transfer)
    : link_(link), mailbox_(mailbox), transfer_(transfer) {
}

uint16_t SketcherProtocol::frame_size_for(const SketchSettings& settings) const {
    size_t size = std::min<size_t>(settings.chunk_size, link_.max_write_size());
    return static_cast<uint16_t>(std::min<size_t>(size, 0xFFFF));
}

SketcherProtocol::UploadResult SketcherProtocol::upload(const std::vector<uint8_t>& payload,
                                                        const SketchSettings& settings,
                                                        const std::atomic<bool>* cancel,
                                                        TransferProgressCallback progress) {
    UploadResult result;
    result.frame_size = frame_size_for(settings);

    mailbox_.clear();
    TransferResult command = send_command(build_send_image_command(result.frame_size), settings);
    if (!command.ok()) {
        result.transfer = command;
        return result;
    }

    if (!mailbox_.wait_for(READY_RESPONSE, settings.ready_timeout_ms)) {
        return result;
    }
    result.device_ready = true;

    TransferOptions options;
    options.max_retries = settings.max_retries;
    options.frame_delay_ms = settings.frame_delay_ms;
    options.retry_delay_ms = settings.retry_delay_ms;
    options.cancel = cancel;
    options.progress = progress;

    result.transfer = transfer_.transfer(payload, result.frame_size, options);
    if (!result.transfer.ok()) {
        return result;
    }

    result.done_received = mailbox_.wait_for(DONE_RESPONSE, settings.done_timeout_ms);
    return result;
}

TransferResult SketcherProtocol::send_command(const std::vector<uint8_t>& bytes, const SketchSettings& settings) {
    TransferOptions options;
    options.max_retries = settings.max_retries;
    options.retry_delay_ms = settings.retry_delay_ms;

    size_t frame_size = std::min(bytes.size(), link_.max_write_size());
    return transfer_.transfer(bytes, static_cast<int32_t>(frame_size), options);
}
