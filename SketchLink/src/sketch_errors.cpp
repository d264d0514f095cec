// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "sketch_errors.h"
#include "ble_link.h"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:             return "NONE";
    case ErrorKind::NOT_FOUND:        return "NOT_FOUND";
    case ErrorKind::CONNECTION_ERROR: return "CONNECTION_ERROR";
    case ErrorKind::WRITE_ERROR:      return "WRITE_ERROR";
    case ErrorKind::ENCODING_ERROR:   return "ENCODING_ERROR";
    case ErrorKind::TRANSFER_FAILED:  return "TRANSFER_FAILED";
    case ErrorKind::CONFIG_ERROR:     return "CONFIG_ERROR";
    case ErrorKind::CANCELLED:        return "CANCELLED";
    case ErrorKind::BUSY:             return "BUSY";
    case ErrorKind::DEVICE_NOT_READY: return "DEVICE_NOT_READY";
    }
    return "UNKNOWN";
}

const char* error_kind_message(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return "no error";
    case ErrorKind::NOT_FOUND:
        return "device not found: make sure the projector is powered on, in range and not connected to another client";
    case ErrorKind::CONNECTION_ERROR:
        return "connection failed: the GATT handshake did not complete or the write characteristic is missing";
    case ErrorKind::WRITE_ERROR:
        return "write failed: the link did not deliver a frame";
    case ErrorKind::ENCODING_ERROR:
        return "image could not be decoded or has zero area";
    case ErrorKind::TRANSFER_FAILED:
        return "transfer failed: retry budget exhausted";
    case ErrorKind::CONFIG_ERROR:
        return "invalid transfer configuration";
    case ErrorKind::CANCELLED:
        return "transfer cancelled by user";
    case ErrorKind::BUSY:
        return "another transfer is already in progress";
    case ErrorKind::DEVICE_NOT_READY:
        return "device did not answer OK to the send-image command";
    }
    return "unknown error";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return EXIT_OK;
    case ErrorKind::NOT_FOUND:
        return EXIT_NOT_FOUND;
    case ErrorKind::CONNECTION_ERROR:
        return EXIT_CONNECTION_FAILED;
    case ErrorKind::ENCODING_ERROR:
        return EXIT_ENCODING_FAILED;
    case ErrorKind::CONFIG_ERROR:
        return EXIT_CONFIG_INVALID;
    case ErrorKind::WRITE_ERROR:
    case ErrorKind::TRANSFER_FAILED:
    case ErrorKind::CANCELLED:
    case ErrorKind::BUSY:
    case ErrorKind::DEVICE_NOT_READY:
        return EXIT_TRANSFER_FAILED;
    }
    return EXIT_TRANSFER_FAILED;
}

const char* link_status_name(LinkStatus status) {
    switch (status) {
    case LinkStatus::OK:           return "OK";
    case LinkStatus::WRITE_ERROR:  return "WRITE_ERROR";
    case LinkStatus::DISCONNECTED: return "DISCONNECTED";
    case LinkStatus::TOO_LONG:     return "TOO_LONG";
    }
    return "UNKNOWN";
}
