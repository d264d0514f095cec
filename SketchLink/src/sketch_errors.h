// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <cstdint>

// Failure kinds surfaced to the shell and the upload entry point.
enum class ErrorKind : uint8_t {
    NONE = 0,
    NOT_FOUND = 1,
    CONNECTION_ERROR = 2,
    WRITE_ERROR = 3,
    ENCODING_ERROR = 4,
    TRANSFER_FAILED = 5,
    CONFIG_ERROR = 6,
    CANCELLED = 7,
    BUSY = 8,
    DEVICE_NOT_READY = 9
};

// Console command return values
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_NOT_FOUND = 1,
    EXIT_CONNECTION_FAILED = 2,
    EXIT_TRANSFER_FAILED = 3,
    EXIT_ENCODING_FAILED = 4,
    EXIT_CONFIG_INVALID = 5
};

const char* error_kind_name(ErrorKind kind);
const char* error_kind_message(ErrorKind kind);
int exit_code_for(ErrorKind kind);
