// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * Shell input decoding.
 *
 * Hex:     "01 00 ff", "0100ff", "0x01,0x02", "de:ad:be:ef"
 *          Separators are space, comma and colon; an optional 0x prefix per
 *          byte group is accepted. An odd number of digits is an error.
 * Literal: text with escapes \n \r \t \0 \\ \xHH; any other escape is an
 *          error.
 */
bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out, std::string* error = nullptr);
bool parse_literal_bytes(const std::string& text, std::vector<uint8_t>& out, std::string* error = nullptr);

std::string format_hex(const uint8_t* data, size_t len);

/**
 * @brief MacroTable - named byte sequences the shell can send
 *
 * Built-in entries cannot be redefined; session entries live until reboot.
 */
class MacroTable {
public:
    MacroTable();

    bool define(const std::string& name, const std::vector<uint8_t>& bytes);
    bool lookup(const std::string& name, std::vector<uint8_t>& out) const;
    bool is_builtin(const std::string& name) const;

    const std::map<std::string, std::vector<uint8_t>>& entries() const { return entries_; }

private:
    std::map<std::string, std::vector<uint8_t>> entries_;
    std::vector<std::string> builtins_;
};
