// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "command_parser.h"
#include "sketch_config.h"
#include "sketcher_protocol.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

bool is_separator(char c) {
    return c == ' ' || c == ',' || c == ':' || c == '\t';
}

bool valid_macro_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // namespace

bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out, std::string* error) {
    out.clear();
    size_t i = 0;
    while (i < text.size()) {
        if (is_separator(text[i])) {
            ++i;
            continue;
        }

        // One group runs until the next separator
        size_t end = i;
        while (end < text.size() && !is_separator(text[end])) {
            ++end;
        }
        size_t start = i;
        if (end - start >= 2 && text[start] == '0' && (text[start + 1] == 'x' || text[start + 1] == 'X')) {
            start += 2;
        }
        if (start == end) {
            set_error(error, "empty hex group at offset " + std::to_string(i));
            return false;
        }
        if ((end - start) % 2 != 0) {
            set_error(error, "odd number of hex digits at offset " + std::to_string(i));
            return false;
        }
        for (size_t k = start; k < end; k += 2) {
            int hi = hex_value(text[k]);
            int lo = hex_value(text[k + 1]);
            if (hi < 0 || lo < 0) {
                set_error(error, "invalid hex digit at offset " + std::to_string(hi < 0 ? k : k + 1));
                return false;
            }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        i = end;
    }

    if (out.empty()) {
        set_error(error, "no bytes given");
        return false;
    }
    return true;
}

bool parse_literal_bytes(const std::string& text, std::vector<uint8_t>& out, std::string* error) {
    out.clear();
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            out.push_back(static_cast<uint8_t>(c));
            continue;
        }
        if (i + 1 >= text.size()) {
            set_error(error, "dangling backslash");
            return false;
        }
        char e = text[++i];
        switch (e) {
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case '0':  out.push_back(0x00); break;
        case '\\': out.push_back('\\'); break;
        case 'x': {
            int hi = (i + 1 < text.size()) ? hex_value(text[i + 1]) : -1;
            int lo = (i + 2 < text.size()) ? hex_value(text[i + 2]) : -1;
            if (hi < 0 || lo < 0) {
                set_error(error, "\\x needs two hex digits at offset " + std::to_string(i - 1));
                return false;
            }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            i += 2;
            break;
        }
        default:
            set_error(error, std::string("unknown escape \\") + e);
            return false;
        }
    }

    if (out.empty()) {
        set_error(error, "no bytes given");
        return false;
    }
    return true;
}

std::string format_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 3);
    char buf[4];
    for (size_t i = 0; i < len; ++i) {
        snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", data[i]);
        out += buf;
    }
    return out;
}

MacroTable::MacroTable() {
    SketchSettings defaults;
    entries_["start_image"] = build_send_image_command(static_cast<uint16_t>(defaults.chunk_size));
    builtins_.push_back("start_image");
}

bool MacroTable::define(const std::string& name, const std::vector<uint8_t>& bytes) {
    if (!valid_macro_name(name) || bytes.empty() || is_builtin(name)) {
        return false;
    }
    entries_[name] = bytes;
    return true;
}

bool MacroTable::lookup(const std::string& name, std::vector<uint8_t>& out) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool MacroTable::is_builtin(const std::string& name) const {
    return std::find(builtins_.begin(), builtins_.end(), name) != builtins_.end();
}
