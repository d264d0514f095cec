// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "sketch_config.h"
#include <cerrno>
#include <cstdlib>

namespace {

bool parse_u32(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long value = strtoul(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value > 0xFFFFFFFFUL) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "on" || text == "yes") {
        out = true;
    } else if (text == "0" || text == "false" || text == "off" || text == "no") {
        out = false;
    } else {
        return false;
    }
    return true;
}

template <typename Settings>
auto u32_field(Settings& s, const std::string& key) -> decltype(&s.scan_timeout_ms) {
    if (key == "scan_timeout_ms")    return &s.scan_timeout_ms;
    if (key == "connect_timeout_ms") return &s.connect_timeout_ms;
    if (key == "write_timeout_ms")   return &s.write_timeout_ms;
    if (key == "chunk_size")         return &s.chunk_size;
    if (key == "frame_delay_ms")     return &s.frame_delay_ms;
    if (key == "max_retries")        return &s.max_retries;
    if (key == "retry_delay_ms")     return &s.retry_delay_ms;
    if (key == "ready_timeout_ms")   return &s.ready_timeout_ms;
    if (key == "done_timeout_ms")    return &s.done_timeout_ms;
    return nullptr;
}

template <typename Settings>
auto bool_field(Settings& s, const std::string& key) -> decltype(&s.reverse_payload) {
    if (key == "write_with_response") return &s.write_with_response;
    if (key == "reverse_payload")     return &s.reverse_payload;
    return nullptr;
}

template <typename Settings>
auto text_field(Settings& s, const std::string& key) -> decltype(&s.name_filter) {
    if (key == "name_filter") return &s.name_filter;
    if (key == "boot_image")  return &s.boot_image;
    return nullptr;
}

} // namespace

const std::vector<const char*>& setting_keys() {
    static const std::vector<const char*> keys = {
        "name_filter", "scan_timeout_ms", "connect_timeout_ms", "write_timeout_ms",
        "write_with_response", "chunk_size", "frame_delay_ms", "max_retries",
        "retry_delay_ms", "ready_timeout_ms", "done_timeout_ms", "fit", "mode",
        "reverse_payload", "boot_image"
    };
    return keys;
}

bool get_setting(const SketchSettings& settings, const std::string& key, std::string& value) {
    if (const uint32_t* field = u32_field(settings, key)) {
        value = std::to_string(*field);
    } else if (const bool* flag = bool_field(settings, key)) {
        value = *flag ? "true" : "false";
    } else if (const std::string* text = text_field(settings, key)) {
        value = *text;
    } else if (key == "fit") {
        value = fit_policy_name(settings.fit);
    } else if (key == "mode") {
        value = pixel_mode_name(settings.mode);
    } else {
        return false;
    }
    return true;
}

bool set_setting(SketchSettings& settings, const std::string& key, const std::string& value) {
    if (uint32_t* field = u32_field(settings, key)) {
        uint32_t parsed;
        if (!parse_u32(value, parsed)) {
            return false;
        }
        // Frame size must fit one ATT write at the largest MTU
        if (key == "chunk_size" && (parsed == 0 || parsed > BLE_LOCAL_MTU - ATT_HEADER_SIZE)) {
            return false;
        }
        *field = parsed;
        return true;
    }
    if (bool* flag = bool_field(settings, key)) {
        return parse_bool(value, *flag);
    }
    if (std::string* text = text_field(settings, key)) {
        *text = value;
        return true;
    }
    if (key == "fit") {
        return parse_fit_policy(value.c_str(), settings.fit);
    }
    if (key == "mode") {
        return parse_pixel_mode(value.c_str(), settings.mode);
    }
    return false;
}

std::string serialize_settings(const SketchSettings& settings) {
    std::string text;
    std::string value;
    for (const char* key : setting_keys()) {
        get_setting(settings, key, value);
        text += key;
        text += '=';
        text += value;
        text += '\n';
    }
    return text;
}

size_t apply_serialized_settings(SketchSettings& settings, const std::string& text) {
    size_t applied = 0;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        start = end + 1;

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        if (set_setting(settings, line.substr(0, eq), line.substr(eq + 1))) {
            applied++;
        }
    }
    return applied;
}
