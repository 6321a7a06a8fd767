/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_uuid.h"

#include <stdexcept>

namespace sjson {
namespace {
int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

bool is_hyphen_position(std::size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}
}  // namespace

bool is_uuid_text(std::string_view s) {
    if (s.size() == kUuidCompactLength) {
        for (const char c : s) {
            if (hex_nibble(c) < 0) {
                return false;
            }
        }
        return true;
    }
    if (s.size() == kUuidHyphenatedLength) {
        for (std::size_t i = 0; i < s.size(); i++) {
            if (is_hyphen_position(i)) {
                if (s[i] != '-') {
                    return false;
                }
            } else if (hex_nibble(s[i]) < 0) {
                return false;
            }
        }
        return true;
    }
    return false;
}

Uuid parse_uuid(std::string_view s) {
    if (!is_uuid_text(s)) {
        throw std::invalid_argument("Not a UUID: " + std::string(s));
    }
    Uuid out;
    std::size_t nibble_index = 0;
    for (const char c : s) {
        if (c == '-') {
            continue;
        }
        const auto n = static_cast<std::uint8_t>(hex_nibble(c));
        auto& b = out.bytes[nibble_index / 2];
        b = (nibble_index & 1) == 0 ? static_cast<std::uint8_t>(n << 4)
                                    : static_cast<std::uint8_t>(b | n);
        nibble_index++;
    }
    return out;
}

std::string format_uuid(const Uuid& uuid, bool hyphens, bool upper) {
    const char* hexdig = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(kUuidHyphenatedLength);
    for (std::size_t i = 0; i < uuid.bytes.size(); i++) {
        if (hyphens && (i == 4 || i == 6 || i == 8 || i == 10)) {
            out.push_back('-');
        }
        out.push_back(hexdig[(uuid.bytes[i] >> 4) & 0xFu]);
        out.push_back(hexdig[uuid.bytes[i] & 0xFu]);
    }
    return out;
}
}  // namespace sjson
