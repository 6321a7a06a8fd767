/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_utf8.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sjson {
std::optional<std::size_t> utf8_code_points(std::string_view s) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        int extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if (c < 0x80) {
            i++;
            count++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1Fu;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0Fu;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07u;
            min_cp = 0x10000;
        } else {
            return std::nullopt;
        }
        if (i + static_cast<std::size_t>(extra) >= s.size()) {
            return std::nullopt;
        }
        for (int k = 1; k <= extra; k++) {
            const auto cc = static_cast<unsigned char>(s[i + static_cast<std::size_t>(k)]);
            if ((cc & 0xC0) != 0x80) {
                return std::nullopt;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return std::nullopt;
        }
        i += static_cast<std::size_t>(extra) + 1;
        count++;
    }
    return count;
}

std::size_t utf8_length(std::string_view s) {
    const auto n = utf8_code_points(s);
    if (!n.has_value()) {
        throw std::invalid_argument(std::string("string is not valid UTF-8"));
    }
    return *n;
}
}  // namespace sjson
