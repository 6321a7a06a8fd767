/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace sjson {
struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
};

constexpr std::size_t kUuidCompactLength = 32;
constexpr std::size_t kUuidHyphenatedLength = 36;

// 32 hex digits, or 8-4-4-4-12 hex groups. Case-insensitive.
bool is_uuid_text(std::string_view s);

Uuid parse_uuid(std::string_view s);

std::string format_uuid(const Uuid& uuid, bool hyphens, bool upper);
}  // namespace sjson
