/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace sjson {
constexpr std::uint32_t kExportMagic = 0x424A5300u;  // "\0SJB" little-endian, low byte = version
constexpr std::uint8_t kExportVersion = 1;
constexpr std::size_t kExportHeaderSize = 16;
constexpr std::size_t kExportDigestSize = 32;

struct ExportHeader {
    std::uint32_t magic = 0;
    std::uint32_t flags = 0;
    std::uint32_t bit_length = 0;
    std::uint32_t payload_size = 0;

    std::uint8_t version() const { return static_cast<std::uint8_t>(magic & 0xFFu); }
};

struct ExportFile {
    ExportHeader header{};
    std::array<std::uint8_t, kExportDigestSize> digest{};
    std::vector<std::uint8_t> payload;

    BitWriter bits() const;
};

std::array<std::uint8_t, kExportDigestSize> blake3_hash32(std::span<const std::uint8_t> payload);

// header (16) | blake3(payload) (32) | payload bytes
std::vector<std::uint8_t> build_export(const BitWriter& bits);
ExportFile parse_export(std::span<const std::uint8_t> file_bytes);
}  // namespace sjson
