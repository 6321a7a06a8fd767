/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_export_file.h"

#include <blake3.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace sjson {
namespace {
std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

void write_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}
}  // namespace

std::array<std::uint8_t, kExportDigestSize> blake3_hash32(std::span<const std::uint8_t> payload) {
    std::array<std::uint8_t, kExportDigestSize> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!payload.empty()) {
        blake3_hasher_update(&h, payload.data(), payload.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

BitWriter ExportFile::bits() const {
    BitWriter out(payload.size());
    const std::size_t whole = header.bit_length / 8;
    const int rest = static_cast<int>(header.bit_length & 7);
    out.write_bytes(std::span<const std::uint8_t>(payload.data(), whole));
    if (rest != 0) {
        out.write_bits(static_cast<std::uint64_t>(payload[whole] >> (8 - rest)), rest);
    }
    return out;
}

std::vector<std::uint8_t> build_export(const BitWriter& bits) {
    if (bits.bit_length() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error(std::string("Binary export too large for container"));
    }
    const auto payload = bits.bytes();
    const auto digest = blake3_hash32(payload);

    std::vector<std::uint8_t> out;
    out.reserve(kExportHeaderSize + kExportDigestSize + payload.size());
    write_u32_le(out, kExportMagic | kExportVersion);
    write_u32_le(out, 0);
    write_u32_le(out, static_cast<std::uint32_t>(bits.bit_length()));
    write_u32_le(out, static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), digest.begin(), digest.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

ExportFile parse_export(std::span<const std::uint8_t> file_bytes) {
    if (file_bytes.size() < kExportHeaderSize + kExportDigestSize) {
        throw std::runtime_error(std::string("Export blob too small for header"));
    }

    ExportHeader hdr{};
    hdr.magic = read_u32_le(file_bytes, 0);
    hdr.flags = read_u32_le(file_bytes, 4);
    hdr.bit_length = read_u32_le(file_bytes, 8);
    hdr.payload_size = read_u32_le(file_bytes, 12);

    if ((hdr.magic & 0xFFFFFF00u) != kExportMagic) {
        throw std::runtime_error(std::string("Not an SJSON export (bad magic)"));
    }
    if (hdr.version() != kExportVersion) {
        throw std::runtime_error(
            "Unsupported export version: " + std::to_string(static_cast<unsigned>(hdr.version()))
        );
    }
    if (file_bytes.size() - kExportHeaderSize - kExportDigestSize != hdr.payload_size) {
        throw std::runtime_error(std::string("Export payloadSize mismatch"));
    }
    if ((static_cast<std::uint64_t>(hdr.bit_length) + 7) / 8 != hdr.payload_size) {
        throw std::runtime_error(std::string("Export bitLength does not match payloadSize"));
    }

    ExportFile out{};
    out.header = hdr;
    std::memcpy(out.digest.data(), file_bytes.data() + kExportHeaderSize, kExportDigestSize);
    const auto payload = file_bytes.subspan(kExportHeaderSize + kExportDigestSize);
    out.payload.assign(payload.begin(), payload.end());

    const auto calc = blake3_hash32(out.payload);
    if (!std::equal(calc.begin(), calc.end(), out.digest.begin())) {
        throw std::runtime_error(std::string("Export payload digest mismatch"));
    }
    const int rest = static_cast<int>(hdr.bit_length & 7);
    if (rest != 0 && (out.payload.back() & (0xFFu >> rest)) != 0) {
        throw std::runtime_error(std::string("Export padding bits are not zero"));
    }
    return out;
}
}  // namespace sjson
