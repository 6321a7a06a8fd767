/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_options.h"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sjson {
class Lz4Frame {
   public:
    // One complete LZ4 frame with the content size stored in its header.
    static std::vector<std::uint8_t>
    compress(std::span<const std::uint8_t> raw, const CompressionOptions& opt = {});

    // nullopt unless the input is exactly one complete, valid frame.
    static std::optional<std::vector<std::uint8_t>>
    try_decompress(std::span<const std::uint8_t> compressed);
};
}  // namespace sjson
