/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

namespace sjson {
struct CompressionOptions {
    // 0 selects the fast LZ4 path, 3..12 select LZ4HC levels.
    int level = 0;
    bool content_checksum = false;
};

struct EncodeOptions {
    CompressionOptions compression{};
    bool debug = false;
};

struct DecodeOptions {
    bool debug = false;
};
}  // namespace sjson
