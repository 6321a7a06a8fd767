/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_lz4.h"

#include <lz4frame.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>

namespace sjson {
namespace {
struct DctxDeleter {
    void operator()(LZ4F_dctx* dctx) const { LZ4F_freeDecompressionContext(dctx); }
};

using DctxPtr = std::unique_ptr<LZ4F_dctx, DctxDeleter>;

DctxPtr make_dctx() {
    LZ4F_dctx* dctx = nullptr;
    const size_t rc = LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION);
    if (LZ4F_isError(rc)) {
        throw std::runtime_error(
            std::string("LZ4F_createDecompressionContext failed: ") + LZ4F_getErrorName(rc)
        );
    }
    return DctxPtr(dctx);
}
}  // namespace

std::vector<std::uint8_t>
Lz4Frame::compress(std::span<const std::uint8_t> raw, const CompressionOptions& opt) {
    LZ4F_preferences_t prefs = LZ4F_INIT_PREFERENCES;
    prefs.frameInfo.contentSize = static_cast<unsigned long long>(raw.size());
    prefs.frameInfo.contentChecksumFlag =
        opt.content_checksum ? LZ4F_contentChecksumEnabled : LZ4F_noContentChecksum;
    prefs.compressionLevel = opt.level;

    static const std::uint8_t empty_src = 0;
    const void* src = raw.empty() ? static_cast<const void*>(&empty_src) : raw.data();

    std::vector<std::uint8_t> out(LZ4F_compressFrameBound(raw.size(), &prefs));
    const size_t n = LZ4F_compressFrame(out.data(), out.size(), src, raw.size(), &prefs);
    if (LZ4F_isError(n)) {
        throw std::runtime_error(std::string("LZ4F_compressFrame failed: ") + LZ4F_getErrorName(n));
    }
    out.resize(n);
    return out;
}

std::optional<std::vector<std::uint8_t>>
Lz4Frame::try_decompress(std::span<const std::uint8_t> compressed) {
    if (compressed.empty()) {
        return std::nullopt;
    }
    DctxPtr dctx = make_dctx();

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, 64 * 1024> chunk{};
    std::size_t pos = 0;
    for (;;) {
        size_t dst_size = chunk.size();
        size_t src_size = compressed.size() - pos;
        const size_t hint = LZ4F_decompress(
            dctx.get(), chunk.data(), &dst_size, compressed.data() + pos, &src_size, nullptr
        );
        if (LZ4F_isError(hint)) {
            return std::nullopt;
        }
        pos += src_size;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(dst_size));
        if (hint == 0) {
            break;
        }
        if (src_size == 0 && dst_size == 0) {
            // truncated frame
            return std::nullopt;
        }
    }
    if (pos != compressed.size()) {
        return std::nullopt;
    }
    return out;
}
}  // namespace sjson
