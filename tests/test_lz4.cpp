/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_lz4.h"
#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace sjson;
using sjson::test::bytes_of;

TEST_CASE("LZ4 frame round trip", "[lz4]") {
    const auto raw = bytes_of(std::string(4096, 'z') + "tail");

    SECTION("default options") {
        const auto packed = Lz4Frame::compress(raw);
        REQUIRE(packed.size() < raw.size());
        REQUIRE(Lz4Frame::try_decompress(packed) == raw);
    }
    SECTION("high compression with content checksum") {
        CompressionOptions opt;
        opt.level = 9;
        opt.content_checksum = true;
        const auto packed = Lz4Frame::compress(raw, opt);
        REQUIRE(Lz4Frame::try_decompress(packed) == raw);
    }
    SECTION("empty input is still one frame") {
        const auto packed = Lz4Frame::compress({});
        REQUIRE_FALSE(packed.empty());
        const auto back = Lz4Frame::try_decompress(packed);
        REQUIRE(back.has_value());
        REQUIRE(back->empty());
    }
}

TEST_CASE("LZ4 frame decode rejects anything but one complete frame", "[lz4]") {
    const auto raw = bytes_of("hello hello hello hello");
    const auto packed = Lz4Frame::compress(raw);

    SECTION("empty input") {
        REQUIRE_FALSE(Lz4Frame::try_decompress({}).has_value());
    }
    SECTION("bad magic") {
        auto bad = packed;
        bad[0] ^= 0xFF;
        REQUIRE_FALSE(Lz4Frame::try_decompress(bad).has_value());
    }
    SECTION("truncated frame") {
        auto cut = packed;
        cut.pop_back();
        REQUIRE_FALSE(Lz4Frame::try_decompress(cut).has_value());
    }
    SECTION("trailing bytes") {
        auto extra = packed;
        extra.push_back(0x00);
        REQUIRE_FALSE(Lz4Frame::try_decompress(extra).has_value());
    }
    SECTION("unrelated bytes") {
        REQUIRE_FALSE(Lz4Frame::try_decompress(bytes_of("garbage")).has_value());
    }
}
