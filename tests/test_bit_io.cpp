/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_bit_reader.h"
#include "sjson/sjson_bit_writer.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

using namespace sjson;

TEST_CASE("BitWriter packs bits MSB-first", "[bit_io]") {
    BitWriter w;
    REQUIRE(w.empty());
    w.write_bits(0b101, 3);
    w.write_bit(true);
    w.write_bits(0, 2);
    REQUIRE(w.bit_length() == 6);
    REQUIRE(w.byte_length() == 1);
    REQUIRE(w.to_bin_string() == "101100");
    REQUIRE(w.to_bytes() == std::vector<std::uint8_t>{0xB0});
}

TEST_CASE("BitWriter writes bytes at an unaligned offset", "[bit_io]") {
    BitWriter w;
    w.write_bits(0b01, 2);
    const std::vector<std::uint8_t> bytes{0xFF, 0x00};
    w.write_bytes(bytes);
    REQUIRE(w.bit_length() == 18);
    REQUIRE(w.to_bytes() == std::vector<std::uint8_t>{0x7F, 0xC0, 0x00});
}

TEST_CASE("BitWriter grows past its initial buffer", "[bit_io]") {
    BitWriter w(1);
    for (int i = 0; i < 100; i++) {
        w.write_bits(0xA5, 8);
    }
    REQUIRE(w.byte_length() == 100);
    REQUIRE(w.bytes()[99] == 0xA5);
}

TEST_CASE("BitWriter append keeps trailing partial bits", "[bit_io]") {
    BitWriter tail;
    tail.write_bits(0x1FF, 9);
    tail.write_bits(0b10, 2);

    BitWriter w;
    w.write_bits(0b011, 3);
    w.append(tail);
    REQUIRE(w.bit_length() == 14);
    REQUIRE(w.to_bin_string() == "01111111111110");

    BitWriter expected;
    expected.write_bits(0b01111111111110, 14);
    REQUIRE(w == expected);
}

TEST_CASE("BitWriter equality looks at length and content", "[bit_io]") {
    BitWriter a;
    BitWriter b;
    a.write_bits(0, 3);
    b.write_bits(0, 4);
    REQUIRE_FALSE(a == b);
    a.write_bit(false);
    REQUIRE(a == b);
    a.write_bit(true);
    b.write_bit(false);
    REQUIRE_FALSE(a == b);
}

TEST_CASE("BitWriter rejects bad arguments", "[bit_io]") {
    BitWriter w;
    REQUIRE_THROWS_AS(w.write_bits(0, 65), std::invalid_argument);
    w.write_bit(true);
    REQUIRE(w.bit_at(0));
    REQUIRE_THROWS_AS(w.bit_at(1), std::out_of_range);
}

TEST_CASE("BitReader reads what BitWriter wrote", "[bit_io]") {
    BitWriter w;
    w.write_bits(0b110, 3);
    w.write_bits(0xDEADBEEFCAFEull, 48);
    w.write_bit(true);

    BitReader r(w.bytes(), w.bit_length());
    REQUIRE(r.read_bits(3) == 0b110);
    REQUIRE(r.read_bits(48) == 0xDEADBEEFCAFEull);
    REQUIRE(r.remaining() == 1);
    REQUIRE(r.read_bit());
    REQUIRE(r.remaining() == 0);
    REQUIRE_THROWS_AS(r.read_bit(), std::runtime_error);
}

TEST_CASE("BitReader stops at its bit length, not the buffer end", "[bit_io]") {
    const std::vector<std::uint8_t> data{0xAB, 0xCD};
    BitReader r(data, 10);
    REQUIRE(r.read_bytes(1) == std::vector<std::uint8_t>{0xAB});
    REQUIRE_THROWS_AS(r.read_bytes(1), std::runtime_error);
    REQUIRE(r.read_bits(2) == 0b11);
    REQUIRE_THROWS_AS(BitReader(data, 17), std::invalid_argument);
}
