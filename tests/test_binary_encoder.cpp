/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_binary_encoder.h"
#include "sjson/sjson_lz4.h"
#include "sjson/sjson_name_dictionary.h"
#include "sjson/sjson_node.h"
#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <span>
#include <string>

using namespace sjson;
using sjson::test::require_codec_error;

namespace {
std::string bits_of(const Node& node) {
    return node.to_binary().to_bin_string();
}

std::string byte_bits(std::uint8_t b) {
    std::string out;
    for (int i = 7; i >= 0; i--) {
        out.push_back(((b >> i) & 1) != 0 ? '1' : '0');
    }
    return out;
}

std::string u32_bits(std::uint32_t v) {
    std::string out;
    for (int shift = 24; shift >= 0; shift -= 8) {
        out += byte_bits(static_cast<std::uint8_t>(v >> shift));
    }
    return out;
}
}  // namespace

TEST_CASE("leaf binary layouts", "[binary]") {
    CHECK(bits_of(Node::null()) == "000");
    CHECK(bits_of(Node::boolean(true)) == "0111");
    CHECK(bits_of(Node::boolean(false)) == "0110");
    // "1.5" -> 1 . 5 + pad
    CHECK(bits_of(Node::number(1.5)) == "001" + byte_bits(0x1A) + byte_bits(0x50));
}

TEST_CASE("string binary layouts", "[binary][string]") {
    SECTION("UUID takes tag plus 130 bits") {
        const BitWriter bits = Node::string("00112233445566778899aabbccddeeff").to_binary();
        REQUIRE(bits.bit_length() == 133);
        REQUIRE(bits.to_bin_string().substr(0, 5) == "01000");
    }
    SECTION("other text is tag plus an LZ4 frame") {
        const std::string text = "plain text";
        const auto frame = Lz4Frame::compress(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(text.data()), text.size()
        ));
        const BitWriter bits = Node::string(text).to_binary();
        REQUIRE(bits.bit_length() == 3 + frame.size() * 8);
        std::string expected = "010";
        for (const auto b : frame) {
            expected += byte_bits(b);
        }
        REQUIRE(bits.to_bin_string() == expected);
    }
}

TEST_CASE("array binary layout has no count", "[binary][array]") {
    CHECK(bits_of(Node::array({})) == "100");
    CHECK(bits_of(Node::array({Node::boolean(true), Node::boolean(false)})) == "10001110110");
    CHECK(bits_of(Node::array({Node::array({Node::null()}), Node::null()})) == "100100000000");
}

TEST_CASE("object binary layout", "[binary][object]") {
    SECTION("count then index and value per property in order") {
        const Node obj = Node::object({{"b", Node::boolean(true)}, {"a", Node::null()}});
        const std::string expected =
            "101" + u32_bits(2) + byte_bits(0x00) + "0111" + byte_bits(0x01) + "000";
        REQUIRE(bits_of(obj) == expected);
    }
    SECTION("empty object") {
        REQUIRE(bits_of(Node::object({})) == "101" + u32_bits(0));
    }
    SECTION("each object has its own dictionary") {
        const Node inner = Node::object({{"y", Node::null()}});
        const Node outer = Node::object({{"x", Node::null()}, {"z", inner}});
        const std::string expected = "101" + u32_bits(2) + byte_bits(0x00) + "000" + byte_bits(0x01)
                                     + "101" + u32_bits(1) + byte_bits(0x00) + "000";
        REQUIRE(bits_of(outer) == expected);
    }
    SECTION("indices past 127 take two bytes") {
        Node::Properties props;
        for (int i = 0; i < 200; i++) {
            props.emplace_back("k" + std::to_string(i), Node::null());
        }
        const BitWriter bits = Node::object(std::move(props)).to_binary();
        REQUIRE(bits.bit_length() == 3 + 32 + 128 * (8 + 3) + 72 * (16 + 3));
        // property 128 starts after the first 128 one-byte entries
        const std::string s = bits.to_bin_string();
        REQUIRE(s.substr(3 + 32 + 128 * 11, 16) == byte_bits(0x80) + byte_bits(0x00));
    }
}

TEST_CASE("object with too many distinct names", "[binary][object][errors]") {
    Node::Properties props;
    for (std::uint32_t i = 0; i <= kMaxNameIndex + 1; i++) {
        props.emplace_back("n" + std::to_string(i), Node::null());
    }
    const Node obj = Node::object(std::move(props));
    require_codec_error([&] { obj.to_binary(); }, ErrorKind::IndexOutOfRange);
}
