/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_uuid.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace sjson;

TEST_CASE("UUID shape detection", "[uuid]") {
    CHECK(is_uuid_text("1234567890123456AF9dc2345b789012"));
    CHECK(is_uuid_text("12345678-1234-a2f7-1234-123456789012"));
    CHECK(is_uuid_text("ABCDEFAB-CDEF-ABCD-EFAB-CDEFABCDEFAB"));

    CHECK_FALSE(is_uuid_text(""));
    CHECK_FALSE(is_uuid_text("1234567890123456AF9dc2345b78901"));
    CHECK_FALSE(is_uuid_text("1234567890123456AF9dc2345b78901g"));
    CHECK_FALSE(is_uuid_text("123456781234-a2f7-1234-1234567890123"));
    CHECK_FALSE(is_uuid_text("12345678_1234_a2f7_1234_123456789012"));
    CHECK_FALSE(is_uuid_text("{12345678-1234-a2f7-1234-1234567890}"));
}

TEST_CASE("UUID parse and format", "[uuid]") {
    const Uuid a = parse_uuid("00112233-4455-6677-8899-aabbccddeeff");
    const Uuid b = parse_uuid("00112233445566778899AABBCCDDEEFF");
    REQUIRE(a == b);
    REQUIRE(a.bytes[0] == 0x00);
    REQUIRE(a.bytes[9] == 0x99);
    REQUIRE(a.bytes[15] == 0xFF);

    CHECK(format_uuid(a, true, false) == "00112233-4455-6677-8899-aabbccddeeff");
    CHECK(format_uuid(a, true, true) == "00112233-4455-6677-8899-AABBCCDDEEFF");
    CHECK(format_uuid(a, false, false) == "00112233445566778899aabbccddeeff");
    CHECK(format_uuid(a, false, true) == "00112233445566778899AABBCCDDEEFF");
}

TEST_CASE("UUID parse rejects other text", "[uuid]") {
    REQUIRE_THROWS_AS(parse_uuid("not-a-uuid"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_uuid("00112233-4455-6677-8899-aabbccddeefg"), std::invalid_argument);
}
