/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sjson {
constexpr std::uint8_t kNybbleDecimalPoint = 10;
constexpr std::uint8_t kNybbleExponent = 11;
constexpr std::uint8_t kNybbleExponentPlus = 12;
constexpr std::uint8_t kNybbleExponentMinus = 13;
constexpr std::uint8_t kNybbleNegative = 14;

struct BcdNumber {
    std::vector<std::uint8_t> bcd;
    // Nybble count, not including the pad nybble of an odd count.
    std::size_t length = 0;
};

// Shortest round-trip text: fixed notation for decimal exponents in [-4, 16),
// otherwise d[.ddd]e+XX.
std::string format_canonical_decimal(double value);

BcdNumber encode_bcd_text(std::string_view text);
std::string decode_bcd_text(std::span<const std::uint8_t> bcd, std::size_t length);

BcdNumber encode_bcd(double value);
double decode_bcd(std::span<const std::uint8_t> bcd, std::size_t length);
}  // namespace sjson
