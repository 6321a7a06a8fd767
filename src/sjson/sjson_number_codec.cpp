/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_number_codec.h"

#include "sjson/sjson_error.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace sjson {
namespace {
// '+' and '-' after the exponent marker use their own nybbles; a leading '-'
// is the overall sign. Encoder and decoder step this state the same way.
struct ExponentState {
    bool after_exponent = false;

    void advance(bool is_exponent_marker) { after_exponent = is_exponent_marker; }
};

std::uint8_t char_to_nybble(char c, std::size_t pos, const ExponentState& state) {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c == '.') {
        return kNybbleDecimalPoint;
    }
    if (c == 'E' || c == 'e') {
        return kNybbleExponent;
    }
    if (c == '+' && state.after_exponent) {
        return kNybbleExponentPlus;
    }
    if (c == '-' && state.after_exponent) {
        return kNybbleExponentMinus;
    }
    if (c == '-' && pos == 0) {
        return kNybbleNegative;
    }
    throw CodecError(
        ErrorKind::InvalidNumberCharacter, std::string("Invalid character in number: ") + c
    );
}

char nybble_to_char(std::uint8_t n, const ExponentState& state) {
    if (n <= 9) {
        return static_cast<char>('0' + n);
    }
    if (n == kNybbleDecimalPoint) {
        return '.';
    }
    if (n == kNybbleExponent) {
        return 'E';
    }
    if (n == kNybbleExponentPlus && state.after_exponent) {
        return '+';
    }
    if (n == kNybbleExponentMinus && state.after_exponent) {
        return '-';
    }
    if (n == kNybbleNegative) {
        return '-';
    }
    throw CodecError(
        ErrorKind::InvalidBCDNybble,
        std::string("Invalid nybble in BCD: ") + std::to_string(static_cast<unsigned>(n))
    );
}
}  // namespace

std::string format_canonical_decimal(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    std::array<char, 64> buf{};
    const auto res =
        std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::scientific);
    if (res.ec != std::errc()) {
        throw std::runtime_error(std::string("to_chars failed for double"));
    }
    const std::string_view sci(buf.data(), static_cast<std::size_t>(res.ptr - buf.data()));

    // sci looks like [-]d[.ddd]e(+|-)XX
    std::size_t pos = 0;
    std::string out;
    if (sci[pos] == '-') {
        out.push_back('-');
        pos++;
    }
    const std::size_t e_pos = sci.find('e');
    std::string digits;
    for (std::size_t i = pos; i < e_pos; i++) {
        if (sci[i] != '.') {
            digits.push_back(sci[i]);
        }
    }
    const int exp = std::atoi(std::string(sci.substr(e_pos + 1)).c_str());

    if (exp >= -4 && exp < 16) {
        if (exp >= 0) {
            const std::size_t int_len = static_cast<std::size_t>(exp) + 1;
            if (digits.size() <= int_len) {
                out += digits;
                out.append(int_len - digits.size(), '0');
                out += ".0";
            } else {
                out += digits.substr(0, int_len);
                out.push_back('.');
                out += digits.substr(int_len);
            }
        } else {
            out += "0.";
            out.append(static_cast<std::size_t>(-exp - 1), '0');
            out += digits;
        }
        return out;
    }

    out.push_back(digits[0]);
    if (digits.size() > 1) {
        out.push_back('.');
        out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(exp < 0 ? '-' : '+');
    const std::string exp_digits = std::to_string(exp < 0 ? -exp : exp);
    if (exp_digits.size() < 2) {
        out.push_back('0');
    }
    out += exp_digits;
    return out;
}

BcdNumber encode_bcd_text(std::string_view text) {
    std::vector<std::uint8_t> nybbles;
    nybbles.reserve(text.size() + 1);
    ExponentState state;
    for (std::size_t i = 0; i < text.size(); i++) {
        const std::uint8_t n = char_to_nybble(text[i], i, state);
        nybbles.push_back(n);
        state.advance(n == kNybbleExponent);
    }

    BcdNumber out;
    out.length = nybbles.size();
    if ((nybbles.size() & 1) != 0) {
        nybbles.push_back(0);
    }
    out.bcd.reserve(nybbles.size() / 2);
    for (std::size_t i = 0; i < nybbles.size(); i += 2) {
        out.bcd.push_back(static_cast<std::uint8_t>((nybbles[i] << 4) | nybbles[i + 1]));
    }
    return out;
}

std::string decode_bcd_text(std::span<const std::uint8_t> bcd, std::size_t length) {
    if (length > bcd.size() * 2) {
        throw CodecError(
            ErrorKind::InvalidField,
            "BCD length " + std::to_string(length) + " exceeds "
                + std::to_string(bcd.size() * 2) + " available nybbles"
        );
    }
    std::string text;
    text.reserve(length);
    ExponentState state;
    for (std::size_t i = 0; i < length; i++) {
        const std::uint8_t byte = bcd[i / 2];
        const std::uint8_t n =
            (i & 1) == 0 ? static_cast<std::uint8_t>((byte >> 4) & 0xFu)
                         : static_cast<std::uint8_t>(byte & 0xFu);
        text.push_back(nybble_to_char(n, state));
        state.advance(n == kNybbleExponent);
    }
    return text;
}

BcdNumber encode_bcd(double value) {
    return encode_bcd_text(format_canonical_decimal(value));
}

double decode_bcd(std::span<const std::uint8_t> bcd, std::size_t length) {
    const std::string text = decode_bcd_text(bcd, length);
    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto res = std::from_chars(first, last, value, std::chars_format::general);
    if (!text.empty() && res.ec == std::errc::result_out_of_range && res.ptr == last) {
        // well-formed but outside double range: strtod rounds to +-HUGE_VAL or +-0.0
        return std::strtod(text.c_str(), nullptr);
    }
    if (text.empty() || res.ec != std::errc() || res.ptr != last) {
        throw CodecError(ErrorKind::InvalidNumberLiteral, "Invalid number string: " + text);
    }
    return value;
}
}  // namespace sjson
