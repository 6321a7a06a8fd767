/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"
#include "sjson/sjson_options.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace sjson {
// 2 flag bits + 128-bit value.
constexpr std::size_t kUuidPayloadBits = 130;

// Text is classified once at construction. UUID-shaped text is rewritten to
// its canonical form with the recorded hyphen and case choice.
class StringValue {
   public:
    explicit StringValue(std::string text);

    const std::string& text() const { return text_; }
    bool is_uuid() const { return is_uuid_; }
    bool had_hyphens() const { return had_hyphens_; }
    bool had_uppercase() const { return had_uppercase_; }
    // Unicode code points.
    std::size_t length() const { return length_; }

    bool operator==(const StringValue& other) const { return text_ == other.text_; }

   private:
    std::string text_;
    bool is_uuid_ = false;
    bool had_hyphens_ = false;
    bool had_uppercase_ = false;
    std::size_t length_ = 0;
};

struct EncodedString {
    std::size_t length = 0;
    BitWriter bits;
};

EncodedString encode_string(const StringValue& value, const CompressionOptions& opt = {});

// Tries LZ4 first, then the 130-bit UUID layout; the recovered text must
// have exactly `length` code points.
StringValue decode_string(
    std::span<const std::uint8_t> payload,
    std::size_t bit_length,
    std::size_t length,
    bool debug = false
);
}  // namespace sjson
