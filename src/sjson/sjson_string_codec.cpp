/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_string_codec.h"

#include "sjson/sjson_bit_reader.h"
#include "sjson/sjson_error.h"
#include "sjson/sjson_lz4.h"
#include "sjson/sjson_utf8.h"
#include "sjson/sjson_uuid.h"
#include "utils/log.h"

#include <algorithm>
#include <optional>

namespace sjson {
namespace {
std::span<const std::uint8_t> as_bytes(const std::string& s) {
    return std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(s.data()), s.size()
    );
}

std::optional<std::string> try_decompress_text(std::span<const std::uint8_t> payload) {
    auto raw = Lz4Frame::try_decompress(payload);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    std::string text(raw->begin(), raw->end());
    if (!utf8_code_points(text).has_value()) {
        return std::nullopt;
    }
    return text;
}

std::string decode_uuid_payload(std::span<const std::uint8_t> payload) {
    BitReader reader(payload, kUuidPayloadBits);
    const bool hyphens = reader.read_bit();
    const bool upper = reader.read_bit();
    const auto raw = reader.read_bytes(16);
    Uuid uuid;
    std::copy(raw.begin(), raw.end(), uuid.bytes.begin());
    return format_uuid(uuid, hyphens, upper);
}
}  // namespace

StringValue::StringValue(std::string text) {
    had_hyphens_ = text.find('-') != std::string::npos;
    had_uppercase_ =
        std::any_of(text.begin(), text.end(), [](char c) { return c >= 'A' && c <= 'F'; });
    is_uuid_ = is_uuid_text(text);
    if (is_uuid_) {
        text_ = format_uuid(parse_uuid(text), had_hyphens_, had_uppercase_);
    } else {
        text_ = std::move(text);
    }
    length_ = utf8_length(text_);
}

EncodedString encode_string(const StringValue& value, const CompressionOptions& opt) {
    EncodedString out;
    out.length = value.length();
    if (value.is_uuid()) {
        const Uuid uuid = parse_uuid(value.text());
        out.bits.write_bit(value.had_hyphens());
        out.bits.write_bit(value.had_uppercase());
        out.bits.write_bytes(uuid.bytes);
        return out;
    }
    out.bits.write_bytes(Lz4Frame::compress(as_bytes(value.text()), opt));
    return out;
}

StringValue decode_string(
    std::span<const std::uint8_t> payload,
    std::size_t bit_length,
    std::size_t length,
    bool debug
) {
    if (bit_length > payload.size() * 8) {
        throw CodecError(ErrorKind::InvalidField, "string bit length exceeds payload size");
    }

    std::optional<std::string> text;
    if ((bit_length & 7) == 0) {
        text = try_decompress_text(payload.first(bit_length / 8));
    }
    if (!text.has_value() && bit_length == kUuidPayloadBits) {
        text = decode_uuid_payload(payload);
        if (debug) {
            SJSON_LOG_INFO("String payload decoded as UUID: %s", text->c_str());
        }
    }
    if (!text.has_value()) {
        throw CodecError(
            ErrorKind::CannotDecodeString,
            "Cannot decompress or parse " + std::to_string(bit_length) + "-bit string payload"
        );
    }

    const std::size_t got = utf8_length(*text);
    if (got != length) {
        throw CodecError(
            ErrorKind::DecodeLengthMismatch,
            "Length mismatch: expected " + std::to_string(length) + ", decoded "
                + std::to_string(got)
        );
    }
    return StringValue(std::move(*text));
}
}  // namespace sjson
