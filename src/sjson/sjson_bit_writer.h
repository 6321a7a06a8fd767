/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace sjson {
// MSB-first bit string. Bits past bit_length() in the last byte stay zero.
class BitWriter {
   public:
    explicit BitWriter(std::size_t initial_bytes = 32)
        : buf_(initial_bytes < 8 ? 8 : initial_bytes, 0), bit_pos_(0) {}

    std::size_t bit_length() const { return bit_pos_; }
    std::size_t byte_length() const { return (bit_pos_ + 7) / 8; }
    bool empty() const { return bit_pos_ == 0; }

    void write_bit(bool bit) {
        ensure_capacity(1);
        if (bit) {
            buf_[bit_pos_ >> 3] |= static_cast<std::uint8_t>(0x80u >> (bit_pos_ & 7));
        }
        bit_pos_++;
    }

    void write_bits(std::uint64_t value, int bit_count) {
        if (bit_count < 0 || bit_count > 64) {
            throw std::invalid_argument("bit_count out of range");
        }
        ensure_capacity(static_cast<std::size_t>(bit_count));
        for (int i = bit_count - 1; i >= 0; i--) {
            if (((value >> i) & 1u) != 0) {
                buf_[bit_pos_ >> 3] |= static_cast<std::uint8_t>(0x80u >> (bit_pos_ & 7));
            }
            bit_pos_++;
        }
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        if (bytes.empty()) {
            return;
        }
        if ((bit_pos_ & 7) != 0) {
            for (const auto b : bytes) {
                write_bits(b, 8);
            }
            return;
        }
        ensure_capacity(bytes.size() * 8);
        std::memcpy(buf_.data() + (bit_pos_ >> 3), bytes.data(), bytes.size());
        bit_pos_ += bytes.size() * 8;
    }

    void append(const BitWriter& other) {
        const std::size_t whole = other.bit_pos_ / 8;
        const int rest = static_cast<int>(other.bit_pos_ & 7);
        write_bytes(std::span<const std::uint8_t>(other.buf_.data(), whole));
        if (rest != 0) {
            write_bits(static_cast<std::uint64_t>(other.buf_[whole] >> (8 - rest)), rest);
        }
    }

    bool bit_at(std::size_t index) const {
        if (index >= bit_pos_) {
            throw std::out_of_range("bit index out of range");
        }
        return ((buf_[index >> 3] >> (7 - (index & 7))) & 1u) != 0;
    }

    std::span<const std::uint8_t> bytes() const {
        return std::span<const std::uint8_t>(buf_.data(), byte_length());
    }

    std::vector<std::uint8_t> to_bytes() const {
        const auto view = bytes();
        return std::vector<std::uint8_t>(view.begin(), view.end());
    }

    std::string to_bin_string() const {
        std::string out;
        out.reserve(bit_pos_);
        for (std::size_t i = 0; i < bit_pos_; i++) {
            out.push_back(bit_at(i) ? '1' : '0');
        }
        return out;
    }

    bool operator==(const BitWriter& other) const {
        if (bit_pos_ != other.bit_pos_) {
            return false;
        }
        return std::memcmp(buf_.data(), other.buf_.data(), byte_length()) == 0;
    }

   private:
    void ensure_capacity(std::size_t more_bits) {
        const std::size_t need_bytes = (bit_pos_ + more_bits + 7) / 8;
        if (need_bytes <= buf_.size()) {
            return;
        }
        std::size_t new_len = buf_.size();
        while (new_len < need_bytes) {
            new_len *= 2;
        }
        buf_.resize(new_len, 0);
    }

    std::vector<std::uint8_t> buf_;
    std::size_t bit_pos_ = 0;
};
}  // namespace sjson
