/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace sjson {
class BitReader {
   public:
    BitReader(std::span<const std::uint8_t> data, std::size_t bit_len)
        : _data(data), _bit_pos(0), _bit_len(bit_len) {
        if (bit_len > data.size() * 8) {
            throw std::invalid_argument(std::string("bitLen exceeds data size"));
        }
    }

    std::size_t remaining() const { return _bit_len - _bit_pos; }

    bool read_bit() {
        if (_bit_pos >= _bit_len) {
            throw std::runtime_error(std::string("Unexpected EOF while reading bits."));
        }
        const std::uint8_t byte = _data[_bit_pos >> 3];
        const bool bit = ((byte >> (7 - (_bit_pos & 7))) & 1u) != 0;
        _bit_pos++;
        return bit;
    }

    std::uint64_t read_bits(int bit_count) {
        if (bit_count < 0 || bit_count > 64) {
            throw std::invalid_argument(std::string("bitCount must be in [0..64]"));
        }
        std::uint64_t value = 0;
        for (int i = 0; i < bit_count; i++) {
            value = (value << 1) | (read_bit() ? 1u : 0u);
        }
        return value;
    }

    std::vector<std::uint8_t> read_bytes(std::size_t count) {
        if (count * 8 > remaining()) {
            throw std::runtime_error(std::string("Unexpected EOF while reading bytes."));
        }
        std::vector<std::uint8_t> out(count);
        for (auto& b : out) {
            b = static_cast<std::uint8_t>(read_bits(8));
        }
        return out;
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _bit_pos;
    std::size_t _bit_len;
};
}  // namespace sjson
