/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sjson {
// Indices 0..127 take one byte, 128..16511 take two.
constexpr std::uint32_t kMaxOneByteNameIndex = 127;
constexpr std::uint32_t kMaxNameIndex = 16511;

// Property name table for a single object. Indices follow first occurrence.
class NameDictionary {
   public:
    std::uint32_t index_of(std::string_view name);

    std::size_t size() const { return names_.size(); }
    const std::vector<std::string>& names() const { return names_; }

   private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::uint32_t> index_;
};

int name_index_byte_count(std::uint32_t index);
void write_name_index(BitWriter& out, std::uint32_t index);
}  // namespace sjson
