/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_name_dictionary.h"

#include "sjson/sjson_error.h"

namespace sjson {
std::uint32_t NameDictionary::index_of(std::string_view name) {
    const std::string key(name);
    const auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }
    const auto index = static_cast<std::uint32_t>(names_.size());
    names_.push_back(key);
    index_.emplace(key, index);
    return index;
}

int name_index_byte_count(std::uint32_t index) {
    if (index <= kMaxOneByteNameIndex) {
        return 1;
    }
    if (index <= kMaxNameIndex) {
        return 2;
    }
    throw CodecError(
        ErrorKind::IndexOutOfRange,
        "Property name index " + std::to_string(index) + " needs more than two bytes (max "
            + std::to_string(kMaxNameIndex) + ")"
    );
}

void write_name_index(BitWriter& out, std::uint32_t index) {
    if (name_index_byte_count(index) == 1) {
        out.write_bits(index, 8);
        return;
    }
    const std::uint32_t rel = index - 128;
    out.write_bits(0x80u + rel / 128, 8);
    out.write_bits(rel % 128, 8);
}
}  // namespace sjson
