/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace sjson {
// Values are the 3-bit wire tags.
enum class NodeType : std::uint8_t {
    Null = 0,
    Number = 1,
    String = 2,
    Boolean = 3,
    Array = 4,
    Object = 5,
};

constexpr int kTypeTagBits = 3;

constexpr std::uint8_t type_tag(NodeType type) {
    return static_cast<std::uint8_t>(type);
}

constexpr std::string_view type_name(NodeType type) {
    switch (type) {
        case NodeType::Null:
            return "null";
        case NodeType::Number:
            return "number";
        case NodeType::String:
            return "string";
        case NodeType::Boolean:
            return "boolean";
        case NodeType::Array:
            return "array";
        case NodeType::Object:
            return "object";
    }
    return "unknown";
}
}  // namespace sjson
