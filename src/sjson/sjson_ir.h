/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"
#include "sjson/sjson_node_type.h"
#include "sjson/sjson_options.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sjson {
class Node;

using Ir = nlohmann::ordered_json;

// One entry of the IR dispatch chain. Rules are tried in table order and the
// first match wins:
//   bcd -> number, boolean value -> boolean, length+bits -> string,
//   {} -> null, items -> array, properties -> object
struct IrShapeRule {
    NodeType type;
    const char* shape;
    bool (*matches)(const Ir& ir);
};

const std::array<IrShapeRule, 6>& ir_shape_rules();

// Throws UnknownShape when no rule matches or the IR is not an object.
NodeType classify_ir(const Ir& ir);

struct IrBits {
    std::vector<std::uint8_t> bytes;
    std::size_t bit_length = 0;
};

// Binary value; the subtype holds the bit count when it is not whole bytes.
Ir bits_to_ir(const BitWriter& bits);
IrBits bits_from_ir(const Ir& value);

Ir encode_ir(const Node& root, const EncodeOptions& opt = {});
Node decode_ir(const Ir& ir, const DecodeOptions& opt = {});

Node decode_null_ir(const Ir& ir);
Node decode_number_ir(const Ir& ir);
Node decode_string_ir(const Ir& ir, const DecodeOptions& opt = {});
Node decode_boolean_ir(const Ir& ir);
Node decode_array_ir(const Ir& ir, const DecodeOptions& opt = {});
Node decode_object_ir(const Ir& ir, const DecodeOptions& opt = {});
}  // namespace sjson
