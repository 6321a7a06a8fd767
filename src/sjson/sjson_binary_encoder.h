/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"
#include "sjson/sjson_options.h"

namespace sjson {
class Node;

// Wire layout per node: 3-bit tag, then
//   null:    nothing
//   number:  packed BCD bytes
//   string:  130-bit UUID payload or LZ4 frame bytes
//   boolean: 1 bit
//   array:   children back to back, no count
//   object:  u32 count, then per property a 1-2 byte name index and the child
// There is no decoder for this layout; use the IR to reconstruct nodes.
BitWriter encode_binary(const Node& root, const EncodeOptions& opt = {});
}  // namespace sjson
