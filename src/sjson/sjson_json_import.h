/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_node.h"

#include <nlohmann/json.hpp>

namespace sjson {
// Plain JSON document -> node tree. Integers become doubles; binary and
// discarded values are rejected.
Node node_from_json(const nlohmann::ordered_json& doc);
}  // namespace sjson
