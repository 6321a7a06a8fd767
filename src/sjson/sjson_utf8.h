/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace sjson {
// Code point count of well-formed UTF-8, nullopt on malformed input
// (overlongs, surrogates, truncated sequences, values above U+10FFFF).
std::optional<std::size_t> utf8_code_points(std::string_view s);

std::size_t utf8_length(std::string_view s);
}  // namespace sjson
