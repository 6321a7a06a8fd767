/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson/sjson_bit_writer.h"
#include "sjson/sjson_export_file.h"
#include "sjson/sjson_node.h"
#include "sjson/sjson_options.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace sjson {

struct EncodeResult {
    Node root;
    nlohmann::ordered_json ir = nlohmann::ordered_json::object();
    BitWriter bits;
    std::vector<std::uint8_t> export_bytes;
};

struct InspectResult {
    ExportFile file;
    NodeType root_type = NodeType::Null;
};

class SjsonCodec {
   public:
    static EncodeResult
    EncodeJsonFile(const std::filesystem::path& path, const EncodeOptions& opt = {});
    static EncodeResult EncodeJson(
        const nlohmann::ordered_json& doc,
        const EncodeOptions& opt = {},
        std::string_view label = {}
    );

    static InspectResult InspectExportFile(const std::filesystem::path& path);
    static InspectResult InspectExportBytes(std::span<const std::uint8_t> bytes);
};

}  // namespace sjson
