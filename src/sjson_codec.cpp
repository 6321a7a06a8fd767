/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson_codec.h"

#include "sjson/sjson_bit_reader.h"
#include "sjson/sjson_json_import.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace sjson {

static long long elapsed_ms(
    std::chrono::steady_clock::time_point from,
    std::chrono::steady_clock::time_point to
) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count()
    );
}

// Re-decodes the IR and compares it with the source tree.
static void debug_validate_ir_round_trip(const EncodeResult& res, std::string_view label) {
    const Node back = Node::from_ir(res.ir, DecodeOptions{true});
    if (back == res.root) {
        SJSON_LOG_INFO("IR round trip ok: %s", std::string(label).c_str());
    } else {
        SJSON_LOG_ERROR("IR round trip differs: %s", std::string(label).c_str());
    }
}

EncodeResult
SjsonCodec::EncodeJsonFile(const std::filesystem::path& path, const EncodeOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto doc = nlohmann::ordered_json::parse(bytes.begin(), bytes.end());
    return EncodeJson(doc, opt, path.filename().string());
}

EncodeResult SjsonCodec::EncodeJson(
    const nlohmann::ordered_json& doc,
    const EncodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    EncodeResult res;
    res.root = node_from_json(doc);
    const auto t1 = std::chrono::steady_clock::now();
    res.ir = res.root.to_ir(opt);
    const auto t2 = std::chrono::steady_clock::now();
    res.bits = res.root.to_binary(opt);
    res.export_bytes = build_export(res.bits);
    const auto t3 = std::chrono::steady_clock::now();

    if (opt.debug) {
        SJSON_LOG_INFO(
            "Encode %s: root=%s import=%lldms ir=%lldms binary=%lldms bits=%zu",
            std::string(label).c_str(), std::string(res.root.type_name()).c_str(),
            elapsed_ms(t0, t1), elapsed_ms(t1, t2), elapsed_ms(t2, t3), res.bits.bit_length()
        );
        debug_validate_ir_round_trip(res, label);
    }
    return res;
}

InspectResult SjsonCodec::InspectExportFile(const std::filesystem::path& path) {
    return InspectExportBytes(fs_utils::read_file(path));
}

InspectResult SjsonCodec::InspectExportBytes(std::span<const std::uint8_t> bytes) {
    InspectResult res;
    res.file = parse_export(bytes);
    if (res.file.header.bit_length < static_cast<std::uint32_t>(kTypeTagBits)) {
        throw std::runtime_error(std::string("Export payload shorter than a type tag"));
    }
    BitReader reader(res.file.payload, res.file.header.bit_length);
    const auto tag = reader.read_bits(kTypeTagBits);
    if (tag > type_tag(NodeType::Object)) {
        throw std::runtime_error(
            "Export payload starts with unknown type tag " + std::to_string(tag)
        );
    }
    res.root_type = static_cast<NodeType>(tag);
    return res;
}

}  // namespace sjson
