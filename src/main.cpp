/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "common.h"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    bool write_ir = false;
    bool write_export = true;
    bool debug = false;
    sjson::CompressionOptions compression{};
};

struct BatchStats {
    std::size_t encoded = 0;
    std::size_t verified = 0;
    std::size_t failed = 0;
};

static void print_usage() {
    SJSON_LOG_INFO(
        "Usage:\n"
        "    sjson_tool <file-or-dir> [--ir] [--no-export] [--level <n>] [--checksum]"
        " [--debug]\n\n"
        "Options:\n"
        "    First argument must be a file or directory\n"
        "    --ir          also write <name>_ir.json\n"
        "    --no-export   skip the <name>.sjb export\n"
        "    --level <n>   LZ4 level for string payloads (0 fast, 3..12 HC)\n"
        "    --checksum    add LZ4 content checksums to string payloads\n"
        "    --debug       log timings and re-check the IR round trip\n\n"
        ".json inputs are encoded, .sjb inputs are verified.\n"
        "Outputs go to output/sjb and output/ir next to the executable."
    );
}

static std::string to_hex(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

static void encode_input(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    sjson::EncodeOptions opt{};
    opt.compression = settings.compression;
    opt.debug = settings.debug;
    const auto res = sjson::SjsonCodec::EncodeJsonFile(path, opt);

    if (settings.write_export) {
        const fs::path sjb_path = sjson::fs_utils::output_path(out_root, "sjb", path, ".sjb");
        sjson::fs_utils::write_file(sjb_path, res.export_bytes);
        SJSON_LOG_INFO(
            "Wrote: %s (%s, %zu bits)", sjb_path.string().c_str(),
            std::string(res.root.type_name()).c_str(), res.bits.bit_length()
        );
    }
    if (settings.write_ir) {
        const fs::path ir_path = sjson::fs_utils::output_path(out_root, "ir", path, "_ir.json");
        sjson::fs_utils::write_text_file(
            ir_path, res.ir.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
        );
        SJSON_LOG_INFO("Wrote: %s", ir_path.string().c_str());
    }
}

static void verify_input(const fs::path& path) {
    const auto res = sjson::SjsonCodec::InspectExportFile(path);
    SJSON_LOG_INFO(
        "Verified: %s root=%s bits=%u blake3=%s", path.string().c_str(),
        std::string(sjson::type_name(res.root_type)).c_str(), res.file.header.bit_length,
        to_hex(res.file.digest).c_str()
    );
}

static void process_file(
    const sjson::fs_utils::InputFile& input,
    const fs::path& out_root,
    const Settings& settings,
    BatchStats& stats
) {
    try {
        switch (input.kind) {
            case sjson::fs_utils::InputKind::JsonDocument:
                encode_input(input.path, out_root, settings);
                stats.encoded++;
                break;
            case sjson::fs_utils::InputKind::ExportContainer:
                verify_input(input.path);
                stats.verified++;
                break;
        }
    } catch (const std::exception& e) {
        stats.failed++;
        SJSON_LOG_ERROR("Failed: %s (%s)", input.path.string().c_str(), e.what());
    }
}

static bool parse_level(std::string_view v, int& level) {
    const auto res = std::from_chars(v.data(), v.data() + v.size(), level);
    return res.ec == std::errc() && res.ptr == v.data() + v.size();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        SJSON_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--ir") {
            settings.write_ir = true;
        } else if (arg == "--no-export") {
            settings.write_export = false;
        } else if (arg == "--checksum") {
            settings.compression.content_checksum = true;
        } else if (arg == "--debug") {
            settings.debug = true;
        } else if (arg == "--level") {
            if (i + 1 >= argc || !parse_level(argv[i + 1], settings.compression.level)) {
                SJSON_LOG_ERROR("--level needs an integer value");
                return 2;
            }
            i++;
        } else {
            SJSON_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return 2;
        }
    }

    if (!fs::exists(input)) {
        SJSON_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const auto inputs = sjson::fs_utils::collect_inputs(input);
    if (inputs.empty()) {
        SJSON_LOG_ERROR("No .json or .sjb inputs found: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = sjson::fs_utils::executable_dir() / "output";
    BatchStats stats;
    for (const auto& in : inputs) {
        if (inputs.size() > 1) {
            SJSON_LOG_INFO(
                "Processing: %s", sjson::fs_utils::display_path(in.path, input).c_str()
            );
        }
        process_file(in, out_root, settings, stats);
    }

    if (inputs.size() > 1) {
        SJSON_LOG_INFO(
            "Done: %zu encoded, %zu verified, %zu failed", stats.encoded, stats.verified,
            stats.failed
        );
    }
    return stats.failed == 0 ? 0 : 1;
}
