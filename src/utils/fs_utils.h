/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sjson::fs_utils {
enum class InputKind {
    JsonDocument,     // .json, encoded
    ExportContainer,  // .sjb, verified
};

struct InputFile {
    std::filesystem::path path;
    InputKind kind = InputKind::JsonDocument;
};

std::filesystem::path executable_dir();

// nullopt for unsupported extensions and for <name>_ir.json outputs.
std::optional<InputKind> classify_input(const std::filesystem::path& path);

// A single file or every supported file below a directory, sorted.
std::vector<InputFile> collect_inputs(const std::filesystem::path& root);

// <out_root>/<subdir>/<input stem><suffix>
std::filesystem::path output_path(
    const std::filesystem::path& out_root,
    std::string_view subdir,
    const std::filesystem::path& input,
    std::string_view suffix
);

std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
// Both writers go through <path>.tmp and a rename.
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void write_text_file(const std::filesystem::path& path, std::string_view text);
void ensure_dir(const std::filesystem::path& dir);

std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);
}  // namespace sjson::fs_utils
