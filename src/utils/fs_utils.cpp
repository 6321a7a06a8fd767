/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "fs_utils.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <system_error>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace sjson::fs_utils {
namespace {
constexpr std::string_view kIrSuffix = "_ir";

void write_bytes_atomically(const fs::path& path, const char* data, std::size_t size) {
    ensure_dir(path.parent_path());
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            throw std::runtime_error("Failed to open file for writing: " + tmp.string());
        }
        if (size != 0) {
            f.write(data, static_cast<std::streamsize>(size));
        }
        f.close();
        if (!f) {
            throw std::runtime_error("Failed to write file: " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to move " + tmp.string() + " to " + path.string());
    }
}
}  // namespace

fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(32768, L'\0');
    const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n == 0 || n >= buf.size()) {
        return fs::current_path();
    }
    buf.resize(n);
    return fs::path(buf).parent_path();
#else
    std::array<char, 4096> buf{};
    const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
    if (n <= 0) {
        return fs::current_path();
    }
    return fs::path(std::string(buf.data(), static_cast<std::size_t>(n))).parent_path();
#endif
}

std::optional<InputKind> classify_input(const fs::path& path) {
    const auto ext = path.extension();
    if (ext == ".sjb") {
        return InputKind::ExportContainer;
    }
    if (ext != ".json") {
        return std::nullopt;
    }
    const std::string stem = path.stem().string();
    if (stem.size() >= kIrSuffix.size()
        && stem.compare(stem.size() - kIrSuffix.size(), kIrSuffix.size(), kIrSuffix) == 0) {
        return std::nullopt;
    }
    return InputKind::JsonDocument;
}

std::vector<InputFile> collect_inputs(const fs::path& root) {
    std::vector<InputFile> out;
    if (!fs::is_directory(root)) {
        if (const auto kind = classify_input(root)) {
            out.push_back(InputFile{root, *kind});
        }
        return out;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (const auto kind = classify_input(entry.path())) {
            out.push_back(InputFile{entry.path(), *kind});
        }
    }
    std::sort(out.begin(), out.end(), [](const InputFile& a, const InputFile& b) {
        return a.path < b.path;
    });
    return out;
}

fs::path output_path(
    const fs::path& out_root,
    std::string_view subdir,
    const fs::path& input,
    std::string_view suffix
) {
    std::string name = input.stem().string();
    name.append(suffix);
    return out_root / fs::path(std::string(subdir)) / name;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error(
            "Failed to stat file: " + path.string() + " (" + ec.message() + ")"
        );
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
    if (!buf.empty()) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!f) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
    }
    return buf;
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    write_bytes_atomically(path, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void write_text_file(const fs::path& path, std::string_view text) {
    write_bytes_atomically(path, text.data(), text.size());
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Failed to create directory: " + dir.string() + " (" + ec.message() + ")"
        );
    }
}

std::string display_path(const fs::path& path, const fs::path& base_dir) {
    if (base_dir.empty()) {
        return path.string();
    }
    std::error_code ec;
    const fs::path rel = fs::relative(path, base_dir, ec);
    if (ec || rel.empty() || *rel.begin() == "..") {
        return path.string();
    }
    return rel.string();
}
}  // namespace sjson::fs_utils
