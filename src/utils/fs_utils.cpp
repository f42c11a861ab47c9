/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include "log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace fs = std::filesystem;

static std::string lower_ext(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

namespace espnvs::fs_utils {
bool is_partition_image(const fs::path& path) {
    return lower_ext(path) == ".bin";
}

bool is_record_document(const fs::path& path) {
    return lower_ext(path) == ".json";
}

fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(MAX_PATH, L'\0');
    for (;;) {
        const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (n == 0) {
            return {};
        }
        if (n < buf.size()) {
            buf.resize(n);
            return fs::path(buf).parent_path();
        }
        buf.resize(buf.size() * 2);
    }
#else
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::path{} : self.parent_path();
#endif
}

std::vector<fs::path> collect_inputs(const fs::path& root) {
    std::vector<fs::path> out;
    for (const auto& it : fs::recursive_directory_iterator(root)) {
        if (!it.is_regular_file()) {
            continue;
        }
        const auto& p = it.path();
        if (!is_partition_image(p) && !is_record_document(p)) {
            continue;
        }
        out.push_back(p);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot read " + path.string() + ": " + ec.message());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for reading: ") + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
    if (!buf.empty()
        && !f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
        throw std::runtime_error(
            "Short read: " + path.string() + " (" + std::to_string(f.gcount()) + " of "
            + std::to_string(buf.size()) + " bytes)"
        );
    }
    return buf;
}

static void write_bytes(const fs::path& path, const char* data, std::size_t len) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for writing: ") + path.string());
    }
    if (len != 0 && !f.write(data, static_cast<std::streamsize>(len))) {
        throw std::runtime_error(std::string("Failed to write: ") + path.string());
    }
}

void write_text_file(const fs::path& path, const std::string& text) {
    write_bytes(path, text.data(), text.size());
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    write_bytes(path, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        ESPNVS_LOG_ERROR(
            "Failed to create directory: %s (%s)", dir.string().c_str(), ec.message().c_str()
        );
        throw std::runtime_error("Cannot create directory " + dir.string());
    }
}

// Shows `path` relative to `base_dir` when it lies underneath it, absolute otherwise.
std::string display_path(const fs::path& path, const fs::path& base_dir) {
    if (base_dir.empty()) {
        return path.string();
    }
    std::error_code ec;
    const fs::path abs_path = fs::weakly_canonical(path, ec);
    if (ec) {
        return path.string();
    }
    const fs::path abs_base = fs::weakly_canonical(base_dir, ec);
    if (ec) {
        return abs_path.string();
    }
    const fs::path rel = abs_path.lexically_relative(abs_base);
    if (rel.empty() || *rel.begin() == "..") {
        return abs_path.string();
    }
    return rel.string();
}
}  // namespace espnvs::fs_utils
