/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool minimal = false;
    bool inline_blobs = false;
    bool strict = false;
    bool debug = false;
    std::size_t page_size = espnvs::nvs::kDefaultPageSize;
    std::optional<fs::path> out_root;
};

struct RunStats {
    std::size_t files = 0;
    std::size_t failed = 0;
    std::size_t files_with_warnings = 0;
};

static void print_usage() {
    ESPNVS_LOG_INFO(
        "Usage:\n" \
        "    nvs_parser <file-or-dir> [--out <dir>] [--page-size <n>] [--minimal] [--inline-blobs] [--strict] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory (.bin decodes to JSON, .json encodes to CSV)\n" \
        "    --out           output root (default: <exe dir>/output)\n" \
        "    --page-size     partition page size in bytes (default 4096)\n" \
        "    --minimal       omits page summaries from JSON output\n" \
        "    --inline-blobs  writes blobs as hex2bin CSV values instead of files\n" \
        "    --strict        exits with status 3 if any partition decoded with warnings\n" \
        "    --debug         enables extra logging\n"
    );
}

static void process_image(
    const fs::path& path,
    const fs::path& out_root,
    const Settings& settings,
    RunStats& stats
) {
    espnvs::ParserDecodeOptions opt{};
    opt.page_size = settings.page_size;
    opt.include_pages = !settings.minimal;
    opt.debug = settings.debug;
    const auto res = espnvs::NvsParser::DecodeNvsFile(path, opt);

    for (const auto& w : res.partition.warnings) {
        ESPNVS_LOG_WARN(
            "%s: %s", path.filename().string().c_str(), espnvs::nvs::format_warning(w).c_str()
        );
    }
    if (!res.partition.warnings.empty()) {
        stats.files_with_warnings++;
    }

    const fs::path json_path = out_root / "json" / (path.stem().string() + ".json");
    espnvs::fs_utils::write_text_file(json_path, espnvs::NvsParser::DumpDocument(res.document));
    ESPNVS_LOG_INFO(
        "Wrote: %s (records=%zu warnings=%zu)", json_path.string().c_str(),
        res.partition.records.size(), res.partition.warnings.size()
    );
}

static nlohmann::ordered_json read_json_file(const fs::path& path, bool debug) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = espnvs::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto text = std::string(bytes.begin(), bytes.end());
    auto json = nlohmann::ordered_json::parse(text);
    const auto t1 = std::chrono::steady_clock::now();
    if (debug) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        ESPNVS_LOG_INFO(
            "JSON read %s: bytes=%zu time=%lldms", path.string().c_str(), bytes.size(),
            static_cast<long long>(ms)
        );
    }
    return json;
}

static void process_document(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    const auto document = read_json_file(path, settings.debug);

    const fs::path blob_dir = out_root / "blobs";
    espnvs::ParserEncodeOptions opt{};
    opt.inline_blobs = settings.inline_blobs;
    opt.blob_dir = blob_dir;
    opt.base_dir = path.parent_path();
    opt.debug = settings.debug;
    const auto res = espnvs::NvsParser::EncodeJsonToCsv(document, opt, path.filename().string());

    for (const auto& blob : res.blob_files) {
        espnvs::fs_utils::write_file(blob.path, blob.bytes);
        ESPNVS_LOG_DEBUG("Wrote blob: %s (%zu bytes)", blob.path.string().c_str(), blob.bytes.size());
    }
    const fs::path csv_path = out_root / "csv" / (path.stem().string() + ".csv");
    espnvs::fs_utils::write_text_file(csv_path, res.csv_text);
    ESPNVS_LOG_INFO(
        "Wrote: %s (records=%zu blobs=%zu)", csv_path.string().c_str(), res.record_count,
        res.blob_files.size()
    );
}

static void process_file(
    const fs::path& path,
    const fs::path& input_root,
    const fs::path& out_root,
    const Settings& settings,
    RunStats& stats
) {
    const bool image = espnvs::fs_utils::is_partition_image(path);
    if (!image && !espnvs::fs_utils::is_record_document(path)) {
        ESPNVS_LOG_INFO("Skipped: %s", path.string().c_str());
        return;
    }

    stats.files++;
    const auto shown = espnvs::fs_utils::display_path(path, input_root);
    try {
        ESPNVS_LOG_DEBUG("Processing: %s", shown.c_str());
        if (image) {
            process_image(path, out_root, settings, stats);
        } else {
            process_document(path, out_root, settings);
        }
    } catch (const std::exception& e) {
        stats.failed++;
        ESPNVS_LOG_ERROR("Failed: %s (%s)", shown.c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        ESPNVS_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--minimal") {
            settings.minimal = true;
            continue;
        }
        if (arg == "--inline-blobs") {
            settings.inline_blobs = true;
            continue;
        }
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                ESPNVS_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_root = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--page-size") {
            if (i + 1 >= argc) {
                ESPNVS_LOG_ERROR("Missing value for --page-size");
                return 2;
            }
            const std::string value = argv[++i];
            try {
                std::size_t used = 0;
                settings.page_size = static_cast<std::size_t>(std::stoul(value, &used, 0));
                if (used != value.size()) {
                    throw std::invalid_argument(value);
                }
                espnvs::nvs::validate_page_size(settings.page_size);
            } catch (const std::exception& e) {
                ESPNVS_LOG_ERROR("Invalid --page-size %s (%s)", value.c_str(), e.what());
                return 2;
            }
            continue;
        }
        ESPNVS_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }
    espnvs::log::set_debug(settings.debug);

    if (!fs::exists(input)) {
        ESPNVS_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = settings.out_root.has_value()
                                  ? *settings.out_root
                                  : espnvs::fs_utils::executable_dir() / "output";
    try {
        espnvs::fs_utils::ensure_dir(out_root);
    } catch (const std::exception& e) {
        ESPNVS_LOG_ERROR("%s", e.what());
        return 2;
    }

    RunStats stats;
    if (fs::is_directory(input)) {
        const auto inputs = espnvs::fs_utils::collect_inputs(input);
        for (const auto& p : inputs) {
            process_file(p, input, out_root, settings, stats);
        }
    } else {
        process_file(input, input.parent_path(), out_root, settings, stats);
    }

    ESPNVS_LOG_DEBUG(
        "Done: files=%zu failed=%zu with_warnings=%zu", stats.files, stats.failed,
        stats.files_with_warnings
    );
    if (settings.strict && (stats.files_with_warnings != 0 || stats.failed != 0)) {
        return 3;
    }
    return 0;
}
