/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_csv_writer.h"
#include "nvs/nvs_format.h"
#include "nvs/nvs_partition.h"
#include "nvs/nvs_record.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace espnvs {

struct ParserDecodeOptions {
    std::size_t page_size = nvs::kDefaultPageSize;
    bool include_pages = true;
    bool debug = false;
};

struct DecodeResult {
    nlohmann::ordered_json document = nlohmann::ordered_json::object();
    nvs::PartitionDecodeResult partition;
};

struct ParserEncodeOptions {
    bool inline_blobs = false;
    std::filesystem::path blob_dir = "blobs";
    // Relative blob file references in the document are resolved against this directory.
    std::filesystem::path base_dir;
    bool debug = false;
};

struct EncodeResult {
    std::string csv_text;
    std::vector<nvs::BlobFile> blob_files;
    std::size_t record_count = 0;
};

class NvsParser {
   public:
    static DecodeResult
    DecodeNvsFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeNvsBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    static EncodeResult EncodeJsonToCsv(
        const nlohmann::ordered_json& document,
        const ParserEncodeOptions& opt = {},
        std::string_view label = {}
    );

    static nlohmann::ordered_json
    PartitionToJson(const nvs::PartitionDecodeResult& partition, bool include_pages = true);
    // Never throws on stray bytes in keys or names; they become U+FFFD.
    static std::string DumpDocument(const nlohmann::ordered_json& document, int indent = 2);
    static std::vector<nvs::Record> RecordsFromJson(
        const nlohmann::ordered_json& document,
        const std::filesystem::path& base_dir = {}
    );
    static std::map<std::uint8_t, std::string>
    NamespacesFromJson(const nlohmann::ordered_json& document);
};

}  // namespace espnvs
