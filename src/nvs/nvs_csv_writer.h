/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_record_encoder.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace espnvs::nvs {
struct BlobFile {
    std::filesystem::path path;
    std::vector<std::uint8_t> bytes;
};

struct CsvDocument {
    std::string text;
    std::vector<BlobFile> blob_files;
};

std::string csv_escape(std::string_view field);

// Renders rows as generator CSV. Placeholder blob rows are rewritten to `blob_dir / name` and
// their bytes returned in blob_files (one entry per distinct path); nothing is written to disk.
CsvDocument write_csv(const std::vector<CsvRow>& rows, const std::filesystem::path& blob_dir);
}  // namespace espnvs::nvs
