/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_error.h"
#include "nvs/nvs_format.h"
#include "nvs/nvs_page.h"
#include "nvs/nvs_record.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace espnvs::nvs {
struct DecodeOptions {
    std::size_t page_size = kDefaultPageSize;
};

struct PageSummary {
    std::size_t index = 0;
    PageStatus status = PageStatus::Corrupt;
    PageHeader header{};
    std::size_t written = 0;
    std::size_t erased = 0;
    std::size_t empty = 0;
    std::size_t illegal = 0;
    std::size_t items = 0;
};

struct PartitionDecodeResult {
    std::vector<Record> records;
    std::map<std::uint8_t, std::string> namespaces;
    std::vector<PageSummary> pages;
    std::vector<Warning> warnings;
};

// Decodes a whole partition image. Throws StructuralError when the length is not a multiple of
// the page size and std::invalid_argument for an unsupported page size; all data corruption is
// reported through PartitionDecodeResult::warnings.
PartitionDecodeResult
decode_partition(std::span<const std::uint8_t> bytes, const DecodeOptions& opt = {});
}  // namespace espnvs::nvs
