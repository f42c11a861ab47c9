/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_bitmap.h"
#include "nvs/nvs_error.h"
#include "nvs/nvs_format.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace espnvs::nvs {
struct PageHeader {
    std::uint32_t raw_state = 0;
    PageState state = PageState::Invalid;
    std::uint32_t seq = 0;
    std::uint8_t version = 0;
    std::uint32_t crc = 0;
};

// One logical item as laid out on flash: the header slot plus its span-1 continuation slots.
struct RawEntry {
    std::size_t page_index = 0;
    std::uint32_t page_seq = 0;
    std::size_t slot = 0;
    std::array<std::uint8_t, kEntrySize> header{};
    std::vector<std::uint8_t> payload;

    std::uint8_t ns_index() const { return header[kEntryNsOffset]; }
    std::uint8_t type_code() const { return header[kEntryTypeOffset]; }
    std::uint8_t span() const { return header[kEntrySpanOffset]; }
    std::uint8_t chunk_index() const { return header[kEntryChunkOffset]; }
    std::string key() const;
    std::span<const std::uint8_t> data() const {
        return std::span<const std::uint8_t>(header).subspan(kEntryDataOffset);
    }
};

enum class PageStatus {
    Decoded,
    Empty,
    Skipped,
    Corrupt,
};

struct PageResult {
    std::size_t page_index = 0;
    PageStatus status = PageStatus::Corrupt;
    PageHeader header{};
    std::size_t entry_capacity = 0;
    std::size_t written = 0;
    std::size_t erased = 0;
    std::size_t empty = 0;
    std::size_t illegal = 0;
    std::vector<RawEntry> entries;
    std::vector<Warning> warnings;
};

std::size_t entry_capacity(std::size_t page_size);
void validate_page_size(std::size_t page_size);

PageHeader read_page_header(std::span<const std::uint8_t> page_bytes);

// Decodes one page. Never throws on bad data: corruption is reported through PageResult.
PageResult decode_page(std::span<const std::uint8_t> page_bytes, std::size_t page_index);
}  // namespace espnvs::nvs
