/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_format.h"
#include "nvs/nvs_page.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace espnvs::nvs {
enum class EntryKind {
    Primitive,
    String,
    LegacyBlob,
    BlobData,
    BlobIndex,
    NamespaceDef,
};

struct EntryLocation {
    std::size_t page_index = 0;
    std::uint32_t page_seq = 0;
    std::size_t slot = 0;
};

struct ClassifiedEntry {
    EntryKind kind = EntryKind::Primitive;
    ItemType type = ItemType::Any;
    std::uint8_t ns_index = 0;
    std::uint8_t chunk_index = kChunkAny;
    std::string key;
    EntryLocation location{};

    // Primitive
    std::uint64_t uint_value = 0;
    std::int64_t int_value = 0;

    // String, LegacyBlob, BlobData (strings without their trailing NUL)
    std::vector<std::uint8_t> bytes;
    std::uint16_t declared_size = 0;
    bool data_crc_ok = true;

    // BlobIndex
    std::uint32_t blob_size = 0;
    std::uint8_t chunk_count = 0;
    std::uint8_t chunk_start = 0;

    // NamespaceDef
    std::uint8_t defined_index = 0;
};

// Throws CorruptEntryError for unknown type codes and malformed items.
ClassifiedEntry classify_entry(const RawEntry& raw);
}  // namespace espnvs::nvs
