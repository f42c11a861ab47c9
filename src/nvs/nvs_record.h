/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_format.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace espnvs::nvs {
// One logical key/value item. Integer records keep uint_value and int_value in sync (two's
// complement); blob records use ItemType::BlobData regardless of how they were stored.
struct Record {
    std::string ns;
    std::string key;
    ItemType type = ItemType::U8;
    std::uint64_t uint_value = 0;
    std::int64_t int_value = 0;
    std::string string_value;
    std::vector<std::uint8_t> blob_value;
    std::optional<std::filesystem::path> blob_file;

    bool is_integer() const { return is_primitive(type); }
    bool is_string() const { return type == ItemType::Str; }
    bool is_blob() const { return type == ItemType::BlobData; }

    bool operator==(const Record&) const = default;
};

Record make_unsigned_record(std::string ns, std::string key, ItemType type, std::uint64_t value);
Record make_signed_record(std::string ns, std::string key, ItemType type, std::int64_t value);
Record make_string_record(std::string ns, std::string key, std::string value);
Record make_blob_record(std::string ns, std::string key, std::vector<std::uint8_t> value);

// Checks that an integer record's value is representable in its type.
bool integer_in_range(const Record& rec);
}  // namespace espnvs::nvs
