/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_record.h"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace espnvs::nvs {
enum class RowKind {
    Namespace,
    Data,
    File,
};

std::string_view row_kind_name(RowKind kind);

// One row of the partition generator CSV: key,type,encoding,value.
struct CsvRow {
    std::string key;
    RowKind kind = RowKind::Data;
    std::string encoding;
    std::string value;
    // Set for File rows whose bytes are still in memory; `value` then holds a placeholder file
    // name the CSV writer resolves against the blob directory.
    std::optional<std::vector<std::uint8_t>> blob_bytes;
};

struct EncodeOptions {
    bool inline_blobs = false;
};

// "blob_<16 hex digits of BLAKE3>.bin"; identical contents map to the same name.
std::string blob_placeholder_name(std::span<const std::uint8_t> bytes);

// Validates and encodes a single record. Throws std::runtime_error naming the record.
CsvRow encode_record(const Record& rec, const EncodeOptions& opt = {});

// Emits a namespace row before each namespace's records. Namespaces from `namespaces` come
// first in index order, then any other namespace in first-appearance order.
std::vector<CsvRow> encode_records(
    const std::vector<Record>& records,
    const std::map<std::uint8_t, std::string>& namespaces = {},
    const EncodeOptions& opt = {}
);
}  // namespace espnvs::nvs
