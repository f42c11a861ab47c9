/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_record_encoder.h"
#include "nvs/nvs_bytes.h"

#include <blake3.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace espnvs::nvs {
static std::string record_label(const Record& rec) {
    return "'" + rec.ns + "/" + rec.key + "'";
}

static void validate_name(const std::string& name, std::string_view what, const Record& rec) {
    if (name.empty() || name.size() > kMaxKeyLength) {
        throw std::runtime_error(
            std::string(what) + " of " + record_label(rec) + " must be 1.."
            + std::to_string(kMaxKeyLength) + " bytes"
        );
    }
    if (name.find('\0') != std::string::npos) {
        throw std::runtime_error(std::string(what) + " of " + record_label(rec) + " contains NUL");
    }
}

std::string_view row_kind_name(RowKind kind) {
    switch (kind) {
        case RowKind::Namespace:
            return "namespace";
        case RowKind::Data:
            return "data";
        case RowKind::File:
            return "file";
    }
    return "data";
}

std::string blob_placeholder_name(std::span<const std::uint8_t> bytes) {
    std::array<std::uint8_t, 32> hash{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!bytes.empty()) {
        blake3_hasher_update(&h, bytes.data(), bytes.size());
    }
    blake3_hasher_finalize(&h, hash.data(), hash.size());
    return "blob_" + bytes_to_hex(std::span<const std::uint8_t>(hash).first(8)) + ".bin";
}

CsvRow encode_record(const Record& rec, const EncodeOptions& opt) {
    validate_name(rec.ns, "namespace", rec);
    validate_name(rec.key, "key", rec);

    CsvRow row{};
    row.key = rec.key;

    if (rec.is_integer()) {
        if (!integer_in_range(rec)) {
            throw std::runtime_error(
                "value of " + record_label(rec) + " is out of range for "
                + std::string(item_type_name(rec.type))
            );
        }
        row.kind = RowKind::Data;
        row.encoding = std::string(item_type_name(rec.type));
        row.value = is_signed(rec.type) ? std::to_string(rec.int_value)
                                        : std::to_string(rec.uint_value);
        return row;
    }

    if (rec.is_string()) {
        if (rec.string_value.size() + 1 > kMaxStringSize) {
            throw std::runtime_error(
                "string " + record_label(rec) + " exceeds " + std::to_string(kMaxStringSize - 1)
                + " bytes"
            );
        }
        if (rec.string_value.find('\0') != std::string::npos) {
            throw std::runtime_error("string " + record_label(rec) + " contains NUL");
        }
        row.kind = RowKind::Data;
        row.encoding = "string";
        row.value = rec.string_value;
        return row;
    }

    if (rec.is_blob()) {
        if (rec.blob_file.has_value()) {
            row.kind = RowKind::File;
            row.encoding = "binary";
            row.value = rec.blob_file->generic_string();
            return row;
        }
        if (rec.blob_value.size() > kMaxBlobSize) {
            throw std::runtime_error(
                "blob " + record_label(rec) + " exceeds " + std::to_string(kMaxBlobSize) + " bytes"
            );
        }
        if (opt.inline_blobs) {
            row.kind = RowKind::Data;
            row.encoding = "hex2bin";
            row.value = bytes_to_hex(rec.blob_value);
            return row;
        }
        row.kind = RowKind::File;
        row.encoding = "binary";
        row.value = blob_placeholder_name(rec.blob_value);
        row.blob_bytes = rec.blob_value;
        return row;
    }

    throw std::runtime_error(
        "record " + record_label(rec) + " has unsupported type "
        + std::string(item_type_name(rec.type))
    );
}

std::vector<CsvRow> encode_records(
    const std::vector<Record>& records,
    const std::map<std::uint8_t, std::string>& namespaces,
    const EncodeOptions& opt
) {
    std::vector<std::string> ns_order;
    for (const auto& [index, name] : namespaces) {
        if (std::find(ns_order.begin(), ns_order.end(), name) == ns_order.end()) {
            ns_order.push_back(name);
        }
    }
    for (const auto& rec : records) {
        if (std::find(ns_order.begin(), ns_order.end(), rec.ns) == ns_order.end()) {
            ns_order.push_back(rec.ns);
        }
    }

    std::vector<CsvRow> rows;
    rows.reserve(ns_order.size() + records.size());
    for (const auto& ns : ns_order) {
        if (ns.empty() || ns.size() > kMaxKeyLength) {
            throw std::runtime_error(
                "namespace '" + ns + "' must be 1.." + std::to_string(kMaxKeyLength) + " bytes"
            );
        }
        CsvRow ns_row{};
        ns_row.key = ns;
        ns_row.kind = RowKind::Namespace;
        rows.push_back(std::move(ns_row));

        std::vector<std::string> seen_keys;
        for (const auto& rec : records) {
            if (rec.ns != ns) {
                continue;
            }
            if (std::find(seen_keys.begin(), seen_keys.end(), rec.key) != seen_keys.end()) {
                throw std::runtime_error("duplicate key " + record_label(rec));
            }
            seen_keys.push_back(rec.key);
            rows.push_back(encode_record(rec, opt));
        }
    }
    return rows;
}
}  // namespace espnvs::nvs
