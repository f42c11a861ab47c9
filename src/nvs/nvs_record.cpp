/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_record.h"

#include <stdexcept>

namespace espnvs::nvs {
Record make_unsigned_record(std::string ns, std::string key, ItemType type, std::uint64_t value) {
    if (!is_primitive(type)) {
        throw std::invalid_argument(std::string("make_unsigned_record requires an integer type"));
    }
    Record rec{};
    rec.ns = std::move(ns);
    rec.key = std::move(key);
    rec.type = type;
    rec.uint_value = value;
    rec.int_value = static_cast<std::int64_t>(value);
    return rec;
}

Record make_signed_record(std::string ns, std::string key, ItemType type, std::int64_t value) {
    if (!is_primitive(type)) {
        throw std::invalid_argument(std::string("make_signed_record requires an integer type"));
    }
    Record rec{};
    rec.ns = std::move(ns);
    rec.key = std::move(key);
    rec.type = type;
    rec.int_value = value;
    rec.uint_value = static_cast<std::uint64_t>(value);
    return rec;
}

Record make_string_record(std::string ns, std::string key, std::string value) {
    Record rec{};
    rec.ns = std::move(ns);
    rec.key = std::move(key);
    rec.type = ItemType::Str;
    rec.string_value = std::move(value);
    return rec;
}

Record make_blob_record(std::string ns, std::string key, std::vector<std::uint8_t> value) {
    Record rec{};
    rec.ns = std::move(ns);
    rec.key = std::move(key);
    rec.type = ItemType::BlobData;
    rec.blob_value = std::move(value);
    return rec;
}

bool integer_in_range(const Record& rec) {
    const std::size_t width = primitive_width(rec.type);
    if (width == 0) {
        return false;
    }
    if (width == 8) {
        return true;
    }
    const unsigned bits = static_cast<unsigned>(width * 8);
    if (is_signed(rec.type)) {
        const std::int64_t lo = -(std::int64_t{1} << (bits - 1));
        const std::int64_t hi = (std::int64_t{1} << (bits - 1)) - 1;
        return rec.int_value >= lo && rec.int_value <= hi;
    }
    return rec.uint_value <= (std::uint64_t{1} << bits) - 1;
}
}  // namespace espnvs::nvs
