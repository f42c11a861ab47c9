/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_entry.h"
#include "nvs/nvs_bytes.h"
#include "nvs/nvs_crc32.h"
#include "nvs/nvs_error.h"

#include <cstdio>

namespace espnvs::nvs {
static std::string hex8(std::uint8_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(v));
    return buf;
}

static std::int64_t sign_extend(std::uint64_t v, std::size_t width) {
    if (width >= 8) {
        return static_cast<std::int64_t>(v);
    }
    const unsigned bits = static_cast<unsigned>(width * 8);
    const std::uint64_t sign = 1ull << (bits - 1);
    const std::uint64_t mask = (1ull << bits) - 1;
    v &= mask;
    return static_cast<std::int64_t>((v ^ sign) - sign);
}

static void require_single_slot(const RawEntry& raw, std::string_view what) {
    if (raw.span() != 1) {
        throw CorruptEntryError(
            std::string(what) + " entry with span " + std::to_string(raw.span()), raw.type_code()
        );
    }
}

static void read_primitive(const RawEntry& raw, ClassifiedEntry& out) {
    require_single_slot(raw, item_type_name(out.type));
    const std::size_t width = primitive_width(out.type);
    out.uint_value = read_uint_le(raw.data(), 0, width);
    out.int_value = is_signed(out.type) ? sign_extend(out.uint_value, width)
                                        : static_cast<std::int64_t>(out.uint_value);
}

static void read_variable_length(const RawEntry& raw, ClassifiedEntry& out) {
    const auto data = raw.data();
    out.declared_size = read_u16_le(data, 0);
    const std::uint32_t stored_crc = read_u32_le(data, 4);
    if (out.declared_size > raw.payload.size()) {
        throw CorruptEntryError(
            "size " + std::to_string(out.declared_size) + " exceeds span capacity "
                + std::to_string(raw.payload.size()),
            raw.type_code()
        );
    }
    out.bytes.assign(raw.payload.begin(), raw.payload.begin() + out.declared_size);
    out.data_crc_ok = crc32_nvs(out.bytes) == stored_crc;
}

ClassifiedEntry classify_entry(const RawEntry& raw) {
    const auto type = item_type_from_code(raw.type_code());
    if (!type.has_value()) {
        throw CorruptEntryError("unknown type code " + hex8(raw.type_code()), raw.type_code());
    }

    ClassifiedEntry out{};
    out.type = *type;
    out.ns_index = raw.ns_index();
    out.chunk_index = raw.chunk_index();
    out.key = raw.key();
    out.location = EntryLocation{raw.page_index, raw.page_seq, raw.slot};

    if (out.key.empty()) {
        throw CorruptEntryError(std::string("entry without key"), raw.type_code());
    }
    if (out.ns_index == kNamespaceAny) {
        throw CorruptEntryError(std::string("entry uses reserved namespace index 255"), raw.type_code());
    }

    if (out.ns_index == kNamespaceTableIndex) {
        if (out.type != ItemType::U8) {
            throw CorruptEntryError(
                "namespace definition with type " + hex8(raw.type_code()), raw.type_code()
            );
        }
        read_primitive(raw, out);
        if (out.uint_value == kNamespaceTableIndex || out.uint_value == kNamespaceAny) {
            throw CorruptEntryError(
                "namespace '" + out.key + "' mapped to reserved index "
                    + std::to_string(out.uint_value),
                raw.type_code()
            );
        }
        out.kind = EntryKind::NamespaceDef;
        out.defined_index = static_cast<std::uint8_t>(out.uint_value);
        return out;
    }

    switch (out.type) {
        case ItemType::Str:
            out.kind = EntryKind::String;
            read_variable_length(raw, out);
            if (!out.data_crc_ok) {
                throw CorruptEntryError(std::string("string data crc mismatch"), raw.type_code());
            }
            if (!out.bytes.empty() && out.bytes.back() == 0) {
                out.bytes.pop_back();
            }
            return out;
        case ItemType::Blob:
            out.kind = EntryKind::LegacyBlob;
            read_variable_length(raw, out);
            if (!out.data_crc_ok) {
                throw CorruptEntryError(std::string("blob data crc mismatch"), raw.type_code());
            }
            return out;
        case ItemType::BlobData:
            // A bad chunk CRC is reported by the blob assembler against the owning blob.
            out.kind = EntryKind::BlobData;
            read_variable_length(raw, out);
            return out;
        case ItemType::BlobIndex: {
            require_single_slot(raw, "blob index");
            const auto data = raw.data();
            out.kind = EntryKind::BlobIndex;
            out.blob_size = read_u32_le(data, 0);
            out.chunk_count = data[4];
            out.chunk_start = data[5];
            return out;
        }
        default:
            out.kind = EntryKind::Primitive;
            read_primitive(raw, out);
            return out;
    }
}
}  // namespace espnvs::nvs
