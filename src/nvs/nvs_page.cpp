/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_page.h"
#include "nvs/nvs_bytes.h"
#include "nvs/nvs_crc32.h"
#include "utils/log.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace espnvs::nvs {
static std::string hex32(std::uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned>(v));
    return buf;
}

std::string RawEntry::key() const {
    const auto* begin = reinterpret_cast<const char*>(header.data() + kEntryKeyOffset);
    const auto* end = std::find(begin, begin + kKeyFieldSize, '\0');
    return std::string(begin, end);
}

std::size_t entry_capacity(std::size_t page_size) {
    validate_page_size(page_size);
    return (page_size - kPageHeaderSize - kBitmapSize) / kEntrySize;
}

void validate_page_size(std::size_t page_size) {
    if (page_size % kEntrySize != 0 || page_size < kMinPageSize || page_size > kMaxPageSize) {
        throw std::invalid_argument(
            "Unsupported page size " + std::to_string(page_size) + " (multiple of 32 in ["
            + std::to_string(kMinPageSize) + ", " + std::to_string(kMaxPageSize) + "])"
        );
    }
}

PageHeader read_page_header(std::span<const std::uint8_t> page_bytes) {
    PageHeader hdr{};
    hdr.raw_state = read_u32_le(page_bytes, kHeaderStateOffset);
    hdr.state = page_state_from_raw(hdr.raw_state);
    hdr.seq = read_u32_le(page_bytes, kHeaderSeqOffset);
    hdr.version = static_cast<std::uint8_t>((page_bytes[kHeaderVersionOffset] ^ 0xFFu) + 1u);
    hdr.crc = read_u32_le(page_bytes, kHeaderCrcOffset);
    return hdr;
}

static Warning page_warning(WarningKind kind, std::size_t page_index, std::string detail) {
    Warning w{};
    w.kind = kind;
    w.page_index = page_index;
    w.detail = std::move(detail);
    return w;
}

static Warning slot_warning(std::size_t page_index, std::size_t slot, std::string detail) {
    Warning w = page_warning(WarningKind::CorruptEntry, page_index, std::move(detail));
    w.slot = slot;
    return w;
}

static bool continuation_written(const EntryBitmap& bitmap, std::size_t slot, std::size_t span) {
    for (std::size_t j = slot + 1; j < slot + span; j++) {
        if (bitmap.states[j] != EntryState::Written) {
            return false;
        }
    }
    return true;
}

static bool is_variable_length_code(std::uint8_t code) {
    const auto type = item_type_from_code(code);
    return type == ItemType::Str || type == ItemType::Blob || type == ItemType::BlobData;
}

// A damaged header's span is only trusted when none of the slots it covers is a valid header.
static bool continuation_is_payload(std::span<const std::uint8_t> entries, std::size_t slot, std::size_t span) {
    for (std::size_t j = slot + 1; j < slot + span; j++) {
        const auto other = entries.subspan(j * kEntrySize, kEntrySize);
        if (read_u32_le(other, kEntryCrcOffset) == entry_crc32(other)) {
            return false;
        }
    }
    return true;
}

PageResult decode_page(std::span<const std::uint8_t> page_bytes, std::size_t page_index) {
    PageResult res{};
    res.page_index = page_index;
    res.entry_capacity = entry_capacity(page_bytes.size());
    res.header = read_page_header(page_bytes);

    switch (res.header.state) {
        case PageState::Empty:
            res.status = PageStatus::Empty;
            return res;
        case PageState::Active:
        case PageState::Full:
            break;
        default:
            res.status = PageStatus::Skipped;
            res.warnings.push_back(page_warning(
                WarningKind::SkippedPage, page_index,
                "page state " + std::string(page_state_name(res.header.state)) + " ("
                    + hex32(res.header.raw_state) + ") is not readable"
            ));
            return res;
    }

    const std::uint32_t crc_calc = page_header_crc32(page_bytes.first(kPageHeaderSize));
    if (crc_calc != res.header.crc) {
        res.status = PageStatus::Corrupt;
        res.warnings.push_back(page_warning(
            WarningKind::CorruptPage, page_index,
            "header crc mismatch (stored " + hex32(res.header.crc) + ", computed "
                + hex32(crc_calc) + ")"
        ));
        return res;
    }

    const std::size_t cap = res.entry_capacity;
    const auto bitmap = read_entry_bitmap(page_bytes.subspan(kPageHeaderSize, kBitmapSize), cap);
    res.written = bitmap.count(EntryState::Written);
    res.erased = bitmap.count(EntryState::Erased);
    res.empty = bitmap.count(EntryState::Empty);
    res.illegal = bitmap.illegal_slots.size();
    for (const auto slot : bitmap.illegal_slots) {
        Warning w = page_warning(WarningKind::IllegalSlot, page_index, "illegal bitmap state");
        w.slot = slot;
        res.warnings.push_back(std::move(w));
    }

    const auto entries = page_bytes.subspan(kPageHeaderSize + kBitmapSize, cap * kEntrySize);
    std::size_t i = 0;
    while (i < cap) {
        if (bitmap.states[i] != EntryState::Written) {
            i++;
            continue;
        }

        const auto slot_bytes = entries.subspan(i * kEntrySize, kEntrySize);
        const std::uint32_t stored_crc = read_u32_le(slot_bytes, kEntryCrcOffset);
        const std::uint32_t calc_crc = entry_crc32(slot_bytes);
        const std::size_t span = slot_bytes[kEntrySpanOffset];
        const bool span_fits = span >= 1 && span <= cap - i;

        if (stored_crc != calc_crc) {
            res.warnings.push_back(slot_warning(
                page_index, i,
                "entry crc mismatch (stored " + hex32(stored_crc) + ", computed "
                    + hex32(calc_crc) + ")"
            ));
            if (span_fits && span > 1 && is_variable_length_code(slot_bytes[kEntryTypeOffset])
                && continuation_written(bitmap, i, span) && continuation_is_payload(entries, i, span)) {
                i += span;
            } else {
                i++;
            }
            continue;
        }
        if (!span_fits) {
            res.warnings.push_back(slot_warning(
                page_index, i,
                "span " + std::to_string(span) + " exceeds remaining page capacity "
                    + std::to_string(cap - i)
            ));
            i++;
            continue;
        }
        if (!continuation_written(bitmap, i, span)) {
            res.warnings.push_back(slot_warning(
                page_index, i,
                "span " + std::to_string(span) + " covers slots not marked written"
            ));
            i++;
            continue;
        }

        RawEntry entry{};
        entry.page_index = page_index;
        entry.page_seq = res.header.seq;
        entry.slot = i;
        std::copy(slot_bytes.begin(), slot_bytes.end(), entry.header.begin());
        if (span > 1) {
            const auto cont = entries.subspan((i + 1) * kEntrySize, (span - 1) * kEntrySize);
            entry.payload.assign(cont.begin(), cont.end());
        }
        res.entries.push_back(std::move(entry));
        i += span;
    }

    res.status = PageStatus::Decoded;
    ESPNVS_LOG_DEBUG(
        "Page %zu: state=%s seq=%u version=%u written=%zu erased=%zu entries=%zu", page_index,
        std::string(page_state_name(res.header.state)).c_str(),
        static_cast<unsigned>(res.header.seq), static_cast<unsigned>(res.header.version),
        res.written, res.erased, res.entries.size()
    );
    return res;
}
}  // namespace espnvs::nvs
