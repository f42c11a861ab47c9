/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace espnvs::nvs {
constexpr std::size_t kDefaultPageSize = 4096;
constexpr std::size_t kEntrySize = 32;
constexpr std::size_t kPageHeaderSize = 32;
constexpr std::size_t kBitmapSize = 32;
constexpr std::size_t kMaxEntriesPerPage = kBitmapSize * 4;
constexpr std::size_t kMinPageSize = kPageHeaderSize + kBitmapSize + kEntrySize;
constexpr std::size_t kMaxPageSize = kPageHeaderSize + kBitmapSize + kMaxEntriesPerPage * kEntrySize;

constexpr std::size_t kKeyFieldSize = 16;
constexpr std::size_t kMaxKeyLength = kKeyFieldSize - 1;
constexpr std::size_t kMaxStringSize = 4000;
constexpr std::size_t kMaxBlobSize = 508000;
// Largest payload a single blob-data chunk can carry (a full page minus its header slot).
constexpr std::size_t kMaxChunkPayload = (kMaxEntriesPerPage - 1) * kEntrySize;

constexpr std::uint8_t kNamespaceTableIndex = 0;
constexpr std::uint8_t kNamespaceAny = 0xFF;
constexpr std::uint8_t kChunkAny = 0xFF;

// Header/entry field offsets.
constexpr std::size_t kHeaderStateOffset = 0;
constexpr std::size_t kHeaderSeqOffset = 4;
constexpr std::size_t kHeaderVersionOffset = 8;
constexpr std::size_t kHeaderCrcOffset = 28;

constexpr std::size_t kEntryNsOffset = 0;
constexpr std::size_t kEntryTypeOffset = 1;
constexpr std::size_t kEntrySpanOffset = 2;
constexpr std::size_t kEntryChunkOffset = 3;
constexpr std::size_t kEntryCrcOffset = 4;
constexpr std::size_t kEntryKeyOffset = 8;
constexpr std::size_t kEntryDataOffset = 24;

enum class PageState : std::uint32_t {
    Empty = 0xFFFFFFFFu,
    Active = 0xFFFFFFFEu,
    Full = 0xFFFFFFFCu,
    Freeing = 0xFFFFFFF8u,
    Corrupt = 0xFFFFFFF0u,
    Invalid = 0,
};

enum class EntryState : std::uint8_t {
    Erased = 0,
    Illegal = 1,
    Written = 2,
    Empty = 3,
};

enum class ItemType : std::uint8_t {
    U8 = 0x01,
    I8 = 0x11,
    U16 = 0x02,
    I16 = 0x12,
    U32 = 0x04,
    I32 = 0x14,
    U64 = 0x08,
    I64 = 0x18,
    Str = 0x21,
    Blob = 0x41,
    BlobData = 0x42,
    BlobIndex = 0x48,
    Any = 0xFF,
};

PageState page_state_from_raw(std::uint32_t raw);
std::string_view page_state_name(PageState state);

std::optional<ItemType> item_type_from_code(std::uint8_t code);
bool is_primitive(ItemType type);
bool is_signed(ItemType type);
std::size_t primitive_width(ItemType type);

// Names used in the JSON document and the generator CSV ("u8".."i64", "string", "blob").
std::string_view item_type_name(ItemType type);
std::optional<ItemType> item_type_from_name(std::string_view name);
}  // namespace espnvs::nvs
