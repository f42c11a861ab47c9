/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_format.h"

#include <array>
#include <utility>

namespace espnvs::nvs {
static const std::array<std::pair<std::string_view, ItemType>, 10> kTypeNames = {{
    {"u8", ItemType::U8},
    {"i8", ItemType::I8},
    {"u16", ItemType::U16},
    {"i16", ItemType::I16},
    {"u32", ItemType::U32},
    {"i32", ItemType::I32},
    {"u64", ItemType::U64},
    {"i64", ItemType::I64},
    {"string", ItemType::Str},
    {"blob", ItemType::BlobData},
}};

PageState page_state_from_raw(std::uint32_t raw) {
    switch (raw) {
        case static_cast<std::uint32_t>(PageState::Empty):
        case static_cast<std::uint32_t>(PageState::Active):
        case static_cast<std::uint32_t>(PageState::Full):
        case static_cast<std::uint32_t>(PageState::Freeing):
        case static_cast<std::uint32_t>(PageState::Corrupt):
            return static_cast<PageState>(raw);
        default:
            return PageState::Invalid;
    }
}

std::string_view page_state_name(PageState state) {
    switch (state) {
        case PageState::Empty:
            return "EMPTY";
        case PageState::Active:
            return "ACTIVE";
        case PageState::Full:
            return "FULL";
        case PageState::Freeing:
            return "FREEING";
        case PageState::Corrupt:
            return "CORRUPT";
        case PageState::Invalid:
            break;
    }
    return "INVALID";
}

std::optional<ItemType> item_type_from_code(std::uint8_t code) {
    switch (code) {
        case 0x01:
        case 0x11:
        case 0x02:
        case 0x12:
        case 0x04:
        case 0x14:
        case 0x08:
        case 0x18:
        case 0x21:
        case 0x41:
        case 0x42:
        case 0x48:
            return static_cast<ItemType>(code);
        default:
            return std::nullopt;
    }
}

bool is_primitive(ItemType type) {
    return primitive_width(type) != 0;
}

bool is_signed(ItemType type) {
    return (static_cast<std::uint8_t>(type) & 0xF0u) == 0x10u;
}

std::size_t primitive_width(ItemType type) {
    switch (type) {
        case ItemType::U8:
        case ItemType::I8:
            return 1;
        case ItemType::U16:
        case ItemType::I16:
            return 2;
        case ItemType::U32:
        case ItemType::I32:
            return 4;
        case ItemType::U64:
        case ItemType::I64:
            return 8;
        default:
            return 0;
    }
}

std::string_view item_type_name(ItemType type) {
    if (type == ItemType::Blob || type == ItemType::BlobIndex) {
        return "blob";
    }
    for (const auto& [name, t] : kTypeNames) {
        if (t == type) {
            return name;
        }
    }
    return "any";
}

std::optional<ItemType> item_type_from_name(std::string_view name) {
    for (const auto& [n, t] : kTypeNames) {
        if (n == name) {
            return t;
        }
    }
    return std::nullopt;
}
}  // namespace espnvs::nvs
