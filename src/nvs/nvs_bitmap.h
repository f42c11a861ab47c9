/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_format.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace espnvs::nvs {
struct EntryBitmap {
    std::vector<EntryState> states;
    std::vector<std::size_t> illegal_slots;

    std::size_t count(EntryState state) const;
};

// Decodes `entry_count` 2-bit slot states. Illegal patterns are collected, not thrown.
EntryBitmap read_entry_bitmap(std::span<const std::uint8_t> bitmap, std::size_t entry_count);
}  // namespace espnvs::nvs
