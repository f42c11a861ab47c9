/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_bitmap.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace espnvs::nvs {
std::size_t EntryBitmap::count(EntryState state) const {
    return static_cast<std::size_t>(std::count(states.begin(), states.end(), state));
}

EntryBitmap read_entry_bitmap(std::span<const std::uint8_t> bitmap, std::size_t entry_count) {
    if (entry_count * 2 > bitmap.size() * 8) {
        throw std::invalid_argument(
            std::string("Bitmap too small for ") + std::to_string(entry_count) + " entries"
        );
    }

    EntryBitmap out{};
    out.states.reserve(entry_count);
    for (std::size_t i = 0; i < entry_count; i++) {
        // Slot i occupies bits [2*(i%4), 2*(i%4)+2) of byte i/4.
        const unsigned shift = static_cast<unsigned>((i % 4) * 2);
        const auto state = static_cast<EntryState>((bitmap[i / 4] >> shift) & 0x3u);
        if (state == EntryState::Illegal) {
            out.illegal_slots.push_back(i);
        }
        out.states.push_back(state);
    }
    return out;
}
}  // namespace espnvs::nvs
