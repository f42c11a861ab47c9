/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_crc32.h"
#include "nvs/nvs_format.h"

#include <array>
#include <stdexcept>
#include <string>

namespace espnvs::nvs {
namespace {
constexpr std::uint32_t poly = 0xEDB88320u;

constexpr std::array<std::uint32_t, 256> make_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; i++) {
        std::uint32_t crc = i;
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 1u) != 0 ? (crc >> 1) ^ poly : (crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kTable = make_table();
}  // namespace

std::uint32_t crc32_update(std::uint32_t crc, const std::uint8_t* data, std::size_t len) {
    crc ^= 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; i++) {
        const std::uint32_t idx = (crc ^ data[i]) & 0xFFu;
        crc = kTable[idx] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

std::uint32_t entry_crc32(std::span<const std::uint8_t> entry) {
    if (entry.size() < kEntrySize) {
        throw std::invalid_argument(std::string("entry shorter than 32 bytes"));
    }
    const std::uint32_t crc = crc32_update(kNvsCrcSeed, entry.data(), kEntryCrcOffset);
    return crc32_update(crc, entry.data() + kEntryKeyOffset, kEntrySize - kEntryKeyOffset);
}

std::uint32_t page_header_crc32(std::span<const std::uint8_t> header) {
    if (header.size() < kPageHeaderSize) {
        throw std::invalid_argument(std::string("page header shorter than 32 bytes"));
    }
    return crc32_update(
        kNvsCrcSeed, header.data() + kHeaderSeqOffset, kHeaderCrcOffset - kHeaderSeqOffset
    );
}
}  // namespace espnvs::nvs
