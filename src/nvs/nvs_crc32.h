/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace espnvs::nvs {
// Reflected CRC-32 (poly 0xEDB88320) continuing from a previous result; same chaining rules
// as zlib's crc32(crc, buf, len).
std::uint32_t crc32_update(std::uint32_t crc, const std::uint8_t* data, std::size_t len);

inline std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::uint8_t> data) {
    return crc32_update(crc, data.data(), data.size());
}

constexpr std::uint32_t kNvsCrcSeed = 0xFFFFFFFFu;

// CRC used by NVS headers, entries and item data, i.e. zlib.crc32(data, 0xFFFFFFFF).
inline std::uint32_t crc32_nvs(std::span<const std::uint8_t> data) {
    return crc32_update(kNvsCrcSeed, data);
}

inline bool crc32_nvs_verify(std::span<const std::uint8_t> data, std::uint32_t expected) {
    return crc32_nvs(data) == expected;
}

// Entry CRC skips its own crc field: bytes [0,4) followed by [8,32).
std::uint32_t entry_crc32(std::span<const std::uint8_t> entry);

// Page header CRC covers bytes [4,28).
std::uint32_t page_header_crc32(std::span<const std::uint8_t> header);
}  // namespace espnvs::nvs
