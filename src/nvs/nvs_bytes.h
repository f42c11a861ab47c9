/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace espnvs::nvs {
inline std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off) {
    if (off + 2 > s.size()) {
        throw std::out_of_range(std::string("read_u16_le out of bounds"));
    }
    return static_cast<std::uint16_t>(
        static_cast<std::uint16_t>(s[off]) | (static_cast<std::uint16_t>(s[off + 1]) << 8)
    );
}

inline std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    if (off + 4 > s.size()) {
        throw std::out_of_range(std::string("read_u32_le out of bounds"));
    }
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

inline std::uint64_t read_uint_le(std::span<const std::uint8_t> s, std::size_t off, std::size_t width) {
    if (off + width > s.size() || width > 8) {
        throw std::out_of_range(std::string("read_uint_le out of bounds"));
    }
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width; i++) {
        v |= static_cast<std::uint64_t>(s[off + i]) << (8 * i);
    }
    return v;
}

inline void put_u16_le(std::span<std::uint8_t> s, std::size_t off, std::uint16_t v) {
    s[off] = static_cast<std::uint8_t>(v & 0xFFu);
    s[off + 1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

inline void put_u32_le(std::span<std::uint8_t> s, std::size_t off, std::uint32_t v) {
    for (std::size_t i = 0; i < 4; i++) {
        s[off + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

inline void put_uint_le(std::span<std::uint8_t> s, std::size_t off, std::uint64_t v, std::size_t width) {
    for (std::size_t i = 0; i < width; i++) {
        s[off + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
std::vector<std::uint8_t> hex_to_bytes(std::string_view s);
}  // namespace espnvs::nvs
