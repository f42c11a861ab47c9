/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_bytes.h"

#include <cctype>
#include <string_view>

namespace espnvs::nvs {
static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); i++) {
        const std::uint8_t b = bytes[i];
        out[i * 2] = hexdig[(b >> 4) & 0xF];
        out[i * 2 + 1] = hexdig[b & 0xF];
    }
    return out;
}

std::vector<std::uint8_t> hex_to_bytes(std::string_view s) {
    std::string clean;
    clean.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }
    std::size_t pos = 0;
    if (clean.rfind("0x", 0) == 0 || clean.rfind("0X", 0) == 0) {
        pos = 2;
    }
    const std::size_t hex_len = clean.size() - pos;
    std::vector<std::uint8_t> out;
    if (hex_len == 0) {
        return out;
    }
    if ((hex_len & 1) != 0) {
        throw std::runtime_error("Invalid hex string length.");
    }
    out.reserve(hex_len / 2);
    for (std::size_t i = 0; i < hex_len; i += 2) {
        const int hi = hex_nibble(clean[pos + i]);
        const int lo = hex_nibble(clean[pos + i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("Invalid hex string character.");
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}
}  // namespace espnvs::nvs
