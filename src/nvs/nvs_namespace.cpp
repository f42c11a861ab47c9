/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_namespace.h"

namespace espnvs::nvs {
std::optional<std::string>
NamespaceResolver::register_namespace(std::uint8_t index, const std::string& name) {
    auto it = _names.find(index);
    if (it == _names.end()) {
        _names.emplace(index, name);
        return std::nullopt;
    }
    if (it->second == name) {
        return std::nullopt;
    }
    std::string previous = std::move(it->second);
    it->second = name;
    return previous;
}

std::optional<std::string> NamespaceResolver::resolve(std::uint8_t index) const {
    const auto it = _names.find(index);
    if (it == _names.end()) {
        return std::nullopt;
    }
    return it->second;
}
}  // namespace espnvs::nvs
