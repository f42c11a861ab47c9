/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace espnvs::nvs {
// Index -> name table built from namespace-index-0 entries. Callers register definitions in
// page-sequence order, so a later definition of the same index replaces the earlier one.
class NamespaceResolver {
   public:
    // Returns the previous name when `index` was already bound to a different name.
    std::optional<std::string> register_namespace(std::uint8_t index, const std::string& name);

    std::optional<std::string> resolve(std::uint8_t index) const;

    const std::map<std::uint8_t, std::string>& table() const { return _names; }

   private:
    std::map<std::uint8_t, std::string> _names;
};
}  // namespace espnvs::nvs
