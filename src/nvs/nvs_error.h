/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace espnvs::nvs {
// Input cannot be treated as a partition at all (length not a multiple of the page size).
class StructuralError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// A single entry could not be interpreted; the caller skips it and records a warning.
class CorruptEntryError : public std::runtime_error {
   public:
    CorruptEntryError(const std::string& what, std::optional<std::uint8_t> type_code = std::nullopt)
        : std::runtime_error(what), _type_code(type_code) {}

    std::optional<std::uint8_t> type_code() const { return _type_code; }

   private:
    std::optional<std::uint8_t> _type_code;
};

enum class WarningKind {
    CorruptPage,
    SkippedPage,
    IllegalSlot,
    CorruptEntry,
    UnresolvedNamespace,
    CorruptBlob,
    DuplicateKey,
    DuplicateNamespace,
};

std::string_view warning_kind_name(WarningKind kind);

struct Warning {
    WarningKind kind = WarningKind::CorruptEntry;
    std::size_t page_index = 0;
    std::optional<std::size_t> slot;
    std::optional<std::string> ns;
    std::optional<std::string> key;
    std::string detail;

    bool operator==(const Warning&) const = default;
};

std::string format_warning(const Warning& w);
}  // namespace espnvs::nvs
