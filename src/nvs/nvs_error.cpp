/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_error.h"

namespace espnvs::nvs {
std::string_view warning_kind_name(WarningKind kind) {
    switch (kind) {
        case WarningKind::CorruptPage:
            return "CorruptPage";
        case WarningKind::SkippedPage:
            return "SkippedPage";
        case WarningKind::IllegalSlot:
            return "IllegalSlot";
        case WarningKind::CorruptEntry:
            return "CorruptEntry";
        case WarningKind::UnresolvedNamespace:
            return "UnresolvedNamespace";
        case WarningKind::CorruptBlob:
            return "CorruptBlob";
        case WarningKind::DuplicateKey:
            return "DuplicateKey";
        case WarningKind::DuplicateNamespace:
            return "DuplicateNamespace";
    }
    return "Unknown";
}

std::string format_warning(const Warning& w) {
    std::string out(warning_kind_name(w.kind));
    out += " page=" + std::to_string(w.page_index);
    if (w.slot.has_value()) {
        out += " slot=" + std::to_string(*w.slot);
    }
    if (w.ns.has_value()) {
        out += " ns=" + *w.ns;
    }
    if (w.key.has_value()) {
        out += " key=" + *w.key;
    }
    if (!w.detail.empty()) {
        out += ": " + w.detail;
    }
    return out;
}
}  // namespace espnvs::nvs
