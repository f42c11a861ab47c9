/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_partition.h"
#include "nvs/nvs_blob.h"
#include "nvs/nvs_entry.h"
#include "nvs/nvs_namespace.h"
#include "utils/log.h"

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace espnvs::nvs {
namespace {
using ItemKey = std::pair<std::uint8_t, std::string>;

Warning entry_warning(
    WarningKind kind,
    const EntryLocation& loc,
    std::optional<std::string> ns,
    std::optional<std::string> key,
    std::string detail
) {
    Warning w{};
    w.kind = kind;
    w.page_index = loc.page_index;
    w.slot = loc.slot;
    w.ns = std::move(ns);
    w.key = std::move(key);
    w.detail = std::move(detail);
    return w;
}

std::string location_text(const EntryLocation& loc) {
    return "page " + std::to_string(loc.page_index) + " slot " + std::to_string(loc.slot);
}

Record to_record(const ClassifiedEntry& e, const std::string& ns) {
    switch (e.kind) {
        case EntryKind::Primitive:
            return is_signed(e.type) ? make_signed_record(ns, e.key, e.type, e.int_value)
                                     : make_unsigned_record(ns, e.key, e.type, e.uint_value);
        case EntryKind::String:
            return make_string_record(ns, e.key, std::string(e.bytes.begin(), e.bytes.end()));
        case EntryKind::LegacyBlob:
            return make_blob_record(ns, e.key, e.bytes);
        default:
            break;
    }
    throw std::logic_error("entry kind has no direct record form");
}

struct DecodeState {
    std::vector<ClassifiedEntry> entries;
    NamespaceResolver namespaces;
    std::vector<Warning> warnings;
};

std::vector<PageResult> decode_pages(
    std::span<const std::uint8_t> bytes,
    std::size_t page_size,
    DecodeState& st
) {
    const std::size_t page_count = bytes.size() / page_size;
    std::vector<PageResult> pages;
    pages.reserve(page_count);
    for (std::size_t i = 0; i < page_count; i++) {
        auto page = decode_page(bytes.subspan(i * page_size, page_size), i);
        for (auto& w : page.warnings) {
            st.warnings.push_back(std::move(w));
        }
        page.warnings.clear();
        pages.push_back(std::move(page));
    }
    return pages;
}

// Pages are replayed by sequence number, not physical position; ties keep physical order.
void classify_in_sequence_order(std::vector<PageResult>& pages, DecodeState& st) {
    std::vector<std::size_t> order(pages.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return pages[a].header.seq < pages[b].header.seq;
    });

    for (const auto idx : order) {
        auto& page = pages[idx];
        if (page.status != PageStatus::Decoded) {
            continue;
        }
        for (const auto& raw : page.entries) {
            try {
                st.entries.push_back(classify_entry(raw));
            } catch (const CorruptEntryError& e) {
                Warning w{};
                w.kind = WarningKind::CorruptEntry;
                w.page_index = raw.page_index;
                w.slot = raw.slot;
                const auto key = raw.key();
                if (!key.empty()) {
                    w.key = key;
                }
                w.detail = e.what();
                st.warnings.push_back(std::move(w));
            }
        }
        page.entries.clear();
    }
}

void register_namespaces(DecodeState& st) {
    for (const auto& e : st.entries) {
        if (e.kind != EntryKind::NamespaceDef) {
            continue;
        }
        const auto previous = st.namespaces.register_namespace(e.defined_index, e.key);
        if (previous.has_value()) {
            st.warnings.push_back(entry_warning(
                WarningKind::DuplicateNamespace, e.location, e.key, std::nullopt,
                "namespace index " + std::to_string(e.defined_index) + " redefined from '"
                    + *previous + "' to '" + e.key + "'"
            ));
        }
    }
}
}  // namespace

PartitionDecodeResult decode_partition(std::span<const std::uint8_t> bytes, const DecodeOptions& opt) {
    validate_page_size(opt.page_size);
    if (bytes.size() % opt.page_size != 0) {
        throw StructuralError(
            "Partition size " + std::to_string(bytes.size()) + " is not a multiple of the page size "
            + std::to_string(opt.page_size)
        );
    }

    DecodeState st{};
    auto pages = decode_pages(bytes, opt.page_size, st);

    PartitionDecodeResult result{};
    result.pages.reserve(pages.size());
    for (const auto& page : pages) {
        PageSummary summary{};
        summary.index = page.page_index;
        summary.status = page.status;
        summary.header = page.header;
        summary.written = page.written;
        summary.erased = page.erased;
        summary.empty = page.empty;
        summary.illegal = page.illegal;
        summary.items = page.entries.size();
        result.pages.push_back(summary);
    }

    classify_in_sequence_order(pages, st);
    register_namespaces(st);

    // Resolve namespaces and keep the latest item per (namespace, key).
    std::map<ItemKey, std::size_t> latest;
    std::map<ItemKey, std::vector<const ClassifiedEntry*>> chunks_by_key;
    std::vector<std::string> ns_names(st.entries.size());
    for (std::size_t i = 0; i < st.entries.size(); i++) {
        const auto& e = st.entries[i];
        if (e.kind == EntryKind::NamespaceDef) {
            continue;
        }
        const auto ns = st.namespaces.resolve(e.ns_index);
        if (!ns.has_value()) {
            st.warnings.push_back(entry_warning(
                WarningKind::UnresolvedNamespace, e.location, std::nullopt, e.key,
                "namespace index " + std::to_string(e.ns_index) + " is not defined"
            ));
            continue;
        }
        ns_names[i] = *ns;

        const ItemKey item_key{e.ns_index, e.key};
        if (e.kind == EntryKind::BlobData) {
            chunks_by_key[item_key].push_back(&e);
            continue;
        }
        const auto it = latest.find(item_key);
        if (it != latest.end()) {
            const auto& old = st.entries[it->second];
            st.warnings.push_back(entry_warning(
                WarningKind::DuplicateKey, old.location, *ns, e.key,
                "superseded by " + location_text(e.location)
            ));
            it->second = i;
        } else {
            latest.emplace(item_key, i);
        }
    }

    std::vector<std::size_t> winners;
    winners.reserve(latest.size());
    for (const auto& [k, idx] : latest) {
        winners.push_back(idx);
    }
    std::sort(winners.begin(), winners.end());

    const std::vector<const ClassifiedEntry*> no_chunks;
    std::set<const ClassifiedEntry*> claimed;
    for (const auto idx : winners) {
        const auto& e = st.entries[idx];
        const auto& ns = ns_names[idx];
        if (e.kind != EntryKind::BlobIndex) {
            result.records.push_back(to_record(e, ns));
            continue;
        }

        const auto chunk_it = chunks_by_key.find(ItemKey{e.ns_index, e.key});
        const auto& candidates = chunk_it != chunks_by_key.end() ? chunk_it->second : no_chunks;
        auto blob = assemble_blob(e, candidates);
        claimed.insert(blob.claimed.begin(), blob.claimed.end());
        if (!blob.ok()) {
            st.warnings.push_back(entry_warning(
                WarningKind::CorruptBlob, e.location, ns, e.key, blob.describe_issues()
            ));
            continue;
        }
        result.records.push_back(make_blob_record(ns, e.key, std::move(blob.bytes)));
    }

    for (const auto& [k, chunks] : chunks_by_key) {
        for (const auto* chunk : chunks) {
            if (claimed.count(chunk) != 0) {
                continue;
            }
            const std::size_t idx = static_cast<std::size_t>(chunk - st.entries.data());
            st.warnings.push_back(entry_warning(
                WarningKind::CorruptBlob, chunk->location, ns_names[idx], chunk->key,
                "orphan chunk " + std::to_string(chunk->chunk_index)
                    + " (no blob index covers it)"
            ));
        }
    }

    result.namespaces = st.namespaces.table();
    result.warnings = std::move(st.warnings);
    ESPNVS_LOG_DEBUG(
        "Partition: pages=%zu items=%zu records=%zu namespaces=%zu warnings=%zu", pages.size(),
        st.entries.size(), result.records.size(), result.namespaces.size(),
        result.warnings.size()
    );
    return result;
}
}  // namespace espnvs::nvs
