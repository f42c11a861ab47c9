/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nvs/nvs_blob.h"

#include <algorithm>
#include <stdexcept>

namespace espnvs::nvs {
std::string BlobIssue::describe() const {
    switch (kind) {
        case BlobDiscrepancy::MissingChunk:
            return "missing chunk " + std::to_string(chunk_index);
        case BlobDiscrepancy::DuplicateChunk:
            return "duplicate chunk " + std::to_string(chunk_index);
        case BlobDiscrepancy::ChunkCrcMismatch:
            return "chunk " + std::to_string(chunk_index) + " crc mismatch";
        case BlobDiscrepancy::LengthMismatch:
            return "length mismatch (expected " + std::to_string(expected) + ", got "
                   + std::to_string(actual) + ")";
    }
    return "unknown blob issue";
}

std::string BlobAssembly::describe_issues() const {
    std::string out;
    for (const auto& issue : issues) {
        if (!out.empty()) {
            out += "; ";
        }
        out += issue.describe();
    }
    return out;
}

BlobAssembly assemble_blob(
    const ClassifiedEntry& index,
    const std::vector<const ClassifiedEntry*>& chunks
) {
    if (index.kind != EntryKind::BlobIndex) {
        throw std::invalid_argument(std::string("assemble_blob requires a blob index entry"));
    }

    const std::uint32_t first = index.chunk_start;
    const std::uint32_t last = first + index.chunk_count;

    BlobAssembly out{};
    for (const auto* chunk : chunks) {
        if (chunk->kind != EntryKind::BlobData || chunk->ns_index != index.ns_index
            || chunk->key != index.key) {
            continue;
        }
        if (chunk->chunk_index >= first && chunk->chunk_index < last) {
            out.claimed.push_back(chunk);
        }
    }
    std::stable_sort(
        out.claimed.begin(), out.claimed.end(),
        [](const ClassifiedEntry* a, const ClassifiedEntry* b) {
            return a->chunk_index < b->chunk_index;
        }
    );

    const std::size_t max_size =
        std::min<std::size_t>(kMaxBlobSize, std::size_t{index.chunk_count} * kMaxChunkPayload);
    if (index.blob_size > max_size) {
        std::size_t claimed_size = 0;
        for (const auto* chunk : out.claimed) {
            claimed_size += chunk->bytes.size();
        }
        out.issues.push_back(
            BlobIssue{BlobDiscrepancy::LengthMismatch, 0, index.blob_size, claimed_size}
        );
        return out;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(index.blob_size);
    std::size_t pos = 0;
    for (std::uint32_t ci = first; ci < last; ci++) {
        std::size_t n = 0;
        const ClassifiedEntry* found = nullptr;
        while (pos < out.claimed.size() && out.claimed[pos]->chunk_index == ci) {
            found = found ? found : out.claimed[pos];
            n++;
            pos++;
        }
        if (n == 0) {
            out.issues.push_back(BlobIssue{BlobDiscrepancy::MissingChunk, ci});
            continue;
        }
        if (n > 1) {
            out.issues.push_back(BlobIssue{BlobDiscrepancy::DuplicateChunk, ci});
            continue;
        }
        if (!found->data_crc_ok) {
            out.issues.push_back(BlobIssue{BlobDiscrepancy::ChunkCrcMismatch, ci});
            continue;
        }
        bytes.insert(bytes.end(), found->bytes.begin(), found->bytes.end());
    }

    if (out.issues.empty() && bytes.size() != index.blob_size) {
        out.issues.push_back(
            BlobIssue{BlobDiscrepancy::LengthMismatch, 0, index.blob_size, bytes.size()}
        );
    }
    if (out.issues.empty()) {
        out.bytes = std::move(bytes);
    }
    return out;
}
}  // namespace espnvs::nvs
