/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nvs/nvs_entry.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace espnvs::nvs {
enum class BlobDiscrepancy {
    MissingChunk,
    DuplicateChunk,
    ChunkCrcMismatch,
    LengthMismatch,
};

struct BlobIssue {
    BlobDiscrepancy kind = BlobDiscrepancy::MissingChunk;
    std::uint32_t chunk_index = 0;
    std::size_t expected = 0;
    std::size_t actual = 0;

    std::string describe() const;
};

struct BlobAssembly {
    std::vector<std::uint8_t> bytes;
    std::vector<BlobIssue> issues;
    // Chunks (from the candidates passed in) that fall inside the index's chunk range.
    std::vector<const ClassifiedEntry*> claimed;

    bool ok() const { return issues.empty(); }
    std::string describe_issues() const;
};

// Assembles the blob described by `index` from `chunks` (all blob-data entries sharing its
// namespace and key). Chunks outside [chunk_start, chunk_start + chunk_count) are ignored.
// On any issue `bytes` is left empty.
BlobAssembly assemble_blob(
    const ClassifiedEntry& index,
    const std::vector<const ClassifiedEntry*>& chunks
);
}  // namespace espnvs::nvs
