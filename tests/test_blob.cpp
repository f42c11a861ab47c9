/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
// tests/test_blob.cpp
#include "tests.hpp"

#include "nvs/nvs_blob.h"

#include <cstdint>
#include <vector>

using namespace espnvs::nvs;

static ClassifiedEntry blob_index(std::uint32_t size, std::uint8_t count, std::uint8_t start = 0) {
    ClassifiedEntry e{};
    e.kind = EntryKind::BlobIndex;
    e.type = ItemType::BlobIndex;
    e.ns_index = 1;
    e.key = "fw";
    e.blob_size = size;
    e.chunk_count = count;
    e.chunk_start = start;
    return e;
}

static ClassifiedEntry chunk(std::uint8_t index, std::vector<std::uint8_t> bytes, bool crc_ok = true) {
    ClassifiedEntry e{};
    e.kind = EntryKind::BlobData;
    e.type = ItemType::BlobData;
    e.ns_index = 1;
    e.key = "fw";
    e.chunk_index = index;
    e.bytes = std::move(bytes);
    e.declared_size = static_cast<std::uint16_t>(e.bytes.size());
    e.data_crc_ok = crc_ok;
    return e;
}

TEST_SUITE("nvs/blob") {
    TEST_CASE("chunks are joined in index order") {
        const auto c0 = chunk(0, std::vector<std::uint8_t>(20, 0x11));
        const auto c1 = chunk(1, std::vector<std::uint8_t>(20, 0x22));
        const auto r = assemble_blob(blob_index(40, 2), {&c1, &c0});

        REQUIRE(r.ok());
        REQUIRE(r.bytes.size() == 40);
        CHECK(r.bytes[0] == 0x11);
        CHECK(r.bytes[19] == 0x11);
        CHECK(r.bytes[20] == 0x22);
        CHECK(r.claimed.size() == 2);
    }

    TEST_CASE("missing chunk") {
        const auto c0 = chunk(0, std::vector<std::uint8_t>(20, 0x11));
        const auto r = assemble_blob(blob_index(40, 2), {&c0});
        CHECK_FALSE(r.ok());
        CHECK(r.bytes.empty());
        REQUIRE(r.issues.size() == 1);
        CHECK(r.issues[0].kind == BlobDiscrepancy::MissingChunk);
        CHECK(r.describe_issues() == "missing chunk 1");
    }

    TEST_CASE("duplicate chunk") {
        const auto a = chunk(0, std::vector<std::uint8_t>(4, 0x01));
        const auto b = chunk(0, std::vector<std::uint8_t>(4, 0x02));
        const auto r = assemble_blob(blob_index(4, 1), {&a, &b});
        REQUIRE(r.issues.size() == 1);
        CHECK(r.issues[0].kind == BlobDiscrepancy::DuplicateChunk);
        CHECK(r.describe_issues() == "duplicate chunk 0");
    }

    TEST_CASE("chunk crc mismatch") {
        const auto c0 = chunk(0, std::vector<std::uint8_t>(8, 0x01));
        const auto c1 = chunk(1, std::vector<std::uint8_t>(8, 0x02), false);
        const auto r = assemble_blob(blob_index(16, 2), {&c0, &c1});
        REQUIRE(r.issues.size() == 1);
        CHECK(r.describe_issues() == "chunk 1 crc mismatch");
    }

    TEST_CASE("length mismatch") {
        const auto c0 = chunk(0, std::vector<std::uint8_t>(10, 0x01));
        const auto r = assemble_blob(blob_index(12, 1), {&c0});
        REQUIRE(r.issues.size() == 1);
        CHECK(r.issues[0].kind == BlobDiscrepancy::LengthMismatch);
        CHECK(r.describe_issues() == "length mismatch (expected 12, got 10)");
    }

    TEST_CASE("declared size beyond what the chunks can hold") {
        const auto c0 = chunk(0, std::vector<std::uint8_t>(8, 0x01));
        const auto c1 = chunk(1, std::vector<std::uint8_t>(8, 0x02));

        SUBCASE("larger than any blob") {
            const auto r = assemble_blob(blob_index(0xFFFFFFFFu, 2), {&c0, &c1});
            REQUIRE(r.issues.size() == 1);
            CHECK(r.describe_issues() == "length mismatch (expected 4294967295, got 16)");
            CHECK(r.bytes.empty());
            CHECK(r.claimed.size() == 2);
        }
        SUBCASE("larger than its chunk count allows") {
            const auto r = assemble_blob(blob_index(static_cast<std::uint32_t>(2 * kMaxChunkPayload + 1), 2), {&c0, &c1});
            REQUIRE(r.issues.size() == 1);
            CHECK(r.issues[0].kind == BlobDiscrepancy::LengthMismatch);
        }
    }

    TEST_CASE("several issues are joined") {
        const auto c1 = chunk(1, std::vector<std::uint8_t>(8, 0x02), false);
        const auto r = assemble_blob(blob_index(24, 3), {&c1});
        CHECK(r.describe_issues() == "missing chunk 0; chunk 1 crc mismatch; missing chunk 2");
    }

    TEST_CASE("only the index's chunk range is claimed") {
        const auto stale = chunk(0, std::vector<std::uint8_t>(6, 0xAA));
        const auto fresh = chunk(128, std::vector<std::uint8_t>(6, 0xBB));
        const auto r = assemble_blob(blob_index(6, 1, 128), {&stale, &fresh});
        REQUIRE(r.ok());
        CHECK(r.bytes == std::vector<std::uint8_t>(6, 0xBB));
        REQUIRE(r.claimed.size() == 1);
        CHECK(r.claimed[0] == &fresh);
    }

    TEST_CASE("empty blob") {
        const auto r = assemble_blob(blob_index(0, 0), {});
        CHECK(r.ok());
        CHECK(r.bytes.empty());
    }

    TEST_CASE("requires a blob index") {
        auto not_index = chunk(0, {});
        CHECK_THROWS_AS(assemble_blob(not_index, {}), std::invalid_argument);
    }
}
