/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
// tests/test_page.cpp
#include "tests.hpp"

#include "nvs/nvs_bytes.h"
#include "nvs/nvs_crc32.h"
#include "nvs/nvs_page.h"
#include "nvs_image_builder.h"

#include <string>

using namespace espnvs::nvs;
using espnvs::test::NvsImageBuilder;

static PageResult decode_first(NvsImageBuilder& b) {
    return decode_page(b.page_bytes(0), 0);
}

static std::size_t count_kind(const PageResult& r, WarningKind kind) {
    std::size_t n = 0;
    for (const auto& w : r.warnings) {
        n += w.kind == kind ? 1 : 0;
    }
    return n;
}

TEST_SUITE("nvs/page") {
    TEST_CASE("page size validation") {
        CHECK(entry_capacity(4096) == 126);
        CHECK(entry_capacity(kMaxPageSize) == kMaxEntriesPerPage);
        CHECK_NOTHROW(validate_page_size(2048));
        CHECK_THROWS_AS(validate_page_size(4097), std::invalid_argument);
        CHECK_THROWS_AS(validate_page_size(64), std::invalid_argument);
        CHECK_THROWS_AS(validate_page_size(8192), std::invalid_argument);
    }

    TEST_CASE("header fields") {
        NvsImageBuilder b;
        b.set_page(0, 7, PageState::Full, 0xFE);
        const auto hdr = read_page_header(b.page_bytes(0));
        CHECK(hdr.state == PageState::Full);
        CHECK(hdr.raw_state == 0xFFFFFFFCu);
        CHECK(hdr.seq == 7);
        CHECK(hdr.version == 2);
        CHECK(hdr.crc == page_header_crc32(b.page_bytes(0).first(kPageHeaderSize)));
    }

    TEST_CASE("erased page is empty and silent") {
        NvsImageBuilder b;
        const auto r = decode_first(b);
        CHECK(r.status == PageStatus::Empty);
        CHECK(r.entries.empty());
        CHECK(r.warnings.empty());
    }

    TEST_CASE("namespace and primitive entries") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        b.add_primitive(0, 1, "v1", ItemType::U32, 42);
        const auto r = decode_first(b);

        CHECK(r.status == PageStatus::Decoded);
        CHECK(r.warnings.empty());
        REQUIRE(r.entries.size() == 2);
        CHECK(r.entries[0].slot == 0);
        CHECK(r.entries[0].ns_index() == 0);
        CHECK(r.entries[0].key() == "cfg");
        CHECK(r.entries[1].slot == 1);
        CHECK(r.entries[1].key() == "v1");
        CHECK(r.entries[1].type_code() == 0x04);
        CHECK(read_u32_le(r.entries[1].data(), 0) == 42u);
        CHECK(r.written == 2);
        CHECK(r.empty == 124);
    }

    TEST_CASE("multi-slot string keeps its payload together") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const std::string text(40, 'x');
        const auto slot = b.add_string(0, 1, "greeting", text);
        b.add_primitive(0, 1, "after", ItemType::U8, 1);
        const auto r = decode_first(b);

        REQUIRE(r.entries.size() == 3);
        CHECK(r.entries[1].slot == slot);
        CHECK(r.entries[1].span() == 3);
        CHECK(r.entries[1].payload.size() == 64);
        CHECK(r.entries[2].slot == slot + 3);
        CHECK(r.entries[2].key() == "after");
    }

    TEST_CASE("header crc mismatch marks the page corrupt") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        b.flip_bit(0, kHeaderSeqOffset, 0);
        const auto r = decode_first(b);
        CHECK(r.status == PageStatus::Corrupt);
        CHECK(r.entries.empty());
        REQUIRE(r.warnings.size() == 1);
        CHECK(r.warnings[0].kind == WarningKind::CorruptPage);
    }

    TEST_CASE("freeing and unknown states are skipped with a warning") {
        NvsImageBuilder b;
        SUBCASE("freeing") {
            b.set_page(0, 1, PageState::Freeing);
        }
        SUBCASE("unknown state word") {
            b.set_page(0, 1, static_cast<PageState>(0x12345678u));
        }
        const auto r = decode_first(b);
        CHECK(r.status == PageStatus::Skipped);
        CHECK(count_kind(r, WarningKind::SkippedPage) == 1);
    }

    TEST_CASE("entry crc mismatch only loses that entry") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const auto bad = b.add_primitive(0, 1, "v1", ItemType::U32, 42);
        b.add_primitive(0, 1, "v2", ItemType::U32, 43);
        b.flip_bit(0, b.entry_offset(bad) + kEntryDataOffset, 3);
        const auto r = decode_first(b);

        REQUIRE(r.warnings.size() == 1);
        CHECK(r.warnings[0].kind == WarningKind::CorruptEntry);
        CHECK(r.warnings[0].slot == bad);
        REQUIRE(r.entries.size() == 2);
        CHECK(r.entries[1].key() == "v2");
    }

    TEST_CASE("corrupt multi-slot header skips its payload slots") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const std::vector<std::uint8_t> payload(70, 0x5A);
        const auto slot = b.add_legacy_blob(0, 1, "blob", payload);
        b.add_primitive(0, 1, "tail", ItemType::U8, 9);
        b.flip_bit(0, b.entry_offset(slot) + kEntryKeyOffset, 0);
        const auto r = decode_first(b);

        REQUIRE(r.warnings.size() == 1);
        CHECK(r.warnings[0].slot == slot);
        REQUIRE(r.entries.size() == 2);
        CHECK(r.entries[1].key() == "tail");
    }

    TEST_CASE("damaged span byte of a primitive does not hide later entries") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const auto bad = b.add_primitive(0, 1, "a", ItemType::U8, 7);
        b.add_primitive(0, 1, "b", ItemType::U32, 1111);
        b.add_primitive(0, 1, "c", ItemType::U32, 2222);
        // span 1 -> 3
        b.flip_bit(0, b.entry_offset(bad) + kEntrySpanOffset, 1);
        const auto r = decode_first(b);

        REQUIRE(r.warnings.size() == 1);
        CHECK(r.warnings[0].slot == bad);
        REQUIRE(r.entries.size() == 3);
        CHECK(r.entries[1].key() == "b");
        CHECK(r.entries[2].key() == "c");
    }

    TEST_CASE("damaged string header does not swallow valid entries it claims to cover") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const auto bad = b.add_string(0, 1, "s", "tiny");
        b.add_primitive(0, 1, "next", ItemType::U8, 3);
        // span 2 -> 3, so the declared extent now covers "next"
        b.flip_bit(0, b.entry_offset(bad) + kEntrySpanOffset, 0);
        const auto r = decode_first(b);

        REQUIRE_FALSE(r.warnings.empty());
        CHECK(r.warnings[0].slot == bad);
        REQUIRE(r.entries.size() == 2);
        CHECK(r.entries[1].key() == "next");
    }

    TEST_CASE("span beyond the page end") {
        NvsImageBuilder b;
        b.set_page(0, 0);
        const std::size_t last = b.capacity() - 1;
        auto e = b.entry(0, last);
        std::fill(e.begin(), e.end(), 0xFF);
        e[kEntryNsOffset] = 1;
        e[kEntryTypeOffset] = static_cast<std::uint8_t>(ItemType::Str);
        e[kEntrySpanOffset] = 2;
        std::fill(e.begin() + kEntryKeyOffset, e.begin() + kEntryDataOffset, 0);
        e[kEntryKeyOffset] = 'k';
        b.refresh_entry_crc(0, last);
        b.set_slot_state(0, last, EntryState::Written);

        const auto r = decode_first(b);
        CHECK(r.entries.empty());
        REQUIRE(r.warnings.size() == 1);
        CHECK(r.warnings[0].kind == WarningKind::CorruptEntry);
        CHECK(r.warnings[0].detail.find("exceeds") != std::string::npos);
    }

    TEST_CASE("span over unwritten slots") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const auto slot = b.add_string(0, 1, "s", std::string(40, 'y'));
        b.set_slot_state(0, slot + 2, EntryState::Erased);
        const auto r = decode_first(b);
        CHECK(r.entries.size() == 1);
        REQUIRE_FALSE(r.warnings.empty());
        CHECK(r.warnings[0].slot == slot);
    }

    TEST_CASE("illegal and erased slots") {
        NvsImageBuilder b;
        b.add_namespace(0, "cfg", 1);
        const auto gone = b.add_primitive(0, 1, "old", ItemType::U8, 1);
        b.add_primitive(0, 1, "new", ItemType::U8, 2);
        b.erase_item(0, gone);
        b.set_slot_state(0, 10, EntryState::Illegal);
        const auto r = decode_first(b);

        CHECK(r.erased == 1);
        CHECK(r.illegal == 1);
        CHECK(count_kind(r, WarningKind::IllegalSlot) == 1);
        REQUIRE(r.entries.size() == 2);
        CHECK(r.entries[1].key() == "new");
    }

    TEST_CASE("smaller page size") {
        NvsImageBuilder b(1, 1024);
        b.add_namespace(0, "cfg", 1);
        b.add_primitive(0, 1, "v", ItemType::I16, 0xFFFF);
        const auto r = decode_first(b);
        CHECK(r.entry_capacity == 30);
        CHECK(r.entries.size() == 2);
    }
}
