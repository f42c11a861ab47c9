/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
// tests/test_record_encoder.cpp
#include "tests.hpp"

#include "nvs/nvs_record_encoder.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace espnvs::nvs;

static std::vector<std::string> row_keys(const std::vector<CsvRow>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows) {
        out.push_back(std::string(row_kind_name(r.kind)) + ":" + r.key);
    }
    return out;
}

TEST_SUITE("nvs/record_encoder") {
    TEST_CASE("integers") {
        const auto u = encode_record(make_unsigned_record("cfg", "v1", ItemType::U32, 42));
        CHECK(u.kind == RowKind::Data);
        CHECK(u.key == "v1");
        CHECK(u.encoding == "u32");
        CHECK(u.value == "42");

        const auto i = encode_record(make_signed_record("cfg", "t", ItemType::I8, -5));
        CHECK(i.encoding == "i8");
        CHECK(i.value == "-5");

        const auto big = encode_record(make_unsigned_record("cfg", "m", ItemType::U64, 0xFFFFFFFFFFFFFFFFull));
        CHECK(big.value == "18446744073709551615");
    }

    TEST_CASE("strings") {
        const auto r = encode_record(make_string_record("cfg", "name", "a, \"quoted\" value"));
        CHECK(r.kind == RowKind::Data);
        CHECK(r.encoding == "string");
        CHECK(r.value == "a, \"quoted\" value");
    }

    TEST_CASE("blobs become file rows with content-addressed names") {
        const std::vector<std::uint8_t> data{1, 2, 3, 4};
        const auto r = encode_record(make_blob_record("cfg", "fw", data));
        CHECK(r.kind == RowKind::File);
        CHECK(r.encoding == "binary");
        REQUIRE(r.blob_bytes.has_value());
        CHECK(*r.blob_bytes == data);
        CHECK(r.value.size() == 25);
        CHECK(r.value.rfind("blob_", 0) == 0);

        CHECK(blob_placeholder_name(data) == r.value);
        const std::vector<std::uint8_t> other{1, 2, 3, 5};
        CHECK(blob_placeholder_name(other) != r.value);
        CHECK(blob_placeholder_name({}) == "blob_af1349b9f5f9a1a6.bin");
    }

    TEST_CASE("inline blobs") {
        EncodeOptions opt{};
        opt.inline_blobs = true;
        const auto r = encode_record(make_blob_record("cfg", "fw", {0xDE, 0xAD, 0x00}), opt);
        CHECK(r.kind == RowKind::Data);
        CHECK(r.encoding == "hex2bin");
        CHECK(r.value == "dead00");
        CHECK_FALSE(r.blob_bytes.has_value());
    }

    TEST_CASE("blob file reference") {
        auto rec = make_blob_record("cfg", "fw", {});
        rec.blob_file = std::filesystem::path("data") / "fw.bin";
        const auto r = encode_record(rec);
        CHECK(r.kind == RowKind::File);
        CHECK(r.value == "data/fw.bin");
        CHECK_FALSE(r.blob_bytes.has_value());
    }

    TEST_CASE("validation") {
        SUBCASE("integer out of range") {
            CHECK_THROWS_AS(encode_record(make_unsigned_record("cfg", "k", ItemType::U8, 300)), std::runtime_error);
            CHECK_THROWS_AS(encode_record(make_signed_record("cfg", "k", ItemType::I16, 40000)), std::runtime_error);
            CHECK_NOTHROW(encode_record(make_signed_record("cfg", "k", ItemType::I16, -32768)));
        }
        SUBCASE("key length") {
            CHECK_NOTHROW(encode_record(make_unsigned_record("cfg", std::string(15, 'k'), ItemType::U8, 1)));
            CHECK_THROWS_AS(encode_record(make_unsigned_record("cfg", std::string(16, 'k'), ItemType::U8, 1)), std::runtime_error);
            CHECK_THROWS_AS(encode_record(make_unsigned_record("cfg", "", ItemType::U8, 1)), std::runtime_error);
        }
        SUBCASE("namespace name") {
            CHECK_THROWS_AS(encode_record(make_unsigned_record("", "k", ItemType::U8, 1)), std::runtime_error);
            CHECK_THROWS_AS(encode_record(make_unsigned_record(std::string(16, 'n'), "k", ItemType::U8, 1)), std::runtime_error);
        }
        SUBCASE("string size") {
            CHECK_NOTHROW(encode_record(make_string_record("cfg", "s", std::string(3999, 'x'))));
            CHECK_THROWS_AS(encode_record(make_string_record("cfg", "s", std::string(4000, 'x'))), std::runtime_error);
            CHECK_THROWS_AS(encode_record(make_string_record("cfg", "s", std::string("a\0b", 3))), std::runtime_error);
        }
        SUBCASE("blob size") {
            CHECK_THROWS_AS(
                encode_record(make_blob_record("cfg", "b", std::vector<std::uint8_t>(kMaxBlobSize + 1))),
                std::runtime_error
            );
        }
    }

    TEST_CASE("namespace rows precede their records") {
        const std::vector<Record> records{
            make_unsigned_record("net", "port", ItemType::U16, 80),
            make_unsigned_record("cfg", "a", ItemType::U8, 1),
            make_unsigned_record("net", "ttl", ItemType::U8, 64),
        };

        SUBCASE("first appearance order") {
            const std::vector<std::string> expected{
                "namespace:net", "data:port", "data:ttl", "namespace:cfg", "data:a"};
            CHECK(row_keys(encode_records(records)) == expected);
        }
        SUBCASE("known table order first") {
            const std::map<std::uint8_t, std::string> table{{1, "cfg"}, {2, "net"}, {3, "spare"}};
            const std::vector<std::string> expected{
                "namespace:cfg", "data:a", "namespace:net", "data:port", "data:ttl", "namespace:spare"};
            CHECK(row_keys(encode_records(records, table)) == expected);
        }
    }

    TEST_CASE("duplicate keys are rejected") {
        const std::vector<Record> records{
            make_unsigned_record("cfg", "a", ItemType::U8, 1),
            make_string_record("cfg", "a", "again"),
        };
        CHECK_THROWS_AS(encode_records(records), std::runtime_error);
    }
}
