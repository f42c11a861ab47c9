/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
// tests/test_fs_utils.cpp
#include "tests.hpp"

#include "utils/fs_utils.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace espnvs;
namespace fs = std::filesystem;

static fs::path scratch_dir(const std::string& name) {
    const auto dir = fs::temp_directory_path() / ("espnvs_tests_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

TEST_SUITE("utils/fs_utils") {
    TEST_CASE("input classification") {
        CHECK(fs_utils::is_partition_image("nvs.bin"));
        CHECK(fs_utils::is_partition_image("NVS.BIN"));
        CHECK(fs_utils::is_record_document("nvs.json"));
        CHECK_FALSE(fs_utils::is_partition_image("nvs.csv"));
    }

    TEST_CASE("read and write round trip") {
        const auto dir = scratch_dir("io");
        const std::vector<std::uint8_t> data{0x00, 0xFF, 0x10};
        fs_utils::write_file(dir / "nested" / "x.bin", data);
        CHECK(fs_utils::read_file(dir / "nested" / "x.bin") == data);
        CHECK(fs_utils::read_file(dir / "nested" / "x.bin").size() == 3);
        fs::remove_all(dir);
    }

    TEST_CASE("display path relative to a base") {
        CHECK(fs_utils::display_path("a/b.bin", "") == "a/b.bin");
        const auto dir = scratch_dir("display");
        CHECK(fs_utils::display_path(dir / "x" / "y.bin", dir) == (fs::path("x") / "y.bin").string());
        fs::remove_all(dir);
    }

    TEST_CASE("collect inputs recursively in sorted order") {
        const auto dir = scratch_dir("collect");
        fs_utils::write_text_file(dir / "b.json", "{}");
        fs_utils::write_text_file(dir / "sub" / "a.bin", "");
        fs_utils::write_text_file(dir / "notes.txt", "x");
        const auto inputs = fs_utils::collect_inputs(dir);
        REQUIRE(inputs.size() == 2);
        CHECK(inputs[0].filename() == "b.json");
        CHECK(inputs[1].filename() == "a.bin");
        fs::remove_all(dir);
    }
}
