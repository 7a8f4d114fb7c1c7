/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tarseek/tarseek.hpp>
#include "tar_fixture.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace tarseek;
using tarseek::testing::make_archive;
using tarseek::testing::repeat;
using tarseek::testing::to_string;
namespace fs = std::filesystem;

namespace {

class TempFile {
    fs::path path_;
public:
    TempFile() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);

        auto temp = fs::temp_directory_path();
        path_ = temp / ("tarseek_test_" + std::to_string(dis(gen)) + ".tar");
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

    void write_tar_data(const std::vector<std::byte>& data) const {
        std::ofstream file(path_, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
};

std::vector<std::pair<std::string, std::string>> read_everything(archive& ar) {
    std::vector<std::pair<std::string, std::string>> result;
    auto entries = ar.entries();
    REQUIRE(entries.has_value());
    for (auto& entry : *entries) {
        auto name = entry.filename();
        REQUIRE(name.has_value());
        auto data = entry.read_all();
        REQUIRE(data.has_value());
        result.emplace_back(std::string{*name}, to_string(*data));
    }
    CHECK_FALSE(entries->failure().has_value());
    return result;
}

} // namespace

TEST_CASE("Open archive from file", "[api]") {
    TempFile file;
    file.write_tar_data(make_archive({
        {"a", repeat("a\n", 11)},
        {"b", repeat("b\n", 11)},
    }));

    auto ar = open_archive(file.path());
    REQUIRE(ar.has_value());

    const auto contents = read_everything(*ar);
    REQUIRE(contents.size() == 2);
    CHECK(contents[0].first == "a");
    CHECK(contents[0].second == repeat("a\n", 11));
    CHECK(contents[1].first == "b");
    CHECK(contents[1].second == repeat("b\n", 11));
}

TEST_CASE("Open archive from missing file", "[api]") {
    auto ar = open_archive(fs::path{"/nonexistent/archive.tar"});
    REQUIRE_FALSE(ar.has_value());
    CHECK(ar.error().code() == error_code::io_error);
    CHECK_THAT(ar.error().message(), Catch::Matchers::StartsWith("Failed to open file"));
}

#ifdef __linux__
TEST_CASE("Open archive through a memory mapping", "[api]") {
    TempFile file;
    file.write_tar_data(make_archive({
        {"mapped.txt", "mapped data"},
        {"big.bin", std::string(5000, 'x')},
    }));

    auto ar = archive::from_mapped_file(file.path());
    REQUIRE(ar.has_value());

    const auto contents = read_everything(*ar);
    REQUIRE(contents.size() == 2);
    CHECK(contents[0].second == "mapped data");
    CHECK(contents[1].second.size() == 5000);
}
#endif

TEST_CASE("Open archive from a caller supplied stream", "[api]") {
    static const auto data = make_archive({{"streamed", "via stream"}});
    auto ar = open_archive(std::make_unique<memory_stream>(data));
    REQUIRE(ar.has_value());

    const auto contents = read_everything(*ar);
    REQUIRE(contents.size() == 1);
    CHECK(contents[0].second == "via stream");
}

TEST_CASE("Walking an archive twice", "[api]") {
    const auto data = make_archive({{"x", "1"}, {"y", "2"}});
    auto ar = archive::from_memory(data);
    REQUIRE(ar.has_value());

    CHECK(read_everything(*ar) == read_everything(*ar));
}

TEST_CASE("Corrupted file archive stops at the bad entry", "[api]") {
    auto data = make_archive({{"ok", "fine"}, {"broken", "data"}, {"after", "never"}});
    data[1024 + 1] = std::byte{'R'};

    TempFile file;
    file.write_tar_data(data);
    auto ar = open_archive(file.path());
    REQUIRE(ar.has_value());
    auto entries = ar->entries();
    REQUIRE(entries.has_value());

    std::vector<std::string> names;
    for (auto& entry : *entries) {
        names.emplace_back(*entry.filename());
    }

    CHECK(names == std::vector<std::string>{"ok"});
    REQUIRE(entries->failure().has_value());
    CHECK(is_malformed_archive(*entries->failure()));
}

TEST_CASE("Malformed archive classification", "[api]") {
    STATIC_REQUIRE(is_malformed_archive(error{error_code::corrupt_archive, {}}));
    STATIC_REQUIRE(is_malformed_archive(error{error_code::invalid_header, {}}));
    STATIC_REQUIRE_FALSE(is_malformed_archive(error{error_code::io_error, {}}));
    STATIC_REQUIRE_FALSE(is_malformed_archive(error{error_code::invalid_encoding, {}}));
}
