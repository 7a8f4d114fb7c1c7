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
#include <tarseek/stream.hpp>
#include <array>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

using namespace tarseek;
namespace fs = std::filesystem;

namespace {

std::vector<std::byte> pattern(size_t count) {
    std::vector<std::byte> data(count);
    for (size_t i = 0; i < count; ++i) {
        data[i] = static_cast<std::byte>(i & 0xFF);
    }
    return data;
}

class temp_file {
    fs::path path_;
public:
    temp_file() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        path_ = fs::temp_directory_path() / ("tarseek_stream_" + std::to_string(dis(gen)) + ".bin");
    }

    ~temp_file() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

    void write(const std::vector<std::byte>& data) const {
        std::ofstream file(path_, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
};

// Behaviour every source implementation must share
void check_source_contract(random_access_stream& stream, size_t size) {
    REQUIRE(stream.size() == size);

    std::array<std::byte, 10> buffer;
    auto first = stream.read(buffer);
    REQUIRE(first.has_value());
    CHECK(*first == 10);
    CHECK(buffer[0] == std::byte{0});
    CHECK(buffer[9] == std::byte{9});

    REQUIRE(stream.seek(100).has_value());
    auto second = stream.read(std::span{buffer}.first(5));
    REQUIRE(second.has_value());
    CHECK(*second == 5);
    CHECK(buffer[0] == std::byte{100});

    // Short read at the end, then end of source
    REQUIRE(stream.seek(size - 3).has_value());
    auto tail = stream.read(buffer);
    REQUIRE(tail.has_value());
    CHECK(*tail == 3);
    auto end = stream.read(buffer);
    REQUIRE(end.has_value());
    CHECK(*end == 0);

    // Positions past the end behave like the end
    REQUIRE(stream.seek(size + 4096).has_value());
    auto past = stream.read(buffer);
    REQUIRE(past.has_value());
    CHECK(*past == 0);
}

} // namespace

TEST_CASE("Memory stream", "[stream]") {
    const auto data = pattern(1024);
    memory_stream stream{data};
    check_source_contract(stream, data.size());
}

TEST_CASE("Memory stream over no bytes", "[stream]") {
    memory_stream stream{std::span<const std::byte>{}};
    std::array<std::byte, 4> buffer;
    auto result = stream.read(buffer);
    REQUIRE(result.has_value());
    CHECK(*result == 0);
    CHECK(stream.size() == 0);
}

TEST_CASE("File stream", "[stream]") {
    temp_file file;
    const auto data = pattern(2048);
    file.write(data);

    auto stream = file_stream::open(file.path());
    REQUIRE(stream.has_value());
    check_source_contract(*stream, data.size());
}

TEST_CASE("File stream open failure", "[stream]") {
    auto stream = file_stream::open("/nonexistent/path/archive.tar");
    REQUIRE_FALSE(stream.has_value());
    CHECK(stream.error().code() == error_code::io_error);
}

#ifdef __linux__
TEST_CASE("Memory mapped file stream", "[stream]") {
    temp_file file;
    const auto data = pattern(4096);
    file.write(data);

    auto stream = mmap_stream::create(file.path());
    REQUIRE(stream.has_value());
    check_source_contract(*stream, data.size());
}

TEST_CASE("Memory mapped empty file", "[stream]") {
    temp_file file;
    file.write({});

    auto stream = mmap_stream::create(file.path());
    REQUIRE(stream.has_value());
    CHECK(stream->size() == 0);

    std::array<std::byte, 4> buffer;
    auto result = stream->read(buffer);
    REQUIRE(result.has_value());
    CHECK(*result == 0);
}
#endif
