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

#pragma once

#include <tarseek/error.hpp>
#include <tarseek/header.hpp>
#include <tarseek/archive_cursor.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iterator>
#include <span>
#include <string_view>
#include <vector>

namespace tarseek {

enum class seek_origin {
    from_start,
    from_current,
    from_end
};

// Read handle over one entry's data region. Every view keeps its own logical
// position and only borrows the archive's cursor, so any number of views can
// be alive at once. The archive must outlive them.
class entry_view {
private:
    header_record header_;
    detail::archive_cursor* cursor_;
    uint64_t data_offset_;
    uint64_t position_ = 0;
    uint64_t size_;

    friend class entry_iterator;

    entry_view(header_record header, detail::archive_cursor* cursor, uint64_t data_offset, uint64_t size)
        : header_(std::move(header)), cursor_(cursor), data_offset_(data_offset), size_(size) {}

public:
    // Chunk size used when copying whole entries
    static constexpr size_t copy_chunk_size = 64 * 1024;

    [[nodiscard]] std::span<const std::byte> filename_bytes() const noexcept { return header_.name_bytes(); }
    [[nodiscard]] std::expected<std::string_view, error> filename() const { return header_.name(); }

    [[nodiscard]] uint64_t size() const noexcept { return size_; }
    [[nodiscard]] uint64_t position() const noexcept { return position_; }
    [[nodiscard]] uint64_t data_offset() const noexcept { return data_offset_; }
    [[nodiscard]] const header_record& header() const noexcept { return header_; }

    // Metadata carried by the header
    [[nodiscard]] entry_type type() const noexcept { return header_.type(); }
    [[nodiscard]] std::expected<uint64_t, error> mode() const { return header_.mode(); }
    [[nodiscard]] std::expected<uint64_t, error> owner_id() const { return header_.owner_id(); }
    [[nodiscard]] std::expected<uint64_t, error> group_id() const { return header_.group_id(); }
    [[nodiscard]] std::expected<std::chrono::system_clock::time_point, error> modification_time() const {
        return header_.modification_time();
    }
    [[nodiscard]] std::expected<std::string_view, error> link_name() const { return header_.link_name(); }

    [[nodiscard]] bool is_regular_file() const noexcept {
        return type() == entry_type::regular_file || type() == entry_type::regular_file_old ||
               type() == entry_type::contiguous_file;
    }
    [[nodiscard]] bool is_directory() const noexcept { return type() == entry_type::directory; }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return type() == entry_type::symbolic_link; }
    [[nodiscard]] bool is_hard_link() const noexcept { return type() == entry_type::hard_link; }

    // Read up to buffer.size() bytes from the current position. Reports
    // end_of_data once the whole entry has been consumed.
    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer);

    // Move the logical position; the source is not touched until the next read
    [[nodiscard]] std::expected<uint64_t, error> seek(int64_t offset, seek_origin origin);

    // Everything from the current position to the end of the entry
    [[nodiscard]] std::expected<std::vector<std::byte>, error> read_all();

    // Copy data from the current position to the end of the entry
    template<std::output_iterator<std::byte> OutputIt>
    [[nodiscard]] auto copy_data_to(OutputIt output) -> std::expected<size_t, error> {
        std::array<std::byte, copy_chunk_size> chunk;
        size_t copied = 0;
        while (position_ < size_) {
            auto result = read(chunk);
            if (!result) {
                return std::unexpected(result.error());
            }
            output = std::ranges::copy(std::span{chunk}.first(*result), output).out;
            copied += *result;
        }
        return copied;
    }

    // Write the entry to the filesystem: regular files, directories and
    // symbolic links are supported. Regular files are copied from offset 0
    // whatever the current position, and position() equals size() afterwards.
    // If the copy fails the partly written file is removed.
    [[nodiscard]] std::expected<void, error> extract_to_path(const std::filesystem::path& dest_path);
};

} // namespace tarseek
