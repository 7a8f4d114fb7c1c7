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
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace tarseek {

namespace detail {

constexpr size_t block_size = 512;

// Consecutive all-zero blocks that mark the end of an archive
constexpr size_t end_of_archive_zero_blocks = 2;

// Byte range of a header field within a 512-byte block
struct field_range {
    size_t offset;
    size_t length;
};

constexpr field_range name_field{0, 100};
constexpr field_range mode_field{100, 8};
constexpr field_range owner_field{108, 8};
constexpr field_range group_field{116, 8};
constexpr field_range size_field{124, 12};
constexpr field_range mtime_field{136, 12};
constexpr field_range checksum_field{148, 8};
constexpr field_range link_flag_field{156, 1};
constexpr field_range link_name_field{157, 100};

// Value the checksum field contributes: eight ASCII spaces
constexpr uint64_t checksum_placeholder = 8 * ' ';

[[nodiscard]] constexpr uint64_t round_up_to_block(uint64_t size) noexcept {
    return (size + (block_size - 1)) & ~static_cast<uint64_t>(block_size - 1);
}

[[nodiscard]] constexpr std::span<const std::byte> field_bytes(
    std::span<const std::byte, block_size> block, field_range field) noexcept {
    return block.subspan(field.offset, field.length);
}

// Bytes of a text field up to (not including) the first NUL
[[nodiscard]] std::span<const std::byte> extract_field(std::span<const std::byte> field) noexcept;

[[nodiscard]] bool is_valid_utf8(std::span<const std::byte> bytes) noexcept;

// Decode NUL-truncated bytes as UTF-8 text
[[nodiscard]] std::expected<std::string_view, error> decode_text(std::span<const std::byte> bytes);

// Parse a numeric header field: truncate at NUL, decode as text, trim
// surrounding whitespace, then read the remainder as base 8.
[[nodiscard]] std::expected<uint64_t, error> parse_octal(std::span<const std::byte> field);

// Sum of bytes [0,148) and [156,512) plus eight spaces for the checksum field
[[nodiscard]] uint64_t compute_checksum(std::span<const std::byte, block_size> block) noexcept;

// Check if block is all zeros (end-of-archive marker)
[[nodiscard]] bool is_zero_block(std::span<const std::byte, block_size> block) noexcept;

} // namespace detail

enum class entry_type : char {
    regular_file = '0',
    regular_file_old = '\0',  // Old tar format
    hard_link = '1',
    symbolic_link = '2',
    character_device = '3',
    block_device = '4',
    directory = '5',
    fifo = '6',
    contiguous_file = '7'
};

// One 512-byte header block. Fields are decoded on access from the copy of
// the block taken at construction; the record never changes afterwards.
class header_record {
public:
    using block_type = std::array<std::byte, detail::block_size>;

    // Copy the block and verify its checksum
    [[nodiscard]] static std::expected<header_record, error> decode(std::span<const std::byte, detail::block_size> block);

    [[nodiscard]] std::span<const std::byte> name_bytes() const noexcept;
    [[nodiscard]] std::expected<std::string_view, error> name() const;

    [[nodiscard]] std::expected<uint64_t, error> size() const;
    [[nodiscard]] std::expected<uint64_t, error> stored_checksum() const;
    [[nodiscard]] uint64_t computed_checksum() const noexcept;

    [[nodiscard]] std::expected<uint64_t, error> mode() const;
    [[nodiscard]] std::expected<uint64_t, error> owner_id() const;
    [[nodiscard]] std::expected<uint64_t, error> group_id() const;
    [[nodiscard]] std::expected<std::chrono::system_clock::time_point, error> modification_time() const;

    [[nodiscard]] entry_type type() const noexcept;
    [[nodiscard]] std::span<const std::byte> link_name_bytes() const noexcept;
    [[nodiscard]] std::expected<std::string_view, error> link_name() const;

    [[nodiscard]] const block_type& raw() const noexcept { return block_; }

private:
    explicit header_record(std::span<const std::byte, detail::block_size> block);

    [[nodiscard]] std::span<const std::byte> field(detail::field_range range) const noexcept {
        return detail::field_bytes(block_, range);
    }

    block_type block_{};
};

} // namespace tarseek
