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

#include <tarseek/header.hpp>
#include <algorithm>
#include <charconv>
#include <ctime>
#include <numeric>
#include <ranges>
#include <string>

namespace tarseek::detail {

namespace {

constexpr std::string_view whitespace = " \t\n\r\v\f";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

uint64_t byte_sum(std::span<const std::byte> bytes) {
    return std::accumulate(bytes.begin(), bytes.end(), uint64_t{0},
        [](uint64_t sum, std::byte b) { return sum + static_cast<uint8_t>(b); });
}

} // namespace

std::span<const std::byte> extract_field(std::span<const std::byte> field) noexcept {
    const auto null_pos = std::ranges::find(field, std::byte{0});
    return field.first(static_cast<size_t>(std::distance(field.begin(), null_pos)));
}

bool is_valid_utf8(std::span<const std::byte> bytes) noexcept {
    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<uint8_t>(bytes[i]);
        size_t continuation;
        uint32_t code_point;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (bytes.size() - i <= continuation) {
            return false;
        }
        for (size_t k = 1; k <= continuation; ++k) {
            const auto next = static_cast<uint8_t>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        constexpr uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[continuation] ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += continuation + 1;
    }
    return true;
}

auto decode_text(std::span<const std::byte> bytes) -> std::expected<std::string_view, error> {
    if (!is_valid_utf8(bytes)) {
        return std::unexpected(error{error_code::invalid_encoding, "Field is not valid UTF-8"});
    }
    return std::string_view{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto parse_octal(std::span<const std::byte> field) -> std::expected<uint64_t, error> {
    auto text = decode_text(extract_field(field));
    if (!text) {
        return std::unexpected(error{error_code::invalid_header, "Numeric field is not text"});
    }

    const std::string_view digits = trim(*text);
    if (digits.empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty numeric field"});
    }

    uint64_t result = 0;
    const auto* const end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, result, 8);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
    }
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(error{error_code::invalid_header,
            "Invalid octal field: '" + std::string{digits} + "'"});
    }

    return result;
}

uint64_t compute_checksum(std::span<const std::byte, block_size> block) noexcept {
    return byte_sum(block.first(checksum_field.offset)) +
           byte_sum(block.subspan(checksum_field.offset + checksum_field.length)) +
           checksum_placeholder;
}

bool is_zero_block(std::span<const std::byte, block_size> block) noexcept {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

} // namespace tarseek::detail

namespace tarseek {

header_record::header_record(std::span<const std::byte, detail::block_size> block) {
    std::ranges::copy(block, block_.begin());
}

auto header_record::decode(std::span<const std::byte, detail::block_size> block) -> std::expected<header_record, error> {
    header_record record{block};

    auto stored = record.stored_checksum();
    if (!stored) {
        return std::unexpected(stored.error());
    }

    if (const uint64_t computed = record.computed_checksum(); computed != *stored) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    return record;
}

std::span<const std::byte> header_record::name_bytes() const noexcept {
    return detail::extract_field(field(detail::name_field));
}

auto header_record::name() const -> std::expected<std::string_view, error> {
    return detail::decode_text(name_bytes());
}

auto header_record::size() const -> std::expected<uint64_t, error> {
    return detail::parse_octal(field(detail::size_field));
}

auto header_record::stored_checksum() const -> std::expected<uint64_t, error> {
    return detail::parse_octal(field(detail::checksum_field));
}

uint64_t header_record::computed_checksum() const noexcept {
    return detail::compute_checksum(block_);
}

auto header_record::mode() const -> std::expected<uint64_t, error> {
    return detail::parse_octal(field(detail::mode_field));
}

auto header_record::owner_id() const -> std::expected<uint64_t, error> {
    return detail::parse_octal(field(detail::owner_field));
}

auto header_record::group_id() const -> std::expected<uint64_t, error> {
    return detail::parse_octal(field(detail::group_field));
}

auto header_record::modification_time() const -> std::expected<std::chrono::system_clock::time_point, error> {
    auto seconds = detail::parse_octal(field(detail::mtime_field));
    if (!seconds) {
        return std::unexpected(seconds.error());
    }
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*seconds));
}

entry_type header_record::type() const noexcept {
    return static_cast<entry_type>(block_[detail::link_flag_field.offset]);
}

std::span<const std::byte> header_record::link_name_bytes() const noexcept {
    return detail::extract_field(field(detail::link_name_field));
}

auto header_record::link_name() const -> std::expected<std::string_view, error> {
    return detail::decode_text(link_name_bytes());
}

} // namespace tarseek
