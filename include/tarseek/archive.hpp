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
#include <tarseek/stream.hpp>
#include <tarseek/header.hpp>
#include <tarseek/archive_cursor.hpp>
#include <tarseek/entry_view.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <span>

namespace tarseek {

// Walks the headers of an archive in physical order. The first I/O or
// validation failure is returned once and ends the walk for good; two
// consecutive zero blocks end it without an error.
class entry_iterator {
private:
    detail::archive_cursor* cursor_;
    uint64_t offset_ = 0;  // Where the next header is expected
    bool done_ = false;
    std::optional<error> failure_;

    friend class archive;

    explicit entry_iterator(detail::archive_cursor* cursor) : cursor_(cursor) {}

    [[nodiscard]] std::unexpected<error> fail(error err);

public:
    // Get next entry in archive; nullopt once the archive is exhausted
    [[nodiscard]] std::expected<std::optional<entry_view>, error> next();

    [[nodiscard]] bool done() const noexcept { return done_; }
    [[nodiscard]] uint64_t offset() const noexcept { return offset_; }

    // The failure that ended the walk, if any
    [[nodiscard]] const std::optional<error>& failure() const noexcept { return failure_; }

    // Iterator support
    class iterator {
    private:
        entry_iterator* source_ = nullptr;
        std::optional<entry_view> current_;
        bool error_occurred_ = false;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = entry_view;
        using difference_type = std::ptrdiff_t;
        using pointer = entry_view*;
        using reference = entry_view&;

        iterator() = default;
        explicit iterator(entry_iterator* source) : source_(source) {
            ++(*this);  // Load the first entry
        }

        // Views are handed out mutable so they can be read in place
        [[nodiscard]] entry_view& operator*() { return *current_; }
        [[nodiscard]] entry_view* operator->() { return &*current_; }

        iterator& operator++() {
            if (source_ && !error_occurred_) {
                if (auto result = source_->next(); result && *result) {
                    current_ = std::move(**result);
                } else {
                    if (!result) {
                        error_occurred_ = true;
                    }
                    source_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        void operator++(int) { ++(*this); }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return source_ == other.source_;
        }

        [[nodiscard]] bool has_error() const noexcept { return error_occurred_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }
};

// Read-only tar archive over a seekable byte source. The archive owns the
// source; iterators and entry views borrow it and must not outlive it.
// Moving an archive keeps them valid.
class archive {
private:
    std::unique_ptr<detail::archive_cursor> cursor_;

    explicit archive(std::unique_ptr<random_access_stream> stream)
        : cursor_(std::make_unique<detail::archive_cursor>(std::move(stream))) {}

public:
    // Factory methods
    [[nodiscard]] static std::expected<archive, error> from_stream(std::unique_ptr<random_access_stream> stream);
    [[nodiscard]] static std::expected<archive, error> from_file(const std::filesystem::path& path);
#ifdef __linux__
    [[nodiscard]] static std::expected<archive, error> from_mapped_file(const std::filesystem::path& path);
#endif
    // The bytes must outlive the archive
    [[nodiscard]] static std::expected<archive, error> from_memory(std::span<const std::byte> data);

    // Start a walk from the first block; fails if the source cannot seek there
    [[nodiscard]] std::expected<entry_iterator, error> entries();

    [[nodiscard]] const detail::archive_cursor& cursor() const noexcept { return *cursor_; }
};

} // namespace tarseek
