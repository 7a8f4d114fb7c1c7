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
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace tarseek::detail {

// Sole owner of an archive's byte source. Iterators and entry views share one
// cursor and issue every physical read and seek through it; the mutex keeps a
// single request in flight. The last known absolute offset lets repeated
// requests for the current position skip the physical seek.
class archive_cursor {
public:
    explicit archive_cursor(std::unique_ptr<random_access_stream> stream)
        : stream_(std::move(stream)) {}

    archive_cursor(const archive_cursor&) = delete;
    archive_cursor& operator=(const archive_cursor&) = delete;

    // Reposition to an absolute offset; no-op when already there
    [[nodiscard]] std::expected<void, error> seek_to(uint64_t offset);

    // Single read from the current position
    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer);

    // Read until the buffer is full or the source reports its end
    [[nodiscard]] std::expected<size_t, error> read_full(std::span<std::byte> buffer);

    // seek_to followed by read, atomically with respect to other callers
    [[nodiscard]] std::expected<size_t, error> read_at(uint64_t offset, std::span<std::byte> buffer);

    // seek_to followed by read_full, atomically with respect to other callers
    [[nodiscard]] std::expected<size_t, error> read_full_at(uint64_t offset, std::span<std::byte> buffer);

    // Empty until the first successful seek
    [[nodiscard]] std::optional<uint64_t> offset() const;

    [[nodiscard]] size_t physical_seeks() const;

    // Total size of the source, if it knows one
    [[nodiscard]] std::optional<uint64_t> source_size() const;

private:
    [[nodiscard]] std::expected<void, error> seek_locked(uint64_t offset);
    [[nodiscard]] std::expected<size_t, error> read_locked(std::span<std::byte> buffer);
    [[nodiscard]] std::expected<size_t, error> read_full_locked(std::span<std::byte> buffer);

    mutable std::mutex mutex_;
    std::unique_ptr<random_access_stream> stream_;
    std::optional<uint64_t> offset_;
    size_t physical_seeks_ = 0;
};

} // namespace tarseek::detail
