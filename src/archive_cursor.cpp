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

#include <tarseek/archive_cursor.hpp>

namespace tarseek::detail {

auto archive_cursor::seek_locked(uint64_t offset) -> std::expected<void, error> {
    if (offset_ == offset) {
        return {};
    }

    if (auto result = stream_->seek(offset); !result) {
        return std::unexpected(result.error());
    }

    ++physical_seeks_;
    offset_ = offset;
    return {};
}

auto archive_cursor::read_locked(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    auto result = stream_->read(buffer);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (offset_) {
        *offset_ += *result;
    }
    return *result;
}

auto archive_cursor::read_full_locked(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t total = 0;
    while (total < buffer.size()) {
        auto result = read_locked(buffer.subspan(total));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;  // End of source
        }
        total += *result;
    }
    return total;
}

auto archive_cursor::seek_to(uint64_t offset) -> std::expected<void, error> {
    std::lock_guard lock{mutex_};
    return seek_locked(offset);
}

auto archive_cursor::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    std::lock_guard lock{mutex_};
    return read_locked(buffer);
}

auto archive_cursor::read_full(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    std::lock_guard lock{mutex_};
    return read_full_locked(buffer);
}

auto archive_cursor::read_at(uint64_t offset, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    std::lock_guard lock{mutex_};
    if (auto seek_result = seek_locked(offset); !seek_result) {
        return std::unexpected(seek_result.error());
    }
    return read_locked(buffer);
}

auto archive_cursor::read_full_at(uint64_t offset, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    std::lock_guard lock{mutex_};
    if (auto seek_result = seek_locked(offset); !seek_result) {
        return std::unexpected(seek_result.error());
    }
    return read_full_locked(buffer);
}

std::optional<uint64_t> archive_cursor::offset() const {
    std::lock_guard lock{mutex_};
    return offset_;
}

size_t archive_cursor::physical_seeks() const {
    std::lock_guard lock{mutex_};
    return physical_seeks_;
}

std::optional<uint64_t> archive_cursor::source_size() const {
    std::lock_guard lock{mutex_};
    return stream_->size();
}

} // namespace tarseek::detail
