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
#include <expected>
#include <span>
#include <memory>
#include <optional>
#include <filesystem>
#include <algorithm>
#include <ranges>
#include <cstdint>
#include <cstdio>

#ifdef __linux__
#include <sys/mman.h>
#endif

namespace tarseek {

// Byte source an archive is read from. Only reading and absolute
// repositioning are required.
class random_access_stream {
public:
    virtual ~random_access_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read.
    // Zero means the end of the source was reached.
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Seek to absolute position
    [[nodiscard]] virtual std::expected<void, error> seek(uint64_t position) = 0;

    // Get total size (if known)
    [[nodiscard]] virtual std::optional<uint64_t> size() const = 0;
};

// Non-owning view over bytes held by the caller
class memory_stream : public random_access_stream {
private:
    std::span<const std::byte> data_;
    uint64_t position_ = 0;

public:
    explicit memory_stream(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        // Positions past the end read as end of source, like a regular file
        if (position_ >= data_.size()) {
            return 0;
        }
        const size_t available = data_.size() - static_cast<size_t>(position_);
        const size_t to_read = std::min(buffer.size(), available);

        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                           static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;

        return to_read;
    }

    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override {
        position_ = position;
        return {};
    }

    [[nodiscard]] std::optional<uint64_t> size() const override {
        return data_.size();
    }
};

// File-based stream
class file_stream : public random_access_stream {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    std::optional<uint64_t> file_size_;

public:
    [[nodiscard]] static std::expected<file_stream, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override;
    [[nodiscard]] std::optional<uint64_t> size() const override;

private:
    explicit file_stream(std::FILE* file, std::optional<uint64_t> size);
};

// Memory-mapped file stream (Linux-specific)
#ifdef __linux__
class mmap_stream : public random_access_stream {
private:
    struct mapping_deleter {
        size_t size;
        void operator()(void* ptr) const {
            if (ptr && ptr != MAP_FAILED) ::munmap(ptr, size);
        }
    };

    std::unique_ptr<void, mapping_deleter> mapping_;
    std::span<const std::byte> data_;
    uint64_t position_ = 0;

public:
    [[nodiscard]] static std::expected<mmap_stream, error> create(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override;
    [[nodiscard]] std::optional<uint64_t> size() const override;

private:
    mmap_stream(void* ptr, size_t size);
};
#endif

} // namespace tarseek
