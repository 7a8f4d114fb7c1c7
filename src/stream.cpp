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

#include <tarseek/stream.hpp>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string>

#ifdef __linux__
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace tarseek {

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<uint64_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    // Try to get file size
    std::optional<uint64_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<uint64_t>(pos);
        }
    }
    if (std::fseek(file, 0, SEEK_SET) != 0) {
        const int saved = errno;
        std::fclose(file);
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(saved)}});
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_stream::seek(uint64_t position) -> std::expected<void, error> {
    if (position > static_cast<uint64_t>(std::numeric_limits<long>::max())) {
        return std::unexpected(error{error_code::io_error, "File seek offset too large"});
    }
    if (std::fseek(file_.get(), static_cast<long>(position), SEEK_SET) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

auto file_stream::size() const -> std::optional<uint64_t> {
    return file_size_;
}

#ifdef __linux__
// mmap_stream implementation
mmap_stream::mmap_stream(void* ptr, const size_t size)
    : mapping_{ptr, mapping_deleter{size}}
    , data_{static_cast<const std::byte*>(ptr), size} {}

auto mmap_stream::create(const std::filesystem::path &path) -> std::expected<mmap_stream, error> {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        const int saved = errno;
        ::close(fd);
        return std::unexpected(error{error_code::io_error,
            "Failed to stat file: " + std::string{std::strerror(saved)}});
    }

    const size_t file_size = static_cast<size_t>(st.st_size);

    void* ptr;
    if (file_size == 0) {
        // Empty files get an empty mapping
        ptr = nullptr;
    } else {
        ptr = ::mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (ptr == MAP_FAILED) {
            const int saved = errno;
            ::close(fd);
            return std::unexpected(error{error_code::io_error,
                "Memory mapping failed: " + std::string{std::strerror(saved)}});
        }

        ::madvise(ptr, file_size, MADV_SEQUENTIAL);
    }

    ::close(fd);  // Can close fd after mmap

    return mmap_stream{ptr, file_size};
}

auto mmap_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
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

auto mmap_stream::seek(uint64_t position) -> std::expected<void, error> {
    position_ = position;
    return {};
}

auto mmap_stream::size() const -> std::optional<uint64_t> {
    return data_.size();
}
#endif

} // namespace tarseek
