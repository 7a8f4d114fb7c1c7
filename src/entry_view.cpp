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

#include <tarseek/entry_view.hpp>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

namespace tarseek {

auto entry_view::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    if (position_ == size_) {
        return std::unexpected(error{error_code::end_of_data, "End of entry data"});
    }

    const uint64_t remaining = size_ - position_;
    const size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    if (to_read == 0) {
        return 0;
    }

    auto result = cursor_->read_at(data_offset_ + position_, buffer.first(to_read));
    if (!result) {
        return std::unexpected(result.error());
    }

    // The source ended inside the declared data region
    if (*result == 0) {
        return std::unexpected(error{error_code::corrupt_archive, "Truncated entry data"});
    }

    position_ += *result;
    return *result;
}

auto entry_view::seek(int64_t offset, seek_origin origin) -> std::expected<uint64_t, error> {
    // Entry sizes come from a 12 digit octal field, so they always fit in int64_t
    int64_t base = 0;
    switch (origin) {
        case seek_origin::from_start:
            base = 0;
            break;
        case seek_origin::from_current:
            base = static_cast<int64_t>(position_);
            break;
        case seek_origin::from_end:
            base = static_cast<int64_t>(size_);
            break;
    }

    if ((offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) ||
        (offset < 0 && base < std::numeric_limits<int64_t>::min() - offset)) {
        return std::unexpected(error{error_code::out_of_range, "Seek offset overflow"});
    }

    const int64_t candidate = base + offset;
    if (candidate < 0) {
        return std::unexpected(error{error_code::out_of_range, "Seek before start of entry"});
    }
    if (static_cast<uint64_t>(candidate) > size_) {
        return std::unexpected(error{error_code::out_of_range, "Seek past end of entry"});
    }

    position_ = static_cast<uint64_t>(candidate);
    return position_;
}

auto entry_view::read_all() -> std::expected<std::vector<std::byte>, error> {
    // The declared size is untrusted; never reserve past what the source holds
    uint64_t expected = std::min<uint64_t>(size_ - position_, copy_chunk_size);
    if (auto available = cursor_->source_size()) {
        const uint64_t start = data_offset_ + position_;
        expected = std::min(size_ - position_, *available > start ? *available - start : 0);
    }

    std::vector<std::byte> data;
    data.reserve(static_cast<size_t>(expected));

    if (auto copied = copy_data_to(std::back_inserter(data)); !copied) {
        return std::unexpected(copied.error());
    }
    return data;
}

auto entry_view::extract_to_path(const std::filesystem::path &dest_path) -> std::expected<void, error> {
    // Create parent directories if they don't exist
    std::error_code ec;
    if (dest_path.has_parent_path()) {
        std::filesystem::create_directories(dest_path.parent_path(), ec);
        if (ec) {
            return std::unexpected(error{error_code::io_error,
                "Failed to create directories: " + ec.message()});
        }
    }

    auto mode = header_.mode();
    if (!mode) {
        return std::unexpected(mode.error());
    }

    switch (type()) {
        case entry_type::regular_file:
        case entry_type::regular_file_old:
        case entry_type::contiguous_file: {
            std::ofstream file{dest_path, std::ios::binary};
            if (!file) {
                return std::unexpected(error{error_code::io_error,
                    "Failed to create output file: " + dest_path.string()});
            }

            if (auto rewind = seek(0, seek_origin::from_start); !rewind) {
                return std::unexpected(rewind.error());
            }

            // A failed copy leaves no partial file behind
            auto discard = [&](error err) -> std::unexpected<error> {
                file.close();
                std::error_code remove_ec;
                std::filesystem::remove(dest_path, remove_ec);
                return std::unexpected(std::move(err));
            };

            std::array<std::byte, copy_chunk_size> chunk;
            while (position_ < size_) {
                auto result = read(chunk);
                if (!result) {
                    return discard(result.error());
                }
                file.write(reinterpret_cast<const char*>(chunk.data()),
                          static_cast<std::streamsize>(*result));
                if (!file) {
                    return discard(error{error_code::io_error, "Failed to write file data"});
                }
            }
            break;
        }

        case entry_type::directory: {
            std::filesystem::create_directories(dest_path, ec);
            if (ec) {
                return std::unexpected(error{error_code::io_error,
                    "Failed to create directory: " + ec.message()});
            }
            break;
        }

        case entry_type::symbolic_link: {
            auto target = link_name();
            if (!target) {
                return std::unexpected(target.error());
            }
            if (target->empty()) {
                return std::unexpected(error{error_code::invalid_operation,
                    "Symbolic link has no target"});
            }

            std::filesystem::create_symlink(std::filesystem::path{*target}, dest_path, ec);
            if (ec) {
                return std::unexpected(error{error_code::io_error,
                    "Failed to create symbolic link: " + ec.message()});
            }
            // Permissions of the link itself are not meaningful
            return {};
        }

        default:
            return std::unexpected(error{error_code::invalid_operation,
                "Extraction of this entry type is not supported"});
    }

    std::filesystem::permissions(dest_path,
        static_cast<std::filesystem::perms>(*mode & 07777), ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Failed to set permissions: " + ec.message()});
    }

    return {};
}

} // namespace tarseek
