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

#include <tarseek/archive.hpp>
#include <array>

namespace tarseek {

auto entry_iterator::fail(error err) -> std::unexpected<error> {
    done_ = true;
    failure_ = err;
    return std::unexpected(std::move(err));
}

auto entry_iterator::next() -> std::expected<std::optional<entry_view>, error> {
    // If we hit a previous error, or we reached the end, we're done here
    if (done_) {
        return std::nullopt;
    }

    // Read blocks until one is not all zeros. A run of zero blocks long
    // enough to be the end-of-archive marker finishes the walk.
    std::array<std::byte, detail::block_size> block{};
    size_t zero_blocks = 0;
    while (true) {
        auto read_result = cursor_->read_full_at(offset_, block);
        if (!read_result) {
            return fail(read_result.error());
        }
        if (*read_result != detail::block_size) {
            return fail(error{error_code::corrupt_archive, "Truncated archive: incomplete header block"});
        }
        offset_ += detail::block_size;

        if (!detail::is_zero_block(block)) {
            break;
        }
        if (++zero_blocks >= detail::end_of_archive_zero_blocks) {
            done_ = true;
            return std::nullopt;  // Normal end of archive
        }
    }

    auto header = header_record::decode(block);
    if (!header) {
        return fail(header.error());
    }

    auto size = header->size();
    if (!size) {
        return fail(size.error());
    }

    const uint64_t data_offset = offset_;
    offset_ += detail::round_up_to_block(*size);

    return entry_view{std::move(*header), cursor_, data_offset, *size};
}

auto archive::from_stream(std::unique_ptr<random_access_stream> stream) -> std::expected<archive, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    return archive{std::move(stream)};
}

auto archive::from_file(const std::filesystem::path &path) -> std::expected<archive, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    return archive{std::make_unique<file_stream>(std::move(*stream))};
}

#ifdef __linux__
auto archive::from_mapped_file(const std::filesystem::path &path) -> std::expected<archive, error> {
    auto stream = mmap_stream::create(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    return archive{std::make_unique<mmap_stream>(std::move(*stream))};
}
#endif

auto archive::from_memory(std::span<const std::byte> data) -> std::expected<archive, error> {
    return archive{std::make_unique<memory_stream>(data)};
}

auto archive::entries() -> std::expected<entry_iterator, error> {
    if (auto result = cursor_->seek_to(0); !result) {
        return std::unexpected(result.error());
    }

    return entry_iterator{cursor_.get()};
}

} // namespace tarseek
