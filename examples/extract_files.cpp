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

/**
 * extract_files - Extracts all entries from a tar archive to a specified directory.
 *
 * Usage: ./extract_files <tar_file> <output_dir>
 *
 * Features demonstrated:
 * - Directory creation
 * - Entry extraction with error handling
 * - Refusing names that would escape the output directory
 * - Progress tracking with byte count statistics
 */

#include <tarseek/tarseek.hpp>
#include <algorithm>
#include <filesystem>
#include <print>

namespace {

// Relative paths without ".." components stay inside the output directory
bool is_safe_entry_path(const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute() || path.has_root_name()) {
        return false;
    }
    return std::none_of(path.begin(), path.end(), [](const auto& part) { return part == ".."; });
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::println(stderr, "Usage: {} <tar_file> <output_dir>", argv[0]);
        return 1;
    }

    const std::filesystem::path tar_file = argv[1];
    const std::filesystem::path output_dir = argv[2];

    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::println(stderr, "Failed to create output directory: {}", ec.message());
        return 1;
    }

    auto archive = tarseek::open_archive(tar_file);
    if (!archive) {
        std::println(stderr, "Failed to open archive: {}", archive.error().message());
        return 1;
    }

    auto entries = archive->entries();
    if (!entries) {
        std::println(stderr, "Failed to read archive: {}", entries.error().message());
        return 1;
    }

    std::println("Extracting archive to: {}", output_dir.string());

    size_t extracted_count = 0;
    size_t failed_count = 0;
    uint64_t total_bytes = 0;

    for (auto& entry : *entries) {
        auto name = entry.filename();
        if (!name) {
            std::println(stderr, "Skipping entry: {}", name.error().message());
            ++failed_count;
            continue;
        }

        const std::filesystem::path relative{*name};
        if (!is_safe_entry_path(relative)) {
            std::println(stderr, "Skipping unsafe path: {}", *name);
            ++failed_count;
            continue;
        }

        std::print("Extracting: {}", *name);

        if (auto result = entry.extract_to_path(output_dir / relative)) {
            std::println(" ✓");
            ++extracted_count;
            total_bytes += entry.size();
        } else {
            std::println(" ✗ ({})", result.error().message());
            ++failed_count;
        }
    }

    if (const auto& failure = entries->failure()) {
        std::println(stderr, "Archive error: {}", failure->message());
        return 1;
    }

    std::println("\nExtraction complete:");
    std::println("  Entries extracted: {}", extracted_count);
    std::println("  Entries skipped: {}", failed_count);
    std::println("  Total bytes: {}", total_bytes);

    return failed_count == 0 ? 0 : 2;
}
