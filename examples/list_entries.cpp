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
 * list_entries - Lists the entries of a tar archive with their metadata and a content preview.
 *
 * Usage: ./list_entries <tar_file>
 *
 * Features demonstrated:
 * - Opening tar archives
 * - Iterating through entries and reporting iteration failures
 * - Displaying entry metadata (type, size, modification time, name)
 * - Reading entry data through a bounded view
 */

#include <tarseek/tarseek.hpp>
#include <array>
#include <cctype>
#include <chrono>
#include <format>
#include <print>
#include <span>
#include <string>

namespace {

char type_char(const tarseek::entry_view& entry) {
    if (entry.is_directory()) return 'd';
    if (entry.is_symbolic_link()) return 'l';
    if (entry.is_hard_link()) return 'h';
    if (entry.is_regular_file()) return 'f';
    return '?';
}

std::string format_name(const tarseek::entry_view& entry) {
    if (auto name = entry.filename()) {
        return std::string{*name};
    }
    // Show undecodable names byte by byte
    std::string escaped;
    for (auto b : entry.filename_bytes()) {
        const auto c = static_cast<unsigned char>(b);
        escaped += std::isprint(c) ? std::string(1, static_cast<char>(c)) : std::format("\\x{:02x}", c);
    }
    return escaped;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println(stderr, "Usage: {} <tar_file>", argv[0]);
        return 1;
    }

    auto archive = tarseek::open_archive(argv[1]);
    if (!archive) {
        std::println(stderr, "Failed to open archive: {}", archive.error().message());
        return 1;
    }

    auto entries = archive->entries();
    if (!entries) {
        std::println(stderr, "Failed to read archive: {}", entries.error().message());
        return 1;
    }

    std::println("Archive contents:");
    std::println("================");

    while (true) {
        auto next = entries->next();
        if (!next) {
            std::println(stderr, "Archive error at offset {}: {}", entries->offset(), next.error().message());
            return 1;
        }
        if (!*next) {
            break;
        }
        auto& entry = **next;

        std::string when = "????-??-?? ??:??";
        if (auto mtime = entry.modification_time()) {
            when = std::format("{:%Y-%m-%d %H:%M}", std::chrono::floor<std::chrono::minutes>(*mtime));
        }

        std::println("{} {:>10} {} {}", type_char(entry), entry.size(), when, format_name(entry));

        if (auto target = entry.link_name(); target && !target->empty()) {
            std::println("  -> {}", *target);
        }

        // For regular files, show the first line
        if (entry.is_regular_file() && entry.size() > 0) {
            std::array<std::byte, 50> preview;
            auto count = entry.read(preview);
            if (!count) {
                std::println(stderr, "  Read failed: {}", count.error().message());
                continue;
            }

            std::print("  Preview: ");
            for (auto byte : std::span{preview}.first(*count)) {
                auto c = static_cast<char>(byte);
                if (c == '\n') {
                    break;  // Stop at first newline
                }
                std::print("{}", std::isprint(static_cast<unsigned char>(c)) ? c : '.');
            }
            std::println("");
        }
    }

    return 0;
}
