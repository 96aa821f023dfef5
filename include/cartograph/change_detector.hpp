// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "config.hpp"
#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cartograph {

namespace fs = std::filesystem;

// Source file found on disk
struct DiscoveredFile {
    std::string relative_path; // '/' separated, relative to the repository root
    fs::path absolute_path;
    Language language = Language::Unknown;
    uint64_t size_bytes = 0;
};

enum class ChangeKind { Unchanged, Changed, New, Deleted };

const char *to_string(ChangeKind kind);

struct FileChange {
    ChangeKind kind = ChangeKind::New;
    std::string relative_path;
    std::optional<FileRecord> stored; // row from the previous run
    DiscoveredFile discovered;        // empty for deleted files
    std::string content;
    std::string content_hash;
    std::string read_error; // set when the file could not be read
};

struct ChangeSet {
    std::vector<FileChange> unchanged;
    std::vector<FileChange> changed;
    std::vector<FileChange> added;
    std::vector<FileChange> deleted;

    // Changed and new files, sorted by path
    std::vector<FileChange *> to_parse();
};

// ============================================================================
// ChangeDetector - compares the files on disk with the stored file rows.
// The SHA-256 content hash is the only input to the skip decision.
// ============================================================================
class ChangeDetector {
public:

    explicit ChangeDetector(const Config &config) : config_(config) {}

    // Iterative walk, sorted output
    std::vector<DiscoveredFile> discover_files(const fs::path &root) const;

    ChangeSet detect(const fs::path &root, const std::vector<FileRecord> &stored) const;

    bool should_ignore(const fs::path &relative) const;

private:

    const Config &config_;
};

// Read a whole file; throws std::runtime_error when it cannot be opened
std::string read_file_content(const fs::path &path);

} // namespace cartograph
