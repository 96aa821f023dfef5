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

#include "cartograph/change_detector.hpp"
#include "cartograph/hash.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace cartograph {

namespace {

const char *const SKIP_DIRECTORIES[] = {
    ".git", ".svn", ".hg", "node_modules", "__pycache__", ".pytest_cache", ".mypy_cache", ".ruff_cache",
    "venv", ".venv", "env", ".env", "target", "build", "dist", ".idea", ".vscode",
};

} // namespace

const char *to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Unchanged:
        return "unchanged";
    case ChangeKind::Changed:
        return "changed";
    case ChangeKind::New:
        return "new";
    case ChangeKind::Deleted:
        return "deleted";
    }
    return "new";
}

std::vector<FileChange *> ChangeSet::to_parse() {
    std::vector<FileChange *> out;
    for (auto &c : changed) out.push_back(&c);
    for (auto &c : added) out.push_back(&c);
    std::sort(out.begin(), out.end(),
              [](const FileChange *a, const FileChange *b) { return a->relative_path < b->relative_path; });
    return out;
}

std::string read_file_content(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer.str();
}

bool ChangeDetector::should_ignore(const fs::path &relative) const {
    for (const auto &component : relative) {
        std::string comp = component.string();
        for (const char *skip : SKIP_DIRECTORIES) {
            if (comp == skip) return true;
        }
        for (const auto &pattern : config_.ignore_patterns) {
            if (comp == pattern) return true;
        }
    }
    return false;
}

std::vector<DiscoveredFile> ChangeDetector::discover_files(const fs::path &root) const {
    std::vector<DiscoveredFile> files;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        log_error("Repository root is not a directory", {StringField("path", root.string())});
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        fs::directory_iterator it(current_dir, ec);
        if (ec) {
            log_warn("Cannot list directory", {StringField("path", current_dir.string()),
                                               StringField("error", ec.message())});
            continue;
        }
        for (const auto &entry : it) {
            const fs::path &path = entry.path();
            fs::path relative = path.lexically_relative(root);
            if (should_ignore(relative)) continue;

            std::error_code entry_ec;
            if (entry.is_directory(entry_ec)) {
                dirs_to_visit.push_back(path);
                continue;
            }
            if (!entry.is_regular_file(entry_ec)) continue;

            Language lang = language_from_extension(path.extension().string());
            if (lang == Language::Unknown) continue;

            uint64_t size = entry.file_size(entry_ec);
            if (entry_ec) continue;
            if (size > config_.max_file_size_bytes) {
                log_info("Skipping large file", {StringField("path", relative.generic_string()),
                                                 IntField("size_bytes", static_cast<int64_t>(size))});
                continue;
            }

            DiscoveredFile file;
            file.relative_path = relative.generic_string();
            file.absolute_path = path;
            file.language = lang;
            file.size_bytes = size;
            files.push_back(std::move(file));
        }
    }

    std::sort(files.begin(), files.end(),
              [](const DiscoveredFile &a, const DiscoveredFile &b) { return a.relative_path < b.relative_path; });
    return files;
}

ChangeSet ChangeDetector::detect(const fs::path &root, const std::vector<FileRecord> &stored) const {
    ChangeSet changes;

    std::unordered_map<std::string, const FileRecord *> previous;
    for (const auto &f : stored) previous[f.relative_path] = &f;

    for (auto &file : discover_files(root)) {
        FileChange change;
        change.relative_path = file.relative_path;

        try {
            change.content = read_file_content(file.absolute_path);
            change.content_hash = sha256_hex(change.content);
        } catch (const std::runtime_error &e) {
            change.read_error = e.what();
        }

        auto it = previous.find(file.relative_path);
        if (it != previous.end()) {
            const FileRecord &row = *it->second;
            change.stored = row;
            previous.erase(it);
            if (row.status == FileStatus::Deleted) {
                change.kind = ChangeKind::New;
            } else if (change.read_error.empty() && row.content_hash == change.content_hash) {
                change.kind = ChangeKind::Unchanged;
            } else {
                change.kind = ChangeKind::Changed;
            }
        } else {
            change.kind = ChangeKind::New;
        }
        change.discovered = std::move(file);

        switch (change.kind) {
        case ChangeKind::Unchanged:
            changes.unchanged.push_back(std::move(change));
            break;
        case ChangeKind::Changed:
            changes.changed.push_back(std::move(change));
            break;
        default:
            changes.added.push_back(std::move(change));
            break;
        }
    }

    // Stored rows with no file on disk
    for (const auto &f : stored) {
        if (f.status == FileStatus::Deleted || !previous.count(f.relative_path)) continue;
        FileChange change;
        change.kind = ChangeKind::Deleted;
        change.relative_path = f.relative_path;
        change.stored = f;
        changes.deleted.push_back(std::move(change));
    }
    return changes;
}

} // namespace cartograph
