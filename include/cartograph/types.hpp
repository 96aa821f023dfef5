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

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {

using json = nlohmann::json;

// ============================================================================
// String Pool - Intern strings to avoid duplication
// ============================================================================
class StringPool {
public:
    // Intern a string and return its index
    size_t intern(const std::string &str) {
        auto it = index_.find(str);
        if (it != index_.end()) {
            return it->second;
        }
        size_t idx = strings_.size();
        strings_.push_back(str);
        index_[strings_.back()] = idx;
        return idx;
    }

    const std::string &get(size_t idx) const {
        static const std::string empty;
        return (idx < strings_.size()) ? strings_[idx] : empty;
    }

    // Get index for string (returns SIZE_MAX if not found)
    size_t find(std::string_view str) const {
        auto it = index_.find(str);
        return (it != index_.end()) ? it->second : SIZE_MAX;
    }

    size_t size() const { return strings_.size(); }

    void clear() {
        strings_.clear();
        index_.clear();
    }

private:
    // deque keeps references stable so the string_view keys stay valid
    std::deque<std::string> strings_;
    std::unordered_map<std::string_view, size_t> index_;
};

// Symbol UID type - 64-bit signed so it round-trips through SQLite INTEGER
using SymbolUID = int64_t;

constexpr SymbolUID INVALID_UID = 0;

// Row ids for everything that is not a symbol
using RowId = int64_t;

// ============================================================================
// Enumerations
// ============================================================================

enum class Language { Unknown, Python, Java, Kotlin, JavaScript, Rust };

enum class SymbolKind {
    Module,
    Class,
    Function,
    Method,
    Import,
    Interface,
    Enum,
    Struct,
    Trait,
    Impl
};

enum class ReferenceType { Call, Usage, Import, Inheritance, Member };

enum class RepositoryStatus { Pending, Parsing, Completed, Failed };

enum class FileStatus { Parsed, Failed, Deleted };

enum class JobType { Parse, DetectEntryPoints, GenerateFlow };

enum class JobStatus { Pending, InProgress, Completed, Failed };

enum class EntryPointType { Http, Event, Scheduler };

const char *language_to_string(Language lang);
Language language_from_string(std::string_view name);

// Get language from file extension (including the dot)
Language language_from_extension(const std::string &ext);

const char *to_string(SymbolKind kind);
const char *to_string(ReferenceType type);
const char *to_string(RepositoryStatus status);
const char *to_string(FileStatus status);
const char *to_string(JobType type);
const char *to_string(JobStatus status);
const char *to_string(EntryPointType type);

// Parsers throw InvalidArgument on unknown names
SymbolKind symbol_kind_from_string(std::string_view name);
ReferenceType reference_type_from_string(std::string_view name);
RepositoryStatus repository_status_from_string(std::string_view name);
FileStatus file_status_from_string(std::string_view name);
JobType job_type_from_string(std::string_view name);
JobStatus job_status_from_string(std::string_view name);
EntryPointType entry_point_type_from_string(std::string_view name);

// True for kinds that open a type scope (members are qualified under them)
bool is_type_kind(SymbolKind kind);

// ============================================================================
// Persisted records
// ============================================================================

struct RepositoryRecord {
    RowId id = 0;
    std::string name;
    std::string root_path;
    RepositoryStatus status = RepositoryStatus::Pending;
    int64_t total_files = 0;
    int64_t parsed_files = 0;
    int64_t failed_files = 0;
    std::vector<std::string> languages;
    std::string error_message;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

struct FileRecord {
    RowId id = 0;
    RowId repo_id = 0;
    std::string relative_path;
    Language language = Language::Unknown;
    std::string content_hash;
    std::string content;
    std::string module_path;
    std::string package;
    FileStatus status = FileStatus::Parsed;
    std::string error;
    int64_t size_bytes = 0;
    int64_t updated_at = 0;
};

struct SymbolRecord {
    SymbolUID id = INVALID_UID;
    RowId repo_id = 0;
    RowId file_id = 0;
    std::string file_path;
    Language language = Language::Unknown;
    std::string name;
    std::string qualified_name;
    SymbolKind kind = SymbolKind::Function;
    std::string signature;
    std::string source_text;
    std::string parent_qualified_name;
    SymbolUID parent_id = INVALID_UID;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    uint32_t start_column = 0;
    uint32_t end_column = 0;
    json metadata = json::object();
};

struct ReferenceRecord {
    RowId id = 0;
    RowId repo_id = 0;
    RowId file_id = 0;
    SymbolUID source_symbol_id = INVALID_UID;
    std::optional<SymbolUID> target_symbol_id;
    std::string target_name;
    std::string target_path;
    ReferenceType type = ReferenceType::Call;
    bool is_external = true;
    bool is_ambiguous = false;
    uint32_t line = 0;
    std::string argument_hint;
};

struct JobRecord {
    RowId id = 0;
    RowId repo_id = 0;
    JobType type = JobType::Parse;
    JobStatus status = JobStatus::Pending;
    int attempts = 0;
    int max_attempts = 3;
    std::string lock_owner;
    int64_t locked_at = 0;
    int64_t available_at = 0;
    json payload = json::object();
    std::string error;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

struct EntryPointCandidateRecord {
    RowId id = 0;
    RowId repo_id = 0;
    int64_t run_id = 0;
    SymbolUID symbol_id = INVALID_UID;
    std::string file_path;
    std::string symbol_name;
    std::string qualified_name;
    EntryPointType type = EntryPointType::Http;
    std::string framework;
    std::string detection_pattern;
    json metadata = json::object();
    double confidence = 0.8;
};

struct EntryPointRecord {
    RowId id = 0;
    RowId repo_id = 0;
    RowId candidate_id = 0;
    SymbolUID symbol_id = INVALID_UID;
    std::string file_path;
    std::string qualified_name;
    EntryPointType type = EntryPointType::Http;
    std::string framework;
    std::string name;
    std::string description;
    json metadata = json::object();
    double confidence = 0.0;
    std::string reasoning;
};

struct CodeSnippet {
    std::string code;
    std::string symbol_name;
    std::string qualified_name;
    std::string file_path;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
};

struct FlowStep {
    int step_number = 0;
    std::string title;
    std::string description;
    std::string file_path;
    std::vector<std::string> log_lines;
    std::vector<CodeSnippet> snippets;
};

struct FlowRecord {
    RowId entry_point_id = 0;
    RowId repo_id = 0;
    std::string flow_name;
    std::string technical_summary;
    std::vector<FlowStep> steps;
    int max_depth_analyzed = 0;
    int iterations_completed = 0;
    std::vector<SymbolUID> symbol_ids;
    std::vector<std::string> file_paths;
    int64_t created_at = 0;
};

// JSON conversions used by storage and the CLI
void to_json(json &j, const RepositoryRecord &r);
void to_json(json &j, const FileRecord &f);
void to_json(json &j, const SymbolRecord &s);
void to_json(json &j, const JobRecord &job);
void to_json(json &j, const EntryPointCandidateRecord &c);
void to_json(json &j, const EntryPointRecord &e);
void to_json(json &j, const CodeSnippet &s);
void from_json(const json &j, CodeSnippet &s);
void to_json(json &j, const FlowStep &s);
void from_json(const json &j, FlowStep &s);
void to_json(json &j, const FlowRecord &f);

} // namespace cartograph
