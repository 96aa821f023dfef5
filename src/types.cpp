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

#include "cartograph/types.hpp"
#include "cartograph/errors.hpp"

namespace cartograph {

const char *language_to_string(Language lang) {
    switch (lang) {
    case Language::Python:
        return "python";
    case Language::Java:
        return "java";
    case Language::Kotlin:
        return "kotlin";
    case Language::JavaScript:
        return "javascript";
    case Language::Rust:
        return "rust";
    default:
        return "unknown";
    }
}

Language language_from_string(std::string_view name) {
    if (name == "python")
        return Language::Python;
    if (name == "java")
        return Language::Java;
    if (name == "kotlin")
        return Language::Kotlin;
    if (name == "javascript")
        return Language::JavaScript;
    if (name == "rust")
        return Language::Rust;
    return Language::Unknown;
}

Language language_from_extension(const std::string &ext) {
    if (ext == ".py")
        return Language::Python;
    if (ext == ".java")
        return Language::Java;
    if (ext == ".kt" || ext == ".kts")
        return Language::Kotlin;
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs")
        return Language::JavaScript;
    if (ext == ".rs")
        return Language::Rust;
    return Language::Unknown;
}

const char *to_string(SymbolKind kind) {
    switch (kind) {
    case SymbolKind::Module:
        return "module";
    case SymbolKind::Class:
        return "class";
    case SymbolKind::Function:
        return "function";
    case SymbolKind::Method:
        return "method";
    case SymbolKind::Import:
        return "import";
    case SymbolKind::Interface:
        return "interface";
    case SymbolKind::Enum:
        return "enum";
    case SymbolKind::Struct:
        return "struct";
    case SymbolKind::Trait:
        return "trait";
    case SymbolKind::Impl:
        return "impl";
    }
    return "function";
}

const char *to_string(ReferenceType type) {
    switch (type) {
    case ReferenceType::Call:
        return "CALL";
    case ReferenceType::Usage:
        return "USAGE";
    case ReferenceType::Import:
        return "IMPORT";
    case ReferenceType::Inheritance:
        return "INHERITANCE";
    case ReferenceType::Member:
        return "MEMBER";
    }
    return "CALL";
}

const char *to_string(RepositoryStatus status) {
    switch (status) {
    case RepositoryStatus::Pending:
        return "pending";
    case RepositoryStatus::Parsing:
        return "parsing";
    case RepositoryStatus::Completed:
        return "completed";
    case RepositoryStatus::Failed:
        return "failed";
    }
    return "pending";
}

const char *to_string(FileStatus status) {
    switch (status) {
    case FileStatus::Parsed:
        return "parsed";
    case FileStatus::Failed:
        return "failed";
    case FileStatus::Deleted:
        return "deleted";
    }
    return "parsed";
}

const char *to_string(JobType type) {
    switch (type) {
    case JobType::Parse:
        return "parse";
    case JobType::DetectEntryPoints:
        return "detect_entry_points";
    case JobType::GenerateFlow:
        return "generate_flow";
    }
    return "parse";
}

const char *to_string(JobStatus status) {
    switch (status) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::InProgress:
        return "in_progress";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    }
    return "pending";
}

const char *to_string(EntryPointType type) {
    switch (type) {
    case EntryPointType::Http:
        return "HTTP";
    case EntryPointType::Event:
        return "EVENT";
    case EntryPointType::Scheduler:
        return "SCHEDULER";
    }
    return "HTTP";
}

namespace {

// Shared lookup for the *_from_string helpers
template <typename Enum, size_t N>
Enum parse_enum(std::string_view name, const Enum (&values)[N], const char *what) {
    for (Enum value : values) {
        if (name == to_string(value))
            return value;
    }
    throw InvalidArgument(std::string("Unknown ") + what + ": '" + std::string(name) + "'");
}

} // namespace

SymbolKind symbol_kind_from_string(std::string_view name) {
    static const SymbolKind all[] = {SymbolKind::Module,    SymbolKind::Class,  SymbolKind::Function,
                                     SymbolKind::Method,    SymbolKind::Import, SymbolKind::Interface,
                                     SymbolKind::Enum,      SymbolKind::Struct, SymbolKind::Trait,
                                     SymbolKind::Impl};
    return parse_enum(name, all, "symbol kind");
}

ReferenceType reference_type_from_string(std::string_view name) {
    static const ReferenceType all[] = {ReferenceType::Call, ReferenceType::Usage,
                                        ReferenceType::Import, ReferenceType::Inheritance,
                                        ReferenceType::Member};
    return parse_enum(name, all, "reference type");
}

RepositoryStatus repository_status_from_string(std::string_view name) {
    static const RepositoryStatus all[] = {RepositoryStatus::Pending, RepositoryStatus::Parsing,
                                           RepositoryStatus::Completed, RepositoryStatus::Failed};
    return parse_enum(name, all, "repository status");
}

FileStatus file_status_from_string(std::string_view name) {
    static const FileStatus all[] = {FileStatus::Parsed, FileStatus::Failed, FileStatus::Deleted};
    return parse_enum(name, all, "file status");
}

JobType job_type_from_string(std::string_view name) {
    static const JobType all[] = {JobType::Parse, JobType::DetectEntryPoints,
                                  JobType::GenerateFlow};
    return parse_enum(name, all, "job type");
}

JobStatus job_status_from_string(std::string_view name) {
    static const JobStatus all[] = {JobStatus::Pending, JobStatus::InProgress,
                                    JobStatus::Completed, JobStatus::Failed};
    return parse_enum(name, all, "job status");
}

EntryPointType entry_point_type_from_string(std::string_view name) {
    static const EntryPointType all[] = {EntryPointType::Http, EntryPointType::Event,
                                         EntryPointType::Scheduler};
    return parse_enum(name, all, "entry point type");
}

bool is_type_kind(SymbolKind kind) {
    switch (kind) {
    case SymbolKind::Class:
    case SymbolKind::Interface:
    case SymbolKind::Enum:
    case SymbolKind::Struct:
    case SymbolKind::Trait:
    case SymbolKind::Impl:
        return true;
    default:
        return false;
    }
}

// ============ JSON ============

void to_json(json &j, const RepositoryRecord &r) {
    j = json{{"id", r.id},
             {"name", r.name},
             {"root_path", r.root_path},
             {"status", to_string(r.status)},
             {"total_files", r.total_files},
             {"parsed_files", r.parsed_files},
             {"failed_files", r.failed_files},
             {"languages", r.languages},
             {"error_message", r.error_message},
             {"created_at", r.created_at},
             {"updated_at", r.updated_at}};
}

void to_json(json &j, const FileRecord &f) {
    j = json{{"id", f.id},
             {"relative_path", f.relative_path},
             {"language", language_to_string(f.language)},
             {"content_hash", f.content_hash},
             {"module_path", f.module_path},
             {"package", f.package},
             {"status", to_string(f.status)},
             {"error", f.error},
             {"size_bytes", f.size_bytes}};
}

void to_json(json &j, const SymbolRecord &s) {
    j = json{{"id", s.id},
             {"file_path", s.file_path},
             {"language", language_to_string(s.language)},
             {"name", s.name},
             {"qualified_name", s.qualified_name},
             {"kind", to_string(s.kind)},
             {"signature", s.signature},
             {"parent_qualified_name", s.parent_qualified_name},
             {"start_line", s.start_line},
             {"end_line", s.end_line},
             {"metadata", s.metadata}};
}

void to_json(json &j, const JobRecord &job) {
    j = json{{"id", job.id},
             {"repo_id", job.repo_id},
             {"type", to_string(job.type)},
             {"status", to_string(job.status)},
             {"attempts", job.attempts},
             {"max_attempts", job.max_attempts},
             {"lock_owner", job.lock_owner},
             {"payload", job.payload},
             {"error", job.error}};
}

void to_json(json &j, const EntryPointCandidateRecord &c) {
    j = json{{"id", c.id},
             {"run_id", c.run_id},
             {"symbol_id", c.symbol_id},
             {"file_path", c.file_path},
             {"symbol_name", c.symbol_name},
             {"qualified_name", c.qualified_name},
             {"entry_point_type", to_string(c.type)},
             {"framework", c.framework},
             {"detection_pattern", c.detection_pattern},
             {"metadata", c.metadata},
             {"confidence", c.confidence}};
}

void to_json(json &j, const EntryPointRecord &e) {
    j = json{{"id", e.id},
             {"candidate_id", e.candidate_id},
             {"symbol_id", e.symbol_id},
             {"file_path", e.file_path},
             {"qualified_name", e.qualified_name},
             {"entry_point_type", to_string(e.type)},
             {"framework", e.framework},
             {"name", e.name},
             {"description", e.description},
             {"metadata", e.metadata},
             {"confidence", e.confidence},
             {"reasoning", e.reasoning}};
}

void to_json(json &j, const CodeSnippet &s) {
    j = json{{"code", s.code},
             {"symbol_name", s.symbol_name},
             {"qualified_name", s.qualified_name},
             {"file_path", s.file_path},
             {"line_range", {s.start_line, s.end_line}}};
}

void from_json(const json &j, CodeSnippet &s) {
    s.code = j.value("code", "");
    s.symbol_name = j.value("symbol_name", "");
    s.qualified_name = j.value("qualified_name", "");
    s.file_path = j.value("file_path", "");
    auto range = j.find("line_range");
    if (range != j.end() && range->is_array() && range->size() == 2) {
        s.start_line = (*range)[0].get<uint32_t>();
        s.end_line = (*range)[1].get<uint32_t>();
    }
}

void to_json(json &j, const FlowStep &s) {
    j = json{{"step_number", s.step_number},
             {"title", s.title},
             {"description", s.description},
             {"file_path", s.file_path},
             {"important_log_lines", s.log_lines},
             {"important_code_snippets", s.snippets}};
}

void from_json(const json &j, FlowStep &s) {
    s.step_number = j.value("step_number", 0);
    s.title = j.value("title", "");
    s.description = j.value("description", "");
    s.file_path = j.value("file_path", "");
    s.log_lines = j.value("important_log_lines", std::vector<std::string>{});
    s.snippets = j.value("important_code_snippets", std::vector<CodeSnippet>{});
}

void to_json(json &j, const FlowRecord &f) {
    j = json{{"entry_point_id", f.entry_point_id},
             {"flow_name", f.flow_name},
             {"technical_summary", f.technical_summary},
             {"steps", f.steps},
             {"max_depth_analyzed", f.max_depth_analyzed},
             {"iterations_completed", f.iterations_completed},
             {"symbol_ids_analyzed", f.symbol_ids},
             {"file_paths", f.file_paths},
             {"created_at", f.created_at}};
}

} // namespace cartograph
