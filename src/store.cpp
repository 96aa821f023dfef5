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

#include "cartograph/store.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/version.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace cartograph {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

namespace {

// `references` is an SQL keyword, so edges live in `refs`
const char *SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS repositories (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    root_path TEXT NOT NULL UNIQUE,
    status TEXT NOT NULL DEFAULT 'pending',
    total_files INTEGER NOT NULL DEFAULT 0,
    parsed_files INTEGER NOT NULL DEFAULT 0,
    failed_files INTEGER NOT NULL DEFAULT 0,
    languages TEXT NOT NULL DEFAULT '[]',
    error_message TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    relative_path TEXT NOT NULL,
    language TEXT NOT NULL,
    content_hash TEXT NOT NULL DEFAULT '',
    content TEXT NOT NULL DEFAULT '',
    module_path TEXT NOT NULL DEFAULT '',
    package TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL,
    error TEXT NOT NULL DEFAULT '',
    size_bytes INTEGER NOT NULL DEFAULT 0,
    updated_at INTEGER NOT NULL,
    UNIQUE (repo_id, relative_path)
);

CREATE TABLE IF NOT EXISTS symbols (
    id INTEGER PRIMARY KEY,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    qualified_name TEXT NOT NULL,
    kind TEXT NOT NULL,
    signature TEXT NOT NULL DEFAULT '',
    source_text TEXT NOT NULL DEFAULT '',
    parent_qualified_name TEXT NOT NULL DEFAULT '',
    parent_id INTEGER,
    start_line INTEGER NOT NULL DEFAULT 0,
    end_line INTEGER NOT NULL DEFAULT 0,
    start_column INTEGER NOT NULL DEFAULT 0,
    end_column INTEGER NOT NULL DEFAULT 0,
    metadata TEXT NOT NULL DEFAULT '{}',
    UNIQUE (repo_id, qualified_name)
);
CREATE INDEX IF NOT EXISTS idx_symbols_name ON symbols(repo_id, name);
CREATE INDEX IF NOT EXISTS idx_symbols_file ON symbols(file_id);

CREATE TABLE IF NOT EXISTS refs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
    source_symbol_id INTEGER NOT NULL REFERENCES symbols(id) ON DELETE CASCADE,
    target_symbol_id INTEGER,
    target_name TEXT NOT NULL,
    target_path TEXT NOT NULL DEFAULT '',
    type TEXT NOT NULL,
    is_external INTEGER NOT NULL DEFAULT 1,
    is_ambiguous INTEGER NOT NULL DEFAULT 0,
    line INTEGER NOT NULL DEFAULT 0,
    argument_hint TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_refs_source ON refs(source_symbol_id);
CREATE INDEX IF NOT EXISTS idx_refs_target ON refs(target_symbol_id);
CREATE INDEX IF NOT EXISTS idx_refs_file ON refs(file_id);
CREATE INDEX IF NOT EXISTS idx_refs_external ON refs(repo_id, is_external);

CREATE TABLE IF NOT EXISTS jobs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    type TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'pending',
    attempts INTEGER NOT NULL DEFAULT 0,
    max_attempts INTEGER NOT NULL DEFAULT 3,
    lock_owner TEXT NOT NULL DEFAULT '',
    locked_at INTEGER NOT NULL DEFAULT 0,
    available_at INTEGER NOT NULL DEFAULT 0,
    payload TEXT NOT NULL DEFAULT '{}',
    error TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_jobs_claim ON jobs(status, available_at, created_at);

CREATE TABLE IF NOT EXISTS entry_point_candidates (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    run_id INTEGER NOT NULL,
    symbol_id INTEGER NOT NULL,
    file_path TEXT NOT NULL,
    symbol_name TEXT NOT NULL,
    qualified_name TEXT NOT NULL,
    type TEXT NOT NULL,
    framework TEXT NOT NULL,
    detection_pattern TEXT NOT NULL,
    metadata TEXT NOT NULL DEFAULT '{}',
    confidence REAL NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_candidates_run ON entry_point_candidates(repo_id, run_id);

CREATE TABLE IF NOT EXISTS entry_points (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    candidate_id INTEGER NOT NULL REFERENCES entry_point_candidates(id),
    symbol_id INTEGER NOT NULL,
    file_path TEXT NOT NULL,
    qualified_name TEXT NOT NULL,
    type TEXT NOT NULL,
    framework TEXT NOT NULL,
    name TEXT NOT NULL,
    description TEXT NOT NULL DEFAULT '',
    metadata TEXT NOT NULL DEFAULT '{}',
    confidence REAL NOT NULL,
    reasoning TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS flows (
    entry_point_id INTEGER PRIMARY KEY REFERENCES entry_points(id) ON DELETE CASCADE,
    repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
    flow_name TEXT NOT NULL,
    technical_summary TEXT NOT NULL,
    steps TEXT NOT NULL DEFAULT '[]',
    max_depth_analyzed INTEGER NOT NULL DEFAULT 0,
    iterations_completed INTEGER NOT NULL DEFAULT 0,
    symbol_ids TEXT NOT NULL DEFAULT '[]',
    file_paths TEXT NOT NULL DEFAULT '[]',
    created_at INTEGER NOT NULL
);
)SQL";

const char *REPOSITORY_COLUMNS =
    "id, name, root_path, status, total_files, parsed_files, failed_files, languages, error_message, "
    "created_at, updated_at";

const char *FILE_COLUMNS =
    "id, repo_id, relative_path, language, content_hash, module_path, package, status, error, size_bytes, "
    "updated_at";

const char *SYMBOL_SELECT =
    "SELECT s.id, s.repo_id, s.file_id, f.relative_path, f.language, s.name, s.qualified_name, s.kind, "
    "s.signature, s.source_text, s.parent_qualified_name, s.parent_id, s.start_line, s.end_line, "
    "s.start_column, s.end_column, s.metadata FROM symbols s JOIN files f ON f.id = s.file_id ";

const char *REFERENCE_COLUMNS =
    "id, repo_id, file_id, source_symbol_id, target_symbol_id, target_name, target_path, type, is_external, "
    "is_ambiguous, line, argument_hint";

const char *JOB_COLUMNS =
    "id, repo_id, type, status, attempts, max_attempts, lock_owner, locked_at, available_at, payload, error, "
    "created_at, updated_at";

const char *CANDIDATE_COLUMNS =
    "id, repo_id, run_id, symbol_id, file_path, symbol_name, qualified_name, type, framework, "
    "detection_pattern, metadata, confidence";

const char *ENTRY_POINT_COLUMNS =
    "id, repo_id, candidate_id, symbol_id, file_path, qualified_name, type, framework, name, description, "
    "metadata, confidence, reasoning";

json parse_json_column(const std::string &text, json fallback) {
    if (text.empty()) return fallback;
    json parsed = json::parse(text, nullptr, false);
    return parsed.is_discarded() ? fallback : parsed;
}

RepositoryRecord read_repository(const Statement &stmt) {
    RepositoryRecord r;
    r.id = stmt.column_int64(0);
    r.name = stmt.column_text(1);
    r.root_path = stmt.column_text(2);
    r.status = repository_status_from_string(stmt.column_text(3));
    r.total_files = stmt.column_int64(4);
    r.parsed_files = stmt.column_int64(5);
    r.failed_files = stmt.column_int64(6);
    r.languages = parse_json_column(stmt.column_text(7), json::array()).get<std::vector<std::string>>();
    r.error_message = stmt.column_text(8);
    r.created_at = stmt.column_int64(9);
    r.updated_at = stmt.column_int64(10);
    return r;
}

FileRecord read_file(const Statement &stmt) {
    FileRecord f;
    f.id = stmt.column_int64(0);
    f.repo_id = stmt.column_int64(1);
    f.relative_path = stmt.column_text(2);
    f.language = language_from_string(stmt.column_text(3));
    f.content_hash = stmt.column_text(4);
    f.module_path = stmt.column_text(5);
    f.package = stmt.column_text(6);
    f.status = file_status_from_string(stmt.column_text(7));
    f.error = stmt.column_text(8);
    f.size_bytes = stmt.column_int64(9);
    f.updated_at = stmt.column_int64(10);
    return f;
}

SymbolRecord read_symbol(const Statement &stmt) {
    SymbolRecord s;
    s.id = stmt.column_int64(0);
    s.repo_id = stmt.column_int64(1);
    s.file_id = stmt.column_int64(2);
    s.file_path = stmt.column_text(3);
    s.language = language_from_string(stmt.column_text(4));
    s.name = stmt.column_text(5);
    s.qualified_name = stmt.column_text(6);
    s.kind = symbol_kind_from_string(stmt.column_text(7));
    s.signature = stmt.column_text(8);
    s.source_text = stmt.column_text(9);
    s.parent_qualified_name = stmt.column_text(10);
    s.parent_id = stmt.column_optional(11).value_or(INVALID_UID);
    s.start_line = static_cast<uint32_t>(stmt.column_int64(12));
    s.end_line = static_cast<uint32_t>(stmt.column_int64(13));
    s.start_column = static_cast<uint32_t>(stmt.column_int64(14));
    s.end_column = static_cast<uint32_t>(stmt.column_int64(15));
    s.metadata = parse_json_column(stmt.column_text(16), json::object());
    return s;
}

ReferenceRecord read_reference(const Statement &stmt) {
    ReferenceRecord r;
    r.id = stmt.column_int64(0);
    r.repo_id = stmt.column_int64(1);
    r.file_id = stmt.column_int64(2);
    r.source_symbol_id = stmt.column_int64(3);
    r.target_symbol_id = stmt.column_optional(4);
    r.target_name = stmt.column_text(5);
    r.target_path = stmt.column_text(6);
    r.type = reference_type_from_string(stmt.column_text(7));
    r.is_external = stmt.column_int(8) != 0;
    r.is_ambiguous = stmt.column_int(9) != 0;
    r.line = static_cast<uint32_t>(stmt.column_int64(10));
    r.argument_hint = stmt.column_text(11);
    return r;
}

JobRecord read_job(const Statement &stmt) {
    JobRecord job;
    job.id = stmt.column_int64(0);
    job.repo_id = stmt.column_int64(1);
    job.type = job_type_from_string(stmt.column_text(2));
    job.status = job_status_from_string(stmt.column_text(3));
    job.attempts = stmt.column_int(4);
    job.max_attempts = stmt.column_int(5);
    job.lock_owner = stmt.column_text(6);
    job.locked_at = stmt.column_int64(7);
    job.available_at = stmt.column_int64(8);
    job.payload = parse_json_column(stmt.column_text(9), json::object());
    job.error = stmt.column_text(10);
    job.created_at = stmt.column_int64(11);
    job.updated_at = stmt.column_int64(12);
    return job;
}

EntryPointCandidateRecord read_candidate(const Statement &stmt) {
    EntryPointCandidateRecord c;
    c.id = stmt.column_int64(0);
    c.repo_id = stmt.column_int64(1);
    c.run_id = stmt.column_int64(2);
    c.symbol_id = stmt.column_int64(3);
    c.file_path = stmt.column_text(4);
    c.symbol_name = stmt.column_text(5);
    c.qualified_name = stmt.column_text(6);
    c.type = entry_point_type_from_string(stmt.column_text(7));
    c.framework = stmt.column_text(8);
    c.detection_pattern = stmt.column_text(9);
    c.metadata = parse_json_column(stmt.column_text(10), json::object());
    c.confidence = stmt.column_double(11);
    return c;
}

EntryPointRecord read_entry_point(const Statement &stmt) {
    EntryPointRecord e;
    e.id = stmt.column_int64(0);
    e.repo_id = stmt.column_int64(1);
    e.candidate_id = stmt.column_int64(2);
    e.symbol_id = stmt.column_int64(3);
    e.file_path = stmt.column_text(4);
    e.qualified_name = stmt.column_text(5);
    e.type = entry_point_type_from_string(stmt.column_text(6));
    e.framework = stmt.column_text(7);
    e.name = stmt.column_text(8);
    e.description = stmt.column_text(9);
    e.metadata = parse_json_column(stmt.column_text(10), json::object());
    e.confidence = stmt.column_double(11);
    e.reasoning = stmt.column_text(12);
    return e;
}

// LIKE pattern matching `query` anywhere, with wildcards escaped
std::string like_pattern(const std::string &query) {
    std::string pattern = "%";
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') pattern.push_back('\\');
        pattern.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    pattern.push_back('%');
    return pattern;
}

} // namespace

GraphStore::GraphStore(const std::string &path) : db_(path) {}

void GraphStore::migrate() {
    int version = db_.user_version();
    if (!is_schema_compatible(version)) {
        throw StoreError("Database schema version " + std::to_string(version) +
                         " is not supported (expected " + std::to_string(SCHEMA_VERSION) + ")");
    }
    db_.exec(SCHEMA_SQL);
    if (version != SCHEMA_VERSION) db_.set_user_version(SCHEMA_VERSION);
}

// ============ Repositories ============

RepositoryRecord GraphStore::insert_repository(const std::string &name, const std::string &root_path) {
    int64_t now = now_ms();
    auto stmt = db_.prepare(std::string("INSERT INTO repositories(name, root_path, status, created_at, updated_at) "
                                        "VALUES(?, ?, 'pending', ?, ?) RETURNING ") +
                            REPOSITORY_COLUMNS);
    stmt.bind_text(1, name).bind_text(2, root_path).bind_int64(3, now).bind_int64(4, now);
    if (!stmt.step()) throw StoreError("Repository insert returned no row");
    RepositoryRecord repo = read_repository(stmt);
    stmt.run();
    return repo;
}

std::optional<RepositoryRecord> GraphStore::find_repository_by_path(const std::string &root_path) {
    auto stmt = db_.prepare(std::string("SELECT ") + REPOSITORY_COLUMNS + " FROM repositories WHERE root_path = ?");
    stmt.bind_text(1, root_path);
    if (!stmt.step()) return std::nullopt;
    return read_repository(stmt);
}

RepositoryRecord GraphStore::get_repository(RowId repo_id) {
    auto stmt = db_.prepare(std::string("SELECT ") + REPOSITORY_COLUMNS + " FROM repositories WHERE id = ?");
    stmt.bind_int64(1, repo_id);
    if (!stmt.step()) throw NotFound("Repository " + std::to_string(repo_id) + " not found");
    return read_repository(stmt);
}

std::vector<RepositoryRecord> GraphStore::list_repositories() {
    std::vector<RepositoryRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + REPOSITORY_COLUMNS + " FROM repositories ORDER BY id");
    while (stmt.step()) out.push_back(read_repository(stmt));
    return out;
}

void GraphStore::set_repository_status(RowId repo_id, RepositoryStatus status, const std::string &error) {
    auto stmt = db_.prepare("UPDATE repositories SET status = ?, error_message = ?, updated_at = ? WHERE id = ?");
    stmt.bind_text(1, to_string(status)).bind_text(2, error).bind_int64(3, now_ms()).bind_int64(4, repo_id);
    stmt.run();
    if (db_.changes() == 0) throw NotFound("Repository " + std::to_string(repo_id) + " not found");
}

RepositoryRecord GraphStore::refresh_repository_counters(RowId repo_id) {
    int64_t total = 0, parsed = 0, failed = 0;
    {
        auto stmt = db_.prepare("SELECT COUNT(*), SUM(status = 'parsed'), SUM(status = 'failed') FROM files "
                                "WHERE repo_id = ? AND status != 'deleted'");
        stmt.bind_int64(1, repo_id);
        if (stmt.step()) {
            total = stmt.column_int64(0);
            parsed = stmt.column_int64(1);
            failed = stmt.column_int64(2);
        }
    }

    json languages = json::array();
    {
        auto stmt = db_.prepare("SELECT DISTINCT language FROM files WHERE repo_id = ? AND status != 'deleted' "
                                "ORDER BY language");
        stmt.bind_int64(1, repo_id);
        while (stmt.step()) languages.push_back(stmt.column_text(0));
    }

    auto stmt = db_.prepare("UPDATE repositories SET total_files = ?, parsed_files = ?, failed_files = ?, "
                            "languages = ?, updated_at = ? WHERE id = ?");
    stmt.bind_int64(1, total)
        .bind_int64(2, parsed)
        .bind_int64(3, failed)
        .bind_text(4, languages.dump())
        .bind_int64(5, now_ms())
        .bind_int64(6, repo_id);
    stmt.run();
    return get_repository(repo_id);
}

// ============ Files ============

std::vector<FileRecord> GraphStore::list_files(RowId repo_id, bool include_deleted) {
    std::vector<FileRecord> out;
    std::string sql = std::string("SELECT ") + FILE_COLUMNS + " FROM files WHERE repo_id = ?";
    if (!include_deleted) sql += " AND status != 'deleted'";
    sql += " ORDER BY relative_path";
    auto stmt = db_.prepare(sql);
    stmt.bind_int64(1, repo_id);
    while (stmt.step()) out.push_back(read_file(stmt));
    return out;
}

std::string GraphStore::file_content(RowId file_id) {
    auto stmt = db_.prepare("SELECT content FROM files WHERE id = ?");
    stmt.bind_int64(1, file_id);
    if (!stmt.step()) throw NotFound("File " + std::to_string(file_id) + " not found");
    return stmt.column_text(0);
}

RowId GraphStore::upsert_file(const FileRecord &file) {
    auto stmt = db_.prepare(
        "INSERT INTO files(repo_id, relative_path, language, content_hash, content, module_path, package, status, "
        "error, size_bytes, updated_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(repo_id, relative_path) DO UPDATE SET language = excluded.language, "
        "content_hash = excluded.content_hash, content = excluded.content, module_path = excluded.module_path, "
        "package = excluded.package, status = excluded.status, error = excluded.error, "
        "size_bytes = excluded.size_bytes, updated_at = excluded.updated_at RETURNING id");
    stmt.bind_int64(1, file.repo_id)
        .bind_text(2, file.relative_path)
        .bind_text(3, language_to_string(file.language))
        .bind_text(4, file.content_hash)
        .bind_text(5, file.content)
        .bind_text(6, file.module_path)
        .bind_text(7, file.package)
        .bind_text(8, to_string(file.status))
        .bind_text(9, file.error)
        .bind_int64(10, file.size_bytes)
        .bind_int64(11, now_ms());
    if (!stmt.step()) throw StoreError("File upsert returned no row for " + file.relative_path);
    RowId id = stmt.column_int64(0);
    stmt.run();
    return id;
}

void GraphStore::mark_file_deleted(RowId file_id) {
    auto stmt = db_.prepare("UPDATE files SET status = 'deleted', content = '', content_hash = '', error = '', "
                            "updated_at = ? WHERE id = ?");
    stmt.bind_int64(1, now_ms()).bind_int64(2, file_id);
    stmt.run();
}

// ============ Symbols and references ============

void GraphStore::delete_file_graph(RowId file_id) {
    auto refs = db_.prepare("DELETE FROM refs WHERE file_id = ?");
    refs.bind_int64(1, file_id);
    refs.run();
    count_graph_writes();

    auto symbols = db_.prepare("DELETE FROM symbols WHERE file_id = ?");
    symbols.bind_int64(1, file_id);
    symbols.run();
    count_graph_writes();
}

void GraphStore::delete_symbols(const std::vector<SymbolUID> &ids) {
    if (ids.empty()) return;
    auto stmt = db_.prepare("DELETE FROM symbols WHERE id = ?");
    for (SymbolUID id : ids) {
        stmt.bind_int64(1, id);
        stmt.run();
        count_graph_writes();
        stmt.reset();
    }
}

void GraphStore::insert_symbols(const std::vector<SymbolRecord> &symbols) {
    if (symbols.empty()) return;
    auto stmt = db_.prepare(
        "INSERT INTO symbols(id, repo_id, file_id, name, qualified_name, kind, signature, source_text, "
        "parent_qualified_name, parent_id, start_line, end_line, start_column, end_column, metadata) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto &s : symbols) {
        stmt.bind_int64(1, s.id)
            .bind_int64(2, s.repo_id)
            .bind_int64(3, s.file_id)
            .bind_text(4, s.name)
            .bind_text(5, s.qualified_name)
            .bind_text(6, to_string(s.kind))
            .bind_text(7, s.signature)
            .bind_text(8, s.source_text)
            .bind_text(9, s.parent_qualified_name)
            .bind_optional(10, s.parent_id == INVALID_UID ? std::nullopt : std::optional<int64_t>(s.parent_id))
            .bind_int64(11, s.start_line)
            .bind_int64(12, s.end_line)
            .bind_int64(13, s.start_column)
            .bind_int64(14, s.end_column)
            .bind_text(15, s.metadata.dump());
        stmt.run();
        count_graph_writes();
        stmt.reset();
    }
}

void GraphStore::insert_references(const std::vector<ReferenceRecord> &refs) {
    if (refs.empty()) return;
    auto stmt = db_.prepare("INSERT INTO refs(repo_id, file_id, source_symbol_id, target_symbol_id, target_name, "
                            "target_path, type, is_external, is_ambiguous, line, argument_hint) "
                            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto &r : refs) {
        stmt.bind_int64(1, r.repo_id)
            .bind_int64(2, r.file_id)
            .bind_int64(3, r.source_symbol_id)
            .bind_optional(4, r.target_symbol_id)
            .bind_text(5, r.target_name)
            .bind_text(6, r.target_path)
            .bind_text(7, to_string(r.type))
            .bind_int(8, r.target_symbol_id ? 0 : 1)
            .bind_int(9, r.is_ambiguous ? 1 : 0)
            .bind_int64(10, r.line)
            .bind_text(11, r.argument_hint);
        stmt.run();
        count_graph_writes();
        stmt.reset();
    }
}

std::optional<SymbolRecord> GraphStore::get_symbol(RowId repo_id, SymbolUID id) {
    auto stmt = db_.prepare(std::string(SYMBOL_SELECT) + "WHERE s.repo_id = ? AND s.id = ?");
    stmt.bind_int64(1, repo_id).bind_int64(2, id);
    if (!stmt.step()) return std::nullopt;
    return read_symbol(stmt);
}

std::vector<SymbolRecord> GraphStore::get_symbols(RowId repo_id, const std::vector<SymbolUID> &ids) {
    std::vector<SymbolRecord> out;
    auto stmt = db_.prepare(std::string(SYMBOL_SELECT) + "WHERE s.repo_id = ? AND s.id = ?");
    for (SymbolUID id : ids) {
        stmt.bind_int64(1, repo_id).bind_int64(2, id);
        if (stmt.step()) out.push_back(read_symbol(stmt));
        stmt.reset();
    }
    return out;
}

std::vector<SymbolRecord> GraphStore::search_symbols(RowId repo_id, const std::string &query, int limit) {
    std::vector<SymbolRecord> out;
    std::string pattern = like_pattern(query);
    auto stmt = db_.prepare(std::string(SYMBOL_SELECT) +
                            "WHERE s.repo_id = ? AND (LOWER(s.name) LIKE ? ESCAPE '\\' "
                            "OR LOWER(s.qualified_name) LIKE ? ESCAPE '\\') "
                            "ORDER BY s.name, s.qualified_name LIMIT ?");
    stmt.bind_int64(1, repo_id).bind_text(2, pattern).bind_text(3, pattern).bind_int(4, limit);
    while (stmt.step()) out.push_back(read_symbol(stmt));
    return out;
}

std::vector<SymbolRecord> GraphStore::list_symbols(RowId repo_id, std::optional<SymbolKind> kind, int limit,
                                                   int offset) {
    std::vector<SymbolRecord> out;
    std::string sql = std::string(SYMBOL_SELECT) + "WHERE s.repo_id = ?";
    if (kind) sql += " AND s.kind = ?";
    sql += " ORDER BY f.relative_path, s.start_line, s.id LIMIT ? OFFSET ?";
    auto stmt = db_.prepare(sql);
    int idx = 1;
    stmt.bind_int64(idx++, repo_id);
    if (kind) stmt.bind_text(idx++, to_string(*kind));
    stmt.bind_int(idx++, limit).bind_int(idx++, offset);
    while (stmt.step()) out.push_back(read_symbol(stmt));
    return out;
}

std::vector<SymbolRecord> GraphStore::symbols_named(RowId repo_id, const std::string &name) {
    std::vector<SymbolRecord> out;
    auto stmt = db_.prepare(std::string(SYMBOL_SELECT) +
                            "WHERE s.repo_id = ? AND s.name = ? AND s.kind != 'import' "
                            "ORDER BY f.relative_path, s.start_line");
    stmt.bind_int64(1, repo_id).bind_text(2, name);
    while (stmt.step()) out.push_back(read_symbol(stmt));
    return out;
}

std::vector<SymbolRecord> GraphStore::repository_symbols(RowId repo_id) {
    std::vector<SymbolRecord> out;
    auto stmt = db_.prepare(std::string(SYMBOL_SELECT) + "WHERE s.repo_id = ? ORDER BY f.relative_path, s.start_line");
    stmt.bind_int64(1, repo_id);
    while (stmt.step()) out.push_back(read_symbol(stmt));
    return out;
}

std::vector<SymbolEntry> GraphStore::symbol_entries(RowId repo_id) {
    std::vector<SymbolEntry> out;
    auto stmt = db_.prepare("SELECT s.id, s.name, s.qualified_name, f.module_path, f.package, s.kind, s.file_id "
                            "FROM symbols s JOIN files f ON f.id = s.file_id WHERE s.repo_id = ?");
    stmt.bind_int64(1, repo_id);
    while (stmt.step()) {
        SymbolEntry e;
        e.id = stmt.column_int64(0);
        e.name = stmt.column_text(1);
        e.qualified_name = stmt.column_text(2);
        e.module_path = stmt.column_text(3);
        e.package = stmt.column_text(4);
        e.kind = symbol_kind_from_string(stmt.column_text(5));
        e.file_id = stmt.column_int64(6);
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<ReferenceRecord> GraphStore::references_from(SymbolUID source_id) {
    std::vector<ReferenceRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + REFERENCE_COLUMNS +
                            " FROM refs WHERE source_symbol_id = ? ORDER BY line, id");
    stmt.bind_int64(1, source_id);
    while (stmt.step()) out.push_back(read_reference(stmt));
    return out;
}

std::vector<ReferenceRecord> GraphStore::references_to(SymbolUID target_id) {
    std::vector<ReferenceRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + REFERENCE_COLUMNS +
                            " FROM refs WHERE target_symbol_id = ? ORDER BY id");
    stmt.bind_int64(1, target_id);
    while (stmt.step()) out.push_back(read_reference(stmt));
    return out;
}

std::vector<ReferenceRecord> GraphStore::repository_references(RowId repo_id) {
    std::vector<ReferenceRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + REFERENCE_COLUMNS +
                            " FROM refs WHERE repo_id = ? ORDER BY source_symbol_id, line, id");
    stmt.bind_int64(1, repo_id);
    while (stmt.step()) out.push_back(read_reference(stmt));
    return out;
}

int64_t GraphStore::reset_dangling_references(RowId repo_id) {
    auto stmt = db_.prepare("UPDATE refs SET target_symbol_id = NULL, is_external = 1, is_ambiguous = 0 "
                            "WHERE repo_id = ? AND target_symbol_id IS NOT NULL "
                            "AND NOT EXISTS (SELECT 1 FROM symbols s WHERE s.id = refs.target_symbol_id)");
    stmt.bind_int64(1, repo_id);
    stmt.run();
    int64_t changed = db_.changes();
    graph_writes_ += changed;
    return changed;
}

int64_t GraphStore::reset_references_to(const std::vector<SymbolUID> &ids) {
    auto stmt = db_.prepare("UPDATE refs SET target_symbol_id = NULL, is_external = 1, is_ambiguous = 0 "
                            "WHERE target_symbol_id = ?1 AND NOT EXISTS (SELECT 1 FROM symbols WHERE id = ?1)");
    int64_t changed = 0;
    for (SymbolUID id : ids) {
        stmt.bind_int64(1, id);
        stmt.run();
        changed += db_.changes();
        stmt.reset();
    }
    graph_writes_ += changed;
    return changed;
}

std::vector<ReferenceRecord> GraphStore::external_references(RowId repo_id) {
    std::vector<ReferenceRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + REFERENCE_COLUMNS +
                            " FROM refs WHERE repo_id = ? AND is_external = 1 AND target_path != '' ORDER BY id");
    stmt.bind_int64(1, repo_id);
    while (stmt.step()) out.push_back(read_reference(stmt));
    return out;
}

void GraphStore::bind_reference(const ReferenceRecord &ref, const std::vector<SymbolUID> &targets) {
    if (targets.empty()) return;

    // Skip targets this site already reaches through another row
    std::vector<SymbolUID> fresh;
    {
        auto stmt = db_.prepare("SELECT 1 FROM refs WHERE source_symbol_id = ? AND target_symbol_id = ? "
                                "AND type = ? AND line = ? LIMIT 1");
        for (SymbolUID target : targets) {
            stmt.bind_int64(1, ref.source_symbol_id)
                .bind_int64(2, target)
                .bind_text(3, to_string(ref.type))
                .bind_int64(4, ref.line);
            if (!stmt.step()) fresh.push_back(target);
            stmt.reset();
        }
    }

    if (fresh.empty()) {
        auto stmt = db_.prepare("DELETE FROM refs WHERE id = ?");
        stmt.bind_int64(1, ref.id);
        stmt.run();
        count_graph_writes();
        return;
    }

    bool ambiguous = targets.size() > 1;
    auto stmt = db_.prepare("UPDATE refs SET target_symbol_id = ?, is_external = 0, is_ambiguous = ? WHERE id = ?");
    stmt.bind_int64(1, fresh.front()).bind_int(2, ambiguous ? 1 : 0).bind_int64(3, ref.id);
    stmt.run();
    count_graph_writes();

    std::vector<ReferenceRecord> siblings;
    for (size_t i = 1; i < fresh.size(); ++i) {
        ReferenceRecord sibling = ref;
        sibling.target_symbol_id = fresh[i];
        sibling.is_external = false;
        sibling.is_ambiguous = true;
        siblings.push_back(sibling);
    }
    insert_references(siblings);
}

// ============ Jobs ============

RowId GraphStore::enqueue_job(RowId repo_id, JobType type, const json &payload, int max_attempts, int64_t now) {
    auto stmt = db_.prepare("INSERT INTO jobs(repo_id, type, status, attempts, max_attempts, payload, available_at, "
                            "created_at, updated_at) VALUES(?, ?, 'pending', 0, ?, ?, ?, ?, ?) RETURNING id");
    stmt.bind_int64(1, repo_id)
        .bind_text(2, to_string(type))
        .bind_int(3, max_attempts)
        .bind_text(4, payload.dump())
        .bind_int64(5, now)
        .bind_int64(6, now)
        .bind_int64(7, now);
    if (!stmt.step()) throw StoreError("Job insert returned no row");
    RowId id = stmt.column_int64(0);
    stmt.run();
    return id;
}

std::optional<JobRecord> GraphStore::find_active_job(RowId repo_id, JobType type) {
    auto stmt = db_.prepare(std::string("SELECT ") + JOB_COLUMNS +
                            " FROM jobs WHERE repo_id = ? AND type = ? AND status IN ('pending', 'in_progress') "
                            "ORDER BY id LIMIT 1");
    stmt.bind_int64(1, repo_id).bind_text(2, to_string(type));
    if (!stmt.step()) return std::nullopt;
    return read_job(stmt);
}

JobRecord GraphStore::get_job(RowId job_id) {
    auto stmt = db_.prepare(std::string("SELECT ") + JOB_COLUMNS + " FROM jobs WHERE id = ?");
    stmt.bind_int64(1, job_id);
    if (!stmt.step()) throw NotFound("Job " + std::to_string(job_id) + " not found");
    return read_job(stmt);
}

std::vector<JobRecord> GraphStore::list_jobs(std::optional<RowId> repo_id) {
    std::vector<JobRecord> out;
    std::string sql = std::string("SELECT ") + JOB_COLUMNS + " FROM jobs";
    if (repo_id) sql += " WHERE repo_id = ?";
    sql += " ORDER BY created_at, id";
    auto stmt = db_.prepare(sql);
    if (repo_id) stmt.bind_int64(1, *repo_id);
    while (stmt.step()) out.push_back(read_job(stmt));
    return out;
}

int64_t GraphStore::count_active_jobs() {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM jobs WHERE status IN ('pending', 'in_progress')");
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::optional<JobRecord> GraphStore::claim_job(const std::string &owner, int64_t now, int64_t lock_timeout_ms) {
    int64_t cutoff = now - lock_timeout_ms;
    std::optional<JobRecord> claimed;

    Transaction tx(db_);
    {
        auto reap = db_.prepare("UPDATE jobs SET status = 'failed', lock_owner = '', updated_at = ?, "
                                "error = 'lock expired after ' || attempts || ' attempts' "
                                "WHERE status = 'in_progress' AND locked_at < ? AND attempts >= max_attempts");
        reap.bind_int64(1, now).bind_int64(2, cutoff);
        reap.run();
    }
    {
        auto claim = db_.prepare(
            std::string("UPDATE jobs SET status = 'in_progress', lock_owner = ?1, locked_at = ?2, "
                        "attempts = attempts + 1, updated_at = ?2 "
                        "WHERE id = (SELECT id FROM jobs "
                        "WHERE (status = 'pending' AND available_at <= ?2) "
                        "OR (status = 'in_progress' AND locked_at < ?3 AND attempts < max_attempts) "
                        "ORDER BY created_at, id LIMIT 1) RETURNING ") +
            JOB_COLUMNS);
        claim.bind_text(1, owner).bind_int64(2, now).bind_int64(3, cutoff);
        if (claim.step()) {
            claimed = read_job(claim);
            claim.run();
        }
    }
    tx.commit();
    return claimed;
}

bool GraphStore::complete_job(RowId job_id, const std::string &owner, int64_t now) {
    auto stmt = db_.prepare("UPDATE jobs SET status = 'completed', lock_owner = '', error = '', updated_at = ? "
                            "WHERE id = ? AND status = 'in_progress' AND lock_owner = ?");
    stmt.bind_int64(1, now).bind_int64(2, job_id).bind_text(3, owner);
    stmt.run();
    return db_.changes() == 1;
}

bool GraphStore::retry_job(RowId job_id, const std::string &owner, const std::string &error, int64_t available_at,
                           int64_t now) {
    auto stmt = db_.prepare("UPDATE jobs SET status = 'pending', lock_owner = '', locked_at = 0, available_at = ?, "
                            "error = ?, updated_at = ? WHERE id = ? AND status = 'in_progress' AND lock_owner = ?");
    stmt.bind_int64(1, available_at).bind_text(2, error).bind_int64(3, now).bind_int64(4, job_id).bind_text(5, owner);
    stmt.run();
    return db_.changes() == 1;
}

bool GraphStore::fail_job(RowId job_id, const std::string &owner, const std::string &error, int64_t now) {
    auto stmt = db_.prepare("UPDATE jobs SET status = 'failed', lock_owner = '', error = ?, updated_at = ? "
                            "WHERE id = ? AND status = 'in_progress' AND lock_owner = ?");
    stmt.bind_text(1, error).bind_int64(2, now).bind_int64(3, job_id).bind_text(4, owner);
    stmt.run();
    return db_.changes() == 1;
}

bool GraphStore::heartbeat_job(RowId job_id, const std::string &owner, int64_t now) {
    auto stmt = db_.prepare("UPDATE jobs SET locked_at = ?, updated_at = ? "
                            "WHERE id = ? AND status = 'in_progress' AND lock_owner = ?");
    stmt.bind_int64(1, now).bind_int64(2, now).bind_int64(3, job_id).bind_text(4, owner);
    stmt.run();
    return db_.changes() == 1;
}

// ============ Entry points and flows ============

int64_t GraphStore::next_candidate_run(RowId repo_id) {
    auto stmt = db_.prepare("SELECT COALESCE(MAX(run_id), 0) + 1 FROM entry_point_candidates WHERE repo_id = ?");
    stmt.bind_int64(1, repo_id);
    return stmt.step() ? stmt.column_int64(0) : 1;
}

void GraphStore::insert_candidates(std::vector<EntryPointCandidateRecord> &candidates) {
    if (candidates.empty()) return;
    auto stmt = db_.prepare("INSERT INTO entry_point_candidates(repo_id, run_id, symbol_id, file_path, symbol_name, "
                            "qualified_name, type, framework, detection_pattern, metadata, confidence, created_at) "
                            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id");
    int64_t now = now_ms();
    for (auto &c : candidates) {
        stmt.bind_int64(1, c.repo_id)
            .bind_int64(2, c.run_id)
            .bind_int64(3, c.symbol_id)
            .bind_text(4, c.file_path)
            .bind_text(5, c.symbol_name)
            .bind_text(6, c.qualified_name)
            .bind_text(7, to_string(c.type))
            .bind_text(8, c.framework)
            .bind_text(9, c.detection_pattern)
            .bind_text(10, c.metadata.dump())
            .bind_double(11, c.confidence)
            .bind_int64(12, now);
        if (stmt.step()) c.id = stmt.column_int64(0);
        stmt.run();
        stmt.reset();
    }
}

std::vector<EntryPointCandidateRecord> GraphStore::list_candidates(RowId repo_id, std::optional<int64_t> run_id) {
    std::vector<EntryPointCandidateRecord> out;
    auto stmt = db_.prepare(std::string("SELECT ") + CANDIDATE_COLUMNS +
                            " FROM entry_point_candidates WHERE repo_id = ?1 AND run_id = "
                            "COALESCE(?2, (SELECT MAX(run_id) FROM entry_point_candidates WHERE repo_id = ?1)) "
                            "ORDER BY confidence DESC, id");
    stmt.bind_int64(1, repo_id).bind_optional(2, run_id);
    while (stmt.step()) out.push_back(read_candidate(stmt));
    return out;
}

void GraphStore::replace_entry_points(RowId repo_id, std::vector<EntryPointRecord> &entry_points) {
    Transaction tx(db_);
    {
        auto del = db_.prepare("DELETE FROM entry_points WHERE repo_id = ?");
        del.bind_int64(1, repo_id);
        del.run();
    }
    {
        auto stmt = db_.prepare("INSERT INTO entry_points(repo_id, candidate_id, symbol_id, file_path, "
                                "qualified_name, type, framework, name, description, metadata, confidence, "
                                "reasoning, created_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id");
        int64_t now = now_ms();
        for (auto &e : entry_points) {
            e.repo_id = repo_id;
            stmt.bind_int64(1, repo_id)
                .bind_int64(2, e.candidate_id)
                .bind_int64(3, e.symbol_id)
                .bind_text(4, e.file_path)
                .bind_text(5, e.qualified_name)
                .bind_text(6, to_string(e.type))
                .bind_text(7, e.framework)
                .bind_text(8, e.name)
                .bind_text(9, e.description)
                .bind_text(10, e.metadata.dump())
                .bind_double(11, e.confidence)
                .bind_text(12, e.reasoning)
                .bind_int64(13, now);
            if (stmt.step()) e.id = stmt.column_int64(0);
            stmt.run();
            stmt.reset();
        }
    }
    tx.commit();
}

std::vector<EntryPointRecord> GraphStore::list_entry_points(RowId repo_id, std::optional<EntryPointType> type,
                                                            const std::string &framework) {
    std::vector<EntryPointRecord> out;
    std::string sql = std::string("SELECT ") + ENTRY_POINT_COLUMNS + " FROM entry_points WHERE repo_id = ?";
    if (type) sql += " AND type = ?";
    if (!framework.empty()) sql += " AND framework = ?";
    sql += " ORDER BY id";
    auto stmt = db_.prepare(sql);
    int idx = 1;
    stmt.bind_int64(idx++, repo_id);
    if (type) stmt.bind_text(idx++, to_string(*type));
    if (!framework.empty()) stmt.bind_text(idx++, framework);
    while (stmt.step()) out.push_back(read_entry_point(stmt));
    return out;
}

EntryPointRecord GraphStore::get_entry_point(RowId repo_id, RowId entry_point_id) {
    auto stmt = db_.prepare(std::string("SELECT ") + ENTRY_POINT_COLUMNS +
                            " FROM entry_points WHERE repo_id = ? AND id = ?");
    stmt.bind_int64(1, repo_id).bind_int64(2, entry_point_id);
    if (!stmt.step()) throw NotFound("Entry point " + std::to_string(entry_point_id) + " not found");
    return read_entry_point(stmt);
}

int64_t GraphStore::count_entry_points(RowId repo_id) {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM entry_points WHERE repo_id = ?");
    stmt.bind_int64(1, repo_id);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

void GraphStore::save_flow(const FlowRecord &flow) {
    auto stmt = db_.prepare(
        "INSERT INTO flows(entry_point_id, repo_id, flow_name, technical_summary, steps, max_depth_analyzed, "
        "iterations_completed, symbol_ids, file_paths, created_at) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(entry_point_id) DO UPDATE SET flow_name = excluded.flow_name, "
        "technical_summary = excluded.technical_summary, steps = excluded.steps, "
        "max_depth_analyzed = excluded.max_depth_analyzed, iterations_completed = excluded.iterations_completed, "
        "symbol_ids = excluded.symbol_ids, file_paths = excluded.file_paths, created_at = excluded.created_at");
    stmt.bind_int64(1, flow.entry_point_id)
        .bind_int64(2, flow.repo_id)
        .bind_text(3, flow.flow_name)
        .bind_text(4, flow.technical_summary)
        .bind_text(5, json(flow.steps).dump())
        .bind_int(6, flow.max_depth_analyzed)
        .bind_int(7, flow.iterations_completed)
        .bind_text(8, json(flow.symbol_ids).dump())
        .bind_text(9, json(flow.file_paths).dump())
        .bind_int64(10, flow.created_at ? flow.created_at : now_ms());
    stmt.run();
}

std::optional<FlowRecord> GraphStore::get_flow(RowId repo_id, RowId entry_point_id) {
    auto stmt = db_.prepare("SELECT entry_point_id, repo_id, flow_name, technical_summary, steps, "
                            "max_depth_analyzed, iterations_completed, symbol_ids, file_paths, created_at "
                            "FROM flows WHERE repo_id = ? AND entry_point_id = ?");
    stmt.bind_int64(1, repo_id).bind_int64(2, entry_point_id);
    if (!stmt.step()) return std::nullopt;

    FlowRecord flow;
    flow.entry_point_id = stmt.column_int64(0);
    flow.repo_id = stmt.column_int64(1);
    flow.flow_name = stmt.column_text(2);
    flow.technical_summary = stmt.column_text(3);
    flow.steps = parse_json_column(stmt.column_text(4), json::array()).get<std::vector<FlowStep>>();
    flow.max_depth_analyzed = stmt.column_int(5);
    flow.iterations_completed = stmt.column_int(6);
    flow.symbol_ids = parse_json_column(stmt.column_text(7), json::array()).get<std::vector<SymbolUID>>();
    flow.file_paths = parse_json_column(stmt.column_text(8), json::array()).get<std::vector<std::string>>();
    flow.created_at = stmt.column_int64(9);
    return flow;
}

} // namespace cartograph
