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

#include "resolver.hpp"
#include "sqlite_db.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cartograph {

// Milliseconds since the epoch
int64_t now_ms();

// ============================================================================
// GraphStore - SQLite persistence for repositories, files, the symbol graph,
// jobs, entry points and flows. One instance per thread.
// ============================================================================
class GraphStore {
public:

    explicit GraphStore(const std::string &path);

    Database &db() { return db_; }

    // Creates tables on a fresh database; throws StoreError on an
    // incompatible schema version
    void migrate();

    // Symbol and reference rows inserted, updated or deleted so far
    int64_t graph_write_count() const { return graph_writes_; }

    // ============ Repositories ============

    RepositoryRecord insert_repository(const std::string &name, const std::string &root_path);
    std::optional<RepositoryRecord> find_repository_by_path(const std::string &root_path);
    RepositoryRecord get_repository(RowId repo_id); // throws NotFound
    std::vector<RepositoryRecord> list_repositories();
    void set_repository_status(RowId repo_id, RepositoryStatus status, const std::string &error = "");

    // Recompute counters and language set from file rows
    RepositoryRecord refresh_repository_counters(RowId repo_id);

    // ============ Files ============

    // Without content; deleted rows only when asked
    std::vector<FileRecord> list_files(RowId repo_id, bool include_deleted = false);
    std::string file_content(RowId file_id);

    // Insert or update by (repo_id, relative_path); returns the row id
    RowId upsert_file(const FileRecord &file);

    // Status deleted, content and hash cleared
    void mark_file_deleted(RowId file_id);

    // ============ Symbols and references ============

    // Remove every symbol and edge owned by a file
    void delete_file_graph(RowId file_id);

    // Symbols with these ids wherever they live, with their outgoing edges
    void delete_symbols(const std::vector<SymbolUID> &ids);

    void insert_symbols(const std::vector<SymbolRecord> &symbols);
    void insert_references(const std::vector<ReferenceRecord> &refs);

    std::optional<SymbolRecord> get_symbol(RowId repo_id, SymbolUID id);
    std::vector<SymbolRecord> get_symbols(RowId repo_id, const std::vector<SymbolUID> &ids);
    std::vector<SymbolRecord> search_symbols(RowId repo_id, const std::string &query, int limit);
    std::vector<SymbolRecord> list_symbols(RowId repo_id, std::optional<SymbolKind> kind, int limit, int offset);
    std::vector<SymbolRecord> symbols_named(RowId repo_id, const std::string &name);

    // Every live symbol of a repository, with source text
    std::vector<SymbolRecord> repository_symbols(RowId repo_id);

    // Index rows for the resolver: symbols joined with their file's module path and package
    std::vector<SymbolEntry> symbol_entries(RowId repo_id);

    std::vector<ReferenceRecord> references_from(SymbolUID source_id);
    std::vector<ReferenceRecord> references_to(SymbolUID target_id);
    std::vector<ReferenceRecord> repository_references(RowId repo_id);

    // Edges whose target symbol no longer exists become external again
    int64_t reset_dangling_references(RowId repo_id);

    // Same, limited to edges aimed at these ids
    int64_t reset_references_to(const std::vector<SymbolUID> &ids);

    // External edges carrying a path hint
    std::vector<ReferenceRecord> external_references(RowId repo_id);

    // Point an external edge at its first candidate; extra candidates become
    // sibling rows, all flagged ambiguous when there is more than one
    void bind_reference(const ReferenceRecord &ref, const std::vector<SymbolUID> &targets);

    // ============ Jobs ============

    RowId enqueue_job(RowId repo_id, JobType type, const json &payload, int max_attempts, int64_t now);
    std::optional<JobRecord> find_active_job(RowId repo_id, JobType type);
    JobRecord get_job(RowId job_id); // throws NotFound
    std::vector<JobRecord> list_jobs(std::optional<RowId> repo_id);

    // Jobs pending or in progress, whatever their available_at
    int64_t count_active_jobs();

    // Atomic claim of the oldest runnable job. Expired locks at the attempt
    // ceiling are failed in the same transaction.
    std::optional<JobRecord> claim_job(const std::string &owner, int64_t now, int64_t lock_timeout_ms);

    // Lock-owner checked transitions; false when the lock was lost
    bool complete_job(RowId job_id, const std::string &owner, int64_t now);
    bool retry_job(RowId job_id, const std::string &owner, const std::string &error, int64_t available_at,
                   int64_t now);
    bool fail_job(RowId job_id, const std::string &owner, const std::string &error, int64_t now);
    bool heartbeat_job(RowId job_id, const std::string &owner, int64_t now);

    // ============ Entry points and flows ============

    int64_t next_candidate_run(RowId repo_id);
    void insert_candidates(std::vector<EntryPointCandidateRecord> &candidates);

    // Candidates of one detection run, the latest by default
    std::vector<EntryPointCandidateRecord> list_candidates(RowId repo_id, std::optional<int64_t> run_id = std::nullopt);

    // Delete the repository's entry points (flows cascade) and insert new ones
    void replace_entry_points(RowId repo_id, std::vector<EntryPointRecord> &entry_points);

    std::vector<EntryPointRecord> list_entry_points(RowId repo_id, std::optional<EntryPointType> type,
                                                    const std::string &framework);
    EntryPointRecord get_entry_point(RowId repo_id, RowId entry_point_id); // throws NotFound
    int64_t count_entry_points(RowId repo_id);

    void save_flow(const FlowRecord &flow);
    std::optional<FlowRecord> get_flow(RowId repo_id, RowId entry_point_id);

private:

    Database db_;
    int64_t graph_writes_ = 0;

    void count_graph_writes() { graph_writes_ += db_.changes(); }
};

} // namespace cartograph
