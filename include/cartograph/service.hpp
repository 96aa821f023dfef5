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

#include "collaborator.hpp"
#include "config.hpp"
#include "entry_points.hpp"
#include "job_queue.hpp"
#include "query.hpp"
#include "store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cartograph {

struct Registration {
    RepositoryRecord repository;
    RowId job_id = 0;
    bool created = false; // false when the path was already registered

    json to_json() const;
};

// ============================================================================
// CodeGraph - service facade over one store connection. Reads run inline;
// indexing and flow generation are queued for a WorkerPool.
// ============================================================================
class CodeGraph {
public:

    explicit CodeGraph(Config config,
                       std::shared_ptr<Collaborator> collaborator = std::make_shared<HeuristicCollaborator>());

    const Config &config() const { return config_; }
    GraphStore &store() { return store_; }

    // ============ Repositories ============

    // Registers (or finds) the repository at `path` and queues a parse
    Registration register_repository(const std::string &path, const std::string &name = "");
    RowId request_reparse(RowId repo_id);
    RepositoryRecord get_repository(RowId repo_id);
    std::vector<RepositoryRecord> list_repositories();
    std::vector<FileRecord> list_files(RowId repo_id);

    // ============ Symbols and traversal ============

    std::vector<SymbolRecord> list_symbols(RowId repo_id, std::optional<SymbolKind> kind, int limit, int offset);
    std::vector<SymbolRecord> search_symbols(RowId repo_id, const std::string &query, int limit = 50);
    SymbolRecord get_symbol(RowId repo_id, SymbolUID symbol_id); // throws NotFound

    Traversal upstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth = std::nullopt);
    Traversal downstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth = std::nullopt);
    LookupResult lookup_by_qualified_path(RowId repo_id, const std::string &path_prefix, const std::string &name,
                                          std::optional<int> depth = std::nullopt);

    // ============ Entry points and flows ============

    // Runs detection on the calling thread
    DetectionResult detect_entry_points(RowId repo_id, bool force);

    // Queues detection for the worker pool
    RowId request_entry_point_detection(RowId repo_id, bool force);

    std::vector<EntryPointCandidateRecord> list_entry_point_candidates(RowId repo_id);
    std::vector<EntryPointRecord> list_entry_points(RowId repo_id, std::optional<EntryPointType> type = std::nullopt,
                                                    const std::string &framework = "");

    // Queues flow generation and returns the job id
    RowId generate_flow(RowId repo_id, RowId entry_point_id);

    // Throws NotFound until the flow job has completed
    FlowRecord get_flow(RowId repo_id, RowId entry_point_id);

    // ============ Jobs ============

    JobRecord get_job(RowId job_id);
    std::vector<JobRecord> list_jobs(std::optional<RowId> repo_id = std::nullopt);

    // Pool with parse, detection and flow handlers. Must not outlive this object.
    std::unique_ptr<WorkerPool> make_worker_pool(Clock clock = now_ms) const;

private:

    Config config_;
    std::shared_ptr<Collaborator> collaborator_;
    GraphStore store_;
    JobQueue queue_;
    QueryEngine query_;
};

} // namespace cartograph
