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

#include "change_detector.hpp"
#include "config.hpp"
#include "parser.hpp"
#include "resolver.hpp"
#include "store.hpp"
#include <functional>
#include <string>
#include <vector>

namespace cartograph {

// Called between write batches so long parse jobs keep their lock
using HeartbeatCallback = std::function<void()>;

// Outcome of one parse run over a repository
struct IndexResult {
    RepositoryStatus status = RepositoryStatus::Completed;
    int64_t files_total = 0;
    int64_t files_parsed = 0;
    int64_t files_failed = 0;
    int64_t files_unchanged = 0;
    int64_t files_reparsed = 0;
    int64_t files_deleted = 0;
    int64_t symbols_written = 0;
    int64_t references_written = 0;
    int64_t references_rebound = 0;
    int64_t graph_writes = 0; // symbol and edge rows touched by this run

    json to_json() const;
};

// Phase 1 output for one file
struct ParsedFile {
    FileChange *change = nullptr;
    std::string module_path;
    bool failed = false;
    std::string error;
    FileAnalysis analysis;
};

// ============================================================================
// Indexer - incremental two-phase indexing of one repository
//
//   phase 1  parse changed and new files in parallel (symbols + call sites)
//   phase 2  resolve call sites against the repository-wide SymbolIndex,
//            then write each file's symbols and edges in one transaction
//   rebind   point external edges at symbols that now exist
// ============================================================================
class Indexer {
public:

    Indexer(GraphStore &store, const Config &config);

    IndexResult index_repository(RowId repo_id, const HeartbeatCallback &heartbeat = nullptr);

    // Parse a single file's content (thread-safe)
    ParsedFile parse_file(FileChange &change, const std::string &module_path) const;

private:

    GraphStore &store_;
    const Config &config_;
    ChangeDetector detector_;

    void parse_all(std::vector<ParsedFile> &files) const;
    void worker_parse_files(std::vector<ParsedFile> &files, size_t start_idx, size_t end_idx) const;

    int64_t rebind_external_edges(RowId repo_id, const Resolver &resolver);
};

} // namespace cartograph
