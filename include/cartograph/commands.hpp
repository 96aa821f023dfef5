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

#include "service.hpp"
#include <optional>
#include <string>

namespace cartograph {

// Command implementations. Each prints its result as JSON on stdout and
// returns the process exit code; errors propagate as exceptions.

// Repositories and jobs
int cmd_register(CodeGraph &graph, const std::string &path, const std::string &name);
int cmd_reparse(CodeGraph &graph, RowId repo_id);
int cmd_status(CodeGraph &graph, std::optional<RowId> repo_id);
int cmd_files(CodeGraph &graph, RowId repo_id);
int cmd_jobs(CodeGraph &graph, std::optional<RowId> repo_id, std::optional<RowId> job_id);

// Workers
int cmd_work(CodeGraph &graph);
int cmd_serve(CodeGraph &graph);

// Symbols and traversal
int cmd_symbols(CodeGraph &graph, RowId repo_id, const std::string &kind, int limit, int offset);
int cmd_search(CodeGraph &graph, RowId repo_id, const std::string &query, int limit);
int cmd_symbol(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id);
int cmd_upstream(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id, std::optional<int> depth);
int cmd_downstream(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id, std::optional<int> depth);
int cmd_lookup(CodeGraph &graph, RowId repo_id, const std::string &prefix, const std::string &name,
               std::optional<int> depth);

// Entry points and flows
int cmd_detect(CodeGraph &graph, RowId repo_id, bool force, bool queued);
int cmd_candidates(CodeGraph &graph, RowId repo_id);
int cmd_entry_points(CodeGraph &graph, RowId repo_id, const std::string &type, const std::string &framework);
int cmd_generate_flow(CodeGraph &graph, RowId repo_id, RowId entry_point_id);
int cmd_flow(CodeGraph &graph, RowId repo_id, RowId entry_point_id);

} // namespace cartograph
