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
#include "store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cartograph {

enum class Direction { Upstream, Downstream };

const char *to_string(Direction direction);

// One node reached by a traversal
struct GraphNode {
    std::optional<SymbolRecord> symbol; // absent for external leaves
    std::string target_name;            // external leaves: name the edge was aimed at
    std::string target_path;            // external leaves: path hint
    ReferenceType via = ReferenceType::Call;
    int depth = 0; // depth at which the node was first reached

    bool is_external() const { return !symbol.has_value(); }

    json to_json() const;
};

struct Traversal {
    SymbolUID root = INVALID_UID;
    Direction direction = Direction::Downstream;
    int max_depth = 0;
    std::vector<GraphNode> nodes; // ordered by depth

    // Nodes grouped by depth: {"depth": d, "nodes": [...]}
    json to_json() const;
};

struct LookupMatch {
    SymbolRecord symbol;
    Traversal upstream;
    Traversal downstream;
};

struct LookupResult {
    std::vector<LookupMatch> matches;

    size_t total_matches() const { return matches.size(); }

    json to_json() const;
};

// ============================================================================
// QueryEngine - breadth-first traversal of the stored call graph
// ============================================================================
class QueryEngine {
public:

    QueryEngine(GraphStore &store, const Config &config);

    // Callers of a symbol, transitively
    Traversal upstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth = std::nullopt);

    // Callees of a symbol, transitively. External targets are leaves.
    Traversal downstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth = std::nullopt);

    // Symbols named `name` in files whose path contains `path_prefix`.
    // A dotted prefix is matched as a '/' path; an empty prefix matches every
    // file. Depth 0 returns the matches without context.
    LookupResult lookup_by_qualified_path(RowId repo_id, const std::string &path_prefix, const std::string &name,
                                          std::optional<int> depth = std::nullopt);

    // Default when unset, InvalidArgument when negative, capped at max_depth_cap
    int effective_depth(std::optional<int> depth) const;

private:

    GraphStore &store_;
    const Config &config_;

    Traversal traverse(RowId repo_id, SymbolUID root, Direction direction, int max_depth);
};

} // namespace cartograph
