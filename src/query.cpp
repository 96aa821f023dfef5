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

#include "cartograph/query.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <set>
#include <tuple>
#include <unordered_set>

namespace cartograph {

const char *to_string(Direction direction) {
    return direction == Direction::Upstream ? "upstream" : "downstream";
}

json GraphNode::to_json() const {
    json j;
    if (symbol) {
        j = *symbol;
    } else {
        j = json{{"id", nullptr}, {"name", target_name}, {"target_path", target_path}};
    }
    j["reference_type"] = to_string(via);
    j["depth"] = depth;
    j["is_external"] = is_external();
    return j;
}

json Traversal::to_json() const {
    json levels = json::array();
    for (const auto &node : nodes) {
        if (levels.empty() || levels.back()["depth"].get<int>() != node.depth) {
            levels.push_back(json{{"depth", node.depth}, {"nodes", json::array()}});
        }
        levels.back()["nodes"].push_back(node.to_json());
    }
    return json{{"symbol_id", root},
                {"direction", cartograph::to_string(direction)},
                {"max_depth", max_depth},
                {"total", nodes.size()},
                {"levels", levels}};
}

json LookupResult::to_json() const {
    json out = json::array();
    for (const auto &m : matches) {
        json symbol = m.symbol;
        symbol["source_text"] = m.symbol.source_text;
        out.push_back(json{{"symbol", symbol}, {"upstream", m.upstream.to_json()}, {"downstream", m.downstream.to_json()}});
    }
    return json{{"matches", out}, {"total_matches", total_matches()}};
}

QueryEngine::QueryEngine(GraphStore &store, const Config &config) : store_(store), config_(config) {}

int QueryEngine::effective_depth(std::optional<int> depth) const {
    int d = depth.value_or(config_.default_max_depth);
    if (d < 0) {
        throw InvalidArgument("Depth must not be negative: " + std::to_string(d));
    }
    return std::min(d, config_.max_depth_cap);
}

Traversal QueryEngine::upstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return traverse(repo_id, symbol_id, Direction::Upstream, effective_depth(depth));
}

Traversal QueryEngine::downstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return traverse(repo_id, symbol_id, Direction::Downstream, effective_depth(depth));
}

Traversal QueryEngine::traverse(RowId repo_id, SymbolUID root, Direction direction, int max_depth) {
    if (!store_.get_symbol(repo_id, root)) {
        throw NotFound("Symbol not found: " + std::to_string(root));
    }

    Traversal result;
    result.root = root;
    result.direction = direction;
    result.max_depth = max_depth;

    std::unordered_set<SymbolUID> seen{root};
    std::set<std::pair<std::string, std::string>> seen_external;
    std::vector<SymbolUID> frontier{root};

    for (int depth = 1; depth <= max_depth && !frontier.empty(); ++depth) {
        std::vector<SymbolUID> next;
        std::vector<GraphNode> level;

        for (SymbolUID node : frontier) {
            auto refs = direction == Direction::Downstream ? store_.references_from(node) : store_.references_to(node);
            for (const auto &ref : refs) {
                if (direction == Direction::Upstream) {
                    SymbolUID caller = ref.source_symbol_id;
                    if (!seen.insert(caller).second) continue;
                    GraphNode n;
                    n.symbol = store_.get_symbol(repo_id, caller);
                    n.via = ref.type;
                    n.depth = depth;
                    if (!n.symbol) continue;
                    next.push_back(caller);
                    level.push_back(std::move(n));
                    continue;
                }

                if (!ref.target_symbol_id) {
                    // External targets are reported once and never expanded
                    if (!seen_external.emplace(ref.target_path, ref.target_name).second) continue;
                    GraphNode n;
                    n.target_name = ref.target_name;
                    n.target_path = ref.target_path;
                    n.via = ref.type;
                    n.depth = depth;
                    level.push_back(std::move(n));
                    continue;
                }

                SymbolUID callee = *ref.target_symbol_id;
                if (!seen.insert(callee).second) continue;
                GraphNode n;
                n.symbol = store_.get_symbol(repo_id, callee);
                n.via = ref.type;
                n.depth = depth;
                if (!n.symbol) continue;
                next.push_back(callee);
                level.push_back(std::move(n));
            }
        }

        std::stable_sort(level.begin(), level.end(), [](const GraphNode &a, const GraphNode &b) {
            if (a.is_external() != b.is_external()) return !a.is_external();
            if (!a.is_external()) return a.symbol->qualified_name < b.symbol->qualified_name;
            return std::tie(a.target_path, a.target_name) < std::tie(b.target_path, b.target_name);
        });
        for (auto &n : level) result.nodes.push_back(std::move(n));
        frontier = std::move(next);
    }

    log_debug("Traversal", {IntField("symbol_id", root), StringField("direction", to_string(direction)),
                            IntField("depth", max_depth), IntField("nodes", static_cast<int64_t>(result.nodes.size()))});
    return result;
}

LookupResult QueryEngine::lookup_by_qualified_path(RowId repo_id, const std::string &path_prefix,
                                                   const std::string &name, std::optional<int> depth) {
    if (name.empty()) {
        throw InvalidArgument("Symbol name is required");
    }
    int max_depth = effective_depth(depth);

    // "com.acme.Orders" -> "com/acme/Orders"; a path with '/' is used as is
    std::string file_pattern = path_prefix;
    if (file_pattern.find('/') == std::string::npos) {
        std::replace(file_pattern.begin(), file_pattern.end(), '.', '/');
    }

    LookupResult result;
    for (auto &sym : store_.symbols_named(repo_id, name)) {
        if (!file_pattern.empty() && sym.file_path.find(file_pattern) == std::string::npos) continue;

        LookupMatch match;
        match.upstream.root = match.downstream.root = sym.id;
        match.upstream.direction = Direction::Upstream;
        if (max_depth > 0) {
            match.upstream = traverse(repo_id, sym.id, Direction::Upstream, max_depth);
            match.downstream = traverse(repo_id, sym.id, Direction::Downstream, max_depth);
        }
        match.symbol = std::move(sym);
        result.matches.push_back(std::move(match));
    }
    return result;
}

} // namespace cartograph
