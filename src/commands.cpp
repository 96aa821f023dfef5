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

#include "cartograph/commands.hpp"
#include "cartograph/logging.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace cartograph {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void request_stop(int) { g_stop_requested = 1; }

int print_json(const json &j) {
    std::cout << j.dump(2) << std::endl;
    return 0;
}

json stats_json(const WorkerStats &stats) {
    return json{{"completed", stats.completed.load()}, {"retried", stats.retried.load()},
                {"failed", stats.failed.load()}};
}

} // namespace

// ============ Repositories and jobs ============

int cmd_register(CodeGraph &graph, const std::string &path, const std::string &name) {
    return print_json(graph.register_repository(path, name).to_json());
}

int cmd_reparse(CodeGraph &graph, RowId repo_id) {
    return print_json(json{{"repo_id", repo_id}, {"job_id", graph.request_reparse(repo_id)}});
}

int cmd_status(CodeGraph &graph, std::optional<RowId> repo_id) {
    if (repo_id) return print_json(graph.get_repository(*repo_id));
    return print_json(graph.list_repositories());
}

int cmd_files(CodeGraph &graph, RowId repo_id) { return print_json(graph.list_files(repo_id)); }

int cmd_jobs(CodeGraph &graph, std::optional<RowId> repo_id, std::optional<RowId> job_id) {
    if (job_id) return print_json(graph.get_job(*job_id));
    return print_json(graph.list_jobs(repo_id));
}

// ============ Workers ============

int cmd_work(CodeGraph &graph) {
    auto pool = graph.make_worker_pool();
    auto start = std::chrono::steady_clock::now();
    pool->run_until_idle();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    json out = stats_json(pool->stats());
    out["elapsed_ms"] = elapsed.count();
    print_json(out);
    return pool->stats().failed.load() == 0 ? 0 : 1;
}

int cmd_serve(CodeGraph &graph) {
    std::signal(SIGINT, request_stop);
    std::signal(SIGTERM, request_stop);

    auto pool = graph.make_worker_pool();
    pool->start();
    log_info("Serving job queue", {StringField("database", graph.config().database_path)});
    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    log_info("Shutdown requested");
    pool->stop();
    return print_json(stats_json(pool->stats()));
}

// ============ Symbols and traversal ============

int cmd_symbols(CodeGraph &graph, RowId repo_id, const std::string &kind, int limit, int offset) {
    std::optional<SymbolKind> filter;
    if (!kind.empty()) filter = symbol_kind_from_string(kind);
    return print_json(graph.list_symbols(repo_id, filter, limit, offset));
}

int cmd_search(CodeGraph &graph, RowId repo_id, const std::string &query, int limit) {
    return print_json(graph.search_symbols(repo_id, query, limit));
}

int cmd_symbol(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id) {
    SymbolRecord sym = graph.get_symbol(repo_id, symbol_id);
    json j = sym;
    j["source_text"] = sym.source_text;
    return print_json(j);
}

int cmd_upstream(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return print_json(graph.upstream(repo_id, symbol_id, depth).to_json());
}

int cmd_downstream(CodeGraph &graph, RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return print_json(graph.downstream(repo_id, symbol_id, depth).to_json());
}

int cmd_lookup(CodeGraph &graph, RowId repo_id, const std::string &prefix, const std::string &name,
               std::optional<int> depth) {
    return print_json(graph.lookup_by_qualified_path(repo_id, prefix, name, depth).to_json());
}

// ============ Entry points and flows ============

int cmd_detect(CodeGraph &graph, RowId repo_id, bool force, bool queued) {
    if (queued) {
        return print_json(json{{"repo_id", repo_id}, {"job_id", graph.request_entry_point_detection(repo_id, force)}});
    }
    return print_json(graph.detect_entry_points(repo_id, force).to_json());
}

int cmd_candidates(CodeGraph &graph, RowId repo_id) { return print_json(graph.list_entry_point_candidates(repo_id)); }

int cmd_entry_points(CodeGraph &graph, RowId repo_id, const std::string &type, const std::string &framework) {
    std::optional<EntryPointType> filter;
    if (!type.empty()) filter = entry_point_type_from_string(type);
    return print_json(graph.list_entry_points(repo_id, filter, framework));
}

int cmd_generate_flow(CodeGraph &graph, RowId repo_id, RowId entry_point_id) {
    return print_json(json{{"entry_point_id", entry_point_id}, {"job_id", graph.generate_flow(repo_id, entry_point_id)}});
}

int cmd_flow(CodeGraph &graph, RowId repo_id, RowId entry_point_id) {
    return print_json(graph.get_flow(repo_id, entry_point_id));
}

} // namespace cartograph
