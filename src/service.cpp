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

#include "cartograph/service.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/flow.hpp"
#include "cartograph/indexer.hpp"
#include "cartograph/logging.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace cartograph {

json Registration::to_json() const {
    json j = repository;
    j["job_id"] = job_id;
    j["created"] = created;
    return j;
}

CodeGraph::CodeGraph(Config config, std::shared_ptr<Collaborator> collaborator)
    : config_(std::move(config)), collaborator_(std::move(collaborator)), store_(config_.database_path),
      queue_(store_, config_), query_(store_, config_) {
    config_.validate();
    if (!collaborator_) throw InvalidArgument("A collaborator is required");
    store_.migrate();
}

// ============ Repositories ============

Registration CodeGraph::register_repository(const std::string &path, const std::string &name) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) throw InvalidArgument("Not a directory: " + path);
    std::string root = fs::canonical(path).string();

    Registration reg;
    if (auto existing = store_.find_repository_by_path(root)) {
        reg.repository = *existing;
    } else {
        std::string repo_name = name.empty() ? fs::path(root).filename().string() : name;
        reg.repository = store_.insert_repository(repo_name, root);
        reg.created = true;
        log_info("Repository registered", {IntField("repo_id", reg.repository.id), StringField("name", repo_name),
                                           StringField("root", root)});
    }
    reg.job_id = queue_.enqueue_parse(reg.repository.id);
    return reg;
}

RowId CodeGraph::request_reparse(RowId repo_id) {
    store_.get_repository(repo_id);
    return queue_.enqueue_parse(repo_id);
}

RepositoryRecord CodeGraph::get_repository(RowId repo_id) { return store_.get_repository(repo_id); }

std::vector<RepositoryRecord> CodeGraph::list_repositories() { return store_.list_repositories(); }

std::vector<FileRecord> CodeGraph::list_files(RowId repo_id) {
    store_.get_repository(repo_id);
    return store_.list_files(repo_id);
}

// ============ Symbols and traversal ============

std::vector<SymbolRecord> CodeGraph::list_symbols(RowId repo_id, std::optional<SymbolKind> kind, int limit,
                                                  int offset) {
    if (limit <= 0 || offset < 0) throw InvalidArgument("limit must be positive and offset non-negative");
    return store_.list_symbols(repo_id, kind, limit, offset);
}

std::vector<SymbolRecord> CodeGraph::search_symbols(RowId repo_id, const std::string &query, int limit) {
    if (query.empty()) throw InvalidArgument("Search query is empty");
    if (limit <= 0) throw InvalidArgument("limit must be positive");
    return store_.search_symbols(repo_id, query, limit);
}

SymbolRecord CodeGraph::get_symbol(RowId repo_id, SymbolUID symbol_id) {
    auto sym = store_.get_symbol(repo_id, symbol_id);
    if (!sym) throw NotFound("Symbol " + std::to_string(symbol_id) + " not found");
    return *sym;
}

Traversal CodeGraph::upstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return query_.upstream(repo_id, symbol_id, depth);
}

Traversal CodeGraph::downstream(RowId repo_id, SymbolUID symbol_id, std::optional<int> depth) {
    return query_.downstream(repo_id, symbol_id, depth);
}

LookupResult CodeGraph::lookup_by_qualified_path(RowId repo_id, const std::string &path_prefix,
                                                 const std::string &name, std::optional<int> depth) {
    return query_.lookup_by_qualified_path(repo_id, path_prefix, name, depth);
}

// ============ Entry points and flows ============

DetectionResult CodeGraph::detect_entry_points(RowId repo_id, bool force) {
    EntryPointDetector detector(store_, config_, collaborator_);
    return detector.detect(repo_id, force);
}

RowId CodeGraph::request_entry_point_detection(RowId repo_id, bool force) {
    store_.get_repository(repo_id);
    return queue_.enqueue(repo_id, JobType::DetectEntryPoints, json{{"force", force}});
}

std::vector<EntryPointCandidateRecord> CodeGraph::list_entry_point_candidates(RowId repo_id) {
    return store_.list_candidates(repo_id);
}

std::vector<EntryPointRecord> CodeGraph::list_entry_points(RowId repo_id, std::optional<EntryPointType> type,
                                                           const std::string &framework) {
    return store_.list_entry_points(repo_id, type, framework);
}

RowId CodeGraph::generate_flow(RowId repo_id, RowId entry_point_id) {
    store_.get_entry_point(repo_id, entry_point_id);
    return queue_.enqueue(repo_id, JobType::GenerateFlow, json{{"entry_point_id", entry_point_id}});
}

FlowRecord CodeGraph::get_flow(RowId repo_id, RowId entry_point_id) {
    auto flow = store_.get_flow(repo_id, entry_point_id);
    if (!flow) throw NotFound("No flow generated for entry point " + std::to_string(entry_point_id));
    return *flow;
}

// ============ Jobs ============

JobRecord CodeGraph::get_job(RowId job_id) { return store_.get_job(job_id); }

std::vector<JobRecord> CodeGraph::list_jobs(std::optional<RowId> repo_id) { return store_.list_jobs(repo_id); }

std::unique_ptr<WorkerPool> CodeGraph::make_worker_pool(Clock clock) const {
    auto pool = std::make_unique<WorkerPool>(config_, std::move(clock));
    const Config &config = config_;
    auto collaborator = collaborator_;

    pool->register_handler(JobType::Parse, [&config](JobContext &ctx) {
        Indexer indexer(ctx.store, config);
        try {
            IndexResult result = indexer.index_repository(ctx.job.repo_id, ctx.heartbeat);
            log_info("Parse job finished", {IntField("job_id", ctx.job.id),
                                            StringField("status", to_string(result.status)),
                                            IntField("graph_writes", result.graph_writes)});
        } catch (const NotFound &) {
            throw;
        } catch (const std::exception &e) {
            // Leave the repository queryable as failed while the job retries
            ctx.store.set_repository_status(ctx.job.repo_id, RepositoryStatus::Failed, e.what());
            throw;
        }
    });

    pool->register_handler(JobType::DetectEntryPoints, [&config, collaborator](JobContext &ctx) {
        EntryPointDetector detector(ctx.store, config, collaborator);
        DetectionResult result = detector.detect(ctx.job.repo_id, ctx.job.payload.value("force", false));
        log_info("Detection job finished", {IntField("job_id", ctx.job.id),
                                            IntField("confirmed", result.entry_points_confirmed)});
    });

    pool->register_handler(JobType::GenerateFlow, [&config, collaborator](JobContext &ctx) {
        auto id = ctx.job.payload.find("entry_point_id");
        if (id == ctx.job.payload.end() || !id->is_number_integer()) {
            throw InvalidArgument("Flow job " + std::to_string(ctx.job.id) + " has no entry_point_id");
        }
        FlowGenerator generator(ctx.store, config, collaborator);
        generator.generate(ctx.job.repo_id, id->get<RowId>());
    });

    return pool;
}

} // namespace cartograph
