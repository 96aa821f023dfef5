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

#include "cartograph/errors.hpp"
#include "cartograph/store.hpp"
#include "cartograph/version.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace cartograph;
using cartograph::test_support::TempDir;

namespace {

class GraphStoreTest : public ::testing::Test {
protected:
    GraphStoreTest() : store_((dir_.path() / "graph.db").string()) { store_.migrate(); }

    RowId add_file(RowId repo_id, const std::string &path, FileStatus status = FileStatus::Parsed) {
        FileRecord file;
        file.repo_id = repo_id;
        file.relative_path = path;
        file.language = Language::Python;
        file.content_hash = "hash-" + path;
        file.content = "# " + path + "\n";
        file.module_path = module_path_of(path);
        file.status = status;
        return store_.upsert_file(file);
    }

    static std::string module_path_of(const std::string &path) {
        std::string out = path.substr(0, path.rfind('.'));
        for (auto &c : out) {
            if (c == '/') c = '.';
        }
        return out;
    }

    static SymbolRecord symbol(SymbolUID id, RowId repo_id, RowId file_id, const std::string &name,
                               const std::string &qualified, SymbolKind kind, uint32_t line) {
        SymbolRecord s;
        s.id = id;
        s.repo_id = repo_id;
        s.file_id = file_id;
        s.name = name;
        s.qualified_name = qualified;
        s.kind = kind;
        s.start_line = line;
        s.end_line = line + 2;
        return s;
    }

    static ReferenceRecord reference(RowId repo_id, RowId file_id, SymbolUID source, std::optional<SymbolUID> target,
                                     const std::string &name, uint32_t line) {
        ReferenceRecord r;
        r.repo_id = repo_id;
        r.file_id = file_id;
        r.source_symbol_id = source;
        r.target_symbol_id = target;
        r.target_name = name;
        r.type = ReferenceType::Call;
        r.line = line;
        return r;
    }

    TempDir dir_;
    GraphStore store_;
};

} // namespace

// ============ Schema ============

TEST_F(GraphStoreTest, MigrateIsIdempotent) {
    EXPECT_NO_THROW(store_.migrate());
    EXPECT_EQ(store_.db().user_version(), SCHEMA_VERSION);
}

TEST_F(GraphStoreTest, IncompatibleSchemaIsRejected) {
    store_.db().set_user_version(SCHEMA_VERSION + 10);
    GraphStore other((dir_.path() / "graph.db").string());
    EXPECT_THROW(other.migrate(), StoreError);
}

// ============ Repositories ============

TEST_F(GraphStoreTest, RepositoryLifecycle) {
    RepositoryRecord repo = store_.insert_repository("shop", "/src/shop");
    EXPECT_GT(repo.id, 0);
    EXPECT_EQ(repo.status, RepositoryStatus::Pending);

    auto found = store_.find_repository_by_path("/src/shop");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, repo.id);
    EXPECT_FALSE(store_.find_repository_by_path("/src/other").has_value());

    store_.set_repository_status(repo.id, RepositoryStatus::Failed, "disk full");
    RepositoryRecord loaded = store_.get_repository(repo.id);
    EXPECT_EQ(loaded.status, RepositoryStatus::Failed);
    EXPECT_EQ(loaded.error_message, "disk full");

    EXPECT_THROW(store_.insert_repository("dup", "/src/shop"), StoreError);
    EXPECT_THROW(store_.get_repository(repo.id + 100), NotFound);
    EXPECT_THROW(store_.set_repository_status(repo.id + 100, RepositoryStatus::Completed), NotFound);
    EXPECT_EQ(store_.list_repositories().size(), 1u);
}

// ============ Files ============

TEST_F(GraphStoreTest, FileUpsertAndCounters) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    RowId a = add_file(repo, "app/a.py");
    RowId b = add_file(repo, "app/b.py", FileStatus::Failed);
    add_file(repo, "app/c.py");

    // Same path updates in place
    EXPECT_EQ(add_file(repo, "app/a.py"), a);

    RepositoryRecord counted = store_.refresh_repository_counters(repo);
    EXPECT_EQ(counted.total_files, 3);
    EXPECT_EQ(counted.parsed_files, 2);
    EXPECT_EQ(counted.failed_files, 1);
    EXPECT_EQ(counted.languages, std::vector<std::string>{"python"});

    store_.mark_file_deleted(b);
    EXPECT_EQ(store_.file_content(b), "");
    EXPECT_EQ(store_.list_files(repo).size(), 2u);
    EXPECT_EQ(store_.list_files(repo, true).size(), 3u);
    EXPECT_EQ(store_.refresh_repository_counters(repo).failed_files, 0);

    auto files = store_.list_files(repo);
    EXPECT_EQ(files[0].relative_path, "app/a.py");
    EXPECT_EQ(files[0].module_path, "app.a");
    EXPECT_THROW(store_.file_content(9999), NotFound);
}

// ============ Symbols and references ============

TEST_F(GraphStoreTest, SymbolQueries) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    RowId file = add_file(repo, "app/orders.py");
    store_.insert_symbols({
        symbol(101, repo, file, "process_order", "app.orders.process_order", SymbolKind::Function, 1),
        symbol(102, repo, file, "processor", "app.orders.processor", SymbolKind::Function, 5),
        symbol(103, repo, file, "Order", "app.orders.Order", SymbolKind::Class, 9),
        symbol(104, repo, file, "processor", "app.orders:lib.processor", SymbolKind::Import, 0),
    });
    EXPECT_EQ(store_.graph_write_count(), 4);

    EXPECT_EQ(store_.search_symbols(repo, "PROC", 10).size(), 3u);
    // `_` is matched literally
    auto underscored = store_.search_symbols(repo, "s_o", 10);
    ASSERT_EQ(underscored.size(), 1u);
    EXPECT_EQ(underscored[0].id, 101);

    auto functions = store_.list_symbols(repo, SymbolKind::Function, 1, 1);
    ASSERT_EQ(functions.size(), 1u);
    EXPECT_EQ(functions[0].id, 102);
    EXPECT_EQ(store_.list_symbols(repo, std::nullopt, 100, 0).size(), 4u);

    auto named = store_.symbols_named(repo, "processor");
    ASSERT_EQ(named.size(), 1u);
    EXPECT_EQ(named[0].kind, SymbolKind::Function);

    auto sym = store_.get_symbol(repo, 103);
    ASSERT_TRUE(sym.has_value());
    EXPECT_EQ(sym->file_path, "app/orders.py");
    EXPECT_EQ(sym->language, Language::Python);
    EXPECT_FALSE(store_.get_symbol(repo, 999).has_value());
    EXPECT_FALSE(store_.get_symbol(repo + 1, 103).has_value());
    EXPECT_EQ(store_.get_symbols(repo, {103, 999, 101}).size(), 2u);

    auto entries = store_.symbol_entries(repo);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].module_path, "app.orders");
}

TEST_F(GraphStoreTest, DanglingEdgesBecomeExternalAndRebind) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    RowId api = add_file(repo, "app/api.py");
    RowId service = add_file(repo, "app/service.py");
    store_.insert_symbols({
        symbol(1, repo, api, "create", "app.api.create", SymbolKind::Function, 1),
        symbol(2, repo, service, "process", "app.service.process", SymbolKind::Function, 1),
    });
    ReferenceRecord bound = reference(repo, api, 1, SymbolUID{2}, "process", 2);
    bound.target_path = "app.service.process";
    store_.insert_references({bound, reference(repo, api, 1, std::nullopt, "print", 3)});

    auto outgoing = store_.references_from(1);
    ASSERT_EQ(outgoing.size(), 2u);
    EXPECT_FALSE(outgoing[0].is_external);
    EXPECT_TRUE(outgoing[1].is_external);
    EXPECT_EQ(store_.references_to(2).size(), 1u);

    // Rewriting service.py drops its symbols; the edge from api.py survives as external
    store_.delete_file_graph(service);
    EXPECT_EQ(store_.reset_dangling_references(repo), 1);
    auto externals = store_.external_references(repo);
    ASSERT_EQ(externals.size(), 1u);
    EXPECT_EQ(externals[0].target_name, "process");
    EXPECT_FALSE(externals[0].target_symbol_id.has_value());

    store_.insert_symbols({
        symbol(3, repo, service, "process", "app.service.process", SymbolKind::Function, 1),
        symbol(4, repo, service, "process", "app.service.process#2", SymbolKind::Function, 8),
    });
    store_.bind_reference(externals[0], {3, 4});

    auto rebound = store_.references_from(1);
    ASSERT_EQ(rebound.size(), 3u);
    int ambiguous = 0;
    for (const auto &ref : rebound) {
        if (ref.target_name == "process") {
            EXPECT_FALSE(ref.is_external);
            EXPECT_TRUE(ref.is_ambiguous);
            ++ambiguous;
        }
    }
    EXPECT_EQ(ambiguous, 2);
    EXPECT_TRUE(store_.external_references(repo).empty());
}

// ============ Jobs ============

TEST_F(GraphStoreTest, JobClaimRetryAndOwnership) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    RowId job = store_.enqueue_job(repo, JobType::Parse, json::object(), 2, 1000);

    auto active = store_.find_active_job(repo, JobType::Parse);
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, job);
    EXPECT_FALSE(store_.find_active_job(repo, JobType::GenerateFlow).has_value());

    auto claimed = store_.claim_job("w1", 1000, 600000);
    ASSERT_TRUE(claimed.has_value());
    EXPECT_EQ(claimed->status, JobStatus::InProgress);
    EXPECT_EQ(claimed->attempts, 1);
    EXPECT_EQ(claimed->lock_owner, "w1");
    EXPECT_FALSE(store_.claim_job("w2", 1001, 600000).has_value());

    EXPECT_FALSE(store_.complete_job(job, "w2", 1002));
    EXPECT_TRUE(store_.heartbeat_job(job, "w1", 1003));
    EXPECT_TRUE(store_.retry_job(job, "w1", "boom", 5000, 1004));
    EXPECT_EQ(store_.get_job(job).status, JobStatus::Pending);
    EXPECT_EQ(store_.get_job(job).error, "boom");

    // Backoff hides the job until available_at
    EXPECT_FALSE(store_.claim_job("w1", 2000, 600000).has_value());
    auto again = store_.claim_job("w1", 5000, 600000);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->attempts, 2);

    EXPECT_TRUE(store_.complete_job(job, "w1", 5001));
    EXPECT_EQ(store_.get_job(job).status, JobStatus::Completed);
    EXPECT_EQ(store_.count_active_jobs(), 0);
    EXPECT_THROW(store_.get_job(job + 50), NotFound);
}

TEST_F(GraphStoreTest, ExpiredLocksAreReclaimedOrFailed) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    RowId first = store_.enqueue_job(repo, JobType::Parse, json::object(), 3, 1000);
    RowId second = store_.enqueue_job(repo, JobType::DetectEntryPoints, json::object(), 1, 1001);

    ASSERT_EQ(store_.claim_job("w1", 1000, 100)->id, first);
    ASSERT_EQ(store_.claim_job("w1", 1001, 100)->id, second);

    // Both locks expire; the job with attempts left is reclaimed, the other fails
    auto reclaimed = store_.claim_job("w2", 2000, 100);
    ASSERT_TRUE(reclaimed.has_value());
    EXPECT_EQ(reclaimed->id, first);
    EXPECT_EQ(reclaimed->lock_owner, "w2");
    EXPECT_EQ(reclaimed->attempts, 2);

    JobRecord failed = store_.get_job(second);
    EXPECT_EQ(failed.status, JobStatus::Failed);
    EXPECT_NE(failed.error.find("lock expired"), std::string::npos);

    EXPECT_FALSE(store_.complete_job(first, "w1", 2001));
    EXPECT_TRUE(store_.fail_job(first, "w2", "permanent", 2002));
    EXPECT_EQ(store_.list_jobs(repo).size(), 2u);
    EXPECT_EQ(store_.list_jobs(std::nullopt).size(), 2u);
}

// ============ Entry points and flows ============

TEST_F(GraphStoreTest, EntryPointsReplaceAndFlowsCascade) {
    RowId repo = store_.insert_repository("shop", "/src/shop").id;
    int64_t run = store_.next_candidate_run(repo);
    EXPECT_EQ(run, 1);

    std::vector<EntryPointCandidateRecord> candidates(2);
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].repo_id = repo;
        candidates[i].run_id = run;
        candidates[i].symbol_id = static_cast<SymbolUID>(10 + i);
        candidates[i].qualified_name = "app.api.handler" + std::to_string(i);
        candidates[i].framework = "flask";
        candidates[i].confidence = i == 0 ? 0.7 : 0.9;
    }
    store_.insert_candidates(candidates);
    EXPECT_GT(candidates[0].id, 0);
    EXPECT_EQ(store_.next_candidate_run(repo), 2);

    auto listed = store_.list_candidates(repo);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_DOUBLE_EQ(listed[0].confidence, 0.9);

    std::vector<EntryPointRecord> entry_points(1);
    entry_points[0].candidate_id = candidates[1].id;
    entry_points[0].symbol_id = candidates[1].symbol_id;
    entry_points[0].name = "POST /orders";
    entry_points[0].framework = "flask";
    store_.replace_entry_points(repo, entry_points);
    RowId ep = entry_points[0].id;
    EXPECT_GT(ep, 0);

    FlowRecord flow;
    flow.entry_point_id = ep;
    flow.repo_id = repo;
    flow.flow_name = "Create order";
    flow.steps.push_back(FlowStep{1, "Receive", "Handles the request", "app/api.py", {"log.info(\"x\")"}, {}});
    flow.symbol_ids = {11, 12};
    flow.file_paths = {"app/api.py"};
    store_.save_flow(flow);

    auto loaded = store_.get_flow(repo, ep);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->flow_name, "Create order");
    ASSERT_EQ(loaded->steps.size(), 1u);
    EXPECT_EQ(loaded->steps[0].log_lines.size(), 1u);
    EXPECT_EQ(loaded->symbol_ids, (std::vector<SymbolUID>{11, 12}));

    EXPECT_EQ(store_.list_entry_points(repo, EntryPointType::Http, "flask").size(), 1u);
    EXPECT_TRUE(store_.list_entry_points(repo, EntryPointType::Event, "").empty());
    EXPECT_TRUE(store_.list_entry_points(repo, std::nullopt, "spring").empty());

    // Replacing entry points drops their flows
    std::vector<EntryPointRecord> none;
    store_.replace_entry_points(repo, none);
    EXPECT_EQ(store_.count_entry_points(repo), 0);
    EXPECT_FALSE(store_.get_flow(repo, ep).has_value());
    EXPECT_THROW(store_.get_entry_point(repo, ep), NotFound);
}
