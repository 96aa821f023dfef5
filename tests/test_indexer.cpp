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
#include "cartograph/hash.hpp"
#include "cartograph/indexer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace cartograph;
using namespace cartograph::test_support;

namespace {

class IndexerTest : public ::testing::Test {
protected:
    IndexerTest() : store_(ws_.config.database_path) { store_.migrate(); }

    RowId add_repository() { return store_.insert_repository("fixture", ws_.sources.path().string()).id; }

    IndexResult index(RowId repo_id) {
        Indexer indexer(store_, ws_.config);
        return indexer.index_repository(repo_id);
    }

    Workspace ws_;
    GraphStore store_;
};

} // namespace

// ============ Discovery ============

TEST_F(IndexerTest, DiscoverySkipsIgnoredAndUnsupportedFiles) {
    ws_.sources.write("app/main.py", "x = 1\n");
    ws_.sources.write("node_modules/lib/index.js", "module.exports = {}\n");
    ws_.sources.write("generated/Api.java", "class Api {}\n");
    ws_.sources.write("README.md", "# shop\n");
    ws_.sources.write("big/Huge.kt", std::string(2048, 'a'));
    ws_.config.ignore_patterns = {"generated"};
    ws_.config.max_file_size_bytes = 1024;

    ChangeDetector detector(ws_.config);
    auto files = detector.discover_files(ws_.sources.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].relative_path, "app/main.py");
    EXPECT_EQ(files[0].language, Language::Python);
}

// ============ Indexing ============

TEST_F(IndexerTest, IndexesPythonRepository) {
    write_python_shop(ws_.sources);
    RowId repo = add_repository();

    IndexResult result = index(repo);
    EXPECT_EQ(result.status, RepositoryStatus::Completed);
    EXPECT_EQ(result.files_total, 3);
    EXPECT_EQ(result.files_parsed, 3);
    EXPECT_EQ(result.files_failed, 0);
    EXPECT_GT(result.symbols_written, 0);

    RepositoryRecord stored = store_.get_repository(repo);
    EXPECT_EQ(stored.status, RepositoryStatus::Completed);
    EXPECT_EQ(stored.languages, std::vector<std::string>{"python"});

    auto create = find_symbol(store_, repo, "app.api.create_order");
    auto process = find_symbol(store_, repo, "app.service.process");
    auto validate = find_symbol(store_, repo, "app.service.validate");
    ASSERT_TRUE(create && process && validate);
    EXPECT_EQ(create->id, stable_symbol_uid(repo, "app.api.create_order"));
    EXPECT_EQ(create->file_path, "app/api.py");
    EXPECT_EQ(create->parent_qualified_name, "app.api");

    // Imported function across files
    auto call = find_edge(store_, create->id, "process", ReferenceType::Call);
    ASSERT_TRUE(call.has_value());
    EXPECT_FALSE(call->is_external);
    EXPECT_EQ(call->target_symbol_id.value_or(INVALID_UID), process->id);
    EXPECT_EQ(call->argument_hint, "new");

    // Same-module function
    auto local = find_edge(store_, process->id, "validate", ReferenceType::Call);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->target_symbol_id.value_or(INVALID_UID), validate->id);

    // Unknown receiver stays external with its name
    auto logged = find_edge(store_, process->id, "info", ReferenceType::Call);
    ASSERT_TRUE(logged.has_value());
    EXPECT_TRUE(logged->is_external);

    // Local argument identifiers leave no edge
    EXPECT_FALSE(find_edge(store_, process->id, "order", ReferenceType::Usage).has_value());

    auto import_sym = find_symbol(store_, repo, "app.api:app.service.process");
    ASSERT_TRUE(import_sym.has_value());
    EXPECT_EQ(import_sym->kind, SymbolKind::Import);
    auto import_edge = find_edge(store_, import_sym->id, "process", ReferenceType::Import);
    ASSERT_TRUE(import_edge.has_value());
    EXPECT_EQ(import_edge->target_symbol_id.value_or(INVALID_UID), process->id);
}

TEST_F(IndexerTest, ResolvesConstructorInjectedArgument) {
    write_kotlin_routes(ws_.sources);
    RowId repo = add_repository();
    index(repo);

    auto configure = find_symbol(store_, repo, "a.Routes.Routes.configure");
    auto processor = find_symbol(store_, repo, "b.FraudProcessor.FraudProcessor");
    ASSERT_TRUE(configure && processor);
    EXPECT_EQ(processor->kind, SymbolKind::Class);

    // Framework DSL call has no repository target
    auto process = find_edge(store_, configure->id, "process", ReferenceType::Call);
    ASSERT_TRUE(process.has_value());
    EXPECT_TRUE(process->is_external);

    auto usage = find_edge(store_, configure->id, "fraudProcessor", ReferenceType::Usage);
    ASSERT_TRUE(usage.has_value());
    EXPECT_FALSE(usage->is_external);
    EXPECT_EQ(usage->target_symbol_id.value_or(INVALID_UID), processor->id);

    auto routes = find_symbol(store_, repo, "a.Routes.Routes");
    ASSERT_TRUE(routes.has_value());
    auto member = find_edge(store_, routes->id, "configure", ReferenceType::Member);
    ASSERT_TRUE(member.has_value());
    EXPECT_EQ(member->target_symbol_id.value_or(INVALID_UID), configure->id);
    auto base = find_edge(store_, routes->id, "RouteBuilder", ReferenceType::Inheritance);
    ASSERT_TRUE(base.has_value());
    EXPECT_TRUE(base->is_external);
}

// ============ Incremental reparse ============

TEST_F(IndexerTest, UnchangedReparseWritesNothing) {
    write_python_shop(ws_.sources);
    RowId repo = add_repository();
    index(repo);
    size_t symbols = store_.repository_symbols(repo).size();

    IndexResult again = index(repo);
    EXPECT_EQ(again.files_unchanged, 3);
    EXPECT_EQ(again.files_reparsed, 0);
    EXPECT_EQ(again.graph_writes, 0);
    EXPECT_EQ(store_.repository_symbols(repo).size(), symbols);
}

TEST_F(IndexerTest, EdgesToRemovedSymbolsBecomeExternalThenRebind) {
    write_python_shop(ws_.sources);
    RowId repo = add_repository();
    index(repo);
    SymbolUID create = stable_symbol_uid(repo, "app.api.create_order");
    SymbolUID process = stable_symbol_uid(repo, "app.service.process");

    ws_.sources.write("app/service.py", "def validate(order):\n    return True\n");
    IndexResult edited = index(repo);
    EXPECT_EQ(edited.files_reparsed, 1);
    EXPECT_EQ(edited.files_unchanged, 2);
    EXPECT_FALSE(find_symbol(store_, repo, "app.service.process").has_value());

    auto dangling = find_edge(store_, create, "process", ReferenceType::Call);
    ASSERT_TRUE(dangling.has_value());
    EXPECT_TRUE(dangling->is_external);
    EXPECT_EQ(dangling->target_path, "app.service.process");

    ws_.sources.write("app/service.py", SHOP_SERVICE_PY);
    IndexResult restored = index(repo);
    EXPECT_GE(restored.references_rebound, 1);

    auto rebound = find_edge(store_, create, "process", ReferenceType::Call);
    ASSERT_TRUE(rebound.has_value());
    EXPECT_FALSE(rebound->is_external);
    EXPECT_EQ(rebound->target_symbol_id.value_or(INVALID_UID), process);
}

TEST_F(IndexerTest, ReadersSeeEachRewrittenFileWhole) {
    ws_.sources.write("a.py", "def alpha_one():\n    return 1\n");
    ws_.sources.write("b.py", "def beta():\n    return 1\n");
    ws_.sources.write("c.py", "from b import beta\n\n\ndef gamma():\n    return beta()\n");
    RowId repo = add_repository();
    index(repo);
    SymbolUID gamma = stable_symbol_uid(repo, "c.gamma");
    ASSERT_TRUE(find_edge(store_, gamma, "beta", ReferenceType::Call).has_value());

    ws_.sources.write("a.py", "def alpha_two():\n    return 2\n");
    ws_.sources.write("b.py", "def beta():\n    return 2\n");
    ws_.config.max_files_per_batch = 1;

    // Second connection, as a concurrent reader would have
    GraphStore reader(ws_.config.database_path);
    int checks = 0;
    auto check = [&] {
        ++checks;
        std::set<std::string> names;
        for (const auto &sym : reader.repository_symbols(repo)) names.insert(sym.qualified_name);
        EXPECT_EQ(names.count("a.alpha_one") + names.count("a.alpha_two"), 1u);
        EXPECT_EQ(names.count("b.beta"), 1u);

        auto edge = find_edge(reader, gamma, "beta", ReferenceType::Call);
        ASSERT_TRUE(edge.has_value());
        EXPECT_FALSE(edge->is_external);
        ASSERT_TRUE(edge->target_symbol_id.has_value());
        EXPECT_TRUE(reader.get_symbol(repo, *edge->target_symbol_id).has_value());
    };

    Indexer indexer(store_, ws_.config);
    IndexResult result = indexer.index_repository(repo, check);
    EXPECT_EQ(result.files_reparsed, 2);
    EXPECT_GE(checks, 2);
    check();
    EXPECT_TRUE(find_symbol(reader, repo, "a.alpha_two").has_value());
}

TEST_F(IndexerTest, DeletedFilesLoseTheirGraph) {
    write_python_shop(ws_.sources);
    RowId repo = add_repository();
    index(repo);
    ASSERT_TRUE(find_symbol(store_, repo, "tests.test_api.fake_orders").has_value());

    ws_.sources.remove("tests/test_api.py");
    IndexResult result = index(repo);
    EXPECT_EQ(result.files_deleted, 1);
    EXPECT_EQ(result.files_total, 2);
    EXPECT_FALSE(find_symbol(store_, repo, "tests.test_api.fake_orders").has_value());
    EXPECT_EQ(store_.list_files(repo).size(), 2u);
    EXPECT_EQ(store_.list_files(repo, true).size(), 3u);
}

TEST_F(IndexerTest, CollidingModulePathsStayDistinct) {
    ws_.sources.write("app/util.py", "def helper():\n    return 1\n");
    ws_.sources.write("app/util.js", "function helper() {\n  return 1;\n}\n");
    RowId repo = add_repository();
    index(repo);

    std::vector<std::string> modules;
    for (const auto &file : store_.list_files(repo)) modules.push_back(file.module_path);
    ASSERT_EQ(modules.size(), 2u);
    EXPECT_NE(modules[0], modules[1]);
    EXPECT_EQ(store_.symbols_named(repo, "helper").size(), 2u);
}

// ============ Failures ============

TEST_F(IndexerTest, FewBrokenFilesLeaveRepositoryCompleted) {
    for (int i = 0; i < 100; ++i) {
        std::string path = "pkg/m" + std::to_string(i) + ".py";
        if (i % 33 == 0 && i > 0) {
            ws_.sources.write(path, std::string("x = 1\n") + '\0' + "binary");
        } else {
            ws_.sources.write(path, "def f" + std::to_string(i) + "():\n    return " + std::to_string(i) + "\n");
        }
    }
    RowId repo = add_repository();

    IndexResult result = index(repo);
    EXPECT_EQ(result.status, RepositoryStatus::Completed);
    EXPECT_EQ(result.files_total, 100);
    EXPECT_EQ(result.files_parsed, 97);
    EXPECT_EQ(result.files_failed, 3);

    int binary = 0;
    for (const auto &file : store_.list_files(repo)) {
        if (file.status == FileStatus::Failed) {
            EXPECT_EQ(file.error, "Binary content");
            ++binary;
        }
    }
    EXPECT_EQ(binary, 3);
}

TEST_F(IndexerTest, FailedFractionAboveThresholdFailsRepository) {
    ws_.config.failed_file_threshold = 0.2;
    ws_.sources.write("ok.py", "def ok():\n    return 1\n");
    ws_.sources.write("bad1.py", std::string("a") + '\0');
    ws_.sources.write("bad2.py", std::string("b") + '\0');
    RowId repo = add_repository();

    IndexResult result = index(repo);
    EXPECT_EQ(result.status, RepositoryStatus::Failed);
    RepositoryRecord stored = store_.get_repository(repo);
    EXPECT_EQ(stored.status, RepositoryStatus::Failed);
    EXPECT_NE(stored.error_message.find("2 of 3"), std::string::npos);
}

TEST_F(IndexerTest, SyntaxErrorsAboveRatioFailTheFile) {
    ws_.config.max_error_ratio = 0.05;
    ws_.sources.write("good.py", "def ok():\n    return 1\n");
    ws_.sources.write("broken.py", ")))) ((( ]]] def def class :::: @@@ }}}\n");
    RowId repo = add_repository();

    index(repo);
    for (const auto &file : store_.list_files(repo)) {
        if (file.relative_path == "broken.py") {
            EXPECT_EQ(file.status, FileStatus::Failed);
            EXPECT_NE(file.error.find("Syntax errors"), std::string::npos);
        } else {
            EXPECT_EQ(file.status, FileStatus::Parsed);
        }
    }
}

TEST_F(IndexerTest, MissingRootIsNotFound) {
    RowId repo = store_.insert_repository("ghost", (ws_.data.path() / "missing").string()).id;
    EXPECT_THROW(index(repo), NotFound);
    EXPECT_THROW(index(repo + 1), NotFound);
}
