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
#include "cartograph/query.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace cartograph;
using namespace cartograph::test_support;

namespace {

class QueryTest : public ::testing::Test {
protected:
    QueryTest() : store_(ws_.config.database_path) { store_.migrate(); }

    SymbolUID id_of(RowId repo, const std::string &qualified) {
        auto sym = find_symbol(store_, repo, qualified);
        EXPECT_TRUE(sym.has_value()) << qualified;
        return sym ? sym->id : INVALID_UID;
    }

    static std::vector<std::string> names(const Traversal &t) {
        std::vector<std::string> out;
        for (const auto &node : t.nodes) out.push_back(node.symbol ? node.symbol->qualified_name : node.target_name);
        return out;
    }

    Workspace ws_;
    GraphStore store_;
};

} // namespace

TEST_F(QueryTest, DownstreamRespectsDepth) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);
    SymbolUID create = id_of(repo, "app.api.create_order");

    Traversal one = query.downstream(repo, create, 1);
    EXPECT_EQ(names(one), std::vector<std::string>{"app.service.process"});
    EXPECT_EQ(one.nodes[0].depth, 1);
    EXPECT_EQ(one.nodes[0].via, ReferenceType::Call);

    Traversal two = query.downstream(repo, create, 2);
    ASSERT_EQ(two.nodes.size(), 3u);
    EXPECT_EQ(two.nodes[1].symbol->qualified_name, "app.service.validate");
    EXPECT_EQ(two.nodes[1].depth, 2);
    // External callees are leaves, after internal nodes of the same depth
    EXPECT_TRUE(two.nodes[2].is_external());
    EXPECT_EQ(two.nodes[2].target_name, "info");

    EXPECT_TRUE(query.downstream(repo, create, 0).nodes.empty());
}

TEST_F(QueryTest, UpstreamFindsTransitiveCallers) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);

    Traversal callers = query.upstream(repo, id_of(repo, "app.service.validate"));
    EXPECT_EQ(callers.max_depth, ws_.config.default_max_depth);
    ASSERT_FALSE(callers.nodes.empty());
    EXPECT_EQ(callers.nodes[0].symbol->qualified_name, "app.service.process");
    EXPECT_EQ(callers.nodes[0].depth, 1);

    auto found = std::find_if(callers.nodes.begin(), callers.nodes.end(), [](const GraphNode &n) {
        return n.symbol && n.symbol->qualified_name == "app.api.create_order";
    });
    ASSERT_NE(found, callers.nodes.end());
    EXPECT_EQ(found->depth, 2);

    json j = callers.to_json();
    EXPECT_EQ(j["direction"], "upstream");
    EXPECT_EQ(j["levels"][0]["depth"], 1);
}

TEST_F(QueryTest, CyclesAreVisitedOnce) {
    ws_.sources.write("loop.py", "def ping():\n    pong()\n\n\ndef pong():\n    ping()\n");
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);

    Traversal t = query.downstream(repo, id_of(repo, "loop.ping"), 10);
    EXPECT_EQ(names(t), std::vector<std::string>{"loop.pong"});

    Traversal up = query.upstream(repo, id_of(repo, "loop.ping"), 10);
    EXPECT_EQ(names(up), std::vector<std::string>{"loop.pong"});
}

TEST_F(QueryTest, DepthValidation) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);
    SymbolUID create = id_of(repo, "app.api.create_order");

    EXPECT_THROW(query.downstream(repo, create, -1), InvalidArgument);
    EXPECT_EQ(query.downstream(repo, create, 1000).max_depth, ws_.config.max_depth_cap);
    EXPECT_EQ(query.effective_depth(std::nullopt), ws_.config.default_max_depth);
    EXPECT_THROW(query.downstream(repo, 12345, 1), NotFound);
    EXPECT_THROW(query.upstream(repo + 1, create, 1), NotFound);
}

TEST_F(QueryTest, LookupByNameAndPath) {
    ws_.sources.write("api/orders/handlers.py", "def handle(event):\n    return audit(event)\n\n\n"
                                                "def audit(event):\n    return event\n");
    ws_.sources.write("jobs/handlers.py", "def handle(job):\n    return job\n");
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);

    LookupResult all = query.lookup_by_qualified_path(repo, "", "handle");
    EXPECT_EQ(all.total_matches(), 2u);

    LookupResult scoped = query.lookup_by_qualified_path(repo, "api.orders", "handle", 1);
    ASSERT_EQ(scoped.total_matches(), 1u);
    EXPECT_EQ(scoped.matches[0].symbol.file_path, "api/orders/handlers.py");
    EXPECT_EQ(names(scoped.matches[0].downstream), std::vector<std::string>{"api.orders.handlers.audit"});

    LookupResult by_path = query.lookup_by_qualified_path(repo, "jobs/", "handle", 0);
    ASSERT_EQ(by_path.total_matches(), 1u);
    EXPECT_TRUE(by_path.matches[0].downstream.nodes.empty());

    EXPECT_EQ(query.lookup_by_qualified_path(repo, "", "missing").total_matches(), 0u);
    EXPECT_THROW(query.lookup_by_qualified_path(repo, "", ""), InvalidArgument);

    json j = all.to_json();
    EXPECT_EQ(j["total_matches"], 2);
}

TEST_F(QueryTest, UpstreamSkipsCallersWithoutSymbol) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    QueryEngine query(store_, ws_.config);
    auto validate = find_symbol(store_, repo, "app.service.validate");
    auto health = find_symbol(store_, repo, "app.api.health");
    ASSERT_TRUE(validate && health);

    // Edges on both sides of a caller row that no longer exists
    const SymbolUID missing = 777;
    ReferenceRecord into;
    into.repo_id = repo;
    into.file_id = validate->file_id;
    into.source_symbol_id = missing;
    into.target_symbol_id = validate->id;
    into.target_name = "validate";
    into.type = ReferenceType::Call;
    into.is_external = false;
    ReferenceRecord onward = into;
    onward.file_id = health->file_id;
    onward.source_symbol_id = health->id;
    onward.target_symbol_id = missing;
    onward.target_name = "missing";

    store_.db().exec("PRAGMA foreign_keys=OFF;");
    store_.insert_references({into, onward});
    store_.db().exec("PRAGMA foreign_keys=ON;");

    Traversal callers = query.upstream(repo, validate->id, 5);
    ASSERT_FALSE(callers.nodes.empty());
    for (const auto &node : callers.nodes) {
        ASSERT_TRUE(node.symbol.has_value());
        EXPECT_NE(node.symbol->qualified_name, "app.api.health");
    }
}
