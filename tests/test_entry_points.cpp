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

#include "cartograph/entry_points.hpp"
#include "cartograph/errors.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <tuple>

using namespace cartograph;
using namespace cartograph::test_support;

namespace {

// Rejects everything, recording what it was shown
class RejectingCollaborator : public Collaborator {
public:
    std::vector<EntryPointVerdict> confirm_entry_points(const RepositoryContext &repo, EntryPointType,
                                                        const std::vector<CandidateEvidence> &batch) override {
        frameworks = repo.frameworks;
        batches++;
        candidates += batch.size();
        return {};
    }

    FlowDraft describe_flow(const FlowRequest &) override { return {}; }

    std::vector<std::string> frameworks;
    int batches = 0;
    size_t candidates = 0;
};

class EntryPointTest : public ::testing::Test {
protected:
    EntryPointTest() : store_(ws_.config.database_path) { store_.migrate(); }

    EntryPointDetector detector(std::shared_ptr<Collaborator> collaborator = std::make_shared<HeuristicCollaborator>()) {
        return EntryPointDetector(store_, ws_.config, std::move(collaborator));
    }

    static std::vector<std::string> names(const std::vector<EntryPointRecord> &eps) {
        std::vector<std::string> out;
        for (const auto &ep : eps) out.push_back(ep.name);
        std::sort(out.begin(), out.end());
        return out;
    }

    Workspace ws_;
    GraphStore store_;
};

} // namespace

// ============ Helpers ============

TEST(EntryPointHelpers, AnnotationNames) {
    EXPECT_EQ(annotation_name("@GetMapping(\"/a\")"), "GetMapping");
    EXPECT_EQ(annotation_name("#[get(\"/\")]"), "get");
    EXPECT_EQ(annotation_name("@app.route('/')"), "app.route");
    EXPECT_EQ(annotation_name("@field:Inject"), "Inject");
}

TEST(EntryPointHelpers, FirstStringLiteral) {
    EXPECT_EQ(first_string_literal("@PostMapping(\"/orders\")"), "/orders");
    EXPECT_EQ(first_string_literal("@app.route('/health')"), "/health");
    EXPECT_EQ(first_string_literal("@Scheduled(fixedRate = 5000)"), "");
}

TEST(EntryPointHelpers, TestPaths) {
    EXPECT_TRUE(is_test_path("tests/test_api.py"));
    EXPECT_TRUE(is_test_path("src/test/java/OrderControllerTest.java"));
    EXPECT_TRUE(is_test_path("web/routes.spec.js"));
    EXPECT_FALSE(is_test_path("app/api.py"));
    EXPECT_FALSE(is_test_path("src/main/kotlin/Routes.kt"));
}

TEST(EntryPointHelpers, FrameworksFromImports) {
    EXPECT_EQ(frameworks_for_import(Language::Python, "flask.Flask"), std::set<std::string>{"flask"});
    EXPECT_EQ(frameworks_for_import(Language::Kotlin, "org.apache.camel.builder.RouteBuilder"),
              std::set<std::string>{"apache-camel"});
    EXPECT_TRUE(frameworks_for_import(Language::Python, "org.apache.camel").empty());
    EXPECT_TRUE(frameworks_for_import(Language::Unknown, "flask").empty());
}

TEST(EntryPointHelpers, TimeoutLeavesSlowCallRunning) {
    auto slow = [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return 1;
    };
    EXPECT_THROW(call_with_timeout<int>(slow, std::chrono::milliseconds(10), "slow"), CollaboratorTimeout);
    EXPECT_EQ(call_with_timeout<int>([] { return 7; }, std::chrono::milliseconds(1000), "fast"), 7);
}

// ============ Detection ============

TEST_F(EntryPointTest, DetectsFlaskRoutesOutsideTests) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);

    DetectionResult result = detector().detect(repo, false);
    EXPECT_FALSE(result.reused_existing);
    EXPECT_EQ(result.candidates_detected, 2);
    EXPECT_EQ(result.entry_points_confirmed, 2);
    EXPECT_EQ(result.frameworks_detected, std::vector<std::string>{"flask"});
    EXPECT_EQ(result.by_type["HTTP"], 2);
    EXPECT_EQ(result.by_framework["flask"], 2);

    auto eps = store_.list_entry_points(repo, std::nullopt, "");
    EXPECT_EQ(names(eps), (std::vector<std::string>{"GET /health", "POST /orders"}));
    for (const auto &ep : eps) {
        EXPECT_EQ(ep.file_path, "app/api.py");
        EXPECT_EQ(ep.framework, "flask");
        EXPECT_EQ(ep.type, EntryPointType::Http);
        EXPECT_GE(ep.confidence, HeuristicCollaborator::MIN_CONFIDENCE);
    }

    for (const auto &c : store_.list_candidates(repo)) {
        EXPECT_FALSE(is_test_path(c.file_path)) << c.file_path;
        EXPECT_EQ(c.detection_pattern, "flask_route");
        EXPECT_EQ(c.run_id, result.run_id);
    }
}

TEST_F(EntryPointTest, DetectsCamelRouteConfiguration) {
    write_kotlin_routes(ws_.sources);
    RowId repo = index_sources(store_, ws_);

    DetectionResult result = detector().detect(repo, false);
    EXPECT_EQ(result.frameworks_detected, std::vector<std::string>{"apache-camel"});

    auto eps = store_.list_entry_points(repo, EntryPointType::Event, "apache-camel");
    ASSERT_EQ(eps.size(), 1u);
    EXPECT_EQ(eps[0].qualified_name, "a.Routes.Routes.configure");
    EXPECT_EQ(eps[0].name, "Consume kafka:orders");
    EXPECT_EQ(eps[0].metadata["topic"], "kafka:orders");
    EXPECT_TRUE(store_.list_entry_points(repo, EntryPointType::Http, "").empty());
}

TEST_F(EntryPointTest, ExistingResultsAreReusedUnlessForced) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    DetectionResult first = detector().detect(repo, false);

    auto rejecting = std::make_shared<RejectingCollaborator>();
    DetectionResult reused = detector(rejecting).detect(repo, false);
    EXPECT_TRUE(reused.reused_existing);
    EXPECT_EQ(reused.entry_points_confirmed, 2);
    EXPECT_EQ(reused.run_id, first.run_id);
    EXPECT_EQ(rejecting->batches, 0);

    DetectionResult forced = detector(rejecting).detect(repo, true);
    EXPECT_FALSE(forced.reused_existing);
    EXPECT_GT(forced.run_id, first.run_id);
    EXPECT_EQ(forced.candidates_detected, 2);
    EXPECT_EQ(forced.entry_points_confirmed, 0);
    EXPECT_EQ(rejecting->candidates, 2u);
    EXPECT_EQ(rejecting->frameworks, std::vector<std::string>{"flask"});
    EXPECT_EQ(store_.count_entry_points(repo), 0);
}

TEST_F(EntryPointTest, ForcedRunsReplaceEntryPointsWithTheSameSet) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);

    using Key = std::tuple<SymbolUID, std::string, EntryPointType>;
    auto keys = [](const std::vector<EntryPointRecord> &eps) {
        std::set<Key> out;
        for (const auto &ep : eps) out.emplace(ep.symbol_id, ep.name, ep.type);
        return out;
    };

    DetectionResult first = detector().detect(repo, true);
    auto first_eps = store_.list_entry_points(repo, std::nullopt, "");
    DetectionResult second = detector().detect(repo, true);
    auto second_eps = store_.list_entry_points(repo, std::nullopt, "");

    EXPECT_EQ(keys(first_eps), keys(second_eps));
    EXPECT_EQ(store_.count_entry_points(repo), static_cast<int64_t>(first_eps.size()));
    std::set<RowId> first_ids;
    for (const auto &ep : first_eps) first_ids.insert(ep.id);
    for (const auto &ep : second_eps) EXPECT_EQ(first_ids.count(ep.id), 0u) << ep.id;

    // Earlier runs stay on record
    EXPECT_EQ(second.run_id, first.run_id + 1);
    EXPECT_EQ(store_.list_candidates(repo, first.run_id).size(), 2u);
    EXPECT_EQ(store_.list_candidates(repo, second.run_id).size(), 2u);
    for (const auto &ep : second_eps) {
        bool from_second_run = false;
        for (const auto &c : store_.list_candidates(repo)) from_second_run |= c.id == ep.candidate_id;
        EXPECT_TRUE(from_second_run) << ep.name;
    }
}

TEST_F(EntryPointTest, CandidatesAreBatchedByType) {
    write_python_shop(ws_.sources);
    RowId repo = index_sources(store_, ws_);
    ws_.config.entry_point_batch_size = 1;

    auto rejecting = std::make_shared<RejectingCollaborator>();
    detector(rejecting).detect(repo, true);
    EXPECT_EQ(rejecting->batches, 2);
}

TEST_F(EntryPointTest, UnindexedRepositoryIsRejected) {
    RowId repo = store_.insert_repository("fixture", ws_.sources.path().string()).id;
    EXPECT_THROW(detector().detect(repo, false), InvalidState);
    EXPECT_THROW(detector().detect(repo + 1, false), NotFound);
}
