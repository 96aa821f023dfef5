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

#include "cartograph/resolver.hpp"
#include <gtest/gtest.h>

using namespace cartograph;

namespace {

constexpr SymbolUID FRAUD_MODULE = 1;
constexpr SymbolUID FRAUD_CLASS = 2;
constexpr SymbolUID FRAUD_INSPECT = 3;
constexpr SymbolUID SERVICE_PROCESS = 4;
constexpr SymbolUID SERVICE_MODULE = 5;
constexpr SymbolUID SERVICE_VALIDATE = 6;
constexpr SymbolUID WORKER_RUN = 7;
constexpr SymbolUID WORKER_RUN_INT = 8;

SymbolEntry entry(SymbolUID id, const std::string &name, const std::string &qualified, const std::string &module,
                  const std::string &package, SymbolKind kind) {
    SymbolEntry e;
    e.id = id;
    e.name = name;
    e.qualified_name = qualified;
    e.module_path = module;
    e.package = package;
    e.kind = kind;
    e.file_id = 1;
    return e;
}

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_.add(entry(FRAUD_MODULE, "FraudProcessor", "b.FraudProcessor", "b.FraudProcessor", "b",
                         SymbolKind::Module));
        index_.add(entry(FRAUD_CLASS, "FraudProcessor", "b.FraudProcessor.FraudProcessor", "b.FraudProcessor", "b",
                         SymbolKind::Class));
        index_.add(entry(FRAUD_INSPECT, "inspect", "b.FraudProcessor.FraudProcessor.inspect", "b.FraudProcessor",
                         "b", SymbolKind::Method));
        index_.add(entry(SERVICE_PROCESS, "process", "app.service.process", "app.service", "app",
                         SymbolKind::Function));
        index_.add(entry(SERVICE_MODULE, "service", "app.service", "app.service", "app", SymbolKind::Module));
        index_.add(entry(SERVICE_VALIDATE, "validate", "app.service.validate", "app.service", "app",
                         SymbolKind::Function));
        index_.add(entry(WORKER_RUN, "run", "jobs.worker.Worker.run", "jobs.worker", "jobs", SymbolKind::Method));
        index_.add(entry(WORKER_RUN_INT, "run", "jobs.worker.Worker.run(int)", "jobs.worker", "jobs",
                         SymbolKind::Method));
    }

    static FileScope kotlin_routes_scope() {
        FileScope scope;
        scope.module_path = "a.Routes";
        scope.package = "a";
        scope.imports["FraudProcessor"] = "b.FraudProcessor";
        scope.imports["RouteBuilder"] = "org.apache.camel.builder.RouteBuilder";
        return scope;
    }

    static CallSite site(ReferenceType type, const std::string &name) {
        CallSite s;
        s.type = type;
        s.name = name;
        s.callee = name;
        return s;
    }

    SymbolIndex index_;
};

} // namespace

// ============ SymbolIndex ============

TEST(SymbolIndexTest, BaseQualifiedStripsOverloadSuffixes) {
    EXPECT_EQ(SymbolIndex::base_qualified("a.B.run(int, String)"), "a.B.run");
    EXPECT_EQ(SymbolIndex::base_qualified("a.B.run#2"), "a.B.run");
    EXPECT_EQ(SymbolIndex::base_qualified("a.B.run"), "a.B.run");
}

TEST(SymbolIndexTest, ModuleMatchesWholeSegmentsOnly) {
    EXPECT_TRUE(SymbolIndex::module_matches("src.a.B", "a.B"));
    EXPECT_TRUE(SymbolIndex::module_matches("a.B", "a.B"));
    EXPECT_FALSE(SymbolIndex::module_matches("src.xa.B", "a.B"));
    EXPECT_FALSE(SymbolIndex::module_matches("a.B", ""));
}

TEST(SymbolIndexTest, ImportSymbolsAreNotIndexed) {
    SymbolIndex index;
    index.add(entry(1, "process", "app.api:app.service.process", "app.api", "app", SymbolKind::Import));
    EXPECT_EQ(index.size(), 0u);
    EXPECT_TRUE(index.find_by_name("process").empty());
}

TEST_F(ResolverTest, MatchTopPrefersDefinitionsOverModules) {
    auto ids = index_.match_top("b.FraudProcessor");
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], FRAUD_CLASS);
}

// ============ Strategy chain ============

TEST_F(ResolverTest, ScopeResolvesTypedReceiverThroughImports) {
    Resolver resolver(index_);
    CallSite call = site(ReferenceType::Call, "inspect");
    call.receiver = "fraudProcessor";
    call.receiver_type = "FraudProcessor";

    auto out = resolver.resolve(kotlin_routes_scope(), call);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].target.has_value());
    EXPECT_EQ(*out[0].target, FRAUD_INSPECT);
    EXPECT_EQ(out[0].target_path, "b.FraudProcessor");
    EXPECT_FALSE(out[0].is_ambiguous);
}

TEST_F(ResolverTest, ArgumentUsageResolvesToDeclaredType) {
    Resolver resolver(index_);
    CallSite usage = site(ReferenceType::Usage, "fraudProcessor");
    usage.receiver_type = "FraudProcessor";

    auto out = resolver.resolve(kotlin_routes_scope(), usage);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].target.has_value());
    EXPECT_EQ(*out[0].target, FRAUD_CLASS);
}

TEST_F(ResolverTest, UntypedReceiverStaysExternal) {
    // from("kafka:orders").process(...) must not bind to an unrelated app.service.process
    Resolver resolver(index_);
    CallSite call = site(ReferenceType::Call, "process");
    call.receiver = "from";

    auto out = resolver.resolve(kotlin_routes_scope(), call);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].is_external());
    EXPECT_EQ(out[0].target_name, "process");
}

TEST_F(ResolverTest, ImportedFunctionResolves) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "app.api";
    scope.package = "app";
    scope.imports["process"] = "app.service.process";

    auto out = resolver.resolve(scope, site(ReferenceType::Call, "process"));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].target.has_value());
    EXPECT_EQ(*out[0].target, SERVICE_PROCESS);
    EXPECT_EQ(out[0].target_path, "app.service.process");
}

TEST_F(ResolverTest, SameModuleFunctionResolves) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "app.service";
    scope.package = "app";

    auto out = resolver.resolve(scope, site(ReferenceType::Call, "validate"));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].target.has_value());
    EXPECT_EQ(*out[0].target, SERVICE_VALIDATE);
}

TEST_F(ResolverTest, SiblingCallInsideType) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "b.FraudProcessor";
    scope.package = "b";
    CallSite call = site(ReferenceType::Call, "inspect");
    call.enclosing_type = "b.FraudProcessor.FraudProcessor";

    auto out = resolver.resolve(scope, call);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].target.value_or(INVALID_UID), FRAUD_INSPECT);
}

TEST_F(ResolverTest, OverloadsAreAmbiguous) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "jobs.worker";
    scope.package = "jobs";
    CallSite call = site(ReferenceType::Call, "run");
    call.enclosing_type = "jobs.worker.Worker";

    auto out = resolver.resolve(scope, call);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out[0].is_ambiguous);
    EXPECT_TRUE(out[1].is_ambiguous);
}

TEST_F(ResolverTest, UnknownUsageIsDropped) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "app.api";
    EXPECT_TRUE(resolver.resolve(scope, site(ReferenceType::Usage, "order")).empty());
}

TEST_F(ResolverTest, KnownTargetsBindExactly) {
    Resolver resolver(index_);
    FileScope scope;
    scope.module_path = "b.FraudProcessor";
    CallSite member = site(ReferenceType::Member, "inspect");
    member.target_qualified = "b.FraudProcessor.FraudProcessor.inspect";

    auto out = resolver.resolve(scope, member);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].target.value_or(INVALID_UID), FRAUD_INSPECT);
}

TEST_F(ResolverTest, ImportSitesCarryTheirPath) {
    Resolver resolver(index_);
    FileScope scope = kotlin_routes_scope();

    CallSite internal = site(ReferenceType::Import, "FraudProcessor");
    internal.import_path = "b.FraudProcessor";
    auto bound = resolver.resolve(scope, internal);
    ASSERT_EQ(bound.size(), 1u);
    EXPECT_EQ(bound[0].target.value_or(INVALID_UID), FRAUD_CLASS);

    CallSite external = site(ReferenceType::Import, "RouteBuilder");
    external.import_path = "org.apache.camel.builder.RouteBuilder";
    auto unbound = resolver.resolve(scope, external);
    ASSERT_EQ(unbound.size(), 1u);
    EXPECT_TRUE(unbound[0].is_external());
    EXPECT_EQ(unbound[0].target_path, "org.apache.camel.builder.RouteBuilder");
}

// ============ Rebinding ============

TEST_F(ResolverTest, RebindFromStoredHint) {
    Resolver resolver(index_);
    EXPECT_EQ(resolver.rebind("process", "app.service.process"), std::vector<SymbolUID>{SERVICE_PROCESS});
    EXPECT_EQ(resolver.rebind("inspect", "b.FraudProcessor"), std::vector<SymbolUID>{FRAUD_INSPECT});
    EXPECT_TRUE(resolver.rebind("process", "").empty());
    EXPECT_TRUE(resolver.rebind("missing", "app.service").empty());
}

TEST(FileScopeTest, BuiltFromAnalysisImports) {
    FileAnalysis analysis;
    analysis.module_path = "app.views";
    analysis.package = "app";
    analysis.imports.push_back({"run", "app.service.process", false});
    analysis.imports.push_back({"*", "app.models", true});

    FileScope scope = FileScope::from(analysis);
    EXPECT_EQ(scope.import_path("run"), "app.service.process");
    EXPECT_EQ(scope.import_path("process"), "");
    ASSERT_EQ(scope.wildcards.size(), 1u);
    EXPECT_EQ(scope.wildcards[0], "app.models");
}
