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

#include "cartograph/parser.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace cartograph;

namespace {

FileAnalysis analyze(Language lang, const std::string &source, const std::string &module_path) {
    auto adapter = create_adapter(lang);
    EXPECT_NE(adapter, nullptr);
    LanguageParser parser(adapter->grammar());
    EXPECT_TRUE(parser.parse(source));
    return adapter->analyze(parser, module_path);
}

const ParsedSymbol *symbol(const FileAnalysis &analysis, const std::string &qualified) {
    for (const auto &sym : analysis.symbols) {
        if (sym.qualified_name == qualified) return &sym;
    }
    return nullptr;
}

std::vector<const CallSite *> sites(const FileAnalysis &analysis, ReferenceType type, const std::string &name) {
    std::vector<const CallSite *> out;
    for (const auto &site : analysis.calls) {
        if (site.type == type && site.name == name) out.push_back(&site);
    }
    return out;
}

} // namespace

// ============ Helpers ============

TEST(ParserHelpersTest, ModulePathFromRelativePath) {
    EXPECT_EQ(module_path_for("src/a/B.kt"), "src.a.B");
    EXPECT_EQ(module_path_for("app/views.py"), "app.views");
    EXPECT_EQ(module_path_for("main.rs"), "main");
}

TEST(ParserHelpersTest, SplitCalleeDropsArgumentsAndNullSafety) {
    EXPECT_EQ(split_callee("this.repo?.save"), (std::vector<std::string>{"this", "repo", "save"}));
    EXPECT_EQ(split_callee("Foo::bar"), (std::vector<std::string>{"Foo", "bar"}));
    EXPECT_EQ(split_callee("from(\"kafka:orders\")\n    .process"), (std::vector<std::string>{"from", "process"}));
    EXPECT_EQ(split_callee("List<String>.of"), (std::vector<std::string>{"List", "of"}));
}

TEST(ParserHelpersTest, ParamSignature) {
    EXPECT_EQ(build_param_signature({}), "()");
    EXPECT_EQ(build_param_signature({"int", " String "}), "(int, String)");
}

TEST(ParserHelpersTest, UnknownLanguageHasNoAdapter) { EXPECT_EQ(create_adapter(Language::Unknown), nullptr); }

// ============ Python ============

TEST(PythonAdapterTest, ExtractsModuleClassesAndMethods) {
    const std::string source = R"(class OrderService(BaseService):
    def place(self, order: Order) -> bool:
        return self.validate(order)

    def validate(self, order):
        return True

def helper():
    pass
)";
    FileAnalysis analysis = analyze(Language::Python, source, "app.orders");

    const ParsedSymbol *module = symbol(analysis, "app.orders");
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(module->kind, SymbolKind::Module);

    const ParsedSymbol *cls = symbol(analysis, "app.orders.OrderService");
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->kind, SymbolKind::Class);
    EXPECT_EQ(cls->metadata["bases"][0], "BaseService");

    const ParsedSymbol *place = symbol(analysis, "app.orders.OrderService.place");
    ASSERT_NE(place, nullptr);
    EXPECT_EQ(place->kind, SymbolKind::Method);
    EXPECT_EQ(place->parent_qualified_name, "app.orders.OrderService");
    EXPECT_EQ(place->start_line, 2u);
    EXPECT_EQ(place->metadata["return_type"], "bool");

    const ParsedSymbol *helper = symbol(analysis, "app.orders.helper");
    ASSERT_NE(helper, nullptr);
    EXPECT_EQ(helper->kind, SymbolKind::Function);
    EXPECT_EQ(helper->parent_qualified_name, "app.orders");
}

TEST(PythonAdapterTest, SelfCallIsSiblingCallWithoutReceiver) {
    const std::string source = R"(class OrderService:
    def place(self, order):
        return self.validate(order)

    def validate(self, order):
        return True
)";
    FileAnalysis analysis = analyze(Language::Python, source, "app.orders");
    auto calls = sites(analysis, ReferenceType::Call, "validate");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]->source, "app.orders.OrderService.place");
    EXPECT_TRUE(calls[0]->receiver.empty());
    EXPECT_EQ(calls[0]->enclosing_type, "app.orders.OrderService");
}

TEST(PythonAdapterTest, ImportsBecomeImportSymbolsAndScope) {
    const std::string source = R"(import os
from app.service import process as run
from app.models import *
)";
    FileAnalysis analysis = analyze(Language::Python, source, "app.views");
    ASSERT_EQ(analysis.imports.size(), 3u);

    auto it = std::find_if(analysis.imports.begin(), analysis.imports.end(),
                           [](const ImportEntry &e) { return e.alias == "run"; });
    ASSERT_NE(it, analysis.imports.end());
    EXPECT_EQ(it->path, "app.service.process");

    const ParsedSymbol *import_sym = symbol(analysis, "app.views:app.service.process");
    ASSERT_NE(import_sym, nullptr);
    EXPECT_EQ(import_sym->kind, SymbolKind::Import);
    EXPECT_EQ(import_sym->metadata["import_path"], "app.service.process");
    EXPECT_EQ(import_sym->metadata["alias"], "run");

    const ParsedSymbol *wildcard = symbol(analysis, "app.views:app.models.*");
    ASSERT_NE(wildcard, nullptr);
    EXPECT_TRUE(wildcard->metadata["wildcard"].get<bool>());
}

TEST(PythonAdapterTest, DecoratorsAndArgumentHints) {
    const std::string source = R"(@app.route("/orders", methods=["POST"])
def create_order():
    log.info("creating order")
)";
    FileAnalysis analysis = analyze(Language::Python, source, "app.api");
    const ParsedSymbol *fn = symbol(analysis, "app.api.create_order");
    ASSERT_NE(fn, nullptr);
    ASSERT_TRUE(fn->metadata.contains("decorators"));
    EXPECT_EQ(fn->metadata["decorators"][0], "@app.route(\"/orders\", methods=[\"POST\"])");

    auto info = sites(analysis, ReferenceType::Call, "info");
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0]->receiver, "log");
    EXPECT_EQ(info[0]->argument_hint, "creating order");
}

TEST(PythonAdapterTest, OverloadedNamesStayUnique) {
    const std::string source = R"(def handle(a):
    pass

def handle(a, b):
    pass
)";
    FileAnalysis analysis = analyze(Language::Python, source, "m");
    std::vector<std::string> names;
    for (const auto &sym : analysis.symbols) {
        if (sym.name == "handle") names.push_back(sym.qualified_name);
    }
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "m.handle");
    EXPECT_NE(names[1], names[0]);
}

// ============ Kotlin ============

TEST(KotlinAdapterTest, CamelRouteCallsAndArgumentUsages) {
    const std::string source = R"(package a

import b.FraudProcessor
import org.apache.camel.builder.RouteBuilder

class Routes(private val fraudProcessor: FraudProcessor) : RouteBuilder() {
    override fun configure() {
        from("kafka:orders")
            .process(fraudProcessor)
            .to("log:done")
    }
}
)";
    FileAnalysis analysis = analyze(Language::Kotlin, source, "a.Routes");
    EXPECT_EQ(analysis.package, "a");

    const ParsedSymbol *cls = symbol(analysis, "a.Routes.Routes");
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->kind, SymbolKind::Class);

    const ParsedSymbol *configure = symbol(analysis, "a.Routes.Routes.configure");
    ASSERT_NE(configure, nullptr);
    EXPECT_EQ(configure->kind, SymbolKind::Method);

    auto process = sites(analysis, ReferenceType::Call, "process");
    ASSERT_FALSE(process.empty());
    EXPECT_EQ(process[0]->source, "a.Routes.Routes.configure");

    auto from = sites(analysis, ReferenceType::Call, "from");
    ASSERT_FALSE(from.empty());
    EXPECT_EQ(from[0]->argument_hint, "kafka:orders");

    auto usage = sites(analysis, ReferenceType::Usage, "fraudProcessor");
    ASSERT_EQ(usage.size(), 1u);
    EXPECT_EQ(usage[0]->source, "a.Routes.Routes.configure");
    EXPECT_EQ(usage[0]->receiver_type, "FraudProcessor");
}

// ============ Java ============

TEST(JavaAdapterTest, AnnotationsAndMembers) {
    const std::string source = R"(package com.acme;

@RestController
public class OrderController {
    @PostMapping("/orders")
    public String create(String body) {
        return service.place(body);
    }
}
)";
    FileAnalysis analysis = analyze(Language::Java, source, "com.acme.OrderController");
    EXPECT_EQ(analysis.package, "com.acme");

    const ParsedSymbol *cls = symbol(analysis, "com.acme.OrderController.OrderController");
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->metadata["annotations"][0], "@RestController");

    const ParsedSymbol *create = symbol(analysis, "com.acme.OrderController.OrderController.create");
    ASSERT_NE(create, nullptr);
    EXPECT_EQ(create->kind, SymbolKind::Method);
    EXPECT_EQ(create->metadata["annotations"][0], "@PostMapping(\"/orders\")");

    auto members = sites(analysis, ReferenceType::Member, "create");
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0]->target_qualified, "com.acme.OrderController.OrderController.create");
}

// ============ Error ratio ============

TEST(LanguageParserTest, ErrorRatioReflectsBrokenSource) {
    auto adapter = create_adapter(Language::Python);
    LanguageParser parser(adapter->grammar());

    ASSERT_TRUE(parser.parse("def ok():\n    return 1\n"));
    EXPECT_DOUBLE_EQ(parser.error_ratio(), 0.0);

    ASSERT_TRUE(parser.parse(")))) ((( ]]] def def class :::: @@@ }}}"));
    EXPECT_GT(parser.error_ratio(), 0.0);
}
