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

#include "cartograph/config.hpp"
#include "cartograph/indexer.hpp"
#include "cartograph/store.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

namespace cartograph {
namespace test_support {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("cartograph-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return path_; }

    void write(const std::string &relative, const std::string &content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    void remove(const std::string &relative) const { fs::remove(path_ / relative); }

private:
    fs::path path_;
};

// Sources and database in separate scratch directories
struct Workspace {
    TempDir sources;
    TempDir data;
    Config config;

    Workspace() {
        config.database_path = (data.path() / "graph.db").string();
        config.parse_threads = 2;
        config.poll_interval_ms = 10;
        config.retry_backoff_ms = 1;
        config.log_level = "warn";
    }
};

// Stored symbol with the given qualified name
inline std::optional<SymbolRecord> find_symbol(GraphStore &store, RowId repo_id, const std::string &qualified) {
    for (auto &sym : store.repository_symbols(repo_id)) {
        if (sym.qualified_name == qualified) return sym;
    }
    return std::nullopt;
}

// Outgoing edge of `source` with the given target name and type
inline std::optional<ReferenceRecord> find_edge(GraphStore &store, SymbolUID source, const std::string &target_name,
                                                ReferenceType type) {
    for (auto &ref : store.references_from(source)) {
        if (ref.target_name == target_name && ref.type == type) return ref;
    }
    return std::nullopt;
}

// ============ Fixtures ============

const char *const SHOP_SERVICE_PY = R"(def process(order):
    log.info("processing order")
    return validate(order)


def validate(order):
    return True
)";

const char *const SHOP_API_PY = R"(from flask import Flask
from app.service import process

app = Flask(__name__)


@app.route("/orders", methods=["POST"])
def create_order():
    return process("new")


@app.route("/health")
def health():
    return "ok"
)";

const char *const SHOP_TEST_PY = R"(from flask import Flask

app = Flask(__name__)


@app.route("/orders")
def fake_orders():
    return "fake"
)";

// Flask service: two routes, a two-level call chain, and a route under tests/
inline void write_python_shop(const TempDir &dir) {
    dir.write("app/service.py", SHOP_SERVICE_PY);
    dir.write("app/api.py", SHOP_API_PY);
    dir.write("tests/test_api.py", SHOP_TEST_PY);
}

const char *const ROUTES_KT = R"(package a

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

const char *const FRAUD_PROCESSOR_KT = R"(package b

class FraudProcessor {
    fun inspect(order: String): Boolean {
        return order.isNotEmpty()
    }
}
)";

// Camel route handing a constructor-injected processor to the framework
inline void write_kotlin_routes(const TempDir &dir) {
    dir.write("a/Routes.kt", ROUTES_KT);
    dir.write("b/FraudProcessor.kt", FRAUD_PROCESSOR_KT);
}

// Repository row for the workspace sources, fully indexed
inline RowId index_sources(GraphStore &store, const Workspace &ws) {
    RowId repo_id = store.insert_repository("fixture", ws.sources.path().string()).id;
    Indexer indexer(store, ws.config);
    indexer.index_repository(repo_id);
    return repo_id;
}

} // namespace test_support
} // namespace cartograph
