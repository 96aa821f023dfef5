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

#include <cxxopts.hpp>
#include <iostream>

#include "cartograph/commands.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"
#include "cartograph/version.hpp"

using namespace cartograph;

namespace {

RowId require_repo(const cxxopts::ParseResult &result) {
    if (!result.count("repo")) throw InvalidArgument("--repo is required for this command");
    return result["repo"].as<RowId>();
}

std::optional<int> depth_option(const cxxopts::ParseResult &result) {
    if (!result.count("depth")) return std::nullopt;
    return result["depth"].as<int>();
}

std::optional<RowId> optional_id(const cxxopts::ParseResult &result, const char *name) {
    if (!result.count(name)) return std::nullopt;
    return result[name].as<RowId>();
}

void print_examples() {
    std::cout << "Examples:" << std::endl;
    std::cout << "  cartograph --register ./service            Register a repository and queue a parse"
              << std::endl;
    std::cout << "  cartograph --work                          Run workers until the queue is idle" << std::endl;
    std::cout << "  cartograph --serve                         Run workers until interrupted" << std::endl;
    std::cout << "  cartograph -r 1 --search handle            Search symbols by name" << std::endl;
    std::cout << "  cartograph -r 1 --downstream 42 --depth 3  Callees of symbol 42" << std::endl;
    std::cout << "  cartograph -r 1 --lookup handle --prefix api.orders" << std::endl;
    std::cout << "                                             Symbols named handle under api/orders" << std::endl;
    std::cout << "  cartograph -r 1 --detect --force           Re-run entry point detection" << std::endl;
    std::cout << "  cartograph -r 1 --generate-flow 3          Queue a flow for entry point 3" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
    cxxopts::Options options("cartograph", "Multi-language code graph indexer and query service");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("config", "JSON configuration file", cxxopts::value<std::string>());
    opts("db", "Database path (overrides configuration)", cxxopts::value<std::string>());
    opts("w,workers", "Worker threads for --work and --serve", cxxopts::value<unsigned int>());
    opts("r,repo", "Repository id", cxxopts::value<RowId>());

    opts("register", "Register the repository at a path and queue a parse", cxxopts::value<std::string>());
    opts("name", "Repository name for --register", cxxopts::value<std::string>()->default_value(""));
    opts("reparse", "Queue a parse of the repository");
    opts("work", "Process queued jobs until none remain");
    opts("serve", "Process queued jobs until interrupted");
    opts("status", "Show one repository (with --repo) or all of them");
    opts("files", "List the repository's files");
    opts("jobs", "List jobs, optionally for one repository");
    opts("job", "Show one job", cxxopts::value<RowId>());

    opts("symbols", "List symbols");
    opts("kind", "Symbol kind filter for --symbols", cxxopts::value<std::string>()->default_value(""));
    opts("limit", "Result limit", cxxopts::value<int>()->default_value("100"));
    opts("offset", "Result offset for --symbols", cxxopts::value<int>()->default_value("0"));
    opts("search", "Search symbols by name", cxxopts::value<std::string>());
    opts("symbol", "Show one symbol with its source", cxxopts::value<SymbolUID>());
    opts("upstream", "Callers of a symbol", cxxopts::value<SymbolUID>());
    opts("downstream", "Callees of a symbol", cxxopts::value<SymbolUID>());
    opts("d,depth", "Traversal depth", cxxopts::value<int>());
    opts("lookup", "Symbols with this name, with callers and callees", cxxopts::value<std::string>());
    opts("prefix", "Module or path prefix for --lookup", cxxopts::value<std::string>()->default_value(""));

    opts("detect", "Detect and confirm entry points");
    opts("force", "Replace existing entry points on --detect");
    opts("queue", "Queue --detect as a job instead of running it");
    opts("candidates", "List entry point candidates of the latest run");
    opts("entry-points", "List confirmed entry points");
    opts("type", "Entry point type filter (HTTP, EVENT, SCHEDULER)", cxxopts::value<std::string>()->default_value(""));
    opts("framework", "Entry point framework filter", cxxopts::value<std::string>()->default_value(""));
    opts("generate-flow", "Queue flow generation for an entry point", cxxopts::value<RowId>());
    opts("flow", "Show the flow of an entry point", cxxopts::value<RowId>());

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            print_examples();
            return 0;
        }

        if (result.count("version")) {
            std::cout << "cartograph v" << VERSION_STRING << std::endl;
            return 0;
        }

        Config config;
        if (result.count("config")) config.load_file(result["config"].as<std::string>());
        config.load_env();
        if (result.count("db")) config.database_path = result["db"].as<std::string>();
        if (result.count("workers")) config.worker_count = result["workers"].as<unsigned int>();
        config.validate();

        init_logging(config);
        CodeGraph graph(config);

        int limit = result["limit"].as<int>();
        int rc = -1;

        if (result.count("register")) {
            rc = cmd_register(graph, result["register"].as<std::string>(), result["name"].as<std::string>());
        } else if (result.count("reparse")) {
            rc = cmd_reparse(graph, require_repo(result));
        } else if (result.count("work")) {
            rc = cmd_work(graph);
        } else if (result.count("serve")) {
            rc = cmd_serve(graph);
        } else if (result.count("status")) {
            rc = cmd_status(graph, optional_id(result, "repo"));
        } else if (result.count("files")) {
            rc = cmd_files(graph, require_repo(result));
        } else if (result.count("jobs") || result.count("job")) {
            rc = cmd_jobs(graph, optional_id(result, "repo"), optional_id(result, "job"));
        } else if (result.count("symbols")) {
            rc = cmd_symbols(graph, require_repo(result), result["kind"].as<std::string>(), limit,
                             result["offset"].as<int>());
        } else if (result.count("search")) {
            rc = cmd_search(graph, require_repo(result), result["search"].as<std::string>(), limit);
        } else if (result.count("symbol")) {
            rc = cmd_symbol(graph, require_repo(result), result["symbol"].as<SymbolUID>());
        } else if (result.count("upstream")) {
            rc = cmd_upstream(graph, require_repo(result), result["upstream"].as<SymbolUID>(), depth_option(result));
        } else if (result.count("downstream")) {
            rc = cmd_downstream(graph, require_repo(result), result["downstream"].as<SymbolUID>(),
                                depth_option(result));
        } else if (result.count("lookup")) {
            rc = cmd_lookup(graph, require_repo(result), result["prefix"].as<std::string>(),
                            result["lookup"].as<std::string>(), depth_option(result));
        } else if (result.count("detect")) {
            rc = cmd_detect(graph, require_repo(result), result.count("force") > 0, result.count("queue") > 0);
        } else if (result.count("candidates")) {
            rc = cmd_candidates(graph, require_repo(result));
        } else if (result.count("entry-points")) {
            rc = cmd_entry_points(graph, require_repo(result), result["type"].as<std::string>(),
                                  result["framework"].as<std::string>());
        } else if (result.count("generate-flow")) {
            rc = cmd_generate_flow(graph, require_repo(result), result["generate-flow"].as<RowId>());
        } else if (result.count("flow")) {
            rc = cmd_flow(graph, require_repo(result), result["flow"].as<RowId>());
        }

        if (rc < 0) {
            std::cout << options.help() << std::endl;
            print_examples();
            rc = 0;
        }
        shutdown_logging();
        return rc;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const NotFound &e) {
        std::cerr << "Not found: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
