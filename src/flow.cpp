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

#include "cartograph/flow.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace cartograph {

namespace {

const std::regex &log_statement() {
    static const std::regex re(
        R"((\b(log|logger|logging|_logger|LOG|LOGGER|Log|console)\s*\.\s*(trace|debug|info|warn|warning|error|fatal|critical|exception|log)\s*\())"
        R"(|(\b(println|eprintln|print|printf)!?\s*\())"
        R"(|(\b(trace|debug|info|warn|error)!\s*\())",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool follows(ReferenceType type) {
    return type == ReferenceType::Call || type == ReferenceType::Usage || type == ReferenceType::Member;
}

} // namespace

std::vector<std::string> extract_log_lines(const std::string &source) {
    std::vector<std::string> lines;
    std::istringstream in(source);
    std::string line;
    while (std::getline(in, line)) {
        if (std::regex_search(line, log_statement())) {
            lines.push_back(trim(line));
        }
    }
    return lines;
}

FlowGenerator::FlowGenerator(GraphStore &store, const Config &config, std::shared_ptr<Collaborator> collaborator)
    : store_(store), config_(config), collaborator_(std::move(collaborator)) {}

FlowEvidence FlowGenerator::evidence_for(const SymbolRecord &symbol, int depth) {
    FlowEvidence ev;
    ev.symbol_id = symbol.id;
    ev.name = symbol.name;
    ev.qualified_name = symbol.qualified_name;
    ev.kind = to_string(symbol.kind);
    ev.signature = symbol.signature;
    ev.language = language_to_string(symbol.language);
    ev.file_path = symbol.file_path;
    ev.depth = depth;

    // Module symbols stand for the whole file
    const std::string source = symbol.kind == SymbolKind::Module && symbol.source_text.empty()
                                   ? store_.file_content(symbol.file_id)
                                   : symbol.source_text;
    ev.snippet.code = head_lines(source, config_.snippet_max_lines);
    ev.snippet.symbol_name = symbol.name;
    ev.snippet.qualified_name = symbol.qualified_name;
    ev.snippet.file_path = symbol.file_path;
    ev.snippet.start_line = symbol.start_line;
    ev.snippet.end_line = symbol.end_line;
    ev.log_lines = extract_log_lines(source);
    return ev;
}

FlowRecord FlowGenerator::generate(RowId repo_id, RowId entry_point_id) {
    EntryPointRecord entry_point = store_.get_entry_point(repo_id, entry_point_id);
    auto root = store_.get_symbol(repo_id, entry_point.symbol_id);
    if (!root) {
        throw NotFound("Symbol " + std::to_string(entry_point.symbol_id) + " of entry point " +
                       std::to_string(entry_point_id) + " no longer exists");
    }

    FlowRecord flow;
    flow.entry_point_id = entry_point_id;
    flow.repo_id = repo_id;

    std::unordered_set<SymbolUID> visited{root->id};
    std::unordered_set<std::string> seen_files{root->file_path};
    flow.symbol_ids.push_back(root->id);
    flow.file_paths.push_back(root->file_path);

    std::vector<SymbolRecord> frontier{*root};
    const size_t max_nodes = std::max(1u, config_.flow_max_nodes);
    const auto timeout = std::chrono::milliseconds(static_cast<int64_t>(config_.collaborator_timeout_seconds) * 1000);
    int depth = 0;

    for (int iteration = 1; iteration <= config_.flow_max_iterations; ++iteration) {
        FlowRequest request;
        request.entry_point = entry_point;
        request.iteration = iteration;
        request.previous_steps = flow.steps;
        if (iteration == 1) request.evidence.push_back(evidence_for(*root, 0));

        // One window of flow_depth_per_iteration BFS levels
        for (int level = 0; level < config_.flow_depth_per_iteration && !frontier.empty(); ++level) {
            std::vector<SymbolUID> next_ids;
            for (const auto &sym : frontier) {
                for (const auto &ref : store_.references_from(sym.id)) {
                    if (ref.is_external || !ref.target_symbol_id || !follows(ref.type)) continue;
                    if (visited.size() >= max_nodes) break;
                    if (visited.insert(*ref.target_symbol_id).second) next_ids.push_back(*ref.target_symbol_id);
                }
            }
            if (next_ids.empty()) {
                frontier.clear();
                break;
            }

            ++depth;
            frontier = store_.get_symbols(repo_id, next_ids);
            std::sort(frontier.begin(), frontier.end(),
                      [](const SymbolRecord &a, const SymbolRecord &b) { return a.qualified_name < b.qualified_name; });
            for (const auto &sym : frontier) {
                request.evidence.push_back(evidence_for(sym, depth));
                flow.symbol_ids.push_back(sym.id);
                if (seen_files.insert(sym.file_path).second) flow.file_paths.push_back(sym.file_path);
            }
        }

        if (request.evidence.empty()) break;

        auto collaborator = collaborator_;
        FlowDraft draft = call_with_timeout<FlowDraft>(
            [collaborator, request] { return collaborator->describe_flow(request); }, timeout, "Flow description");

        flow.steps = std::move(draft.steps);
        for (size_t i = 0; i < flow.steps.size(); ++i) flow.steps[i].step_number = static_cast<int>(i) + 1;
        flow.flow_name = draft.flow_name;
        flow.technical_summary = draft.technical_summary;
        flow.iterations_completed = iteration;
        flow.max_depth_analyzed = depth;

        log_info("Flow iteration", {IntField("entry_point_id", entry_point_id), IntField("iteration", iteration),
                                    IntField("evidence", static_cast<int64_t>(request.evidence.size())),
                                    IntField("depth", depth)});
    }

    if (flow.flow_name.empty()) flow.flow_name = entry_point.name;
    flow.created_at = now_ms();
    store_.save_flow(flow);
    log_info("Flow generated", {IntField("entry_point_id", entry_point_id),
                                IntField("steps", static_cast<int64_t>(flow.steps.size())),
                                IntField("symbols", static_cast<int64_t>(flow.symbol_ids.size())),
                                IntField("files", static_cast<int64_t>(flow.file_paths.size()))});
    return flow;
}

} // namespace cartograph
