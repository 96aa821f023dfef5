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

#include "cartograph/collaborator.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace cartograph {

namespace {

std::string metadata_text(const json &metadata, const char *key) {
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// "POST /orders", "orders-topic", "0 0 * * *" or the symbol name
std::string entry_point_name(const EntryPointCandidateRecord &c) {
    switch (c.type) {
    case EntryPointType::Http: {
        std::string method = metadata_text(c.metadata, "method");
        std::string path = metadata_text(c.metadata, "path");
        if (!path.empty()) return (method.empty() ? "ANY" : method) + " " + path;
        break;
    }
    case EntryPointType::Event: {
        std::string topic = metadata_text(c.metadata, "topic");
        if (!topic.empty()) return "Consume " + topic;
        break;
    }
    case EntryPointType::Scheduler: {
        std::string schedule = metadata_text(c.metadata, "schedule");
        if (!schedule.empty()) return c.symbol_name + " @ " + schedule;
        break;
    }
    }
    return c.symbol_name;
}

const char *type_phrase(EntryPointType type) {
    switch (type) {
    case EntryPointType::Http:
        return "HTTP handler";
    case EntryPointType::Event:
        return "event consumer";
    case EntryPointType::Scheduler:
        return "scheduled job";
    }
    return "entry point";
}

} // namespace

std::string head_lines(const std::string &text, unsigned int max_lines) {
    size_t pos = 0;
    for (unsigned int line = 0; line < max_lines; ++line) {
        pos = text.find('\n', pos);
        if (pos == std::string::npos) return text;
        ++pos;
    }
    return text.substr(0, pos == 0 ? 0 : pos - 1);
}

std::vector<EntryPointVerdict> HeuristicCollaborator::confirm_entry_points(const RepositoryContext &,
                                                                           EntryPointType type,
                                                                           const std::vector<CandidateEvidence> &batch) {
    std::vector<EntryPointVerdict> verdicts;
    for (size_t i = 0; i < batch.size(); ++i) {
        const auto &c = batch[i].candidate;
        EntryPointVerdict v;
        v.candidate_index = i;
        v.confidence = c.confidence;
        // Type declarations register handlers; only their members handle requests
        v.is_entry_point = c.confidence >= MIN_CONFIDENCE && !is_type_kind(batch[i].kind);
        v.name = entry_point_name(c);
        v.description = std::string(type_phrase(type)) + " " + c.qualified_name + " (" + c.framework + ")";
        v.reasoning = v.is_entry_point ? "Matched " + c.detection_pattern
                                       : "Rejected " + c.detection_pattern + ": declaration or low confidence";
        verdicts.push_back(std::move(v));
    }
    return verdicts;
}

FlowDraft HeuristicCollaborator::describe_flow(const FlowRequest &request) {
    FlowDraft draft;
    draft.steps = request.previous_steps;

    std::unordered_set<std::string> described;
    for (const auto &step : draft.steps) {
        for (const auto &snippet : step.snippets) described.insert(snippet.qualified_name);
    }

    for (const auto &node : request.evidence) {
        if (!described.insert(node.qualified_name).second) continue;
        FlowStep step;
        step.step_number = static_cast<int>(draft.steps.size()) + 1;
        step.title = node.depth == 0 ? "Receive " + request.entry_point.name : "Call " + node.name;
        std::ostringstream desc;
        desc << node.kind << " " << node.qualified_name;
        if (!node.signature.empty()) desc << " " << node.signature;
        desc << " at depth " << node.depth << " in " << node.file_path;
        step.description = desc.str();
        step.file_path = node.file_path;
        step.log_lines = node.log_lines;
        step.snippets.push_back(node.snippet);
        draft.steps.push_back(std::move(step));
    }

    std::unordered_set<std::string> files;
    for (const auto &step : draft.steps) files.insert(step.file_path);

    const auto &ep = request.entry_point;
    draft.flow_name = ep.name.empty() ? ep.qualified_name : ep.name;
    std::ostringstream summary;
    summary << to_string(ep.type) << " entry point " << ep.qualified_name;
    if (!ep.framework.empty()) summary << " (" << ep.framework << ")";
    summary << " reaches " << draft.steps.size() << " symbols across " << files.size() << " files";
    draft.technical_summary = summary.str();
    return draft;
}

} // namespace cartograph
