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

#include "errors.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace cartograph {

// What the collaborator sees about one candidate
struct CandidateEvidence {
    EntryPointCandidateRecord candidate;
    SymbolKind kind = SymbolKind::Function;
    std::string language;
    std::string signature;
    std::string snippet; // first lines of the symbol's source
};

struct RepositoryContext {
    std::string name;
    std::vector<std::string> languages;
    std::vector<std::string> frameworks;
};

// Verdict for candidates[candidate_index] of a confirmation batch
struct EntryPointVerdict {
    size_t candidate_index = 0;
    bool is_entry_point = false;
    std::string name;
    std::string description;
    double confidence = 0.0;
    std::string reasoning;
};

// One symbol visited by the flow traversal
struct FlowEvidence {
    SymbolUID symbol_id = INVALID_UID;
    std::string name;
    std::string qualified_name;
    std::string kind;
    std::string signature;
    std::string language;
    std::string file_path;
    int depth = 0;
    CodeSnippet snippet;
    std::vector<std::string> log_lines;
};

struct FlowRequest {
    EntryPointRecord entry_point;
    int iteration = 1;
    std::vector<FlowEvidence> evidence; // nodes first reached in this window
    std::vector<FlowStep> previous_steps;
};

// The collaborator's current description of the whole flow
struct FlowDraft {
    std::string flow_name;
    std::string technical_summary;
    std::vector<FlowStep> steps;
};

// ============================================================================
// Collaborator - external judgement on candidates and flows. Implementations
// must be safe to call from several worker threads at once.
// ============================================================================
class Collaborator {
public:

    virtual ~Collaborator() = default;

    // All candidates of one batch share `type`
    virtual std::vector<EntryPointVerdict> confirm_entry_points(const RepositoryContext &repo, EntryPointType type,
                                                                const std::vector<CandidateEvidence> &batch) = 0;

    virtual FlowDraft describe_flow(const FlowRequest &request) = 0;
};

// Deterministic offline collaborator: confirms function-level candidates
// above a confidence floor and narrates flows from the evidence itself
class HeuristicCollaborator : public Collaborator {
public:

    static constexpr double MIN_CONFIDENCE = 0.7;

    std::vector<EntryPointVerdict> confirm_entry_points(const RepositoryContext &repo, EntryPointType type,
                                                        const std::vector<CandidateEvidence> &batch) override;

    FlowDraft describe_flow(const FlowRequest &request) override;
};

// First max_lines lines of a source text, for evidence payloads
std::string head_lines(const std::string &text, unsigned int max_lines);

// Run fn on its own thread and wait at most `timeout` for it.
// Throws CollaboratorTimeout when the wait expires; the call itself keeps
// running detached, so fn must own everything it touches.
template <typename T>
T call_with_timeout(std::function<T()> fn, std::chrono::milliseconds timeout, const std::string &what) {
    auto task = std::make_shared<std::packaged_task<T()>>(std::move(fn));
    std::future<T> result = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw CollaboratorTimeout(what + " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}

} // namespace cartograph
