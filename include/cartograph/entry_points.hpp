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

#include "collaborator.hpp"
#include "config.hpp"
#include "store.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace cartograph {

// A symbol as the detection rules see it
struct SymbolView {
    const SymbolRecord &symbol;
    const SymbolRecord *parent;                  // enclosing symbol, if stored
    std::vector<std::string> annotations;        // annotations, decorators and attributes
    std::vector<std::string> bases;              // declared base types
    const std::vector<ReferenceRecord> &calls;   // outgoing edges
};

// A rule fires by returning the candidate's metadata
using RulePredicate = std::function<std::optional<json>(const SymbolView &view)>;

struct DetectionRule {
    std::string id;
    std::set<Language> languages;
    std::string framework;
    EntryPointType type;
    double confidence;
    RulePredicate predicate;
};

// Built-in rule table
const std::vector<DetectionRule> &detection_rules();

// Frameworks imported by a file of the given language, e.g. "spring-boot"
std::set<std::string> frameworks_for_import(Language lang, const std::string &import_path);

// Test sources never yield entry points
bool is_test_path(const std::string &relative_path);

// "@GetMapping(\"/a\")" -> "GetMapping", "#[get(\"/\")]" -> "get", "@app.route('/')" -> "app.route"
std::string annotation_name(const std::string &annotation);

// First quoted string inside an annotation or call text
std::string first_string_literal(const std::string &text);

struct DetectionResult {
    int64_t run_id = 0;
    int64_t candidates_detected = 0;
    int64_t entry_points_confirmed = 0;
    std::vector<std::string> frameworks_detected;
    std::map<std::string, int64_t> by_type;
    std::map<std::string, int64_t> by_framework;
    bool reused_existing = false; // detection skipped, counts from stored rows

    json to_json() const;
};

// ============================================================================
// EntryPointDetector - rule-based candidate detection followed by batched
// confirmation through the collaborator
// ============================================================================
class EntryPointDetector {
public:

    EntryPointDetector(GraphStore &store, const Config &config, std::shared_ptr<Collaborator> collaborator);

    // Without force, a repository that already has entry points keeps them
    DetectionResult detect(RowId repo_id, bool force);

    // Rule pass only: deduplicated, test paths removed, not persisted
    std::vector<EntryPointCandidateRecord> find_candidates(RowId repo_id, std::vector<std::string> &frameworks);

private:

    GraphStore &store_;
    const Config &config_;
    std::shared_ptr<Collaborator> collaborator_;

    std::vector<EntryPointRecord> confirm(const RepositoryRecord &repo, const std::vector<std::string> &frameworks,
                                          const std::vector<EntryPointCandidateRecord> &candidates);

    DetectionResult existing_result(RowId repo_id);
};

} // namespace cartograph
