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
#include <memory>
#include <string>
#include <vector>

namespace cartograph {

// Lines of a body that look like logging statements, trimmed
std::vector<std::string> extract_log_lines(const std::string &source);

// ============================================================================
// FlowGenerator - windowed BFS from an entry point, narrated iteration by
// iteration through the collaborator
// ============================================================================
class FlowGenerator {
public:

    FlowGenerator(GraphStore &store, const Config &config, std::shared_ptr<Collaborator> collaborator);

    // Builds and persists the flow, replacing any previous one
    FlowRecord generate(RowId repo_id, RowId entry_point_id);

private:

    GraphStore &store_;
    const Config &config_;
    std::shared_ptr<Collaborator> collaborator_;

    FlowEvidence evidence_for(const SymbolRecord &symbol, int depth);
};

} // namespace cartograph
