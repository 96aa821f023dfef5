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

#include <cstdint>
#include <string>
#include <vector>

namespace cartograph {

// Runtime configuration. Layered: defaults, JSON file, CARTOGRAPH_* environment,
// then command-line overrides applied by main.
struct Config {
    std::string database_path = ".cartograph.db";

    // Worker pool
    unsigned int worker_count = 4;
    unsigned int poll_interval_ms = 1000;

    // Indexing
    unsigned int max_files_per_batch = 100;
    unsigned int parse_threads = 0; // 0 = auto-detect
    uint64_t max_file_size_bytes = 1000000;
    double max_error_ratio = 0.25;
    double failed_file_threshold = 0.5;

    // File patterns to ignore, on top of the built-in skip directories
    std::vector<std::string> ignore_patterns;

    // Graph queries
    int default_max_depth = 5;
    int max_depth_cap = 50;

    // Job queue
    int job_max_attempts = 3;
    unsigned int job_lock_timeout_seconds = 600;
    unsigned int retry_backoff_ms = 2000;

    // Collaborator
    unsigned int collaborator_timeout_seconds = 120;
    unsigned int entry_point_batch_size = 5;

    // Flow generation
    int flow_depth_per_iteration = 3;
    int flow_max_iterations = 4;
    unsigned int flow_max_nodes = 200;
    unsigned int snippet_max_lines = 80;

    // Logging
    std::string log_level = "info";
    std::string log_pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

    // Overlay values from a JSON file; unknown keys are rejected
    void load_file(const std::string &path);

    // Overlay values from CARTOGRAPH_* environment variables
    void load_env();

    // Throws InvalidArgument on out-of-range values
    void validate() const;

    // Effective parse thread count (resolves 0 to hardware concurrency)
    unsigned int effective_parse_threads() const;

    static Config from_environment();
};

} // namespace cartograph
