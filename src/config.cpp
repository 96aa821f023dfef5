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

#include "cartograph/config.hpp"
#include "cartograph/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace cartograph {

namespace {

using json = nlohmann::json;

const char *env(const char *name) {
    const char *value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

unsigned long env_unsigned(const char *name, unsigned long fallback) {
    const char *value = env(name);
    if (!value)
        return fallback;
    try {
        return std::stoul(value);
    } catch (const std::exception &) {
        throw InvalidArgument(std::string(name) + " must be a non-negative integer, got '" +
                              value + "'");
    }
}

double env_double(const char *name, double fallback) {
    const char *value = env(name);
    if (!value)
        return fallback;
    try {
        return std::stod(value);
    } catch (const std::exception &) {
        throw InvalidArgument(std::string(name) + " must be a number, got '" + value + "'");
    }
}

template <typename T> void read_key(const json &j, const char *key, T &out) {
    auto it = j.find(key);
    if (it != j.end()) {
        out = it->get<T>();
    }
}

} // namespace

void Config::load_file(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw InvalidArgument("Cannot open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::exception &e) {
        throw InvalidArgument("Malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw InvalidArgument("Config file must hold a JSON object: " + path);
    }

    static const char *known[] = {"database_path",
                                  "worker_count",
                                  "poll_interval_ms",
                                  "max_files_per_batch",
                                  "parse_threads",
                                  "max_file_size_bytes",
                                  "max_error_ratio",
                                  "failed_file_threshold",
                                  "ignore_patterns",
                                  "default_max_depth",
                                  "max_depth_cap",
                                  "job_max_attempts",
                                  "job_lock_timeout_seconds",
                                  "retry_backoff_ms",
                                  "collaborator_timeout_seconds",
                                  "entry_point_batch_size",
                                  "flow_depth_per_iteration",
                                  "flow_max_iterations",
                                  "flow_max_nodes",
                                  "snippet_max_lines",
                                  "log_level",
                                  "log_pattern"};
    for (const auto &item : j.items()) {
        bool found = false;
        for (const char *k : known) {
            if (item.key() == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw InvalidArgument("Unknown config key '" + item.key() + "' in " + path);
        }
    }

    try {
        read_key(j, "database_path", database_path);
        read_key(j, "worker_count", worker_count);
        read_key(j, "poll_interval_ms", poll_interval_ms);
        read_key(j, "max_files_per_batch", max_files_per_batch);
        read_key(j, "parse_threads", parse_threads);
        read_key(j, "max_file_size_bytes", max_file_size_bytes);
        read_key(j, "max_error_ratio", max_error_ratio);
        read_key(j, "failed_file_threshold", failed_file_threshold);
        read_key(j, "ignore_patterns", ignore_patterns);
        read_key(j, "default_max_depth", default_max_depth);
        read_key(j, "max_depth_cap", max_depth_cap);
        read_key(j, "job_max_attempts", job_max_attempts);
        read_key(j, "job_lock_timeout_seconds", job_lock_timeout_seconds);
        read_key(j, "retry_backoff_ms", retry_backoff_ms);
        read_key(j, "collaborator_timeout_seconds", collaborator_timeout_seconds);
        read_key(j, "entry_point_batch_size", entry_point_batch_size);
        read_key(j, "flow_depth_per_iteration", flow_depth_per_iteration);
        read_key(j, "flow_max_iterations", flow_max_iterations);
        read_key(j, "flow_max_nodes", flow_max_nodes);
        read_key(j, "snippet_max_lines", snippet_max_lines);
        read_key(j, "log_level", log_level);
        read_key(j, "log_pattern", log_pattern);
    } catch (const json::type_error &e) {
        throw InvalidArgument("Wrong value type in " + path + ": " + e.what());
    }
}

void Config::load_env() {
    if (const char *db = env("CARTOGRAPH_DB"))
        database_path = db;
    worker_count = static_cast<unsigned int>(env_unsigned("CARTOGRAPH_WORKERS", worker_count));
    poll_interval_ms =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_POLL_INTERVAL_MS", poll_interval_ms));
    max_files_per_batch =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_BATCH_SIZE", max_files_per_batch));
    parse_threads =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_PARSE_THREADS", parse_threads));
    max_file_size_bytes = env_unsigned("CARTOGRAPH_MAX_FILE_SIZE", max_file_size_bytes);
    max_error_ratio = env_double("CARTOGRAPH_MAX_ERROR_RATIO", max_error_ratio);
    failed_file_threshold = env_double("CARTOGRAPH_FAILED_THRESHOLD", failed_file_threshold);
    default_max_depth =
        static_cast<int>(env_unsigned("CARTOGRAPH_MAX_DEPTH", static_cast<unsigned long>(default_max_depth)));
    job_max_attempts = static_cast<int>(
        env_unsigned("CARTOGRAPH_JOB_MAX_ATTEMPTS", static_cast<unsigned long>(job_max_attempts)));
    job_lock_timeout_seconds = static_cast<unsigned int>(
        env_unsigned("CARTOGRAPH_LOCK_TIMEOUT", job_lock_timeout_seconds));
    retry_backoff_ms =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_RETRY_BACKOFF_MS", retry_backoff_ms));
    collaborator_timeout_seconds = static_cast<unsigned int>(
        env_unsigned("CARTOGRAPH_COLLABORATOR_TIMEOUT", collaborator_timeout_seconds));
    entry_point_batch_size = static_cast<unsigned int>(
        env_unsigned("CARTOGRAPH_EP_BATCH_SIZE", entry_point_batch_size));
    flow_depth_per_iteration = static_cast<int>(env_unsigned(
        "CARTOGRAPH_FLOW_DEPTH_PER_ITERATION", static_cast<unsigned long>(flow_depth_per_iteration)));
    flow_max_iterations = static_cast<int>(env_unsigned(
        "CARTOGRAPH_FLOW_MAX_ITERATIONS", static_cast<unsigned long>(flow_max_iterations)));
    flow_max_nodes =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_FLOW_MAX_NODES", flow_max_nodes));
    snippet_max_lines =
        static_cast<unsigned int>(env_unsigned("CARTOGRAPH_SNIPPET_LINES", snippet_max_lines));
    if (const char *level = env("CARTOGRAPH_LOG_LEVEL"))
        log_level = level;
    if (const char *pattern = env("CARTOGRAPH_LOG_PATTERN"))
        log_pattern = pattern;
}

void Config::validate() const {
    if (database_path.empty())
        throw InvalidArgument("database_path must not be empty");
    if (worker_count == 0)
        throw InvalidArgument("worker_count must be at least 1");
    if (max_files_per_batch == 0)
        throw InvalidArgument("max_files_per_batch must be at least 1");
    if (max_file_size_bytes == 0)
        throw InvalidArgument("max_file_size_bytes must be at least 1");
    if (max_error_ratio <= 0.0 || max_error_ratio > 1.0)
        throw InvalidArgument("max_error_ratio must be in (0, 1]");
    if (failed_file_threshold < 0.0 || failed_file_threshold > 1.0)
        throw InvalidArgument("failed_file_threshold must be in [0, 1]");
    if (default_max_depth < 1 || default_max_depth > max_depth_cap)
        throw InvalidArgument("default_max_depth must be between 1 and max_depth_cap");
    if (job_max_attempts < 1)
        throw InvalidArgument("job_max_attempts must be at least 1");
    if (job_lock_timeout_seconds == 0)
        throw InvalidArgument("job_lock_timeout_seconds must be at least 1");
    if (collaborator_timeout_seconds == 0)
        throw InvalidArgument("collaborator_timeout_seconds must be at least 1");
    if (entry_point_batch_size == 0)
        throw InvalidArgument("entry_point_batch_size must be at least 1");
    if (flow_depth_per_iteration < 1 || flow_max_iterations < 1)
        throw InvalidArgument("flow depth and iteration budgets must be at least 1");
    if (flow_max_nodes == 0)
        throw InvalidArgument("flow_max_nodes must be at least 1");
    static const char *levels[] = {"trace", "debug", "info", "warn", "warning",
                                   "error", "err",   "critical", "off"};
    for (const char *level : levels) {
        if (log_level == level)
            return;
    }
    throw InvalidArgument("Unknown log_level '" + log_level + "'");
}

unsigned int Config::effective_parse_threads() const {
    if (parse_threads != 0)
        return parse_threads;
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n; // Fallback
}

Config Config::from_environment() {
    Config config;
    config.load_env();
    return config;
}

} // namespace cartograph
