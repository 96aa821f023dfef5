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

#include "config.hpp"
#include "store.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cartograph {

// Millisecond clock, injectable for tests
using Clock = std::function<int64_t()>;

// ============================================================================
// JobQueue - persistent job lifecycle over one store connection
//
//   pending --claim--> in_progress --complete--> completed
//                           |
//                           +--fail--> pending (backoff) | failed (ceiling
//                                      or permanent error)
// ============================================================================
class JobQueue {
public:

    JobQueue(GraphStore &store, const Config &config, Clock clock = now_ms);

    RowId enqueue(RowId repo_id, JobType type, const json &payload = json::object());

    // Returns the id of an already pending or running parse job if there is one
    RowId enqueue_parse(RowId repo_id);

    // nullopt when nothing is runnable or the database is busy
    std::optional<JobRecord> claim(const std::string &owner);

    bool complete(const JobRecord &job, const std::string &owner);
    bool heartbeat(const JobRecord &job, const std::string &owner);

    // Retry with backoff below the attempt ceiling, otherwise fail.
    // Returns the status the job was moved to.
    JobStatus fail(const JobRecord &job, const std::string &owner, const std::exception &error);

    // retry_backoff_ms * 2^(attempts-1)
    int64_t backoff_ms(int attempts) const;

    int64_t now() const { return clock_(); }

private:

    GraphStore &store_;
    const Config &config_;
    Clock clock_;
};

// What a handler gets for one claimed job
struct JobContext {
    GraphStore &store;
    const JobRecord &job;
    std::function<void()> heartbeat;
};

using JobHandler = std::function<void(JobContext &ctx)>;

struct WorkerStats {
    std::atomic<int64_t> completed{0};
    std::atomic<int64_t> retried{0};
    std::atomic<int64_t> failed{0};
};

// ============================================================================
// WorkerPool - N threads, each with its own store connection, sharing one
// claim / handle / complete skeleton across job types
// ============================================================================
class WorkerPool {
public:

    explicit WorkerPool(const Config &config, Clock clock = now_ms);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void register_handler(JobType type, JobHandler handler);

    // Process jobs until none are pending or in progress, then return
    void run_until_idle();

    // Service mode: poll until stop()
    void start();
    void stop();

    bool running() const { return running_; }

    const WorkerStats &stats() const { return stats_; }

private:

    const Config &config_;
    Clock clock_;
    std::map<JobType, JobHandler> handlers_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    WorkerStats stats_;

    void worker_loop(unsigned int index, bool until_idle);
    void process(GraphStore &store, JobQueue &queue, const JobRecord &job, const std::string &owner);

    // False when stop() was called during the wait
    bool sleep_for(int64_t ms);
};

} // namespace cartograph
