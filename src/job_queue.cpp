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

#include "cartograph/job_queue.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <chrono>
#include <unistd.h>

namespace cartograph {

// ============ JobQueue ============

JobQueue::JobQueue(GraphStore &store, const Config &config, Clock clock)
    : store_(store), config_(config), clock_(std::move(clock)) {}

RowId JobQueue::enqueue(RowId repo_id, JobType type, const json &payload) {
    RowId id = store_.enqueue_job(repo_id, type, payload, config_.job_max_attempts, clock_());
    log_info("Job enqueued", {IntField("job_id", id), IntField("repo_id", repo_id), StringField("type", to_string(type))});
    return id;
}

RowId JobQueue::enqueue_parse(RowId repo_id) {
    Transaction tx(store_.db());
    if (auto active = store_.find_active_job(repo_id, JobType::Parse)) {
        tx.commit();
        log_info("Parse job already queued", {IntField("job_id", active->id), IntField("repo_id", repo_id)});
        return active->id;
    }
    RowId id = enqueue(repo_id, JobType::Parse);
    tx.commit();
    return id;
}

std::optional<JobRecord> JobQueue::claim(const std::string &owner) {
    try {
        return store_.claim_job(owner, clock_(), static_cast<int64_t>(config_.job_lock_timeout_seconds) * 1000);
    } catch (const StoreBusy &e) {
        log_debug("Claim skipped, database busy", {StringField("owner", owner), StringField("error", e.what())});
        return std::nullopt;
    }
}

bool JobQueue::complete(const JobRecord &job, const std::string &owner) {
    bool ok = store_.complete_job(job.id, owner, clock_());
    if (!ok) {
        log_warn("Job lock lost before completion", {IntField("job_id", job.id), StringField("owner", owner)});
    }
    return ok;
}

bool JobQueue::heartbeat(const JobRecord &job, const std::string &owner) {
    return store_.heartbeat_job(job.id, owner, clock_());
}

int64_t JobQueue::backoff_ms(int attempts) const {
    int shift = std::min(std::max(attempts - 1, 0), 20);
    return static_cast<int64_t>(config_.retry_backoff_ms) << shift;
}

JobStatus JobQueue::fail(const JobRecord &job, const std::string &owner, const std::exception &error) {
    int64_t now = clock_();
    bool permanent = is_permanent_failure(error);

    if (permanent || job.attempts >= job.max_attempts) {
        if (!store_.fail_job(job.id, owner, error.what(), now)) {
            log_warn("Job lock lost before failure", {IntField("job_id", job.id), StringField("owner", owner)});
        }
        log_error("Job failed", {IntField("job_id", job.id), StringField("type", to_string(job.type)),
                                 IntField("attempts", job.attempts), BoolField("permanent", permanent),
                                 StringField("error", error.what())});
        return JobStatus::Failed;
    }

    int64_t delay = backoff_ms(job.attempts);
    if (!store_.retry_job(job.id, owner, error.what(), now + delay, now)) {
        log_warn("Job lock lost before retry", {IntField("job_id", job.id), StringField("owner", owner)});
    }
    log_warn("Job will be retried", {IntField("job_id", job.id), StringField("type", to_string(job.type)),
                                     IntField("attempts", job.attempts), IntField("backoff_ms", delay),
                                     StringField("error", error.what())});
    return JobStatus::Pending;
}

// ============ WorkerPool ============

WorkerPool::WorkerPool(const Config &config, Clock clock) : config_(config), clock_(std::move(clock)) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::register_handler(JobType type, JobHandler handler) { handlers_[type] = std::move(handler); }

void WorkerPool::run_until_idle() {
    running_ = true;
    std::vector<std::thread> threads;
    for (unsigned int i = 0; i < std::max(1u, config_.worker_count); ++i) {
        threads.emplace_back(&WorkerPool::worker_loop, this, i, true);
    }
    for (auto &t : threads) {
        t.join();
    }
    running_ = false;
}

void WorkerPool::start() {
    if (running_) return;
    running_ = true;
    for (unsigned int i = 0; i < std::max(1u, config_.worker_count); ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i, false);
    }
    log_info("Worker pool started", {IntField("workers", static_cast<int64_t>(threads_.size()))});
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_.notify_all();
    for (auto &t : threads_) {
        if (t.joinable()) t.join();
    }
    if (!threads_.empty()) log_info("Worker pool stopped");
    threads_.clear();
}

bool WorkerPool::sleep_for(int64_t ms) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return !running_; });
    return running_;
}

void WorkerPool::worker_loop(unsigned int index, bool until_idle) {
    std::string owner = "worker-" + std::to_string(::getpid()) + "-" + std::to_string(index);
    const int64_t base_interval = std::max<int64_t>(1, config_.poll_interval_ms);
    const int64_t max_interval = base_interval * 10;

    std::optional<GraphStore> store;
    try {
        store.emplace(config_.database_path);
    } catch (const StoreError &e) {
        log_error("Worker cannot open database", {StringField("owner", owner), StringField("error", e.what())});
        return;
    }
    JobQueue queue(*store, config_, clock_);

    int64_t interval = base_interval;
    while (running_) {
        try {
            auto job = queue.claim(owner);
            if (job) {
                interval = base_interval;
                process(*store, queue, *job, owner);
                continue;
            }
            if (until_idle && store->count_active_jobs() == 0) break;

            sleep_for(interval);
            interval = std::min<int64_t>(static_cast<int64_t>(static_cast<double>(interval) * 1.5), max_interval);
        } catch (const std::exception &e) {
            log_error("Worker loop error", {StringField("owner", owner), StringField("error", e.what())});
            sleep_for(base_interval * 2);
        }
    }
}

void WorkerPool::process(GraphStore &store, JobQueue &queue, const JobRecord &job, const std::string &owner) {
    log_info("Job claimed", {IntField("job_id", job.id), IntField("repo_id", job.repo_id),
                             StringField("type", to_string(job.type)), IntField("attempt", job.attempts),
                             StringField("owner", owner)});

    auto it = handlers_.find(job.type);
    if (it == handlers_.end()) {
        queue.fail(job, owner, InvalidArgument(std::string("No handler for job type ") + to_string(job.type)));
        stats_.failed++;
        return;
    }

    JobContext ctx{store, job, [&queue, &job, &owner] { queue.heartbeat(job, owner); }};
    try {
        it->second(ctx);
    } catch (const std::exception &e) {
        if (queue.fail(job, owner, e) == JobStatus::Failed) {
            stats_.failed++;
        } else {
            stats_.retried++;
        }
        return;
    }

    if (queue.complete(job, owner)) {
        stats_.completed++;
        log_info("Job completed", {IntField("job_id", job.id), StringField("type", to_string(job.type))});
    }
}

} // namespace cartograph
