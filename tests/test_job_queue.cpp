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

#include "cartograph/errors.hpp"
#include "cartograph/job_queue.hpp"
#include "test_support.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace cartograph;
using namespace cartograph::test_support;

namespace {

class JobQueueTest : public ::testing::Test {
protected:
    JobQueueTest() : store_(ws_.config.database_path) {
        store_.migrate();
        repo_ = store_.insert_repository("fixture", ws_.sources.path().string()).id;
    }

    Workspace ws_;
    GraphStore store_;
    RowId repo_ = 0;
};

// Handler bookkeeping shared across worker threads
struct Calls {
    std::mutex mutex;
    std::map<RowId, int> per_job;

    int record(RowId job_id) {
        std::lock_guard<std::mutex> lock(mutex);
        return ++per_job[job_id];
    }
};

} // namespace

// ============ JobQueue ============

TEST_F(JobQueueTest, ParseJobsAreDeduplicated) {
    JobQueue queue(store_, ws_.config);
    RowId first = queue.enqueue_parse(repo_);
    EXPECT_EQ(queue.enqueue_parse(repo_), first);

    // Other job types are not deduplicated
    RowId detect_a = queue.enqueue(repo_, JobType::DetectEntryPoints);
    RowId detect_b = queue.enqueue(repo_, JobType::DetectEntryPoints);
    EXPECT_NE(detect_a, detect_b);

    auto job = queue.claim("w1");
    ASSERT_TRUE(job.has_value());
    ASSERT_TRUE(queue.complete(*job, "w1"));
    EXPECT_NE(queue.enqueue_parse(repo_), first);
}

TEST_F(JobQueueTest, BackoffDoubles) {
    ws_.config.retry_backoff_ms = 2000;
    JobQueue queue(store_, ws_.config);
    EXPECT_EQ(queue.backoff_ms(1), 2000);
    EXPECT_EQ(queue.backoff_ms(2), 4000);
    EXPECT_EQ(queue.backoff_ms(3), 8000);
}

TEST_F(JobQueueTest, TransientFailureRetriesWithBackoff) {
    ws_.config.retry_backoff_ms = 500;
    int64_t now = 10000;
    JobQueue queue(store_, ws_.config, [&now] { return now; });

    RowId id = queue.enqueue(repo_, JobType::GenerateFlow, json{{"entry_point_id", 1}});
    auto job = queue.claim("w1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->payload["entry_point_id"], 1);

    EXPECT_EQ(queue.fail(*job, "w1", std::runtime_error("collaborator down")), JobStatus::Pending);
    JobRecord stored = store_.get_job(id);
    EXPECT_EQ(stored.status, JobStatus::Pending);
    EXPECT_EQ(stored.available_at, 10500);
    EXPECT_EQ(stored.error, "collaborator down");

    now = 10499;
    EXPECT_FALSE(queue.claim("w1").has_value());
    now = 10500;
    auto retried = queue.claim("w1");
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried->attempts, 2);
}

TEST_F(JobQueueTest, PermanentErrorsAndCeilingFail) {
    ws_.config.job_max_attempts = 2;
    JobQueue queue(store_, ws_.config);

    RowId missing = queue.enqueue(repo_, JobType::GenerateFlow);
    auto job = queue.claim("w1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(queue.fail(*job, "w1", NotFound("Entry point 9 not found")), JobStatus::Failed);
    EXPECT_EQ(store_.get_job(missing).status, JobStatus::Failed);
    EXPECT_EQ(store_.get_job(missing).attempts, 1);

    RowId flaky = queue.enqueue(repo_, JobType::Parse);
    auto first = queue.claim("w1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(queue.fail(*first, "w1", std::runtime_error("busy")), JobStatus::Pending);

    std::optional<JobRecord> second;
    for (int i = 0; i < 100 && !second; ++i) {
        second = queue.claim("w1");
        if (!second) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(queue.fail(*second, "w1", std::runtime_error("busy")), JobStatus::Failed);
    EXPECT_EQ(store_.get_job(flaky).attempts, 2);
}

TEST_F(JobQueueTest, LostLockIsReported) {
    JobQueue queue(store_, ws_.config);
    queue.enqueue(repo_, JobType::Parse);
    auto job = queue.claim("w1");
    ASSERT_TRUE(job.has_value());
    EXPECT_FALSE(queue.complete(*job, "w2"));
    EXPECT_FALSE(queue.heartbeat(*job, "w2"));
    EXPECT_TRUE(queue.heartbeat(*job, "w1"));
}

// ============ WorkerPool ============

TEST_F(JobQueueTest, EachJobIsHandledExactlyOnce) {
    ws_.config.worker_count = 4;
    JobQueue queue(store_, ws_.config);
    const int job_count = 40;
    for (int i = 0; i < job_count; ++i) {
        queue.enqueue(repo_, i % 2 ? JobType::GenerateFlow : JobType::DetectEntryPoints, json{{"n", i}});
    }

    Calls calls;
    WorkerPool pool(ws_.config);
    auto handler = [&calls](JobContext &ctx) {
        calls.record(ctx.job.id);
        ctx.heartbeat();
    };
    pool.register_handler(JobType::GenerateFlow, handler);
    pool.register_handler(JobType::DetectEntryPoints, handler);
    pool.run_until_idle();

    EXPECT_EQ(pool.stats().completed.load(), job_count);
    EXPECT_EQ(pool.stats().failed.load(), 0);
    ASSERT_EQ(calls.per_job.size(), static_cast<size_t>(job_count));
    for (const auto &entry : calls.per_job) {
        EXPECT_EQ(entry.second, 1) << "job " << entry.first;
    }
    for (const auto &job : store_.list_jobs(repo_)) {
        EXPECT_EQ(job.status, JobStatus::Completed);
        EXPECT_EQ(job.attempts, 1);
    }
}

TEST_F(JobQueueTest, HandlerErrorsAreRetriedThenFailed) {
    ws_.config.worker_count = 2;
    JobQueue queue(store_, ws_.config);
    RowId flaky = queue.enqueue(repo_, JobType::Parse);
    RowId broken = queue.enqueue(repo_, JobType::DetectEntryPoints);
    RowId invalid = queue.enqueue(repo_, JobType::GenerateFlow);

    Calls calls;
    WorkerPool pool(ws_.config);
    pool.register_handler(JobType::Parse, [&calls](JobContext &ctx) {
        if (calls.record(ctx.job.id) == 1) throw StoreBusy("database is locked");
    });
    pool.register_handler(JobType::DetectEntryPoints, [&calls](JobContext &ctx) {
        calls.record(ctx.job.id);
        throw std::runtime_error("always broken");
    });
    pool.register_handler(JobType::GenerateFlow, [&calls](JobContext &ctx) {
        calls.record(ctx.job.id);
        throw InvalidArgument("entry_point_id is required");
    });
    pool.run_until_idle();

    JobRecord flaky_job = store_.get_job(flaky);
    EXPECT_EQ(flaky_job.status, JobStatus::Completed);
    EXPECT_EQ(flaky_job.attempts, 2);

    JobRecord broken_job = store_.get_job(broken);
    EXPECT_EQ(broken_job.status, JobStatus::Failed);
    EXPECT_EQ(broken_job.attempts, ws_.config.job_max_attempts);
    EXPECT_EQ(broken_job.error, "always broken");

    JobRecord invalid_job = store_.get_job(invalid);
    EXPECT_EQ(invalid_job.status, JobStatus::Failed);
    EXPECT_EQ(invalid_job.attempts, 1);

    EXPECT_EQ(pool.stats().completed.load(), 1);
    EXPECT_EQ(pool.stats().failed.load(), 2);
    EXPECT_EQ(pool.stats().retried.load(), 1 + (ws_.config.job_max_attempts - 1));
}

TEST_F(JobQueueTest, JobsWithoutHandlerFail) {
    JobQueue queue(store_, ws_.config);
    RowId id = queue.enqueue(repo_, JobType::GenerateFlow);

    WorkerPool pool(ws_.config);
    pool.run_until_idle();

    JobRecord job = store_.get_job(id);
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_NE(job.error.find("No handler"), std::string::npos);
}

TEST_F(JobQueueTest, ServiceModeProcessesUntilStopped) {
    ws_.config.worker_count = 2;
    WorkerPool pool(ws_.config);
    pool.register_handler(JobType::Parse, [](JobContext &) {});
    pool.start();
    EXPECT_TRUE(pool.running());

    JobQueue queue(store_, ws_.config);
    RowId id = queue.enqueue(repo_, JobType::Parse);
    for (int i = 0; i < 500 && store_.get_job(id).status != JobStatus::Completed; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(store_.get_job(id).status, JobStatus::Completed);

    pool.stop();
    EXPECT_FALSE(pool.running());
}
