/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <chunkport/chain/chain_handle.hpp>
#include <chunkport/chain/job_chain.hpp>
#include <chunkport/async/executor_job_queue.hpp>
#include <chunkport/async/test/manual_job_queue.hpp>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace chunkport;
using namespace chunkport::chain;

namespace {

struct Recorder {
    std::mutex mutex_;
    std::vector<size_t> executed_;

    folly::Function<void()> job(size_t index, bool fail = false) {
        return [this, index, fail]() {
            {
                std::lock_guard lock{mutex_};
                executed_.push_back(index);
            }
            if (fail)
                throw std::runtime_error(fmt::format("job {} failed", index));
        };
    }

    std::vector<ChainJob> jobs(size_t count, std::optional<size_t> fail_at = std::nullopt) {
        std::vector<ChainJob> output;
        for (size_t i = 0; i < count; ++i)
            output.emplace_back(fmt::format("job-{}", i), job(i, fail_at && *fail_at == i));
        return output;
    }

    std::vector<size_t> executed() {
        std::lock_guard lock{mutex_};
        return executed_;
    }
};

std::vector<size_t> iota(size_t count) {
    std::vector<size_t> output(count);
    for (size_t i = 0; i < count; ++i)
        output[i] = i;
    return output;
}

} // namespace

TEST(JobChain, RunsJobsOneAtATimeInOrder) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(3), "ordered");
    ASSERT_EQ(chain->state(), ChainState::pending());
    ASSERT_EQ(queue->pending_deliveries(), 0u);

    chain->dispatch();
    for (size_t i = 0; i < 3; ++i) {
        ASSERT_EQ(chain->state(), ChainState::running(i));
        ASSERT_EQ(queue->pending_deliveries(), 1u);
        ASSERT_TRUE(queue->run_next());
    }
    ASSERT_EQ(recorder.executed(), iota(3));
    ASSERT_EQ(chain->state(), ChainState::succeeded(3));
    ASSERT_EQ(chain->job_ids().size(), 3u);
    ASSERT_EQ(chain->job_names(), (std::vector<std::string>{"job-0", "job-1", "job-2"}));
    ASSERT_NO_THROW(chain->completion().get(std::chrono::seconds(1)));
}

TEST(JobChain, AbandonCleanupRunsOnlyForUndispatchedChains) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    int cleanups = 0;
    {
        auto chain = JobChain::build(queue, recorder.jobs(2), "dropped");
        chain->on_abandoned([&cleanups]() { ++cleanups; });
    }
    ASSERT_EQ(cleanups, 1);

    {
        auto chain = JobChain::build(queue, recorder.jobs(2), "finished");
        chain->on_abandoned([&cleanups]() { ++cleanups; });
        chain->dispatch();
        queue->run_all();
        ASSERT_EQ(chain->state(), ChainState::succeeded(2));
    }
    ASSERT_EQ(cleanups, 1);
}

TEST(JobChain, NonStandardExceptionFailsChain) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    std::vector<ChainJob> jobs;
    jobs.emplace_back("throws-int", []() { throw 42; });
    auto chain = JobChain::build(queue, std::move(jobs), "odd-throw");
    chain->append(ChainJob{"after", recorder.job(1)});
    std::vector<ChainState> observed;
    chain->on_failure([&observed](const ChainState& state, const std::string&) { observed.push_back(state); });

    chain->dispatch();
    ASSERT_NO_THROW(queue->run_all());
    ASSERT_EQ(chain->state(), ChainState::failed(0));
    ASSERT_TRUE(recorder.executed().empty());
    ASSERT_EQ(observed, (std::vector<ChainState>{ChainState::failed(0)}));
    ASSERT_TRUE(chain->failure_reason().has_value());
    ASSERT_THROW(chain->completion().get(std::chrono::seconds(1)), ChainAbortedException);
    ASSERT_EQ(queue->outcome(chain->job_ids()[0])->status_, async::JobStatus::FAILED);
}

TEST(JobChain, FailureSkipsEverythingAfter) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(3, 1), "failing");
    bool continuation_ran = false;
    chain->append(ChainJob{"notify", [&continuation_ran]() { continuation_ran = true; }});

    std::vector<std::pair<ChainState, std::string>> failures;
    chain->on_failure([&failures](const ChainState& state, const std::string& reason) {
        failures.emplace_back(state, reason);
    });

    chain->dispatch();
    queue->run_all();

    ASSERT_EQ(recorder.executed(), (std::vector<size_t>{0, 1}));
    ASSERT_FALSE(continuation_ran);
    ASSERT_EQ(chain->state(), ChainState::failed(1));
    ASSERT_EQ(chain->failure_reason(), std::optional<std::string>("job 1 failed"));
    ASSERT_EQ(failures.size(), 1u);
    ASSERT_EQ(failures[0].first, ChainState::failed(1));
    ASSERT_EQ(queue->enqueued().size(), 2u);

    try {
        chain->completion().get(std::chrono::seconds(1));
        FAIL() << "expected the chain to abort";
    } catch (const ChainAbortedException& e) {
        ASSERT_EQ(e.state(), ChainState::failed(1));
        ASSERT_EQ(e.reason(), "job 1 failed");
    }

    // Observers registered after the fact still hear about it
    bool late_observer = false;
    chain->on_failure([&late_observer](const ChainState&, const std::string&) { late_observer = true; });
    ASSERT_TRUE(late_observer);
}

TEST(JobChain, StaleAndDuplicateDeliveriesAreDropped) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(3), "redelivered");
    chain->dispatch();

    const auto first = queue->enqueued()[0].id_;
    queue->redeliver(first);
    ASSERT_TRUE(queue->run_next());
    // Chain moved on to job 1, the duplicate of job 0 must not run again
    ASSERT_EQ(queue->pending_deliveries(), 2u);
    queue->run_all();
    queue->redeliver(first);
    queue->redeliver(queue->enqueued()[2].id_);
    queue->run_all();

    ASSERT_EQ(recorder.executed(), iota(3));
    ASSERT_EQ(chain->state(), ChainState::succeeded(3));
}

TEST(JobChain, TransportFailureWithoutRunningFailsChain) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(2), "timed-out");
    chain->dispatch();
    queue->fail_without_running(queue->enqueued()[0].id_, "visibility timeout");
    ASSERT_EQ(chain->state(), ChainState::failed(0));
    ASSERT_EQ(chain->failure_reason(), std::optional<std::string>("visibility timeout"));
    ASSERT_TRUE(recorder.executed().empty());
}

TEST(JobChain, AppendUntilTerminal) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(1), "appended");
    chain->append(ChainJob{"job-1", recorder.job(1)});
    chain->dispatch();
    queue->run_next();
    chain->append(ChainJob{"job-2", recorder.job(2)});
    queue->run_all();

    ASSERT_EQ(recorder.executed(), iota(3));
    ASSERT_EQ(chain->state(), ChainState::succeeded(3));
    ASSERT_THROW(chain->append(ChainJob{"too-late", recorder.job(3)}), ConfigurationException);
}

TEST(JobChain, QueueOnlyBeforeDispatch) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(1), "routed");
    chain->all_on_queue("exports");
    chain->append(ChainJob{"job-1", recorder.job(1)});
    ASSERT_EQ(chain->queue_name(), "exports");
    chain->dispatch();
    ASSERT_THROW(chain->all_on_queue("elsewhere"), ConfigurationException);
    ASSERT_THROW(chain->dispatch(), ConfigurationException);
    queue->run_all();

    ASSERT_EQ(queue->enqueued().size(), 2u);
    for (const auto& delivery : queue->enqueued())
        ASSERT_EQ(delivery.queue_name_, "exports");
}

TEST(JobChain, DefaultQueue) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(1));
    chain->dispatch();
    ASSERT_EQ(queue->enqueued()[0].queue_name_, DefaultQueueName);
}

TEST(JobChain, EmptyChainSucceedsOnDispatch) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    auto chain = JobChain::build(queue, {}, "empty");
    chain->dispatch();
    ASSERT_EQ(chain->state(), ChainState::succeeded(0));
    ASSERT_EQ(queue->pending_deliveries(), 0u);
}

TEST(JobChain, CancelBeforeDispatch) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(2), "cancelled");
    bool observed = false;
    chain->on_failure([&observed](const ChainState& state, const std::string&) {
        observed = state == ChainState::cancelled(0);
    });
    ASSERT_TRUE(chain->cancel());
    ASSERT_TRUE(observed);
    ASSERT_FALSE(chain->cancel());
    ASSERT_THROW(chain->dispatch(), ConfigurationException);
    ASSERT_THROW(chain->append(ChainJob{"late", recorder.job(5)}), ConfigurationException);
    ASSERT_THROW(chain->completion().get(std::chrono::seconds(1)), ChainAbortedException);
}

TEST(JobChain, CancelStopsPendingJobs) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(3), "cancelled");
    chain->dispatch();
    queue->run_next();
    ASSERT_TRUE(chain->cancel());
    ASSERT_EQ(chain->state(), ChainState::cancelled(1));
    queue->run_all();
    ASSERT_EQ(recorder.executed(), (std::vector<size_t>{0}));
}

TEST(JobChain, CancelDuringJobWaitsForIt) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    std::shared_ptr<JobChain> chain;
    bool observed_during_job = false;
    bool observed = false;
    std::vector<ChainJob> jobs;
    jobs.emplace_back("cancels", [&]() {
        chain->cancel();
        observed_during_job = observed;
    });
    jobs.emplace_back("never", []() { FAIL() << "ran after cancel"; });
    chain = JobChain::build(queue, std::move(jobs), "self-cancelling");
    chain->on_failure([&observed](const ChainState&, const std::string&) { observed = true; });
    chain->dispatch();
    queue->run_all();

    ASSERT_FALSE(observed_during_job);
    ASSERT_TRUE(observed);
    ASSERT_EQ(chain->state(), ChainState::cancelled(0));
}

TEST(JobChain, HandleWrapsChain) {
    auto queue = std::make_shared<async::ManualJobQueue>();
    Recorder recorder;
    ChainHandle handle{JobChain::build(queue, recorder.jobs(1), "handled")};
    handle.set_queue("bulk").append("job-1", recorder.job(1));
    handle.dispatch();
    queue->run_all();
    ASSERT_NO_THROW(handle.wait());
    ASSERT_EQ(handle.state(), ChainState::succeeded(2));
    ASSERT_EQ(fmt::format("{}", handle.state()), "Succeeded(2)");
    ASSERT_EQ(handle.chain()->queue_name(), "bulk");
}

TEST(JobChain, RunsOnExecutorQueue) {
    auto sched = std::make_shared<async::TaskScheduler>(4);
    auto queue = std::make_shared<async::ExecutorJobQueue>(sched);
    Recorder recorder;
    auto chain = JobChain::build(queue, recorder.jobs(20), "threaded");
    chain->dispatch();
    ASSERT_NO_THROW(chain->completion().get(std::chrono::seconds(30)));
    ASSERT_EQ(recorder.executed(), iota(20));

    Recorder failing;
    auto failed = JobChain::build(queue, failing.jobs(5, 2), "threaded-failing");
    failed->dispatch();
    ASSERT_THROW(failed->completion().get(std::chrono::seconds(30)), ChainAbortedException);
    ASSERT_EQ(failing.executed(), iota(3));
    ASSERT_EQ(failed->state(), ChainState::failed(2));
    sched->join();
}
