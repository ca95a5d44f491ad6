/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/async/job_queue.hpp>
#include <chunkport/chain/chain_state.hpp>
#include <chunkport/util/constructors.hpp>

#include <folly/Function.h>
#include <folly/futures/Future.h>
#include <folly/futures/SharedPromise.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkport::chain {

inline constexpr const char* DefaultQueueName = "default";

struct ChainJob {
    std::string name_;
    folly::Function<void()> body_;

    ChainJob(std::string name, folly::Function<void()>&& body) :
        name_(std::move(name)),
        body_(std::move(body)) {
    }

    CHUNKPORT_MOVE_ONLY_DEFAULT(ChainJob)
};

using FailureObserver = folly::Function<void(const ChainState& state, const std::string& reason)>;

/*
 * An ordered list of jobs executed strictly one after another through a JobQueue.
 *
 * Only the job at the current index is ever handed to the transport; the next one is enqueued when the
 * current one reports success. Every delivery re-checks the chain state before running its body, so
 * duplicate, late or out of order deliveries from an at-least-once transport are dropped without running
 * anything. A failing job moves the chain to Failed(i) and no later job runs.
 *
 * Jobs may be appended until the chain is terminal. The queue can only be changed before dispatch.
 * A chain destroyed without ever being dispatched runs its abandon cleanups instead of the failure observers.
 */
class JobChain : public std::enable_shared_from_this<JobChain> {
public:
    static std::shared_ptr<JobChain> build(
        std::shared_ptr<async::JobQueue> queue,
        std::vector<ChainJob>&& jobs,
        std::string label = "chain");

    JobChain(std::shared_ptr<async::JobQueue> queue, std::vector<ChainJob>&& jobs, std::string label);

    ~JobChain();

    CHUNKPORT_NO_MOVE_OR_COPY(JobChain)

    void append(ChainJob&& job);

    void all_on_queue(std::string queue_name);

    void dispatch();

    // Returns false if the chain was already terminal
    bool cancel();

    // Called once when the chain ends Failed(i) or Cancelled(i), immediately if it already has
    void on_failure(FailureObserver&& observer);

    // Run from the destructor if the chain is dropped while still Pending
    void on_abandoned(folly::Function<void()>&& cleanup);

    [[nodiscard]] ChainState state() const;

    // Completes when the chain succeeds, fails with ChainAbortedException otherwise
    folly::SemiFuture<folly::Unit> completion();

    [[nodiscard]] const std::string& label() const { return label_; }

    [[nodiscard]] std::string queue_name() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] std::vector<std::string> job_names() const;

    // Transport ids of the jobs enqueued so far, in chain order
    [[nodiscard]] std::vector<async::JobId> job_ids() const;

    [[nodiscard]] std::optional<std::string> failure_reason() const;

private:
    struct Entry {
        std::string name_;
        folly::Function<void()> body_;
        bool started_ = false;
        bool finished_ = false;
        std::optional<async::JobId> job_id_;
    };

    ChainState state_locked() const;

    void enqueue(size_t index);

    void run(size_t index);

    void finished(size_t index, std::optional<std::string> error);

    void settle();

    std::shared_ptr<async::JobQueue> queue_;
    std::string label_;

    mutable std::mutex mutex_;
    std::vector<Entry> jobs_;
    std::string queue_name_ = DefaultQueueName;
    ChainStatus status_ = ChainStatus::PENDING;
    size_t current_ = 0;
    bool cancel_settle_pending_ = false;
    bool settled_ = false;
    std::string failure_reason_;
    std::vector<FailureObserver> failure_observers_;
    std::vector<folly::Function<void()>> abandon_cleanups_;
    folly::SharedPromise<folly::Unit> completion_;
};

} // namespace chunkport::chain
