/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/chain/job_chain.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::chain {

std::shared_ptr<JobChain> JobChain::build(
    std::shared_ptr<async::JobQueue> queue,
    std::vector<ChainJob>&& jobs,
    std::string label) {
    return std::make_shared<JobChain>(std::move(queue), std::move(jobs), std::move(label));
}

JobChain::JobChain(std::shared_ptr<async::JobQueue> queue, std::vector<ChainJob>&& jobs, std::string label) :
    queue_(std::move(queue)),
    label_(std::move(label)) {
    util::check_arg(static_cast<bool>(queue_), "Chain {} requires a job queue", label_);
    jobs_.reserve(jobs.size());
    for (auto& job : jobs)
        jobs_.push_back(Entry{std::move(job.name_), std::move(job.body_)});
}

JobChain::~JobChain() {
    if (status_ != ChainStatus::PENDING)
        return;

    if (!abandon_cleanups_.empty())
        log::chain().warn("Chain {} dropped before dispatch, cleaning up", label_);

    for (auto& cleanup : abandon_cleanups_) {
        try {
            cleanup();
        } catch (const std::exception& e) {
            log::chain().error("Cleanup of abandoned chain {} raised: {}", label_, e.what());
        } catch (...) {
            log::chain().error("Cleanup of abandoned chain {} raised: {}", label_, current_exception_message());
        }
    }
}

void JobChain::on_abandoned(folly::Function<void()>&& cleanup) {
    std::lock_guard lock{mutex_};
    abandon_cleanups_.emplace_back(std::move(cleanup));
}

void JobChain::append(ChainJob&& job) {
    std::lock_guard lock{mutex_};
    configuration::check<ErrorCode::E_CHAIN_TERMINATED>(!state_locked().is_terminal(),
        "Cannot append {} to chain {} which is {}", job.name_, label_, state_locked());
    jobs_.push_back(Entry{std::move(job.name_), std::move(job.body_)});
}

void JobChain::all_on_queue(std::string queue_name) {
    std::lock_guard lock{mutex_};
    configuration::check<ErrorCode::E_CHAIN_ALREADY_DISPATCHED>(status_ == ChainStatus::PENDING,
        "Cannot move chain {} to queue {} once it is {}", label_, queue_name, state_locked());
    queue_name_ = std::move(queue_name);
}

void JobChain::dispatch() {
    bool empty;
    {
        std::lock_guard lock{mutex_};
        configuration::check<ErrorCode::E_CHAIN_ALREADY_DISPATCHED>(status_ == ChainStatus::PENDING,
            "Chain {} cannot be dispatched, it is {}", label_, state_locked());
        empty = jobs_.empty();
        status_ = empty ? ChainStatus::SUCCEEDED : ChainStatus::RUNNING;
        current_ = 0;
        log::chain().debug("Dispatching chain {} with {} jobs on queue {}", label_, jobs_.size(), queue_name_);
    }

    if (empty)
        settle();
    else
        enqueue(0);
}

bool JobChain::cancel() {
    bool settle_now;
    {
        std::lock_guard lock{mutex_};
        if (state_locked().is_terminal())
            return false;

        const bool in_flight = status_ == ChainStatus::RUNNING && jobs_[current_].started_ && !jobs_[current_].finished_;
        status_ = ChainStatus::CANCELLED;
        failure_reason_ = "cancelled";
        cancel_settle_pending_ = in_flight;
        settle_now = !in_flight;
        log::chain().info("Cancelled chain {} at job {}{}", label_, current_, in_flight ? ", waiting for the running job" : "");
    }

    if (settle_now)
        settle();

    return true;
}

void JobChain::on_failure(FailureObserver&& observer) {
    ChainState state;
    std::string reason;
    {
        std::lock_guard lock{mutex_};
        if (!settled_) {
            failure_observers_.emplace_back(std::move(observer));
            return;
        }
        state = state_locked();
        reason = failure_reason_;
    }

    if (state.status_ != ChainStatus::SUCCEEDED)
        observer(state, reason);
}

ChainState JobChain::state() const {
    std::lock_guard lock{mutex_};
    return state_locked();
}

ChainState JobChain::state_locked() const {
    switch (status_) {
    case ChainStatus::PENDING:
        return ChainState::pending();
    case ChainStatus::RUNNING:
        return ChainState::running(current_);
    case ChainStatus::SUCCEEDED:
        return ChainState::succeeded(jobs_.size());
    case ChainStatus::FAILED:
        return ChainState::failed(current_);
    case ChainStatus::CANCELLED:
        return ChainState::cancelled(current_);
    }
    util::raise_rte("Unknown chain status {}", static_cast<int>(status_));
}

folly::SemiFuture<folly::Unit> JobChain::completion() {
    return completion_.getSemiFuture();
}

std::string JobChain::queue_name() const {
    std::lock_guard lock{mutex_};
    return queue_name_;
}

size_t JobChain::size() const {
    std::lock_guard lock{mutex_};
    return jobs_.size();
}

std::vector<std::string> JobChain::job_names() const {
    std::lock_guard lock{mutex_};
    std::vector<std::string> names;
    names.reserve(jobs_.size());
    for (const auto& job : jobs_)
        names.push_back(job.name_);
    return names;
}

std::vector<async::JobId> JobChain::job_ids() const {
    std::lock_guard lock{mutex_};
    std::vector<async::JobId> ids;
    for (const auto& job : jobs_) {
        if (job.job_id_)
            ids.push_back(*job.job_id_);
    }
    return ids;
}

std::optional<std::string> JobChain::failure_reason() const {
    std::lock_guard lock{mutex_};
    if (status_ != ChainStatus::FAILED && status_ != ChainStatus::CANCELLED)
        return std::nullopt;

    return failure_reason_;
}

void JobChain::enqueue(size_t index) {
    std::string queue_name;
    std::string job_name;
    {
        std::lock_guard lock{mutex_};
        queue_name = queue_name_;
        job_name = jobs_[index].name_;
    }

    async::JobId id;
    try {
        id = queue_->enqueue(async::JobUnit{fmt::format("{}/{}", label_, job_name), [self = shared_from_this(), index]() {
            self->run(index);
        }}, queue_name);
    } catch (const std::exception& e) {
        log::chain().error("Failed to enqueue job {} ({}) of chain {} on {}: {}", index, job_name, label_, queue_name, e.what());
        finished(index, std::string(e.what()));
        return;
    } catch (...) {
        auto error = current_exception_message();
        log::chain().error("Failed to enqueue job {} ({}) of chain {} on {}: {}", index, job_name, label_, queue_name, error);
        finished(index, std::move(error));
        return;
    }

    {
        std::lock_guard lock{mutex_};
        jobs_[index].job_id_ = id;
    }
    CHUNKPORT_DEBUG(log::chain(), "Enqueued job {} ({}) of chain {} as {}", index, job_name, label_, id);

    // Failures the transport reports without our body having run, e.g. a rejected submission
    queue_->on_complete(id, [weak = weak_from_this(), index](const async::JobOutcome& outcome) {
        if (outcome.succeeded())
            return;

        if (auto self = weak.lock())
            self->finished(index, outcome.error_);
    });
}

void JobChain::run(size_t index) {
    folly::Function<void()> body;
    {
        std::lock_guard lock{mutex_};
        if (status_ != ChainStatus::RUNNING || index != current_ || jobs_[index].started_) {
            log::chain().info("Dropping delivery of job {} of chain {}: chain is {}{}", index, label_, state_locked(),
                index < jobs_.size() && jobs_[index].started_ ? " and the job already ran" : "");
            return;
        }
        jobs_[index].started_ = true;
        body = std::move(jobs_[index].body_);
        log::chain().debug("Running job {} ({}) of chain {}", index, jobs_[index].name_, label_);
    }

    try {
        body();
    } catch (const std::exception& e) {
        finished(index, std::string(e.what()));
        throw;
    } catch (...) {
        finished(index, current_exception_message());
        throw;
    }
    finished(index, std::nullopt);
}

void JobChain::finished(size_t index, std::optional<std::string> error) {
    std::unique_lock lock{mutex_};
    auto& entry = jobs_[index];
    if (entry.finished_)
        return;

    entry.finished_ = true;

    if (status_ == ChainStatus::CANCELLED) {
        if (cancel_settle_pending_ && index == current_) {
            cancel_settle_pending_ = false;
            lock.unlock();
            settle();
        }
        return;
    }

    if (status_ != ChainStatus::RUNNING || index != current_)
        return;

    if (error) {
        status_ = ChainStatus::FAILED;
        failure_reason_ = std::move(*error);
        log::chain().warn("Chain {} failed at job {} ({}): {}", label_, index, entry.name_, failure_reason_);
        lock.unlock();
        settle();
        return;
    }

    if (index + 1 == jobs_.size()) {
        status_ = ChainStatus::SUCCEEDED;
        log::chain().info("Chain {} succeeded after {} jobs", label_, jobs_.size());
        lock.unlock();
        settle();
        return;
    }

    current_ = index + 1;
    lock.unlock();
    enqueue(index + 1);
}

void JobChain::settle() {
    ChainState state;
    std::string reason;
    std::vector<FailureObserver> observers;
    {
        std::lock_guard lock{mutex_};
        if (settled_)
            return;

        settled_ = true;
        state = state_locked();
        reason = failure_reason_;
        observers.swap(failure_observers_);
    }

    if (state.status_ == ChainStatus::SUCCEEDED) {
        completion_.setValue();
        return;
    }

    for (auto& observer : observers) {
        try {
            observer(state, reason);
        } catch (const std::exception& e) {
            log::chain().error("Failure observer of chain {} raised: {}", label_, e.what());
        } catch (...) {
            log::chain().error("Failure observer of chain {} raised: {}", label_, current_exception_message());
        }
    }
    completion_.setException(folly::make_exception_wrapper<ChainAbortedException>(label_, state, reason));
}

} // namespace chunkport::chain
