/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/async/job_queue.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/error_code.hpp>
#include <chunkport/util/configs_map.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::async {

JobRegistry::JobRegistry(std::optional<size_t> retained_outcomes) :
    retained_outcomes_(retained_outcomes ? *retained_outcomes :
        static_cast<size_t>(ConfigsMap::instance()->get_int("JobQueue.RetainedOutcomes", 10000))) {
    util::check_arg(retained_outcomes_ > 0, "Job registry must retain at least one outcome");
}

JobId JobRegistry::register_job(const std::string& queue_name, const std::string& job_name) {
    std::lock_guard lock{mutex_};
    const auto id = next_id_++;
    auto& entry = entries_[id];
    entry.queue_name_ = queue_name;
    entry.job_name_ = job_name;
    entry.outcome_.id_ = id;
    return id;
}

bool JobRegistry::complete(JobId id, JobStatus status, std::string error) {
    std::vector<CompletionCallback> callbacks;
    JobOutcome outcome;
    {
        std::lock_guard lock{mutex_};
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            log::schedule().warn("Completion reported for unknown job {}", id);
            return false;
        }
        auto& entry = it->second;
        if (entry.outcome_.status_ != JobStatus::PENDING) {
            log::schedule().debug("Ignoring repeated completion of job {} ({}), already {}",
                id, entry.job_name_, entry.outcome_.status_);
            return false;
        }
        entry.outcome_.status_ = status;
        entry.outcome_.error_ = std::move(error);
        outcome = entry.outcome_;
        callbacks.swap(entry.callbacks_);

        completed_.push_back(id);
        while (completed_.size() > retained_outcomes_) {
            entries_.erase(completed_.front());
            completed_.pop_front();
        }
    }

    for (auto& callback : callbacks)
        callback(outcome);

    return true;
}

void JobRegistry::on_complete(JobId id, CompletionCallback&& callback) {
    std::optional<JobOutcome> completed;
    {
        std::lock_guard lock{mutex_};
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            log::schedule().warn("Completion callback registered for unknown job {}", id);
            return;
        }
        if (it->second.outcome_.status_ == JobStatus::PENDING)
            it->second.callbacks_.emplace_back(std::move(callback));
        else
            completed = it->second.outcome_;
    }

    if (completed)
        callback(*completed);
}

std::optional<JobOutcome> JobRegistry::outcome(JobId id) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;

    return it->second.outcome_;
}

std::optional<std::string> JobRegistry::queue_name(JobId id) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;

    return it->second.queue_name_;
}

void run_unit(JobRegistry& registry, JobId id, const std::string& job_name, folly::Function<void()>& body) {
    try {
        body();
    } catch (const std::exception& e) {
        log::schedule().warn("Job {} ({}) failed: {}", id, job_name, e.what());
        registry.complete(id, JobStatus::FAILED, e.what());
        return;
    } catch (...) {
        auto error = current_exception_message();
        log::schedule().warn("Job {} ({}) failed: {}", id, job_name, error);
        registry.complete(id, JobStatus::FAILED, std::move(error));
        return;
    }
    registry.complete(id, JobStatus::SUCCEEDED);
}

} // namespace chunkport::async
