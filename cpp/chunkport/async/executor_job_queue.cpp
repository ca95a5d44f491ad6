/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/async/executor_job_queue.hpp>

#include <functional>

namespace chunkport::async {

namespace {

struct RunJobTask : BaseTask {
    std::function<void()> run_;

    explicit RunJobTask(std::function<void()> run) :
        run_(std::move(run)) {
    }

    CHUNKPORT_MOVE_ONLY_DEFAULT(RunJobTask)

    folly::Unit operator()() {
        run_();
        return folly::Unit{};
    }
};

} // namespace

ExecutorJobQueue::ExecutorJobQueue(std::shared_ptr<TaskScheduler> scheduler) :
    scheduler_(std::move(scheduler)) {
    util::check(static_cast<bool>(scheduler_), "Executor job queue requires a task scheduler");
}

JobId ExecutorJobQueue::do_enqueue(JobUnit&& unit, const std::string& queue_name) {
    const auto id = registry()->register_job(queue_name, unit.name_);
    {
        std::lock_guard lock{mutex_};
        ++submitted_by_queue_[queue_name];
    }
    CHUNKPORT_DEBUG(log::schedule(), "Submitting job {} ({}) on queue {}", id, unit.name_, queue_name);

    auto shared_unit = std::make_shared<JobUnit>(std::move(unit));
    try {
        scheduler_->submit_io_task(RunJobTask{[registry = registry(), id, shared_unit]() {
            run_unit(*registry, id, shared_unit->name_, shared_unit->body_);
        }});
    } catch (const std::exception& e) {
        log::schedule().error("Failed to submit job {} ({}) on queue {}: {}", id, shared_unit->name_, queue_name, e.what());
        registry()->complete(id, JobStatus::FAILED, e.what());
    }
    return id;
}

size_t ExecutorJobQueue::submitted(const std::string& queue_name) const {
    std::lock_guard lock{mutex_};
    auto it = submitted_by_queue_.find(queue_name);
    return it == submitted_by_queue_.end() ? 0 : it->second;
}

} // namespace chunkport::async
