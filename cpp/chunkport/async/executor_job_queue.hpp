/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/async/job_queue.hpp>
#include <chunkport/async/task_scheduler.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkport::async {

// In-process transport: every unit runs on the scheduler's IO pool, queue names only partition the statistics.
class ExecutorJobQueue final : public JobQueue {
public:
    explicit ExecutorJobQueue(std::shared_ptr<TaskScheduler> scheduler = TaskScheduler::instance());

    [[nodiscard]] std::string name() const override {
        return "executor";
    }

    [[nodiscard]] size_t submitted(const std::string& queue_name) const;

private:
    JobId do_enqueue(JobUnit&& unit, const std::string& queue_name) override;

    std::shared_ptr<TaskScheduler> scheduler_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> submitted_by_queue_;
};

} // namespace chunkport::async
