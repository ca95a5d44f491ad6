/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/async/task_scheduler.hpp>

namespace chunkport::async {

namespace {
std::shared_ptr<TaskScheduler> scheduler_instance_;
std::mutex scheduler_mutex_;
} // namespace

std::shared_ptr<TaskScheduler> TaskScheduler::instance() {
    std::lock_guard lock{scheduler_mutex_};
    if (!scheduler_instance_)
        init();
    return scheduler_instance_;
}

void TaskScheduler::init() {
    scheduler_instance_ = std::make_shared<TaskScheduler>();
}

void TaskScheduler::destroy_instance() {
    std::shared_ptr<TaskScheduler> instance;
    {
        std::lock_guard lock{scheduler_mutex_};
        instance = std::move(scheduler_instance_);
    }
    if (instance)
        instance->stop();
}

} // namespace chunkport::async
