/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/util/configs_map.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/async/base_task.hpp>
#include <chunkport/log/log.hpp>

#include <folly/executors/FutureExecutor.h>
#include <folly/executors/IOThreadPoolExecutor.h>
#include <folly/executors/thread_factory/NamedThreadFactory.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

namespace chunkport::async {

inline int64_t get_default_num_cpus() {
    return std::thread::hardware_concurrency() == 0 ? 16 : std::thread::hardware_concurrency();
}

/*
 * IO thread pool shared by the process. Chunk jobs dispatched through the default job queue run here since
 * they spend most of their time reading the source and writing artifacts.
 */
class TaskScheduler {
  public:
    using IOSchedulerType = folly::FutureExecutor<folly::IOThreadPoolExecutor>;

    explicit TaskScheduler(const std::optional<size_t>& io_thread_count = std::nullopt) :
        io_thread_count_(io_thread_count ? *io_thread_count : ConfigsMap::instance()->get_int("Scheduler.NumIOThreads", (int64_t) (get_default_num_cpus() * 1.5))),
        io_exec_(io_thread_count_, std::make_shared<folly::NamedThreadFactory>("IOPool")) {
        util::check(io_thread_count_ > 0, "Zero IO threads: {}", io_thread_count_);
        CHUNKPORT_RUNTIME_DEBUG(log::schedule(), "Task scheduler created with {:d} IO threads", io_thread_count_);
    }

    template<class Task>
    auto submit_io_task(Task &&t) {
        auto task = std::forward<decltype(t)>(t);
        static_assert(std::is_base_of_v<BaseTask, std::decay_t<Task>>, "Only support Tasks derived from BaseTask");
        CHUNKPORT_DEBUG(log::schedule(), "{} Submitting IO task {}: {}", uintptr_t(this), typeid(task).name(), io_exec_.getPendingTaskCount());
        std::lock_guard lock{io_mutex_};
        return io_exec_.addFuture(std::move(task));
    }

    static std::shared_ptr<TaskScheduler> instance();
    static void destroy_instance();

    void join() {
        CHUNKPORT_DEBUG(log::schedule(), "Joining task scheduler");
        io_exec_.join();
    }

    void stop() {
        CHUNKPORT_DEBUG(log::schedule(), "Stopping task scheduler");
        io_exec_.stop();
    }

    size_t io_thread_count() const {
        return io_thread_count_;
    }

private:
    static void init();

    size_t io_thread_count_;
    IOSchedulerType io_exec_;
    std::mutex io_mutex_;
};

} // namespace chunkport::async
