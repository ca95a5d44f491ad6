/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/util/constructors.hpp>

#include <folly/Function.h>
#include <fmt/format.h>

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkport::async {

using JobId = uint64_t;

enum class JobStatus {
    PENDING,
    SUCCEEDED,
    FAILED
};

struct JobOutcome {
    JobId id_ = 0;
    JobStatus status_ = JobStatus::PENDING;
    std::string error_;

    [[nodiscard]] bool succeeded() const {
        return status_ == JobStatus::SUCCEEDED;
    }
};

// One deliverable unit of work. The body may be executed more than once by an at-least-once transport.
struct JobUnit {
    std::string name_;
    folly::Function<void()> body_;

    JobUnit(std::string name, folly::Function<void()>&& body) :
        name_(std::move(name)),
        body_(std::move(body)) {
    }

    CHUNKPORT_MOVE_ONLY_DEFAULT(JobUnit)
};

using CompletionCallback = folly::Function<void(const JobOutcome&)>;

/*
 * Outcome bookkeeping shared by the transports. A job completes at most once: later completions of the same
 * id, e.g. from a redelivered copy, are ignored. Callbacks registered after completion fire immediately on
 * the registering thread, others fire on the completing thread without any lock held.
 * Pending jobs are always tracked; only the most recent retained_outcomes completed ones are remembered, older
 * outcomes are forgotten and their ids look unknown.
 */
class JobRegistry {
public:
    // Defaults to JobQueue.RetainedOutcomes, 10000 if unset
    explicit JobRegistry(std::optional<size_t> retained_outcomes = std::nullopt);

    JobId register_job(const std::string& queue_name, const std::string& job_name);

    // Returns false if the job had already completed
    bool complete(JobId id, JobStatus status, std::string error = std::string{});

    void on_complete(JobId id, CompletionCallback&& callback);

    [[nodiscard]] std::optional<JobOutcome> outcome(JobId id) const;

    [[nodiscard]] std::optional<std::string> queue_name(JobId id) const;

private:
    struct Entry {
        std::string queue_name_;
        std::string job_name_;
        JobOutcome outcome_;
        std::vector<CompletionCallback> callbacks_;
    };

    mutable std::mutex mutex_;
    size_t retained_outcomes_;
    JobId next_id_ = 1;
    std::unordered_map<JobId, Entry> entries_;
    std::deque<JobId> completed_;
};

/*
 * The transport chains are dispatched on. Implementations decide where and when bodies run; chains only rely
 * on enqueue and on the completion signal.
 */
class JobQueue {
public:
    JobQueue() = default;
    virtual ~JobQueue() = default;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    JobId enqueue(JobUnit&& unit, const std::string& queue_name) {
        return do_enqueue(std::move(unit), queue_name);
    }

    void on_complete(JobId id, CompletionCallback&& callback) {
        registry_->on_complete(id, std::move(callback));
    }

    [[nodiscard]] std::optional<JobOutcome> outcome(JobId id) const {
        return registry_->outcome(id);
    }

    [[nodiscard]] std::optional<std::string> queue_name(JobId id) const {
        return registry_->queue_name(id);
    }

    [[nodiscard]] virtual std::string name() const = 0;

protected:
    [[nodiscard]] const std::shared_ptr<JobRegistry>& registry() const {
        return registry_;
    }

private:
    virtual JobId do_enqueue(JobUnit&& unit, const std::string& queue_name) = 0;

    std::shared_ptr<JobRegistry> registry_ = std::make_shared<JobRegistry>();
};

// Runs the body and records its outcome against id
void run_unit(JobRegistry& registry, JobId id, const std::string& job_name, folly::Function<void()>& body);

} // namespace chunkport::async

namespace fmt {
template<>
struct formatter<chunkport::async::JobStatus> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(chunkport::async::JobStatus status, FormatContext &ctx) const {
        using chunkport::async::JobStatus;
        switch (status) {
        case JobStatus::PENDING:
            return fmt::format_to(ctx.out(), "PENDING");
        case JobStatus::SUCCEEDED:
            return fmt::format_to(ctx.out(), "SUCCEEDED");
        case JobStatus::FAILED:
            return fmt::format_to(ctx.out(), "FAILED");
        }
        return fmt::format_to(ctx.out(), "UNKNOWN");
    }
};
}
