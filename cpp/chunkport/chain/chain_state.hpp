/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/util/error_code.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <string>

namespace chunkport::chain {

enum class ChainStatus {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

/*
 * Where a chain is. index_ is the job that is eligible to run (RUNNING), that failed (FAILED) or that was
 * current when the chain was cancelled (CANCELLED). For SUCCEEDED it is the number of jobs run.
 */
struct ChainState {
    ChainStatus status_ = ChainStatus::PENDING;
    size_t index_ = 0;

    [[nodiscard]] bool is_terminal() const {
        return status_ == ChainStatus::SUCCEEDED || status_ == ChainStatus::FAILED || status_ == ChainStatus::CANCELLED;
    }

    friend bool operator==(const ChainState&, const ChainState&) = default;

    static ChainState pending() { return {ChainStatus::PENDING, 0}; }
    static ChainState running(size_t index) { return {ChainStatus::RUNNING, index}; }
    static ChainState succeeded(size_t count) { return {ChainStatus::SUCCEEDED, count}; }
    static ChainState failed(size_t index) { return {ChainStatus::FAILED, index}; }
    static ChainState cancelled(size_t index) { return {ChainStatus::CANCELLED, index}; }
};

} // namespace chunkport::chain

namespace fmt {
template<>
struct formatter<chunkport::chain::ChainStatus> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(chunkport::chain::ChainStatus status, FormatContext &ctx) const {
        using chunkport::chain::ChainStatus;
        switch (status) {
        case ChainStatus::PENDING:
            return fmt::format_to(ctx.out(), "Pending");
        case ChainStatus::RUNNING:
            return fmt::format_to(ctx.out(), "Running");
        case ChainStatus::SUCCEEDED:
            return fmt::format_to(ctx.out(), "Succeeded");
        case ChainStatus::FAILED:
            return fmt::format_to(ctx.out(), "Failed");
        case ChainStatus::CANCELLED:
            return fmt::format_to(ctx.out(), "Cancelled");
        }
        return fmt::format_to(ctx.out(), "Unknown");
    }
};

template<>
struct formatter<chunkport::chain::ChainState> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const chunkport::chain::ChainState &state, FormatContext &ctx) const {
        if (state.status_ == chunkport::chain::ChainStatus::PENDING)
            return fmt::format_to(ctx.out(), "{}", state.status_);

        return fmt::format_to(ctx.out(), "{}({})", state.status_, state.index_);
    }
};
}

namespace chunkport::chain {

// Result of completion() for a chain that ended Failed(i) or Cancelled(i)
class ChainAbortedException : public ChunkportSpecificException<ErrorCode::E_CHAIN_ABORTED> {
public:
    ChainAbortedException(const std::string& label, ChainState state, std::string reason) :
        ChunkportSpecificException<ErrorCode::E_CHAIN_ABORTED>(fmt::format("{} Chain {} ended {}: {}",
            error_code_data<ErrorCode::E_CHAIN_ABORTED>.name_, label, state, reason)),
        state_(state),
        reason_(std::move(reason)) {
    }

    [[nodiscard]] const ChainState& state() const { return state_; }

    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    ChainState state_;
    std::string reason_;
};

} // namespace chunkport::chain
