/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/chain/job_chain.hpp>

#include <memory>
#include <string>

namespace chunkport::chain {

// What callers get back for a queued export. Copies share the same chain.
class ChainHandle {
public:
    explicit ChainHandle(std::shared_ptr<JobChain> chain) :
        chain_(std::move(chain)) {
    }

    ChainHandle& set_queue(std::string queue_name) {
        chain_->all_on_queue(std::move(queue_name));
        return *this;
    }

    ChainHandle& append(std::string name, folly::Function<void()>&& body) {
        chain_->append(ChainJob{std::move(name), std::move(body)});
        return *this;
    }

    void dispatch() {
        chain_->dispatch();
    }

    bool cancel() {
        return chain_->cancel();
    }

    [[nodiscard]] ChainState state() const {
        return chain_->state();
    }

    folly::SemiFuture<folly::Unit> completion() {
        return chain_->completion();
    }

    // Blocks until the chain is terminal, rethrowing ChainAbortedException if it did not succeed
    void wait() {
        chain_->completion().get();
    }

    [[nodiscard]] const std::shared_ptr<JobChain>& chain() const {
        return chain_;
    }

private:
    std::shared_ptr<JobChain> chain_;
};

} // namespace chunkport::chain
