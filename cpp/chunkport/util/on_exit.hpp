/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/log/log.hpp>
#include <chunkport/util/constructors.hpp>
#include <chunkport/util/error_code.hpp>

#include <folly/Function.h>

namespace chunkport {

struct OnExit {
    folly::Func func_;
    bool released_ = false;

    CHUNKPORT_NO_MOVE_OR_COPY(OnExit);

    explicit OnExit(folly::Func&& func) :
        func_(std::move(func)) {}

    ~OnExit() {
        if(!released_) {
            // Must not throw in destructor to avoid crashes
            try {
                func_();
            } catch (const std::exception& e) {
                log::root().error("Exception in OnExit: {}", e.what());
            } catch (...) {
                log::root().error("Exception in OnExit: {}", current_exception_message());
            }
        }
    }

    void release() {
        released_ = true;
    }
};

} // namespace chunkport
