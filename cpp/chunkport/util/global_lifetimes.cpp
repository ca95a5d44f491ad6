/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/util/global_lifetimes.hpp>
#include <chunkport/async/task_scheduler.hpp>
#include <chunkport/log/log.hpp>

namespace chunkport {

void shutdown_globals() {
    async::TaskScheduler::destroy_instance();
    log::Loggers::destroy_instance();
}

} // namespace chunkport
