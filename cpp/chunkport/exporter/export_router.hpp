/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/exporter/queued_writer.hpp>
#include <chunkport/exporter/sync_writer.hpp>

#include <memory>
#include <optional>

namespace chunkport::exporter {

class ExportRouter {
public:
    ExportRouter(std::shared_ptr<QueuedWriter> queued_writer, std::shared_ptr<SyncWriter> sync_writer);

    // Queued when the definition is flagged queue_by_default, in which case the chain handle is returned
    std::optional<chain::ChainHandle> store(const ExportDefinition& definition, const Destination& destination);

    chain::ChainHandle queue(const ExportDefinition& definition, const Destination& destination);

private:
    std::shared_ptr<QueuedWriter> queued_writer_;
    std::shared_ptr<SyncWriter> sync_writer_;
};

} // namespace chunkport::exporter
