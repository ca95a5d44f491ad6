/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/export_router.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::exporter {

ExportRouter::ExportRouter(std::shared_ptr<QueuedWriter> queued_writer, std::shared_ptr<SyncWriter> sync_writer) :
    queued_writer_(std::move(queued_writer)),
    sync_writer_(std::move(sync_writer)) {
    util::check_arg(static_cast<bool>(queued_writer_) && static_cast<bool>(sync_writer_),
        "Export router requires both a queued and a synchronous writer");
}

std::optional<chain::ChainHandle> ExportRouter::store(const ExportDefinition& definition, const Destination& destination) {
    if (definition.queue_by_default()) {
        CHUNKPORT_DEBUG(log::exporter(), "Export {} is queued by default", definition.name());
        return queued_writer_->queue(definition, destination);
    }

    sync_writer_->write(definition, destination);
    return std::nullopt;
}

chain::ChainHandle ExportRouter::queue(const ExportDefinition& definition, const Destination& destination) {
    return queued_writer_->queue(definition, destination);
}

} // namespace chunkport::exporter
