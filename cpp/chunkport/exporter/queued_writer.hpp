/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/async/job_queue.hpp>
#include <chunkport/chain/chain_handle.hpp>
#include <chunkport/exporter/export_definition.hpp>
#include <chunkport/exporter/row_formatter.hpp>
#include <chunkport/storage/artifact_store.hpp>

#include <memory>
#include <optional>
#include <string>

namespace chunkport::exporter {

struct QueuedWriterOptions {
    std::string queue_name_ = chain::DefaultQueueName;
    // When false the chain is returned undispatched so the caller can still move it or append to it. Dropping
    // every handle to such a chain without dispatching or cancelling it releases the artifact.
    bool dispatch_ = true;
    // Unset means Export.MultiHost
    std::optional<bool> multi_host_;

    // Queue name from Export.DefaultQueue
    static QueuedWriterOptions from_config();
};

/*
 * Splits an export into one ChunkWriteJob per chunk plus a FinalizeExportJob, chains them on the job queue and
 * returns without waiting. Configuration and sizing errors are raised before anything is created or enqueued.
 * If the chain fails or is cancelled the artifact is released and the definition's failure callback is
 * invoked with the reason.
 */
class QueuedWriter {
public:
    QueuedWriter(
        std::shared_ptr<async::JobQueue> queue,
        std::shared_ptr<storage::TemporaryArtifactStore> store,
        std::shared_ptr<const RowFormatter> formatter = std::make_shared<CsvRowFormatter>(),
        QueuedWriterOptions options = QueuedWriterOptions::from_config());

    chain::ChainHandle queue(const ExportDefinition& definition, const Destination& destination);

    [[nodiscard]] const QueuedWriterOptions& options() const {
        return options_;
    }

    [[nodiscard]] bool multi_host() const;

private:
    std::shared_ptr<async::JobQueue> queue_;
    std::shared_ptr<storage::TemporaryArtifactStore> store_;
    std::shared_ptr<const RowFormatter> formatter_;
    QueuedWriterOptions options_;
};

} // namespace chunkport::exporter
