/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/queued_writer.hpp>
#include <chunkport/exporter/chunk_write_job.hpp>
#include <chunkport/exporter/finalize_export_job.hpp>
#include <chunkport/chain/job_chain.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/configs_map.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::exporter {

QueuedWriterOptions QueuedWriterOptions::from_config() {
    QueuedWriterOptions options;
    options.queue_name_ = ConfigsMap::instance()->get_string("Export.DefaultQueue", chain::DefaultQueueName);
    return options;
}

QueuedWriter::QueuedWriter(
    std::shared_ptr<async::JobQueue> queue,
    std::shared_ptr<storage::TemporaryArtifactStore> store,
    std::shared_ptr<const RowFormatter> formatter,
    QueuedWriterOptions options) :
    queue_(std::move(queue)),
    store_(std::move(store)),
    formatter_(std::move(formatter)),
    options_(std::move(options)) {
    util::check_arg(static_cast<bool>(queue_), "Queued writer requires a job queue");
    util::check_arg(static_cast<bool>(store_), "Queued writer requires a temporary artifact store");
    util::check_arg(static_cast<bool>(formatter_), "Queued writer requires a row formatter");
}

bool QueuedWriter::multi_host() const {
    if (options_.multi_host_)
        return *options_.multi_host_;

    return ConfigsMap::instance()->get_int("Export.MultiHost", 0) != 0;
}

chain::ChainHandle QueuedWriter::queue(const ExportDefinition& definition, const Destination& destination) {
    const auto chunk_size = resolve_chunk_size(definition);
    auto sizer = make_chunk_sizer(definition);
    const auto chunk_count = sizer->chunk_count(*definition.source(), static_cast<int64_t>(chunk_size));

    std::vector<chain::ChainJob> jobs;
    sizing::check<ErrorCode::E_CHUNK_COUNT_OVERFLOW>(chunk_count < jobs.max_size(),
        "Export {} sized as {} chunks, more jobs than a chain can hold", definition.name(), chunk_count);

    store_->check_topology(multi_host());
    auto artifact_scope = store_->scoped(store_->generate_key(definition.name()));
    const auto& artifact = artifact_scope->handle();

    jobs.reserve(chunk_count);
    for (ChunkIndex index = 0; index < chunk_count; ++index) {
        ChunkWriteJob job{definition.source(), chunk_size, index, artifact, formatter_};
        auto name = job.name();
        jobs.emplace_back(std::move(name), [job = std::move(job)]() { job.execute(); });
    }

    auto chain = chain::JobChain::build(queue_, std::move(jobs), fmt::format("export-{}", definition.name()));
    FinalizeExportJob finalize{artifact, chunk_count, destination, definition.headings(), formatter_};
    chain->append(chain::ChainJob{"finalize", [finalize = std::move(finalize)]() { finalize.execute(); }});
    chain->all_on_queue(options_.queue_name_);

    chain->on_failure([artifact, definition](const chain::ChainState& state, const std::string& reason) {
        try {
            artifact.release();
        } catch (const std::exception& e) {
            log::exporter().error("Failed to release artifact {} of export {}: {}", artifact.key(), definition.name(), e.what());
        }
        log::exporter().warn("Export {} ended {}: {}", definition.name(), state, reason);
        definition.failed(reason);
    });

    chain->on_abandoned([artifact]() {
        artifact.release();
    });

    log::exporter().info("Queued export {} as {} chunks of {} rows ({} sizer) on queue {}, artifact {} on {}",
        definition.name(), chunk_count, chunk_size, sizer->name(), options_.queue_name_, artifact.key(), store_->backend()->name());

    if (options_.dispatch_)
        chain->dispatch();

    artifact_scope->keep();
    return chain::ChainHandle{std::move(chain)};
}

} // namespace chunkport::exporter
