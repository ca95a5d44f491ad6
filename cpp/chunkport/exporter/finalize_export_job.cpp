/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/finalize_export_job.hpp>
#include <chunkport/exporter/destination_file.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::exporter {

FinalizeExportJob::FinalizeExportJob(
    storage::ArtifactHandle artifact,
    uint64_t chunk_count,
    Destination destination,
    std::optional<Row> headings,
    std::shared_ptr<const RowFormatter> formatter) :
    artifact_(std::move(artifact)),
    chunk_count_(chunk_count),
    destination_(std::move(destination)),
    headings_(std::move(headings)),
    formatter_(std::move(formatter)) {
    util::check_arg(static_cast<bool>(formatter_), "Finalize job for {} has no row formatter", artifact_.key());
}

void FinalizeExportJob::execute() const {
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(artifact_.exists(),
        "Artifact {} does not exist, cannot finalize {}", artifact_.key(), destination_.path_.string());
    for (uint64_t slot = 0; slot < chunk_count_; ++slot) {
        missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(artifact_.slot_exists(slot),
            "Artifact {} is missing chunk {} of {}", artifact_.key(), slot, chunk_count_);
    }

    write_destination(destination_.path_, [this](std::ostream& out) {
        if (headings_)
            out << formatter_->format_row(*headings_);

        for (uint64_t slot = 0; slot < chunk_count_; ++slot)
            out << artifact_.read_slot(slot);
    });
    log::exporter().info("Merged {} chunks of artifact {} into {}", chunk_count_, artifact_.key(), destination_.path_.string());

    try {
        artifact_.release();
    } catch (const std::exception& e) {
        log::exporter().warn("Export {} is complete but artifact {} could not be released: {}",
            destination_.path_.string(), artifact_.key(), e.what());
    }
}

} // namespace chunkport::exporter
