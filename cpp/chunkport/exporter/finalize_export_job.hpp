/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/exporter/export_definition.hpp>
#include <chunkport/exporter/row_formatter.hpp>
#include <chunkport/storage/artifact_store.hpp>

#include <memory>
#include <optional>

namespace chunkport::exporter {

/*
 * Last job of a queued export: concatenates headings and slots 0..chunk_count-1 into the destination, then
 * releases the artifact. Raises ArtifactNotFoundException if the artifact or any slot is missing, in which
 * case the destination is left untouched.
 */
class FinalizeExportJob {
public:
    FinalizeExportJob(
        storage::ArtifactHandle artifact,
        uint64_t chunk_count,
        Destination destination,
        std::optional<Row> headings,
        std::shared_ptr<const RowFormatter> formatter);

    void execute() const;

private:
    storage::ArtifactHandle artifact_;
    uint64_t chunk_count_;
    Destination destination_;
    std::optional<Row> headings_;
    std::shared_ptr<const RowFormatter> formatter_;
};

} // namespace chunkport::exporter
