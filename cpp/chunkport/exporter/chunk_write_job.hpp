/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/chunk.hpp>
#include <chunkport/exporter/row_formatter.hpp>
#include <chunkport/source/data_source.hpp>
#include <chunkport/storage/artifact_store.hpp>

#include <memory>
#include <string>

namespace chunkport::exporter {

/*
 * Writes the rows of one chunk into the artifact slot numbered by the chunk index. Executing it again replaces
 * the slot with the same bytes. Failures are raised as ChunkWriteException and never retried here.
 */
class ChunkWriteJob {
public:
    ChunkWriteJob(
        std::shared_ptr<source::DataSource> source,
        uint64_t chunk_size,
        ChunkIndex index,
        storage::ArtifactHandle artifact,
        std::shared_ptr<const RowFormatter> formatter);

    // Reads this job's chunk from the source, then writes it
    void execute() const;

    void execute(const Chunk& chunk, const storage::ArtifactHandle& artifact) const;

    [[nodiscard]] ChunkIndex index() const {
        return index_;
    }

    [[nodiscard]] std::string name() const;

private:
    Chunk read_chunk() const;

    std::shared_ptr<source::DataSource> source_;
    uint64_t chunk_size_;
    ChunkIndex index_;
    storage::ArtifactHandle artifact_;
    std::shared_ptr<const RowFormatter> formatter_;
};

} // namespace chunkport::exporter
