/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/chunk_write_job.hpp>
#include <chunkport/chunk/chunk_iterator.hpp>
#include <chunkport/chunk/chunk_sizer.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::exporter {

ChunkWriteJob::ChunkWriteJob(
    std::shared_ptr<source::DataSource> source,
    uint64_t chunk_size,
    ChunkIndex index,
    storage::ArtifactHandle artifact,
    std::shared_ptr<const RowFormatter> formatter) :
    source_(std::move(source)),
    chunk_size_(chunk_size),
    index_(index),
    artifact_(std::move(artifact)),
    formatter_(std::move(formatter)) {
    util::check_arg(static_cast<bool>(source_), "Chunk job {} has no data source", index_);
    util::check_arg(static_cast<bool>(formatter_), "Chunk job {} has no row formatter", index_);
}

std::string ChunkWriteJob::name() const {
    return fmt::format("chunk-{}", index_);
}

void ChunkWriteJob::execute() const {
    execute(read_chunk(), artifact_);
}

Chunk ChunkWriteJob::read_chunk() const {
    try {
        chunking::ChunkIterator iterator{source_, chunk_size_, index_, 1};
        if (auto chunk = iterator.next_chunk(); chunk)
            return std::move(*chunk);
    } catch (const std::exception& e) {
        chunk_write::raise<ErrorCode::E_ROW_READ_FAILED>("Reading chunk {} of {} failed: {}", index_, source_->name(), e.what());
    } catch (...) {
        chunk_write::raise<ErrorCode::E_ROW_READ_FAILED>("Reading chunk {} of {} failed: {}", index_, source_->name(), current_exception_message());
    }

    // The source shrank after sizing, the slot is still written so the merge finds every index
    log::chunk().warn("Chunk {} of {} is past the end of the source, writing it empty", index_, source_->name());
    const auto range = chunking::chunk_range(index_, chunk_size_);
    return Chunk{range.index_, range.offset_, Rows{}};
}

void ChunkWriteJob::execute(const Chunk& chunk, const storage::ArtifactHandle& artifact) const {
    std::string data;
    try {
        data = formatter_->format_rows(chunk.rows_);
    } catch (const std::exception& e) {
        chunk_write::raise<ErrorCode::E_ROW_SERIALIZATION_FAILED>("Formatting chunk {} as {} failed: {}", chunk.index_, formatter_->name(), e.what());
    } catch (...) {
        chunk_write::raise<ErrorCode::E_ROW_SERIALIZATION_FAILED>("Formatting chunk {} as {} failed: {}", chunk.index_, formatter_->name(), current_exception_message());
    }

    try {
        artifact.write_slot(chunk.index_, data);
    } catch (const std::exception& e) {
        chunk_write::raise<ErrorCode::E_ARTIFACT_WRITE_FAILED>("Writing chunk {} to artifact {} failed: {}", chunk.index_, artifact.key(), e.what());
    } catch (...) {
        chunk_write::raise<ErrorCode::E_ARTIFACT_WRITE_FAILED>("Writing chunk {} to artifact {} failed: {}", chunk.index_, artifact.key(), current_exception_message());
    }

    log::chunk().debug("Wrote chunk {} ({} rows, {} bytes) to artifact {}", chunk.index_, chunk.row_count(), data.size(), artifact.key());
}

} // namespace chunkport::exporter
