/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/chunk/chunk_iterator.hpp>
#include <chunkport/chunk/chunk_sizer.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/log/log.hpp>

namespace chunkport::chunking {

ChunkIterator::ChunkIterator(
    std::shared_ptr<source::DataSource> source,
    uint64_t chunk_size,
    ChunkIndex start_index,
    std::optional<uint64_t> chunk_limit) :
        source_(std::move(source)),
        chunk_size_(chunk_size),
        index_(start_index) {
    util::check_arg(static_cast<bool>(source_), "Chunk iterator requires a data source");
    configuration::check<ErrorCode::E_INVALID_CHUNK_SIZE>(chunk_size_ > 0, "Chunk size must be positive");
    if (chunk_limit)
        end_index_ = start_index + *chunk_limit;
}

std::optional<Chunk> ChunkIterator::next_chunk() {
    if (exhausted_)
        return std::nullopt;

    if (end_index_ && index_ >= *end_index_) {
        exhausted_ = true;
        return std::nullopt;
    }

    const auto range = chunk_range(index_, chunk_size_);
    auto rows = source_->fetch_range(range.offset_, range.limit_);
    CHUNKPORT_DEBUG(log::chunk(), "Fetched {} rows for {} of '{}'", rows.size(), range, source_->name());
    if (rows.empty()) {
        exhausted_ = true;
        return std::nullopt;
    }

    util::check(rows.size() <= chunk_size_, "Source '{}' returned {} rows for a chunk of {}",
                source_->name(), rows.size(), chunk_size_);
    if (rows.size() < chunk_size_)
        exhausted_ = true;

    ++index_;
    return Chunk{range.index_, range.offset_, std::move(rows)};
}

} // namespace chunkport::chunking
