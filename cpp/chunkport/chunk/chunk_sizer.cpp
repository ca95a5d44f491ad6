/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/chunk/chunk_sizer.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/log/log.hpp>

#include <limits>

namespace chunkport::chunking {

uint64_t checked_chunk_size(int64_t chunk_size) {
    configuration::check<ErrorCode::E_INVALID_CHUNK_SIZE>(chunk_size > 0, "Chunk size must be positive, got {}", chunk_size);
    return static_cast<uint64_t>(chunk_size);
}

uint64_t chunk_count_for_rows(RowCount rows, uint64_t chunk_size) {
    util::check_arg(chunk_size > 0, "Zero chunk size");
    return rows / chunk_size + (rows % chunk_size != 0 ? 1 : 0);
}

ChunkRange chunk_range(ChunkIndex index, uint64_t chunk_size) {
    return {index, index * chunk_size, chunk_size};
}

std::vector<ChunkRange> chunk_ranges(RowCount rows, uint64_t chunk_size) {
    const auto count = chunk_count_for_rows(rows, chunk_size);
    std::vector<ChunkRange> output;
    output.reserve(count);
    for (ChunkIndex index = 0; index < count; ++index) {
        auto range = chunk_range(index, chunk_size);
        range.limit_ = std::min(chunk_size, rows - range.offset_);
        output.emplace_back(range);
    }
    return output;
}

uint64_t ChunkSizer::chunk_count(source::DataSource& source, int64_t chunk_size) {
    const auto size = checked_chunk_size(chunk_size);
    const auto count = do_chunk_count(source, size);
    sizing::check<ErrorCode::E_CHUNK_COUNT_OVERFLOW>(count <= std::numeric_limits<uint64_t>::max() / size,
        "{} strategy sized '{}' as {} chunks of {} rows, past the last addressable row", name(), source.name(), count, size);
    log::chunk().debug("Sized '{}' with {} strategy: {} chunks of {} rows", source.name(), name(), count, size);
    return count;
}

uint64_t CountChunkSizer::do_chunk_count(source::DataSource& source, uint64_t chunk_size) {
    RowCount rows;
    try {
        rows = source.count();
    } catch (const std::exception& e) {
        sizing::raise<ErrorCode::E_COUNT_FAILED>("Counting rows of '{}' failed: {}", source.name(), e.what());
    } catch (...) {
        sizing::raise<ErrorCode::E_COUNT_FAILED>("Counting rows of '{}' failed: {}", source.name(), current_exception_message());
    }
    return chunk_count_for_rows(rows, chunk_size);
}

CustomChunkSizer::CustomChunkSizer(SizeStrategy strategy) :
    strategy_(std::move(strategy)) {
    configuration::check<ErrorCode::E_MISSING_SIZE_STRATEGY>(static_cast<bool>(strategy_),
                                                            "Custom chunk sizer requires a size strategy");
}

uint64_t CustomChunkSizer::do_chunk_count(source::DataSource& source, uint64_t chunk_size) {
    try {
        return strategy_(source, chunk_size);
    } catch (const std::exception& e) {
        sizing::raise<ErrorCode::E_CUSTOM_SIZE_FAILED>("Custom size strategy for '{}' failed: {}", source.name(), e.what());
    } catch (...) {
        sizing::raise<ErrorCode::E_CUSTOM_SIZE_FAILED>("Custom size strategy for '{}' failed: {}", source.name(), current_exception_message());
    }
}

} // namespace chunkport::chunking
