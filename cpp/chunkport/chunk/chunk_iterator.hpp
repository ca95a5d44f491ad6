/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/chunk.hpp>
#include <chunkport/source/data_source.hpp>
#include <chunkport/util/constructors.hpp>

#include <memory>
#include <optional>

namespace chunkport::chunking {

/*
 * Forward-only walk over a source in chunks of chunk_size rows. Holds at most one chunk in memory and cannot
 * be rewound; a worker that needs chunk k constructs a fresh iterator starting at k.
 */
class ChunkIterator {
public:
    ChunkIterator(
        std::shared_ptr<source::DataSource> source,
        uint64_t chunk_size,
        ChunkIndex start_index = 0,
        std::optional<uint64_t> chunk_limit = std::nullopt);

    CHUNKPORT_MOVE_ONLY_DEFAULT(ChunkIterator)

    std::optional<Chunk> next_chunk();

    [[nodiscard]] ChunkIndex position() const {
        return index_;
    }

    [[nodiscard]] bool exhausted() const {
        return exhausted_;
    }

private:
    std::shared_ptr<source::DataSource> source_;
    uint64_t chunk_size_;
    ChunkIndex index_;
    std::optional<ChunkIndex> end_index_;
    bool exhausted_ = false;
};

} // namespace chunkport::chunking
