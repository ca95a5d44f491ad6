/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/chunk.hpp>
#include <chunkport/source/data_source.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkport::chunking {

/*
 * Number of chunks an export will iterate, given the chunk size. Declared by exports whose count() does not
 * match the number of iterable rows, e.g. grouped queries.
 */
using SizeStrategy = std::function<uint64_t(source::DataSource& source, uint64_t chunk_size)>;

// Raises ConfigurationException unless chunk_size > 0.
uint64_t checked_chunk_size(int64_t chunk_size);

uint64_t chunk_count_for_rows(RowCount rows, uint64_t chunk_size);

ChunkRange chunk_range(ChunkIndex index, uint64_t chunk_size);

// Consecutive ranges covering exactly [0, rows), the last one possibly short.
std::vector<ChunkRange> chunk_ranges(RowCount rows, uint64_t chunk_size);

class ChunkSizer {
public:
    ChunkSizer() = default;
    virtual ~ChunkSizer() = default;

    ChunkSizer(const ChunkSizer&) = delete;
    ChunkSizer& operator=(const ChunkSizer&) = delete;

    uint64_t chunk_count(source::DataSource& source, int64_t chunk_size);

    [[nodiscard]] virtual std::string name() const = 0;

private:
    virtual uint64_t do_chunk_count(source::DataSource& source, uint64_t chunk_size) = 0;
};

// ceil(count() / chunk_size)
class CountChunkSizer final : public ChunkSizer {
public:
    [[nodiscard]] std::string name() const override { return "count"; }

private:
    uint64_t do_chunk_count(source::DataSource& source, uint64_t chunk_size) override;
};

class CustomChunkSizer final : public ChunkSizer {
public:
    explicit CustomChunkSizer(SizeStrategy strategy);

    [[nodiscard]] std::string name() const override { return "custom"; }

private:
    uint64_t do_chunk_count(source::DataSource& source, uint64_t chunk_size) override;

    SizeStrategy strategy_;
};

} // namespace chunkport::chunking
