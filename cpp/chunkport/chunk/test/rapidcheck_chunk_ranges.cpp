/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <chunkport/util/test/rapidcheck.hpp>

#include <chunkport/chunk/chunk_iterator.hpp>
#include <chunkport/chunk/chunk_sizer.hpp>
#include <chunkport/util/test/test_sources.hpp>

using namespace chunkport;

RC_GTEST_PROP(ChunkRanges, CountIsCeilingAndRangesTileRows, ()) {
    const auto rows = *rc::gen::inRange<RowCount>(0, 5000);
    const auto chunk_size = *rc::gen::inRange<uint64_t>(1, 700);

    auto source = test::make_source(rows);
    chunking::CountChunkSizer sizer;
    const auto count = sizer.chunk_count(*source, static_cast<int64_t>(chunk_size));
    RC_ASSERT(count == (rows + chunk_size - 1) / chunk_size);

    const auto ranges = chunking::chunk_ranges(rows, chunk_size);
    RC_ASSERT(ranges.size() == count);

    RowOffset next = 0;
    for (size_t i = 0; i < ranges.size(); ++i) {
        RC_ASSERT(ranges[i].index_ == i);
        RC_ASSERT(ranges[i].offset_ == next);
        RC_ASSERT(ranges[i].limit_ > 0u);
        RC_ASSERT(ranges[i].limit_ <= chunk_size);
        next = ranges[i].end();
    }
    RC_ASSERT(next == rows);
}

RC_GTEST_PROP(ChunkRanges, IteratorYieldsEveryRowOnce, ()) {
    const auto rows = *rc::gen::inRange<RowCount>(0, 2000);
    const auto chunk_size = *rc::gen::inRange<uint64_t>(1, 300);

    chunking::ChunkIterator iterator{test::make_source(rows), chunk_size};
    const auto ranges = chunking::chunk_ranges(rows, chunk_size);

    size_t chunks = 0;
    int64_t expected = 0;
    while (auto chunk = iterator.next_chunk()) {
        RC_ASSERT(chunks < ranges.size());
        RC_ASSERT(chunk->offset_ == ranges[chunks].offset_);
        RC_ASSERT(chunk->row_count() == ranges[chunks].limit_);
        for (const auto& row : chunk->rows_)
            RC_ASSERT(std::get<int64_t>(row[0]) == expected++);
        ++chunks;
    }
    RC_ASSERT(chunks == ranges.size());
    RC_ASSERT(expected == static_cast<int64_t>(rows));
}
