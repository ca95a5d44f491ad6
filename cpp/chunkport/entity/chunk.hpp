/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/types.hpp>
#include <chunkport/util/constructors.hpp>

#include <fmt/format.h>

namespace chunkport::entity {

/*
 * Rows [offset_, offset_ + limit_) of the source, the index_-th chunk of an export. A job carries this until
 * it is executed and materializes the rows.
 */
struct ChunkRange {
    ChunkIndex index_ = 0;
    RowOffset offset_ = 0;
    RowCount limit_ = 0;

    [[nodiscard]] RowOffset end() const {
        return offset_ + limit_;
    }

    friend bool operator==(const ChunkRange&, const ChunkRange&) = default;
};

struct Chunk {
    ChunkIndex index_ = 0;
    RowOffset offset_ = 0;
    Rows rows_;

    Chunk() = default;

    Chunk(ChunkIndex index, RowOffset offset, Rows&& rows) :
        index_(index),
        offset_(offset),
        rows_(std::move(rows)) {
    }

    CHUNKPORT_MOVE_ONLY_DEFAULT(Chunk)

    [[nodiscard]] RowCount row_count() const {
        return rows_.size();
    }
};

} // namespace chunkport::entity

namespace fmt {
template<>
struct formatter<chunkport::entity::ChunkRange> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const chunkport::entity::ChunkRange &range, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "chunk {} [{}, {})", range.index_, range.offset_, range.end());
    }
};
}
