/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/types.hpp>

#include <string>

namespace chunkport::source {

/*
 * Query or enumerable an export reads from. Implementations must return rows in a stable order, so that
 * fetching the same (offset, limit) from any worker yields the same rows.
 */
class DataSource {
public:
    DataSource() = default;
    virtual ~DataSource() = default;

    DataSource(const DataSource&) = delete;
    DataSource& operator=(const DataSource&) = delete;

    RowCount count() {
        return do_count();
    }

    Rows fetch_range(RowOffset offset, RowCount limit) {
        return do_fetch_range(offset, limit);
    }

    [[nodiscard]] virtual std::string name() const = 0;

private:
    virtual RowCount do_count() = 0;

    virtual Rows do_fetch_range(RowOffset offset, RowCount limit) = 0;
};

} // namespace chunkport::source
