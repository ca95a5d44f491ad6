/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/source/data_source.hpp>

#include <algorithm>
#include <memory>
#include <mutex>

namespace chunkport::source {

// Rows held in memory, e.g. a collection the caller already built.
class VectorDataSource : public DataSource {
public:
    explicit VectorDataSource(Rows rows, std::string name = "vector") :
        name_(std::move(name)),
        rows_(std::move(rows)) {
    }

    [[nodiscard]] std::string name() const override {
        return name_;
    }

    void append(Row row) {
        std::lock_guard lock{mutex_};
        rows_.emplace_back(std::move(row));
    }

private:
    RowCount do_count() override {
        std::lock_guard lock{mutex_};
        return rows_.size();
    }

    Rows do_fetch_range(RowOffset offset, RowCount limit) override {
        std::lock_guard lock{mutex_};
        if (offset >= rows_.size())
            return {};

        const auto end = offset + std::min<RowCount>(limit, rows_.size() - offset);
        return {rows_.begin() + static_cast<std::ptrdiff_t>(offset), rows_.begin() + static_cast<std::ptrdiff_t>(end)};
    }

    std::string name_;
    std::mutex mutex_;
    Rows rows_;
};

} // namespace chunkport::source
