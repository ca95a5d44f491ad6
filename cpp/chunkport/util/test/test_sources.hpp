/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/source/data_source.hpp>
#include <chunkport/source/vector_source.hpp>

#include <fmt/format.h>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>

namespace chunkport::test {

// Rows {i, "row-i"} for i in [0, n)
inline Rows make_rows(RowCount n) {
    Rows rows;
    rows.reserve(n);
    for (RowCount i = 0; i < n; ++i)
        rows.push_back(Row{CellValue{static_cast<int64_t>(i)}, CellValue{fmt::format("row-{}", i)}});
    return rows;
}

inline std::shared_ptr<source::VectorDataSource> make_source(RowCount n, std::string name = "test") {
    return std::make_shared<source::VectorDataSource>(make_rows(n), std::move(name));
}

// What a CsvRowFormatter produces for make_rows(n) from row `from`
inline std::string expected_csv(RowCount from, RowCount to) {
    std::string output;
    for (RowCount i = from; i < to; ++i)
        output += fmt::format("{},row-{}\n", i, i);
    return output;
}

/*
 * Vector backed source that can be told to fail. Counts every fetch so tests can check how often the
 * source was read.
 */
class FaultySource : public source::DataSource {
public:
    explicit FaultySource(RowCount rows) :
        rows_(make_rows(rows)) {
    }

    [[nodiscard]] std::string name() const override {
        return "faulty";
    }

    void fail_count() {
        fail_count_ = true;
    }

    void fail_fetch_at(RowOffset offset) {
        fail_fetch_at_ = offset;
    }

    // count() reports this instead of the real number of rows, like a grouped query
    void report_count(RowCount count) {
        reported_count_ = count;
    }

    [[nodiscard]] size_t fetches() const {
        return fetches_;
    }

private:
    RowCount do_count() override {
        if (fail_count_)
            throw std::runtime_error("count unavailable");

        return reported_count_.value_or(rows_.size());
    }

    Rows do_fetch_range(RowOffset offset, RowCount limit) override {
        ++fetches_;
        if (fail_fetch_at_ && *fail_fetch_at_ == offset)
            throw std::runtime_error(fmt::format("fetch failed at {}", offset));

        if (offset >= rows_.size())
            return {};

        const auto end = std::min<RowCount>(offset + limit, rows_.size());
        return {rows_.begin() + static_cast<std::ptrdiff_t>(offset), rows_.begin() + static_cast<std::ptrdiff_t>(end)};
    }

    Rows rows_;
    bool fail_count_ = false;
    std::optional<RowOffset> fail_fetch_at_;
    std::optional<RowCount> reported_count_;
    std::atomic<size_t> fetches_ = 0;
};

} // namespace chunkport::test
