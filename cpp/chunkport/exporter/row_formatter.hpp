/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/types.hpp>

#include <string>

namespace chunkport::exporter {

// Turns rows into the bytes of the destination format. Output of consecutive calls is concatenated as is.
class RowFormatter {
public:
    RowFormatter() = default;
    virtual ~RowFormatter() = default;

    RowFormatter(const RowFormatter&) = delete;
    RowFormatter& operator=(const RowFormatter&) = delete;

    std::string format_row(const Row& row) const {
        return do_format_row(row);
    }

    std::string format_rows(const Rows& rows) const {
        std::string output;
        for (const auto& row : rows)
            output += do_format_row(row);
        return output;
    }

    [[nodiscard]] virtual std::string name() const = 0;

private:
    virtual std::string do_format_row(const Row& row) const = 0;
};

// RFC 4180 style: fields containing the delimiter, quotes or line breaks are quoted, rows end with '\n'
class CsvRowFormatter final : public RowFormatter {
public:
    explicit CsvRowFormatter(char delimiter = ',') :
        delimiter_(delimiter) {
    }

    [[nodiscard]] std::string name() const override {
        return "csv";
    }

private:
    std::string do_format_row(const Row& row) const override;

    std::string format_cell(const CellValue& value) const;

    char delimiter_;
};

} // namespace chunkport::exporter
