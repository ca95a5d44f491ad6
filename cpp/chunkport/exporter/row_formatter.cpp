/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/row_formatter.hpp>
#include <chunkport/util/variant.hpp>

#include <fmt/format.h>

namespace chunkport::exporter {

std::string CsvRowFormatter::do_format_row(const Row& row) const {
    std::string output;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i != 0)
            output += delimiter_;
        output += format_cell(row[i]);
    }
    output += '\n';
    return output;
}

std::string CsvRowFormatter::format_cell(const CellValue& value) const {
    auto text = util::variant_match(value,
        [](std::monostate) { return std::string{}; },
        [](bool b) { return std::string{b ? "true" : "false"}; },
        [](int64_t i) { return fmt::format("{}", i); },
        [](double d) { return fmt::format("{}", d); },
        [](const std::string& s) { return s; });

    if (text.find_first_of(std::string{delimiter_} + "\"\r\n") == std::string::npos)
        return text;

    std::string quoted{"\""};
    for (auto c : text) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace chunkport::exporter
