/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <chunkport/exporter/row_formatter.hpp>

using namespace chunkport;

TEST(CsvRowFormatter, PlainCells) {
    exporter::CsvRowFormatter formatter;
    Row row{CellValue{int64_t{-3}}, CellValue{2.5}, CellValue{true}, CellValue{std::monostate{}}, CellValue{std::string{"abc"}}};
    ASSERT_EQ(formatter.format_row(row), "-3,2.5,true,,abc\n");
    ASSERT_EQ(formatter.format_row(Row{}), "\n");
}

TEST(CsvRowFormatter, QuotesWhenNeeded) {
    exporter::CsvRowFormatter formatter;
    Row row{CellValue{std::string{"a,b"}}, CellValue{std::string{"say \"hi\""}}, CellValue{std::string{"two\nlines"}}};
    ASSERT_EQ(formatter.format_row(row), "\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\"\n");
}

TEST(CsvRowFormatter, CustomDelimiter) {
    exporter::CsvRowFormatter formatter{';'};
    Row row{CellValue{std::string{"a,b"}}, CellValue{std::string{"c;d"}}};
    ASSERT_EQ(formatter.format_row(row), "a,b;\"c;d\"\n");
}

TEST(CsvRowFormatter, RowsAreConcatenated) {
    exporter::CsvRowFormatter formatter;
    Rows rows{Row{CellValue{int64_t{1}}}, Row{CellValue{int64_t{2}}}};
    ASSERT_EQ(formatter.format_rows(rows), "1\n2\n");
    ASSERT_EQ(formatter.format_rows(Rows{}), "");
}
