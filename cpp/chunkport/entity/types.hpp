/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace chunkport::entity {

using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using Row = std::vector<CellValue>;
using Rows = std::vector<Row>;

using ChunkIndex = uint64_t;
using RowOffset = uint64_t;
using RowCount = uint64_t;

} // namespace chunkport::entity

namespace chunkport {
using namespace chunkport::entity;
}
