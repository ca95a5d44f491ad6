/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/exporter/export_definition.hpp>
#include <chunkport/exporter/row_formatter.hpp>

#include <memory>

namespace chunkport::exporter {

// Writes an export in the calling thread, one chunk in memory at a time. Returns the number of data rows written.
class SyncWriter {
public:
    explicit SyncWriter(std::shared_ptr<const RowFormatter> formatter = std::make_shared<CsvRowFormatter>());

    RowCount write(const ExportDefinition& definition, const Destination& destination) const;

private:
    std::shared_ptr<const RowFormatter> formatter_;
};

} // namespace chunkport::exporter
