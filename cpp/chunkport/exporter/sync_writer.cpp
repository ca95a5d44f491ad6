/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/sync_writer.hpp>
#include <chunkport/exporter/destination_file.hpp>
#include <chunkport/chunk/chunk_iterator.hpp>
#include <chunkport/log/log.hpp>
#include <chunkport/util/preconditions.hpp>

namespace chunkport::exporter {

SyncWriter::SyncWriter(std::shared_ptr<const RowFormatter> formatter) :
    formatter_(std::move(formatter)) {
    util::check_arg(static_cast<bool>(formatter_), "Sync writer requires a row formatter");
}

RowCount SyncWriter::write(const ExportDefinition& definition, const Destination& destination) const {
    const auto chunk_size = resolve_chunk_size(definition);

    // A declared size also bounds what the synchronous path reads
    std::optional<uint64_t> chunk_limit;
    if (definition.has_custom_size())
        chunk_limit = make_chunk_sizer(definition)->chunk_count(*definition.source(), static_cast<int64_t>(chunk_size));

    RowCount rows_written = 0;
    write_destination(destination.path_, [&](std::ostream& out) {
        if (definition.headings())
            out << formatter_->format_row(*definition.headings());

        chunking::ChunkIterator iterator{definition.source(), chunk_size, 0, chunk_limit};
        while (auto chunk = iterator.next_chunk()) {
            out << formatter_->format_rows(chunk->rows_);
            rows_written += chunk->row_count();
        }
    });

    log::exporter().info("Wrote export {} synchronously: {} rows to {}", definition.name(), rows_written, destination.path_.string());
    return rows_written;
}

} // namespace chunkport::exporter
