/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/export_definition.hpp>
#include <chunkport/util/configs_map.hpp>

namespace chunkport::exporter {

namespace {
constexpr int64_t DEFAULT_CHUNK_SIZE = 1000;
}

uint64_t resolve_chunk_size(const ExportDefinition& definition) {
    const auto requested = definition.chunk_size().value_or(
        ConfigsMap::instance()->get_int("Export.ChunkSize", DEFAULT_CHUNK_SIZE));
    return chunking::checked_chunk_size(requested);
}

std::unique_ptr<chunking::ChunkSizer> make_chunk_sizer(const ExportDefinition& definition) {
    if (definition.has_custom_size())
        return std::make_unique<chunking::CustomChunkSizer>(definition.custom_size());

    return std::make_unique<chunking::CountChunkSizer>();
}

} // namespace chunkport::exporter
