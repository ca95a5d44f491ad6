/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/storage/backend_factory.hpp>
#include <chunkport/storage/file/file_backend.hpp>
#include <chunkport/storage/memory/memory_backend.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/util/pb_util.hpp>
#include <chunkport/log/log.hpp>

namespace chunkport::storage {

using Config = proto::artifact_store::ArtifactStoreConfig;

std::shared_ptr<ArtifactBackend> create_artifact_backend(const Config& config) {
    switch (config.backend_case()) {
        case Config::kLocalDisk:
            configuration::check<ErrorCode::E_INVALID_STORAGE_CONFIG>(!config.local_disk().path().empty(),
                "Local disk artifact backend requires a path");
            return std::make_shared<file::LocalDiskBackend>(config.local_disk().path());
        case Config::kSharedDisk:
            configuration::check<ErrorCode::E_INVALID_STORAGE_CONFIG>(!config.shared_disk().path().empty(),
                "Shared disk artifact backend requires a path");
            return std::make_shared<file::SharedDiskBackend>(config.shared_disk().path(), config.shared_disk().prefix());
        case Config::kInMemory:
            return std::make_shared<memory::MemoryBackend>();
        default:
            configuration::raise<ErrorCode::E_INVALID_STORAGE_CONFIG>(
                "No artifact backend selected in config: {}", util::newlines_to_spaces(config));
    }
}

std::shared_ptr<TemporaryArtifactStore> create_artifact_store(const Config& config) {
    auto backend = create_artifact_backend(config);
    log::storage().info("Using {} artifact backend (shared={})", backend->name(), backend->is_shared());
    return std::make_shared<TemporaryArtifactStore>(std::move(backend), config.key_prefix());
}

} // namespace chunkport::storage
