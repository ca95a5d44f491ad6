/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/protobufs.hpp>
#include <chunkport/storage/artifact_backend.hpp>
#include <chunkport/storage/artifact_store.hpp>

#include <memory>

namespace chunkport::storage {

std::shared_ptr<ArtifactBackend> create_artifact_backend(const proto::artifact_store::ArtifactStoreConfig& config);

std::shared_ptr<TemporaryArtifactStore> create_artifact_store(const proto::artifact_store::ArtifactStoreConfig& config);

} // namespace chunkport::storage
