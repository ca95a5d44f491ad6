/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/storage/artifact_backend.hpp>
#include <chunkport/util/constructors.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chunkport::storage {

// A resolved artifact: its key and the backend it lives in. Cheap to copy into every job of a chain.
class ArtifactHandle {
public:
    ArtifactHandle(std::shared_ptr<ArtifactBackend> backend, ArtifactKey key);

    [[nodiscard]] const ArtifactKey& key() const { return key_; }

    [[nodiscard]] const std::shared_ptr<ArtifactBackend>& backend() const { return backend_; }

    [[nodiscard]] bool exists() const;

    void write_slot(SlotIndex slot, std::string_view data) const;

    [[nodiscard]] SlotData read_slot(SlotIndex slot) const;

    [[nodiscard]] bool slot_exists(SlotIndex slot) const;

    [[nodiscard]] std::vector<SlotIndex> slots() const;

    // Deletes the artifact and everything written to it
    void release() const;

private:
    std::shared_ptr<ArtifactBackend> backend_;
    ArtifactKey key_;
};

/*
 * Releases the artifact when it goes out of scope, on every exit path, unless ownership of the cleanup was
 * handed elsewhere with keep().
 */
class ScopedArtifact {
public:
    explicit ScopedArtifact(ArtifactHandle handle);

    ~ScopedArtifact();

    CHUNKPORT_NO_MOVE_OR_COPY(ScopedArtifact)

    [[nodiscard]] const ArtifactHandle& handle() const { return handle_; }

    const ArtifactHandle& keep() {
        kept_ = true;
        return handle_;
    }

private:
    ArtifactHandle handle_;
    bool kept_ = false;
};

class TemporaryArtifactStore {
public:
    explicit TemporaryArtifactStore(std::shared_ptr<ArtifactBackend> backend, std::string key_prefix = std::string{});

    // <prefix><label>-<32 random alphanumerics>
    [[nodiscard]] ArtifactKey generate_key(std::string_view label) const;

    // Handle to an existing or future artifact; does not touch the backend
    [[nodiscard]] ArtifactHandle resolve(const ArtifactKey& key) const;

    ArtifactHandle create(const ArtifactKey& key);

    std::unique_ptr<ScopedArtifact> scoped(const ArtifactKey& key);

    [[nodiscard]] bool is_shared() const;

    // Raises ConfigurationException when jobs may run on several hosts but the backend is host local
    void check_topology(bool multi_host) const;

    [[nodiscard]] const std::shared_ptr<ArtifactBackend>& backend() const { return backend_; }

private:
    std::shared_ptr<ArtifactBackend> backend_;
    std::string key_prefix_;
};

} // namespace chunkport::storage
