/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/storage/artifact_backend.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace chunkport::storage::file {

/*
 * One directory per artifact under root, one file per slot. Slots are written to a uniquely named temporary
 * file and renamed into place, so a slot is either absent or complete.
 */
class FileBackend : public ArtifactBackend {
public:
    FileBackend(fs::path root, std::string prefix);

    [[nodiscard]] const fs::path& root() const { return root_; }

    [[nodiscard]] fs::path artifact_path(const ArtifactKey& key) const;

    [[nodiscard]] fs::path slot_path(const ArtifactKey& key, SlotIndex slot) const;

private:
    void do_create(const ArtifactKey& key) final;

    bool do_exists(const ArtifactKey& key) final;

    void do_write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) final;

    SlotData do_read_slot(const ArtifactKey& key, SlotIndex slot) final;

    bool do_slot_exists(const ArtifactKey& key, SlotIndex slot) final;

    std::vector<SlotIndex> do_slots(const ArtifactKey& key) final;

    void do_remove(const ArtifactKey& key) final;

    fs::path root_;
    std::string prefix_;
};

// Disk of the host running the job; other hosts cannot see what is written here.
class LocalDiskBackend final : public FileBackend {
public:
    explicit LocalDiskBackend(fs::path root) :
        FileBackend(std::move(root), std::string{}) {
    }

    [[nodiscard]] bool is_shared() const override { return false; }

    [[nodiscard]] std::string name() const override { return "local_disk"; }
};

// Mount reachable from every worker host, e.g. NFS.
class SharedDiskBackend final : public FileBackend {
public:
    SharedDiskBackend(fs::path root, std::string prefix) :
        FileBackend(std::move(root), std::move(prefix)) {
    }

    [[nodiscard]] bool is_shared() const override { return true; }

    [[nodiscard]] std::string name() const override { return "shared_disk"; }
};

} // namespace chunkport::storage::file
