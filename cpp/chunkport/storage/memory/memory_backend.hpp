/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/storage/artifact_backend.hpp>

#include <map>
#include <mutex>
#include <unordered_map>

namespace chunkport::storage::memory {

// Artifacts held in this process. Visible to every worker thread, but to no other host.
class MemoryBackend final : public ArtifactBackend {
public:
    MemoryBackend() = default;

    [[nodiscard]] bool is_shared() const override { return false; }

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] size_t artifact_count() const;

private:
    void do_create(const ArtifactKey& key) final;

    bool do_exists(const ArtifactKey& key) final;

    void do_write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) final;

    SlotData do_read_slot(const ArtifactKey& key, SlotIndex slot) final;

    bool do_slot_exists(const ArtifactKey& key, SlotIndex slot) final;

    std::vector<SlotIndex> do_slots(const ArtifactKey& key) final;

    void do_remove(const ArtifactKey& key) final;

    using SlotMap = std::map<SlotIndex, SlotData>;

    mutable std::mutex mutex_;
    std::unordered_map<ArtifactKey, SlotMap> data_;
};

} // namespace chunkport::storage::memory
