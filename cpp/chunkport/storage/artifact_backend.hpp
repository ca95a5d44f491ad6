/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkport::storage {

using ArtifactKey = std::string;
using SlotIndex = uint64_t;
using SlotData = std::string;

/*
 * Storage for temporary export artifacts. An artifact is addressed by a key and holds numbered slots; writing
 * a slot replaces its previous content, so writing the same slot twice leaves the artifact as if written once.
 */
class ArtifactBackend {
public:
    ArtifactBackend() = default;
    virtual ~ArtifactBackend() = default;

    ArtifactBackend(const ArtifactBackend&) = delete;
    ArtifactBackend& operator=(const ArtifactBackend&) = delete;

    void create(const ArtifactKey& key) {
        do_create(key);
    }

    [[nodiscard]] bool exists(const ArtifactKey& key) {
        return do_exists(key);
    }

    void write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) {
        do_write_slot(key, slot, data);
    }

    SlotData read_slot(const ArtifactKey& key, SlotIndex slot) {
        return do_read_slot(key, slot);
    }

    [[nodiscard]] bool slot_exists(const ArtifactKey& key, SlotIndex slot) {
        return do_slot_exists(key, slot);
    }

    // Ascending
    std::vector<SlotIndex> slots(const ArtifactKey& key) {
        return do_slots(key);
    }

    // Removing an artifact that does not exist is not an error
    void remove(const ArtifactKey& key) {
        do_remove(key);
    }

    // True when every worker host sees the same artifacts
    [[nodiscard]] virtual bool is_shared() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;

private:
    virtual void do_create(const ArtifactKey& key) = 0;

    virtual bool do_exists(const ArtifactKey& key) = 0;

    virtual void do_write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) = 0;

    virtual SlotData do_read_slot(const ArtifactKey& key, SlotIndex slot) = 0;

    virtual bool do_slot_exists(const ArtifactKey& key, SlotIndex slot) = 0;

    virtual std::vector<SlotIndex> do_slots(const ArtifactKey& key) = 0;

    virtual void do_remove(const ArtifactKey& key) = 0;
};

} // namespace chunkport::storage
