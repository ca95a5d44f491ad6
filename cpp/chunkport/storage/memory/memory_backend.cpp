/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */
#include <chunkport/storage/memory/memory_backend.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/log/log.hpp>

namespace chunkport::storage::memory {

size_t MemoryBackend::artifact_count() const {
    std::lock_guard lock{mutex_};
    return data_.size();
}

void MemoryBackend::do_create(const ArtifactKey& key) {
    std::lock_guard lock{mutex_};
    auto [it, inserted] = data_.try_emplace(key);
    storage::check<ErrorCode::E_ARTIFACT_EXISTS>(inserted, "Artifact '{}' already exists", key);
    CHUNKPORT_DEBUG(log::storage(), "Created in-memory artifact {}", key);
}

bool MemoryBackend::do_exists(const ArtifactKey& key) {
    std::lock_guard lock{mutex_};
    return data_.find(key) != data_.end();
}

void MemoryBackend::do_write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) {
    std::lock_guard lock{mutex_};
    auto it = data_.find(key);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(it != data_.end(),
        "Cannot write slot {} of artifact '{}': artifact not found", slot, key);
    it->second.insert_or_assign(slot, SlotData{data});
}

SlotData MemoryBackend::do_read_slot(const ArtifactKey& key, SlotIndex slot) {
    std::lock_guard lock{mutex_};
    auto it = data_.find(key);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(it != data_.end(), "Artifact '{}' not found", key);
    auto slot_it = it->second.find(slot);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(slot_it != it->second.end(),
        "Slot {} of artifact '{}' not found", slot, key);
    return slot_it->second;
}

bool MemoryBackend::do_slot_exists(const ArtifactKey& key, SlotIndex slot) {
    std::lock_guard lock{mutex_};
    auto it = data_.find(key);
    return it != data_.end() && it->second.find(slot) != it->second.end();
}

std::vector<SlotIndex> MemoryBackend::do_slots(const ArtifactKey& key) {
    std::lock_guard lock{mutex_};
    auto it = data_.find(key);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(it != data_.end(), "Artifact '{}' not found", key);
    std::vector<SlotIndex> output;
    output.reserve(it->second.size());
    for (const auto& [slot, _] : it->second)
        output.push_back(slot);
    return output;
}

void MemoryBackend::do_remove(const ArtifactKey& key) {
    std::lock_guard lock{mutex_};
    data_.erase(key);
}

} // namespace chunkport::storage::memory
