/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/storage/artifact_store.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/log/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <random>

namespace chunkport::storage {

namespace {
constexpr size_t RANDOM_KEY_LENGTH = 32;

std::string random_alphanumerics(size_t length) {
    static constexpr std::string_view alphabet = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
    std::string output(length, '0');
    for (auto& c : output)
        c = alphabet[dist(gen)];
    return output;
}

std::string sanitize_label(std::string_view label) {
    std::string output{label};
    for (auto& c : output) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_')
            c = '_';
    }
    return output;
}
} // namespace

ArtifactHandle::ArtifactHandle(std::shared_ptr<ArtifactBackend> backend, ArtifactKey key) :
    backend_(std::move(backend)),
    key_(std::move(key)) {
    util::check_arg(static_cast<bool>(backend_), "Artifact handle '{}' has no backend", key_);
}

bool ArtifactHandle::exists() const {
    return backend_->exists(key_);
}

void ArtifactHandle::write_slot(SlotIndex slot, std::string_view data) const {
    backend_->write_slot(key_, slot, data);
}

SlotData ArtifactHandle::read_slot(SlotIndex slot) const {
    return backend_->read_slot(key_, slot);
}

bool ArtifactHandle::slot_exists(SlotIndex slot) const {
    return backend_->slot_exists(key_, slot);
}

std::vector<SlotIndex> ArtifactHandle::slots() const {
    return backend_->slots(key_);
}

void ArtifactHandle::release() const {
    log::storage().debug("Releasing artifact {} on {}", key_, backend_->name());
    backend_->remove(key_);
}

ScopedArtifact::ScopedArtifact(ArtifactHandle handle) :
    handle_(std::move(handle)) {
}

ScopedArtifact::~ScopedArtifact() {
    if (kept_)
        return;

    try {
        handle_.release();
    } catch (const std::exception& e) {
        log::storage().error("Failed to release artifact {}: {}", handle_.key(), e.what());
    }
}

TemporaryArtifactStore::TemporaryArtifactStore(std::shared_ptr<ArtifactBackend> backend, std::string key_prefix) :
    backend_(std::move(backend)),
    key_prefix_(std::move(key_prefix)) {
    util::check_arg(static_cast<bool>(backend_), "Temporary artifact store requires a backend");
}

ArtifactKey TemporaryArtifactStore::generate_key(std::string_view label) const {
    return fmt::format("{}{}-{}", key_prefix_, sanitize_label(label), random_alphanumerics(RANDOM_KEY_LENGTH));
}

ArtifactHandle TemporaryArtifactStore::resolve(const ArtifactKey& key) const {
    return {backend_, key};
}

ArtifactHandle TemporaryArtifactStore::create(const ArtifactKey& key) {
    backend_->create(key);
    log::storage().debug("Created artifact {} on {}", key, backend_->name());
    return resolve(key);
}

std::unique_ptr<ScopedArtifact> TemporaryArtifactStore::scoped(const ArtifactKey& key) {
    return std::make_unique<ScopedArtifact>(create(key));
}

bool TemporaryArtifactStore::is_shared() const {
    return backend_->is_shared();
}

void TemporaryArtifactStore::check_topology(bool multi_host) const {
    configuration::check<ErrorCode::E_UNSHARED_STORAGE_IN_MULTI_HOST>(
        !multi_host || is_shared(),
        "Artifact backend '{}' is local to one host but chunk jobs may run on several hosts; "
        "configure a shared backend", backend_->name());
}

} // namespace chunkport::storage
