/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/storage/file/file_backend.hpp>
#include <chunkport/util/preconditions.hpp>
#include <chunkport/log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <system_error>

namespace chunkport::storage::file {

namespace {
constexpr std::string_view SLOT_FILE_PREFIX = "slot-";

std::string slot_file_name(SlotIndex slot) {
    return fmt::format("{}{:012d}", SLOT_FILE_PREFIX, slot);
}

std::optional<SlotIndex> parse_slot_file_name(const std::string& name) {
    if (name.size() != SLOT_FILE_PREFIX.size() + 12 || name.compare(0, SLOT_FILE_PREFIX.size(), SLOT_FILE_PREFIX) != 0)
        return std::nullopt;

    const auto digits = name.substr(SLOT_FILE_PREFIX.size());
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return std::nullopt;

    return std::stoull(digits);
}

std::string temp_suffix() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    static std::atomic<uint64_t> counter{0};
    return fmt::format(".tmp-{:x}-{}", gen(), counter.fetch_add(1));
}
} // namespace

FileBackend::FileBackend(fs::path root, std::string prefix) :
    root_(std::move(root)),
    prefix_(std::move(prefix)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    storage::check<ErrorCode::E_STORAGE_IO>(!ec, "Failed to create artifact root '{}': {}", root_.string(), ec.message());
}

fs::path FileBackend::artifact_path(const ArtifactKey& key) const {
    return root_ / fmt::format("{}{}", prefix_, key);
}

fs::path FileBackend::slot_path(const ArtifactKey& key, SlotIndex slot) const {
    return artifact_path(key) / slot_file_name(slot);
}

void FileBackend::do_create(const ArtifactKey& key) {
    const auto path = artifact_path(key);
    std::error_code ec;
    const bool created = fs::create_directory(path, ec);
    storage::check<ErrorCode::E_STORAGE_IO>(!ec, "Failed to create artifact '{}': {}", path.string(), ec.message());
    storage::check<ErrorCode::E_ARTIFACT_EXISTS>(created, "Artifact '{}' already exists", path.string());
    CHUNKPORT_DEBUG(log::storage(), "Created artifact directory {}", path.string());
}

bool FileBackend::do_exists(const ArtifactKey& key) {
    std::error_code ec;
    return fs::is_directory(artifact_path(key), ec);
}

void FileBackend::do_write_slot(const ArtifactKey& key, SlotIndex slot, std::string_view data) {
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(do_exists(key),
        "Cannot write slot {} of artifact '{}' at {}: artifact not found", slot, key, root_.string());

    const auto target = slot_path(key, slot);
    auto temp = target;
    temp += temp_suffix();
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        storage::check<ErrorCode::E_STORAGE_IO>(static_cast<bool>(out), "Failed to open '{}' for write", temp.string());
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        storage::check<ErrorCode::E_STORAGE_IO>(static_cast<bool>(out), "Failed to write {} bytes to '{}'", data.size(), temp.string());
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        storage::raise<ErrorCode::E_STORAGE_IO>("Failed to move slot into place at '{}': {}", target.string(), ec.message());
    }
}

SlotData FileBackend::do_read_slot(const ArtifactKey& key, SlotIndex slot) {
    const auto path = slot_path(key, slot);
    std::ifstream in(path, std::ios::binary);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(static_cast<bool>(in),
        "Slot {} of artifact '{}' not found at {}", slot, key, path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

bool FileBackend::do_slot_exists(const ArtifactKey& key, SlotIndex slot) {
    std::error_code ec;
    return fs::is_regular_file(slot_path(key, slot), ec);
}

std::vector<SlotIndex> FileBackend::do_slots(const ArtifactKey& key) {
    const auto path = artifact_path(key);
    missing_data::check<ErrorCode::E_ARTIFACT_NOT_FOUND>(do_exists(key), "Artifact '{}' not found", path.string());

    std::vector<SlotIndex> output;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (auto slot = parse_slot_file_name(entry.path().filename().string()); slot)
            output.push_back(*slot);
    }
    std::sort(output.begin(), output.end());
    return output;
}

void FileBackend::do_remove(const ArtifactKey& key) {
    const auto path = artifact_path(key);
    std::error_code ec;
    const auto removed = fs::remove_all(path, ec);
    storage::check<ErrorCode::E_STORAGE_IO>(!ec, "Failed to remove artifact '{}': {}", path.string(), ec.message());
    CHUNKPORT_DEBUG(log::storage(), "Removed artifact {} ({} entries)", path.string(), removed);
}

} // namespace chunkport::storage::file
