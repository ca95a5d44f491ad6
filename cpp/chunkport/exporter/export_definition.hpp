/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/chunk/chunk_sizer.hpp>
#include <chunkport/source/data_source.hpp>
#include <chunkport/util/preconditions.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkport::exporter {

/*
 * Number of chunks an export will iterate, given the chunk size. Declared by exports whose count() does not
 * match the number of iterable rows, e.g. grouped queries.
 */
using SizeStrategy = chunking::SizeStrategy;

using FailureCallback = std::function<void(const std::string& reason)>;

/*
 * What to export and how. Immutable once built; the caller owns it and the queued path copies what it
 * needs into the jobs it creates.
 */
class ExportDefinition {
public:
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] const std::shared_ptr<source::DataSource>& source() const { return source_; }

    [[nodiscard]] bool has_custom_size() const { return static_cast<bool>(custom_size_); }

    [[nodiscard]] const SizeStrategy& custom_size() const { return custom_size_; }

    [[nodiscard]] std::optional<int64_t> chunk_size() const { return chunk_size_; }

    [[nodiscard]] bool queue_by_default() const { return queue_by_default_; }

    [[nodiscard]] const std::optional<Row>& headings() const { return headings_; }

    void failed(const std::string& reason) const {
        if (on_failed_)
            on_failed_(reason);
    }

private:
    friend class ExportDefinitionBuilder;

    ExportDefinition() = default;

    std::string name_;
    std::shared_ptr<source::DataSource> source_;
    SizeStrategy custom_size_;
    std::optional<int64_t> chunk_size_;
    bool queue_by_default_ = false;
    std::optional<Row> headings_;
    FailureCallback on_failed_;
};

class ExportDefinitionBuilder {
public:
    ExportDefinitionBuilder(std::string name, std::shared_ptr<source::DataSource> source) {
        def_.name_ = std::move(name);
        def_.source_ = std::move(source);
    }

    ExportDefinitionBuilder& custom_size(SizeStrategy strategy) {
        def_.custom_size_ = std::move(strategy);
        return *this;
    }

    ExportDefinitionBuilder& chunk_size(int64_t size) {
        def_.chunk_size_ = size;
        return *this;
    }

    ExportDefinitionBuilder& queue_by_default(bool queued = true) {
        def_.queue_by_default_ = queued;
        return *this;
    }

    ExportDefinitionBuilder& headings(Row headings) {
        def_.headings_ = std::move(headings);
        return *this;
    }

    ExportDefinitionBuilder& on_failed(FailureCallback callback) {
        def_.on_failed_ = std::move(callback);
        return *this;
    }

    ExportDefinition build() const {
        configuration::check<ErrorCode::E_MISSING_DATA_SOURCE>(
            static_cast<bool>(def_.source_), "Export '{}' has no data source", def_.name_);
        return def_;
    }

private:
    ExportDefinition def_;
};

// Chunk size of the definition if it sets one, else Export.ChunkSize. Raises ConfigurationException unless > 0.
uint64_t resolve_chunk_size(const ExportDefinition& definition);

// Custom strategy when the definition declares one, else the count based default
std::unique_ptr<chunking::ChunkSizer> make_chunk_sizer(const ExportDefinition& definition);

// Where the merged output of an export is delivered.
struct Destination {
    std::filesystem::path path_;

    explicit Destination(std::filesystem::path path) :
        path_(std::move(path)) {
    }
};

} // namespace chunkport::exporter
