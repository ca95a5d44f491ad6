/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/exporter/destination_file.hpp>
#include <chunkport/util/on_exit.hpp>
#include <chunkport/util/preconditions.hpp>

#include <fstream>
#include <system_error>

namespace chunkport::exporter {

namespace fs = std::filesystem;

void write_destination(const fs::path& path, const std::function<void(std::ostream&)>& write_body) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        storage::check<ErrorCode::E_DESTINATION_WRITE_FAILED>(!ec,
            "Cannot create directory {}: {}", path.parent_path().string(), ec.message());
    }

    auto tmp_path = path;
    tmp_path += ".partial";
    OnExit remove_tmp{[&tmp_path]() {
        std::error_code ec;
        fs::remove(tmp_path, ec);
    }};

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        storage::check<ErrorCode::E_DESTINATION_WRITE_FAILED>(out.is_open(), "Cannot open {} for writing", tmp_path.string());
        write_body(out);
        out.flush();
        storage::check<ErrorCode::E_DESTINATION_WRITE_FAILED>(out.good(), "Failed writing {}", tmp_path.string());
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    storage::check<ErrorCode::E_DESTINATION_WRITE_FAILED>(!ec,
        "Cannot move {} to {}: {}", tmp_path.string(), path.string(), ec.message());
    remove_tmp.release();
}

} // namespace chunkport::exporter
