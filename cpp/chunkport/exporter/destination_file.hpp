/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <ostream>

namespace chunkport::exporter {

/*
 * Writes the destination through a sibling temporary file that is renamed into place once write_body returns,
 * so a failed export never leaves a partial destination behind. Raises StorageException on IO errors and
 * rethrows whatever write_body raises.
 */
void write_destination(const std::filesystem::path& path, const std::function<void(std::ostream&)>& write_body);

} // namespace chunkport::exporter
