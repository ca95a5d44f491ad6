/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <logger.pb.h>
#include <artifact_store.pb.h>

namespace chunkport::proto {

namespace logger = chunkport::pb2::logger_pb2;
namespace artifact_store = chunkport::pb2::artifact_store_pb2;

} // namespace chunkport::proto
