/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <chunkport/entity/protobufs.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>

#ifdef DEBUG_BUILD
#define CHUNKPORT_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#define CHUNKPORT_TRACE(logger, ...) logger.trace(__VA_ARGS__)
#else
#define CHUNKPORT_DEBUG(logger, ...) (void)0
#define CHUNKPORT_TRACE(logger, ...) (void)0
#endif

#define CHUNKPORT_RUNTIME_DEBUG(logger, ...) logger.debug(__VA_ARGS__)

namespace chunkport::log {

class Loggers {
  public:
    Loggers();
    ~Loggers();

    static Loggers& instance();
    static void destroy_instance();

    /**
     * Configure the loggers instance.
     * If called multiple times will ignore subsequent calls and return false
     * @param conf
     * @return true if configuration occurred
     */
    bool configure(const proto::logger::LoggersConfig &conf, bool force=false);

    spdlog::logger &root();
    spdlog::logger &storage();
    spdlog::logger &schedule();
    spdlog::logger &chain();
    spdlog::logger &chunk();
    spdlog::logger &exporter();

    void flush_all();

  private:
    static void init();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

spdlog::logger &root();
spdlog::logger &storage();
spdlog::logger &schedule();
spdlog::logger &chain();
spdlog::logger &chunk();
spdlog::logger &exporter();

inline std::unordered_map<std::string, spdlog::logger*> get_loggers_by_name() {
    return {
        {"root", &root()},
        {"storage", &storage()},
        {"schedule", &schedule()},
        {"chain", &chain()},
        {"chunk", &chunk()},
        {"exporter", &exporter()}
    };
}

} //namespace chunkport::log
