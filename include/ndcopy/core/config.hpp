#pragma once

#include <string>

#include "spdlog/common.h"

namespace ndcopy {

struct Config {
    /// Minimum severity of the messages emitted through the default spdlog logger. The runtime-rank
    /// copy and fill paths trace every descriptor they execute at `trace` level.
    spdlog::level::level_enum log_level = spdlog::level::info;

    /// If non-empty, replaces the pattern of the default spdlog logger.
    std::string log_pattern;
};

/**
 * Builds a configuration from `NDCOPY_LOG_LEVEL` (trace, debug, info, warn, err, critical, off)
 * and `NDCOPY_LOG_PATTERN`. Unset variables keep their defaults.
 */
Config default_config_from_environment();

/**
 * Applies `config` to the default spdlog logger.
 */
void apply_config(const Config& config);

}  // namespace ndcopy
