#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "ndcopy/core/config.hpp"

namespace ndcopy {

static spdlog::level::level_enum parse_log_level(const char* input) {
    auto name = std::string(input);
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    // `from_str` maps every unknown name to `off`, so that case must be told apart explicitly.
    auto level = spdlog::level::from_str(name);

    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error(fmt::format("invalid log level: {}", input));
    }

    return level;
}

Config default_config_from_environment() {
    Config config;

    if (auto* s = getenv("NDCOPY_LOG_LEVEL")) {
        config.log_level = parse_log_level(s);
    }

    if (auto* s = getenv("NDCOPY_LOG_PATTERN")) {
        config.log_pattern = s;
    }

    return config;
}

void apply_config(const Config& config) {
    spdlog::set_level(config.log_level);

    if (!config.log_pattern.empty()) {
        spdlog::set_pattern(config.log_pattern);
    }

    spdlog::debug(
        "applied configuration: log_level={} log_pattern=\"{}\"",
        spdlog::level::to_string_view(config.log_level),
        config.log_pattern);
}

}  // namespace ndcopy
