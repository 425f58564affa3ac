#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace symnav::utils {

// "trace", "debug", "info", "warn", "error" or "off"; anything else is info
auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum;

// Level named by the SYMNAV_LOG_LEVEL environment variable (default: info)
auto GetLogLevelFromEnv() -> spdlog::level::level_enum;

// Named stderr logger for embedding hosts. stdout usually belongs to the
// host. Reuses and reconfigures an already registered logger of that name.
auto CreateLogger(std::string name, spdlog::level::level_enum level)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace symnav::utils
