#include "symnav/utils/logging.hpp"

#include <cstdlib>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace symnav::utils {

namespace {

constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr auto kDefaultLevel = spdlog::level::info;

}  // namespace

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return kDefaultLevel;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SYMNAV_LOG_LEVEL");
  if (env_level == nullptr) {
    return kDefaultLevel;
  }
  return ParseLogLevel(env_level);
}

auto CreateLogger(std::string name, spdlog::level::level_enum level)
    -> std::shared_ptr<spdlog::logger> {
  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace symnav::utils
