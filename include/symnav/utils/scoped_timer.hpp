#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace symnav::utils {

// Logs the lifetime of a scope at debug level when destroyed
class ScopedTimer {
 public:
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&) = delete;
  auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
  auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::microseconds;

  // "850us", "12ms" or "1.2s"
  static auto FormatDuration(std::chrono::microseconds duration)
      -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace symnav::utils
