#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace symnav::utils {

namespace detail {

// Shared between a source, its tokens and their registrations
struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::mutex mutex;  // Protects callbacks and next_id
  std::map<std::uint64_t, std::function<void()>> callbacks;
  std::uint64_t next_id = 1;
};

}  // namespace detail

// Removes a cancellation callback when destroyed. Move-only.
class CancellationRegistration {
 public:
  CancellationRegistration() = default;
  ~CancellationRegistration();

  CancellationRegistration(const CancellationRegistration&) = delete;
  auto operator=(const CancellationRegistration&)
      -> CancellationRegistration& = delete;
  CancellationRegistration(CancellationRegistration&& other) noexcept;
  auto operator=(CancellationRegistration&& other) noexcept
      -> CancellationRegistration&;

  auto Reset() -> void;

 private:
  friend class CancellationToken;
  CancellationRegistration(
      std::weak_ptr<detail::CancellationState> state, std::uint64_t id);

  std::weak_ptr<detail::CancellationState> state_;
  std::uint64_t id_ = 0;
};

// Cooperative cancellation signal observed by the resolution pipeline.
// Cheap to copy; a default-constructed token is never cancelled.
class CancellationToken {
 public:
  CancellationToken() = default;

  [[nodiscard]] auto IsCancellationRequested() const -> bool;

  [[nodiscard]] auto CanBeCancelled() const -> bool {
    return state_ != nullptr;
  }

  // Invoke `callback` once cancellation is requested. If it already was, the
  // callback runs immediately on the calling thread.
  [[nodiscard]] auto OnCancel(std::function<void()> callback) const
      -> CancellationRegistration;

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<detail::CancellationState> state_;
};

// Owner side of a cancellation signal. Thread-safe; Cancel() is idempotent.
class CancellationSource {
 public:
  CancellationSource();

  auto Cancel() -> void;

  [[nodiscard]] auto IsCancellationRequested() const -> bool;

  [[nodiscard]] auto Token() const -> CancellationToken;

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace symnav::utils
