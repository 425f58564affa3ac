#include "symnav/utils/cancellation.hpp"

#include <utility>
#include <vector>

namespace symnav::utils {

CancellationRegistration::CancellationRegistration(
    std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {
}

CancellationRegistration::~CancellationRegistration() {
  Reset();
}

CancellationRegistration::CancellationRegistration(
    CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {
}

auto CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept -> CancellationRegistration& {
  if (this != &other) {
    Reset();
    state_ = std::move(other.state_);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

auto CancellationRegistration::Reset() -> void {
  if (id_ == 0) {
    return;
  }
  if (auto state = state_.lock()) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->callbacks.erase(id_);
  }
  state_.reset();
  id_ = 0;
}

auto CancellationToken::IsCancellationRequested() const -> bool {
  return state_ != nullptr &&
         state_->cancelled.load(std::memory_order_acquire);
}

auto CancellationToken::OnCancel(std::function<void()> callback) const
    -> CancellationRegistration {
  if (!state_) {
    return {};
  }

  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled.load(std::memory_order_acquire)) {
      auto id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(callback));
      return {state_, id};
    }
  }

  callback();
  return {};
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {
}

auto CancellationSource::Cancel() -> void {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    callbacks.reserve(state_->callbacks.size());
    for (auto& [id, callback] : state_->callbacks) {
      callbacks.push_back(std::move(callback));
    }
    state_->callbacks.clear();
  }

  // Run outside the lock so callbacks may register or reset freely
  for (auto& callback : callbacks) {
    callback();
  }
}

auto CancellationSource::IsCancellationRequested() const -> bool {
  return state_->cancelled.load(std::memory_order_acquire);
}

auto CancellationSource::Token() const -> CancellationToken {
  return CancellationToken(state_);
}

}  // namespace symnav::utils
