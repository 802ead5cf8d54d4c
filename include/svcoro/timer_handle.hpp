#pragma once

#include <svcoro/detail/timer_entry.hpp>

#include <chrono>
#include <memory>
#include <utility>

namespace svcoro {

/// Handle to a single scheduled timer callback.
///
/// Copies refer to the same registration. `cancel()` is thread-safe and guarantees the
/// callback will not run if it returns true.
class timer_handle {
 public:
  timer_handle() noexcept = default;
  explicit timer_handle(std::shared_ptr<detail::timer_entry> entry) noexcept
      : entry_(std::move(entry)) {}

  auto cancel() noexcept -> bool { return entry_ != nullptr && entry_->cancel(); }

  auto pending() const noexcept -> bool { return entry_ != nullptr && entry_->is_pending(); }
  auto fired() const noexcept -> bool { return entry_ != nullptr && entry_->is_fired(); }
  auto cancelled() const noexcept -> bool { return entry_ != nullptr && entry_->is_cancelled(); }

  auto expiry() const noexcept -> std::chrono::steady_clock::time_point {
    return entry_ != nullptr ? entry_->expiry : std::chrono::steady_clock::time_point{};
  }

  explicit operator bool() const noexcept { return entry_ != nullptr; }

 private:
  std::shared_ptr<detail::timer_entry> entry_{};
};

}  // namespace svcoro
