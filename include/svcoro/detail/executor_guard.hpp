#pragma once

#include <svcoro/executor.hpp>

#include <utility>

namespace svcoro::detail {

/// Slot for the executor whose handler is running on this thread. Empty outside handlers.
inline auto this_thread_executor() noexcept -> executor& {
  thread_local executor slot{};
  return slot;
}

inline auto get_current_executor() noexcept -> executor { return this_thread_executor(); }

/// Makes `ex` the current executor until the guard goes out of scope.
class executor_guard {
 public:
  explicit executor_guard(executor ex) noexcept
      : saved_(std::exchange(this_thread_executor(), std::move(ex))) {}

  ~executor_guard() { this_thread_executor() = std::move(saved_); }

  executor_guard(executor_guard const&) = delete;
  auto operator=(executor_guard const&) -> executor_guard& = delete;

 private:
  executor saved_;
};

}  // namespace svcoro::detail
