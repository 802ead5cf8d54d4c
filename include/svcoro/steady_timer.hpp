#pragma once

#include <svcoro/awaitable.hpp>
#include <svcoro/executor.hpp>
#include <svcoro/timer_handle.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <system_error>

namespace svcoro {

namespace detail {
class timer_waiter;
}  // namespace detail

/// A reusable timer bound to an executor.
///
/// Model:
/// - Set the expiry (expires_at/after), then co_await async_wait().
/// - cancel() completes the pending wait with `error::operation_aborted`.
/// - Destroying the coroutine suspended in async_wait() deregisters the wait; nothing is
///   resumed afterwards.
///
/// Resumption always happens from a handler on the bound executor, never inline. At most one
/// wait may be outstanding at a time.
class steady_timer {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using duration = clock::duration;

  explicit steady_timer(executor ex) noexcept;
  steady_timer(executor ex, time_point at) noexcept;
  steady_timer(executor ex, duration after) noexcept;

  steady_timer(steady_timer const&) = delete;
  auto operator=(steady_timer const&) -> steady_timer& = delete;
  steady_timer(steady_timer&&) = delete;
  auto operator=(steady_timer&&) -> steady_timer& = delete;

  ~steady_timer();

  auto get_executor() const noexcept -> executor { return ex_; }

  auto expiry() const noexcept -> time_point { return expiry_; }

  /// Set the expiry time. Returns the number of pending waits that were cancelled.
  auto expires_at(time_point at) noexcept -> std::size_t;
  auto expires_after(duration d) noexcept -> std::size_t;

  /// Wait until expiry. Yields `error::operation_aborted` iff the wait was cancelled or the
  /// executor is stopped.
  auto async_wait() -> awaitable<std::error_code>;

  /// Cancel the pending wait, if any. Returns the number of waits cancelled.
  auto cancel() noexcept -> std::size_t;

 private:
  executor ex_{};
  time_point expiry_{clock::now()};
  std::weak_ptr<detail::timer_waiter> wait_{};
};

}  // namespace svcoro
