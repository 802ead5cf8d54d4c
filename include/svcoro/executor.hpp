#pragma once

#include <svcoro/detail/clock.hpp>
#include <svcoro/detail/unique_function.hpp>
#include <svcoro/timer_handle.hpp>

#include <chrono>
#include <memory>
#include <utility>

// Scheduling handle for an io_context.
//
// Semantics:
// - post(fn): enqueue fn for later execution on the context thread; never runs inline.
// - dispatch(fn): run fn inline when already on the context thread, otherwise post.
// - schedule_timer(at, fn): run fn on the context thread once `at` has passed, unless the
//   returned handle is cancelled first.
// Every handler runs with this executor installed as the current executor.

namespace svcoro {

namespace detail {
class io_context_impl;
}  // namespace detail

class executor {
 public:
  using clock = std::chrono::steady_clock;

  executor() noexcept = default;
  explicit executor(std::shared_ptr<detail::io_context_impl> impl) noexcept
      : impl_(std::move(impl)) {}

  void post(detail::unique_function<void()> f) const;
  void dispatch(detail::unique_function<void()> f) const;

  auto schedule_timer(clock::time_point at, detail::unique_function<void()> f) const
    -> timer_handle;

  auto schedule_timer(clock::duration after, detail::unique_function<void()> f) const
    -> timer_handle {
    return schedule_timer(detail::deadline_after(after), std::move(f));
  }

  /// True if the underlying context has been stopped (or this executor is empty).
  auto stopped() const noexcept -> bool;

  auto running_in_this_thread() const noexcept -> bool;

  explicit operator bool() const noexcept { return impl_ != nullptr; }

  friend auto operator==(executor const& a, executor const& b) noexcept -> bool {
    return a.impl_.get() == b.impl_.get();
  }

 private:
  friend class work_guard;

  void add_work_guard() const noexcept;
  void remove_work_guard() const noexcept;

  auto ensure_impl() const -> detail::io_context_impl&;

  std::shared_ptr<detail::io_context_impl> impl_{};
};

}  // namespace svcoro
