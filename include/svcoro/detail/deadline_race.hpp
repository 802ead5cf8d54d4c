#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/awaitable.hpp>
#include <svcoro/detail/executor_guard.hpp>
#include <svcoro/executor.hpp>
#include <svcoro/timer_handle.hpp>

#include <chrono>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace svcoro::detail {

/// Shared between a deadline_race, the branch running the inner computation and the deadline
/// timer. Whichever settles first resumes the waiter through the executor; the waiter then
/// picks the winner by whether the branch has finished.
struct deadline_state {
  explicit deadline_state(executor ex_) : ex(std::move(ex_)) {}

  executor ex;
  std::mutex m;
  std::coroutine_handle<> waiter{};
  bool settled = false;

  static void settle(std::shared_ptr<deadline_state> const& self) {
    {
      std::scoped_lock lk{self->m};
      if (self->settled) {
        return;
      }
      self->settled = true;
      if (!self->waiter) {
        return;
      }
    }
    self->ex.post([s = self]() {
      std::coroutine_handle<> h{};
      {
        std::scoped_lock lk{s->m};
        h = std::exchange(s->waiter, {});
      }
      if (h) {
        h.resume();
      }
    });
  }
};

template <class T>
auto run_racing_branch(awaitable<T> inner, std::shared_ptr<deadline_state> st) -> awaitable<T> {
  try {
    auto v = co_await std::move(inner);
    deadline_state::settle(st);
    co_return v;
  } catch (...) {
    deadline_state::settle(st);
    throw;
  }
}

/// Awaiter racing `inner` against a deadline.
///
/// Yields the inner result, or `std::nullopt` if the deadline passed first. In the latter case
/// the inner computation is destroyed before the awaiting coroutine resumes. If the inner
/// computation finished by the time the waiter runs, its result is used even when the deadline
/// fired first. Destroying the awaiter cancels both sides.
template <class T>
class deadline_race {
 public:
  deadline_race(awaitable<T> inner, std::chrono::steady_clock::time_point deadline)
      : inner_(std::move(inner)), deadline_(deadline) {}

  deadline_race(deadline_race const&) = delete;
  auto operator=(deadline_race const&) -> deadline_race& = delete;
  deadline_race(deadline_race&&) = default;

  ~deadline_race() {
    (void)timer_.cancel();
    if (st_) {
      std::scoped_lock lk{st_->m};
      st_->waiter = {};
    }
  }

  bool await_ready() const noexcept { return false; }

  template <class Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) -> bool {
    executor ex{};
    if constexpr (requires { h.promise().get_executor(); }) {
      ex = h.promise().get_executor();
    }
    if (!ex) {
      ex = get_current_executor();
    }
    SVCORO_ENSURE(ex, "deadline_race: requires an executor");

    st_ = std::make_shared<deadline_state>(ex);
    branch_.emplace(run_racing_branch<T>(std::move(inner_), st_));
    branch_->start(ex);

    {
      std::scoped_lock lk{st_->m};
      if (st_->settled) {
        return false;
      }
    }

    std::weak_ptr<deadline_state> w = st_;
    timer_ = ex.schedule_timer(deadline_, [w]() {
      if (auto s = w.lock()) {
        deadline_state::settle(s);
      }
    });

    std::scoped_lock lk{st_->m};
    if (st_->settled) {
      return false;
    }
    st_->waiter = h;
    return true;
  }

  auto await_resume() -> std::optional<T> {
    (void)timer_.cancel();
    if (branch_.has_value() && branch_->done()) {
      return std::optional<T>{branch_->await_resume()};
    }
    branch_.reset();
    return std::nullopt;
  }

 private:
  awaitable<T> inner_;
  std::chrono::steady_clock::time_point deadline_;
  std::shared_ptr<deadline_state> st_{};
  std::optional<awaitable<T>> branch_{};
  timer_handle timer_{};
};

}  // namespace svcoro::detail
