#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/detail/executor_guard.hpp>
#include <svcoro/executor.hpp>
#include <svcoro/this_coro.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <utility>
#include <variant>

namespace svcoro {
template <typename T>
class awaitable;
}  // namespace svcoro

namespace svcoro::detail {

/// Hands control back to whoever awaited the finished frame.
///
/// - detached frame: destroys itself.
/// - no continuation (started with awaitable::start, or never awaited): parks.
/// - continuation bound to the executor running this thread: symmetric transfer.
/// - otherwise: the continuation is posted to the frame's executor.
struct final_transfer {
  executor ex;
  std::coroutine_handle<> continuation;
  bool detached;

  bool await_ready() const noexcept { return false; }

  auto await_suspend(std::coroutine_handle<> self) noexcept -> std::coroutine_handle<> {
    if (detached) {
      self.destroy();
      return std::noop_coroutine();
    }
    if (!continuation) {
      return std::noop_coroutine();
    }
    if (get_current_executor() == ex) {
      return continuation;
    }
    ex.post([h = continuation]() { h.resume(); });
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

class promise_core {
 public:
  std::suspend_always initial_suspend() const noexcept { return {}; }

  auto final_suspend() noexcept -> final_transfer {
    return final_transfer{executor_, std::exchange(continuation_, {}), detached_};
  }

  auto get_executor() const noexcept -> executor { return executor_; }
  void set_executor(executor ex) noexcept { executor_ = std::move(ex); }

  /// Keeps an executor bound earlier (by co_spawn or start) over the awaiting one.
  void inherit_executor(executor const& parent) noexcept {
    if (!executor_) {
      executor_ = parent;
    }
  }

  void set_continuation(std::coroutine_handle<> h) noexcept { continuation_ = h; }

  void detach() noexcept {
    SVCORO_ENSURE(executor_, "awaitable: a detached frame needs an executor");
    detached_ = true;
  }

  template <typename A>
  decltype(auto) await_transform(A&& a) noexcept {
    return std::forward<A>(a);
  }

  auto await_transform(this_coro::executor_t) noexcept {
    struct current_executor {
      executor ex;
      bool await_ready() const noexcept { return true; }
      void await_suspend(std::coroutine_handle<>) const noexcept {}
      auto await_resume() const noexcept -> executor { return ex; }
    };
    return current_executor{executor_};
  }

 private:
  executor executor_{};
  std::coroutine_handle<> continuation_{};
  bool detached_ = false;
};

template <typename T>
class awaitable_promise final : public promise_core {
 public:
  auto get_return_object() -> awaitable<T>;

  template <typename U>
    requires std::convertible_to<U, T>
  void return_value(U&& v) {
    outcome_.template emplace<1>(std::forward<U>(v));
  }

  void unhandled_exception() noexcept { outcome_.template emplace<2>(std::current_exception()); }

  /// The value the coroutine returned, or the exception it exited with rethrown. Call once.
  auto take_result() -> T {
    if (outcome_.index() == 2) {
      std::rethrow_exception(std::get<2>(std::exchange(outcome_, {})));
    }
    SVCORO_ASSERT(outcome_.index() == 1);
    T v = std::get<1>(std::move(outcome_));
    outcome_.template emplace<0>();
    return v;
  }

 private:
  std::variant<std::monostate, T, std::exception_ptr> outcome_{};
};

template <>
class awaitable_promise<void> final : public promise_core {
 public:
  auto get_return_object() -> awaitable<void>;

  void return_void() const noexcept {}

  void unhandled_exception() noexcept { error_ = std::current_exception(); }

  void take_result() {
    if (error_) {
      std::rethrow_exception(std::exchange(error_, nullptr));
    }
  }

 private:
  std::exception_ptr error_{};
};

}  // namespace svcoro::detail
