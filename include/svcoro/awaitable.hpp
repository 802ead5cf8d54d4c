#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/detail/awaitable_promise.hpp>

#include <coroutine>
#include <utility>

namespace svcoro {

/// Lazily started coroutine producing a `T`.
///
/// An awaitable owns its coroutine frame. Destroying it before completion destroys the frame,
/// which runs the destructors of every suspended awaiter inside it: that is how an in-flight
/// operation is abandoned. Nothing runs until the awaitable is awaited, spawned or started.
template <typename T>
class awaitable {
 public:
  using promise_type = detail::awaitable_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;
  using value_type = T;

  explicit awaitable(handle_type frame) noexcept : frame_(frame) {}

  awaitable(awaitable&& other) noexcept : frame_(other.release()) {}
  auto operator=(awaitable&& other) noexcept -> awaitable& {
    awaitable tmp{std::move(other)};
    std::swap(frame_, tmp.frame_);
    return *this;
  }

  awaitable(awaitable const&) = delete;
  auto operator=(awaitable const&) -> awaitable& = delete;

  ~awaitable() { reset(); }

  /// Give up ownership of the frame; the caller becomes responsible for destroying it.
  [[nodiscard]] auto release() noexcept -> handle_type { return std::exchange(frame_, {}); }

  /// Destroy the frame now, abandoning whatever it is suspended on.
  void reset() noexcept {
    if (auto f = release()) {
      f.destroy();
    }
  }

  [[nodiscard]] auto get_executor() const noexcept -> executor {
    return frame_ ? frame_.promise().get_executor() : executor{};
  }

  /// Bind `ex` and run the body inline up to its first suspension point.
  ///
  /// There is no continuation: a finished frame parks until this object goes away, and its
  /// result can be collected with `await_resume()` once `done()` reports true.
  void start(executor ex) {
    SVCORO_ENSURE(frame_ && !frame_.done(), "awaitable::start: nothing to start");
    frame_.promise().set_executor(std::move(ex));
    frame_.resume();
  }

  [[nodiscard]] auto done() const noexcept -> bool { return !frame_ || frame_.done(); }

  // Awaiting runs the child on the parent's executor unless one was bound already.
  auto await_ready() const noexcept -> bool { return false; }

  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> parent) -> std::coroutine_handle<> {
    auto& p = frame_.promise();
    p.set_continuation(parent);
    if constexpr (requires { parent.promise().get_executor(); }) {
      p.inherit_executor(parent.promise().get_executor());
    }
    return frame_;
  }

  auto await_resume() -> T { return frame_.promise().take_result(); }

 private:
  handle_type frame_;
};

}  // namespace svcoro

namespace svcoro::detail {

template <typename T>
auto awaitable_promise<T>::get_return_object() -> awaitable<T> {
  return awaitable<T>{std::coroutine_handle<awaitable_promise>::from_promise(*this)};
}

inline auto awaitable_promise<void>::get_return_object() -> awaitable<void> {
  return awaitable<void>{std::coroutine_handle<awaitable_promise>::from_promise(*this)};
}

}  // namespace svcoro::detail
