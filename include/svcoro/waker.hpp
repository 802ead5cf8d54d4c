#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/executor.hpp>

#include <coroutine>
#include <memory>
#include <mutex>
#include <utility>

namespace svcoro {

namespace detail {

/// Shared between a `wake_slot` and every `waker` it handed out.
///
/// `h` is set only while the owning coroutine is parked. `notified` records a wake that
/// arrived while nobody was parked so the next park returns immediately. `scheduled` limits the
/// number of posted resumptions to one.
struct waker_state {
  explicit waker_state(executor ex_) : ex(std::move(ex_)) {}

  executor ex;
  std::mutex m;
  std::coroutine_handle<> h{};
  bool notified = false;
  bool scheduled = false;
};

}  // namespace detail

/// Notification handle passed to `poll_ready`.
///
/// A service that answers `readiness::pending` keeps the waker and calls `wake()` once the
/// condition that blocked it clears. `wake()` is thread-safe and may be called any number of
/// times. It reschedules the parked coroutine through its executor, never inline. Waking a
/// waker whose slot has gone away does nothing; so does a default-constructed waker.
class waker {
 public:
  waker() noexcept = default;
  explicit waker(std::shared_ptr<detail::waker_state> st) noexcept : st_(std::move(st)) {}

  void wake() const {
    if (!st_) {
      return;
    }
    {
      std::scoped_lock lk{st_->m};
      st_->notified = true;
      if (!st_->h || st_->scheduled) {
        return;
      }
      st_->scheduled = true;
    }
    st_->ex.post([s = st_]() {
      std::coroutine_handle<> h{};
      {
        std::scoped_lock lk{s->m};
        s->scheduled = false;
        h = std::exchange(s->h, {});
      }
      if (h) {
        h.resume();
      }
    });
  }

  /// True if both wakers would resume the same coroutine.
  auto will_wake(waker const& other) const noexcept -> bool { return st_ == other.st_; }

  explicit operator bool() const noexcept { return st_ != nullptr; }

 private:
  std::shared_ptr<detail::waker_state> st_{};
};

/// Owner side of a waker: hands out wakers and parks the owning coroutine until one of them
/// is woken.
///
/// Destroying the slot (or the coroutine parked on it) turns every outstanding waker into a
/// no-op.
class wake_slot {
 public:
  explicit wake_slot(executor ex) : st_(std::make_shared<detail::waker_state>(std::move(ex))) {
    SVCORO_ENSURE(st_->ex, "wake_slot: requires a non-empty executor");
  }

  wake_slot(wake_slot const&) = delete;
  auto operator=(wake_slot const&) -> wake_slot& = delete;

  ~wake_slot() {
    std::scoped_lock lk{st_->m};
    st_->h = {};
  }

  auto get_waker() const -> waker { return waker{st_}; }

  /// True if a wake arrived since the last park.
  auto notified() const -> bool {
    std::scoped_lock lk{st_->m};
    return st_->notified;
  }

  class park_awaiter {
   public:
    explicit park_awaiter(std::shared_ptr<detail::waker_state> st) noexcept
        : st_(std::move(st)) {}

    park_awaiter(park_awaiter const&) = delete;
    auto operator=(park_awaiter const&) -> park_awaiter& = delete;
    park_awaiter(park_awaiter&&) noexcept = default;

    ~park_awaiter() {
      if (!st_) {
        return;
      }
      std::scoped_lock lk{st_->m};
      st_->h = {};
    }

    bool await_ready() const noexcept { return false; }

    auto await_suspend(std::coroutine_handle<> h) -> bool {
      std::scoped_lock lk{st_->m};
      if (st_->notified) {
        st_->notified = false;
        return false;
      }
      st_->h = h;
      return true;
    }

    void await_resume() noexcept {
      std::scoped_lock lk{st_->m};
      st_->notified = false;
    }

   private:
    std::shared_ptr<detail::waker_state> st_;
  };

  /// Suspend until a waker from this slot is woken. Returns at once if one already was.
  auto wait() -> park_awaiter { return park_awaiter{st_}; }

 private:
  std::shared_ptr<detail::waker_state> st_;
};

}  // namespace svcoro
