#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/log.hpp>
#include <svcoro/semaphore.hpp>
#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <cstddef>
#include <optional>
#include <utility>

namespace svcoro {

namespace detail {

template <class T>
auto hold_permit(awaitable<T> fut, semaphore::permit p) -> awaitable<T> {
  auto r = co_await std::move(fut);
  p.reset();
  co_return r;
}

}  // namespace detail

/// Caps the number of in-flight requests across every copy of the service.
///
/// poll_ready() first reserves a permit, then asks the inner service. The permit moves into the
/// response future at call() and is returned when that future completes or is destroyed. A
/// reservation that is never used goes back to the pool when the service copy holding it is
/// destroyed. Copies share the pool but start without a reservation.
template <class S>
class concurrency_limit {
 public:
  concurrency_limit(S inner, std::size_t max) : inner_(std::move(inner)), sem_(max) {}
  concurrency_limit(S inner, semaphore sem) : inner_(std::move(inner)), sem_(std::move(sem)) {}

  concurrency_limit(concurrency_limit const& other) : inner_(other.inner_), sem_(other.sem_) {}
  auto operator=(concurrency_limit const& other) -> concurrency_limit& {
    if (this != &other) {
      inner_ = other.inner_;
      sem_ = other.sem_;
      permit_.reset();
    }
    return *this;
  }

  concurrency_limit(concurrency_limit&&) noexcept = default;
  auto operator=(concurrency_limit&&) noexcept -> concurrency_limit& = default;

  ~concurrency_limit() = default;

  auto poll_ready(waker const& w) -> poll_ready_t<S> {
    if (!permit_.has_value()) {
      permit_ = sem_.poll_acquire(w);
      if (!permit_.has_value()) {
        log_trace("concurrency_limit: all {} permits in use", sem_.max_permits());
        return readiness::pending;
      }
    }
    return inner_.poll_ready(w);
  }

  template <class Req>
    requires service<S, Req>
  auto call(Req req) -> call_t<S, Req> {
    SVCORO_ENSURE(permit_.has_value(),
                  "concurrency_limit: max requests in flight; poll_ready must be called first");
    auto p = std::move(*permit_);
    permit_.reset();
    return detail::hold_permit(inner_.call(std::move(req)), std::move(p));
  }

  /// Permits currently free in the shared pool.
  auto available_permits() const -> std::size_t { return sem_.available_permits(); }
  auto max_concurrency() const noexcept -> std::size_t { return sem_.max_permits(); }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  semaphore sem_;
  std::optional<semaphore::permit> permit_{};
};

/// Gives every service it wraps a pool of its own.
class concurrency_limit_layer {
 public:
  explicit concurrency_limit_layer(std::size_t max) noexcept : max_(max) {}

  template <class S>
  auto layer(S s) const -> concurrency_limit<S> {
    return concurrency_limit<S>{std::move(s), max_};
  }

 private:
  std::size_t max_;
};

/// Every service it wraps draws from the same pool.
class global_concurrency_limit_layer {
 public:
  explicit global_concurrency_limit_layer(std::size_t max) : sem_(max) {}

  template <class S>
  auto layer(S s) const -> concurrency_limit<S> {
    return concurrency_limit<S>{std::move(s), sem_};
  }

 private:
  semaphore sem_;
};

}  // namespace svcoro
