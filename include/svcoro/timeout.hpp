#pragma once

#include <svcoro/any_error.hpp>
#include <svcoro/detail/clock.hpp>
#include <svcoro/detail/deadline_race.hpp>
#include <svcoro/error.hpp>
#include <svcoro/log.hpp>
#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <chrono>
#include <string>
#include <system_error>
#include <utility>

namespace svcoro {

/// The request did not complete before its deadline.
class elapsed {
 public:
  auto message() const -> std::string { return "request timed out"; }
  auto code() const noexcept -> std::error_code { return make_error_code(error::timed_out); }
};

namespace detail {

template <class R, class E>
auto race_deadline(response_future<R, E> inner, std::chrono::steady_clock::time_point deadline)
  -> response_future<R, any_error> {
  auto r = co_await deadline_race<expected<R, E>>{std::move(inner), deadline};
  if (!r.has_value()) {
    log_debug("timeout: deadline passed, inner request dropped");
    co_return unexpected(any_error{elapsed{}});
  }
  if (!r->has_value()) {
    co_return unexpected(box_error(std::move(*r).error()));
  }
  co_return std::move(**r);
}

}  // namespace detail

/// Fails requests that take longer than a fixed duration.
///
/// The deadline is taken when call() runs. poll_ready() is forwarded to the inner service
/// unchanged. Errors from both sides are reported as `any_error`; a missed deadline is an
/// `elapsed` payload. When the deadline wins, the inner response future is destroyed.
template <class S>
class timeout {
 public:
  using duration_type = std::chrono::steady_clock::duration;

  timeout(S inner, duration_type d) : inner_(std::move(inner)), duration_(d) {}

  auto poll_ready(waker const& w) -> poll_ready_result<any_error> {
    auto r = inner_.poll_ready(w);
    if (!r) {
      return unexpected(box_error(std::move(r).error()));
    }
    return *r;
  }

  template <class Req>
    requires service<S, Req>
  auto call(Req req) -> response_future<response_t<S, Req>, any_error> {
    auto const deadline = detail::deadline_after(duration_);
    return detail::race_deadline(inner_.call(std::move(req)), deadline);
  }

  auto duration() const noexcept -> duration_type { return duration_; }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  duration_type duration_;
};

class timeout_layer {
 public:
  explicit timeout_layer(std::chrono::steady_clock::duration d) noexcept : duration_(d) {}

  template <class S>
  auto layer(S s) const -> timeout<S> {
    return timeout<S>{std::move(s), duration_};
  }

 private:
  std::chrono::steady_clock::duration duration_;
};

}  // namespace svcoro
