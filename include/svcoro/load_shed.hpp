#pragma once

#include <svcoro/any_error.hpp>
#include <svcoro/error.hpp>
#include <svcoro/log.hpp>
#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <utility>

namespace svcoro {

/// The inner service had no capacity when the request arrived.
class overloaded {
 public:
  auto message() const -> std::string { return "service overloaded"; }
  auto code() const noexcept -> std::error_code { return make_error_code(error::overloaded); }
};

namespace detail {

template <class R, class E>
auto box_response_error(response_future<R, E> fut) -> response_future<R, any_error> {
  auto r = co_await std::move(fut);
  if (!r) {
    co_return unexpected(box_error(std::move(r).error()));
  }
  co_return std::move(*r);
}

}  // namespace detail

/// Rejects requests instead of waiting when the inner service is not ready.
///
/// poll_ready() always answers ready (inner errors still propagate). If the inner service
/// answered pending, the following call() fails at once with `overloaded`.
template <class S>
class load_shed {
 public:
  explicit load_shed(S inner) : inner_(std::move(inner)) {}

  load_shed(load_shed const& other) : inner_(other.inner_) {}
  auto operator=(load_shed const& other) -> load_shed& {
    if (this != &other) {
      inner_ = other.inner_;
      is_ready_ = false;
    }
    return *this;
  }

  load_shed(load_shed&&) noexcept = default;
  auto operator=(load_shed&&) noexcept -> load_shed& = default;

  ~load_shed() = default;

  auto poll_ready(waker const& w) -> poll_ready_result<any_error> {
    auto r = inner_.poll_ready(w);
    if (!r) {
      return unexpected(box_error(std::move(r).error()));
    }
    is_ready_ = *r == readiness::ready;
    return readiness::ready;
  }

  template <class Req>
    requires service<S, Req>
  auto call(Req req) -> response_future<response_t<S, Req>, any_error> {
    if (!is_ready_) {
      log_debug("load_shed: inner service not ready, rejecting request");
      return ready_response<response_t<S, Req>, any_error>(unexpected(any_error{overloaded{}}));
    }
    is_ready_ = false;
    if constexpr (std::same_as<error_t<S, Req>, any_error>) {
      return inner_.call(std::move(req));
    } else {
      return detail::box_response_error(inner_.call(std::move(req)));
    }
  }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  bool is_ready_ = false;
};

struct load_shed_layer {
  template <class S>
  auto layer(S s) const -> load_shed<S> {
    return load_shed<S>{std::move(s)};
  }
};

}  // namespace svcoro
