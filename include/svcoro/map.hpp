#pragma once

#include <svcoro/expected.hpp>
#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

// Adapters that change the request, response or error type of a service. None of them touch
// readiness: poll_ready() is forwarded (map_err only translates its error).

namespace svcoro {

namespace detail {

template <class R, class E, class F>
auto map_response_future(response_future<R, E> fut, F f)
  -> response_future<std::invoke_result_t<F&, R>, E> {
  auto r = co_await std::move(fut);
  if (!r) {
    co_return unexpected<E>(std::move(r).error());
  }
  co_return std::invoke(f, std::move(*r));
}

template <class R, class E, class F>
auto map_error_future(response_future<R, E> fut, F f)
  -> response_future<R, std::invoke_result_t<F&, E>> {
  using mapped = std::invoke_result_t<F&, E>;
  auto r = co_await std::move(fut);
  if (!r) {
    co_return unexpected<mapped>(std::invoke(f, std::move(r).error()));
  }
  co_return std::move(*r);
}

}  // namespace detail

template <class S, class F>
class map_request_service {
 public:
  map_request_service(S inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

  auto poll_ready(waker const& w) { return inner_.poll_ready(w); }

  template <class Req>
    requires std::invocable<F&, Req> && service<S, std::invoke_result_t<F&, Req>>
  auto call(Req req) {
    return inner_.call(std::invoke(f_, std::move(req)));
  }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  F f_;
};

template <class S, class F>
class map_response_service {
 public:
  map_response_service(S inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

  auto poll_ready(waker const& w) { return inner_.poll_ready(w); }

  template <class Req>
    requires service<S, Req> && std::invocable<F&, response_t<S, Req>>
  auto call(Req req) {
    return detail::map_response_future(inner_.call(std::move(req)), f_);
  }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  F f_;
};

/// Translates errors from both poll_ready() and the response futures.
template <class S, class F>
class map_err_service {
 public:
  map_err_service(S inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

  auto poll_ready(waker const& w)
    -> poll_ready_result<std::invoke_result_t<F&, readiness_error_t<S>>> {
    auto r = inner_.poll_ready(w);
    if (!r) {
      return unexpected(std::invoke(f_, std::move(r).error()));
    }
    return *r;
  }

  template <class Req>
    requires service<S, Req> && std::invocable<F&, error_t<S, Req>>
  auto call(Req req) {
    return detail::map_error_future(inner_.call(std::move(req)), f_);
  }

  auto get_ref() const noexcept -> S const& { return inner_; }
  auto get_mut() noexcept -> S& { return inner_; }
  auto into_inner() && -> S { return std::move(inner_); }

 private:
  S inner_;
  F f_;
};

template <class S, class F>
auto map_request(S svc, F f) -> map_request_service<S, F> {
  return {std::move(svc), std::move(f)};
}

template <class S, class F>
auto map_response(S svc, F f) -> map_response_service<S, F> {
  return {std::move(svc), std::move(f)};
}

template <class S, class F>
auto map_err(S svc, F f) -> map_err_service<S, F> {
  return {std::move(svc), std::move(f)};
}

template <class F>
struct map_request_layer {
  F f;

  template <class S>
  auto layer(S s) const -> map_request_service<S, F> {
    return {std::move(s), f};
  }
};

template <class F>
struct map_response_layer {
  F f;

  template <class S>
  auto layer(S s) const -> map_response_service<S, F> {
    return {std::move(s), f};
  }
};

template <class F>
struct map_err_layer {
  F f;

  template <class S>
  auto layer(S s) const -> map_err_service<S, F> {
    return {std::move(s), f};
  }
};

}  // namespace svcoro
