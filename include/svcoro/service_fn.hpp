#pragma once

#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace svcoro {

namespace detail {

// Each request owns a copy of the callable, so the returned future never refers back to the
// service it came from.
template <class F, class Req>
auto invoke_owned(F f, Req req) -> std::invoke_result_t<F&, Req> {
  co_return co_await std::invoke(f, std::move(req));
}

}  // namespace detail

/// Leaf service built from a callable `Req -> response_future<R, E>`. Always ready.
template <class Req, class F>
class fn_service {
 public:
  using future_type = std::invoke_result_t<F&, Req>;
  static_assert(detail::is_response_future<future_type>::value,
                "service_fn: the callable must return a response_future");
  using error_type = typename future_type::value_type::error_type;

  explicit fn_service(F f) : f_(std::move(f)) {}

  auto poll_ready(waker const&) -> poll_ready_result<error_type> { return readiness::ready; }

  auto call(Req req) -> future_type { return detail::invoke_owned(f_, std::move(req)); }

 private:
  F f_;
};

template <class Req, class F>
auto service_fn(F&& f) -> fn_service<Req, std::decay_t<F>> {
  return fn_service<Req, std::decay_t<F>>{std::forward<F>(f)};
}

}  // namespace svcoro
