#pragma once

#include <svcoro/awaitable.hpp>
#include <svcoro/expected.hpp>
#include <svcoro/waker.hpp>

#include <concepts>
#include <cstdint>
#include <type_traits>
#include <utility>

// Service contract.
//
// A service turns a request into a pending computation and reports, through poll_ready(),
// whether it can accept one more request right now.
//
// - poll_ready(w) never blocks. `readiness::ready` reserves capacity for exactly one call.
//   `readiness::pending` means the service kept `w` and will wake it once capacity frees up;
//   the caller suspends and polls again. An error means the service is unusable from then on.
// - call(req) is only legal after poll_ready() answered ready. It returns a lazy
//   `response_future`; its failure concerns that request only.
// - Destroying a response_future before it completes abandons the request and releases
//   whatever it reserved.
// - Services are cheap to copy. A copy shares any capacity-tracking state with the original
//   but never inherits a reservation made through it.

namespace svcoro {

enum class readiness : std::uint8_t {
  ready,
  pending,
};

template <class E>
using poll_ready_result = expected<readiness, E>;

template <class R, class E>
using response_future = awaitable<expected<R, E>>;

namespace detail {

template <class T>
struct is_poll_ready_result : std::false_type {};

template <class E>
struct is_poll_ready_result<expected<readiness, E>> : std::true_type {};

template <class T>
struct is_response_future : std::false_type {};

template <class R, class E>
struct is_response_future<awaitable<expected<R, E>>> : std::true_type {};

}  // namespace detail

template <class S>
using poll_ready_t = decltype(std::declval<S&>().poll_ready(std::declval<waker const&>()));

template <class S, class Req>
using call_t = decltype(std::declval<S&>().call(std::declval<Req>()));

/// Anything that answers poll_ready().
template <class S>
concept ready_service = requires(S& s, waker const& w) { s.poll_ready(w); } &&
                        detail::is_poll_ready_result<poll_ready_t<S>>::value;

/// A copyable service accepting `Req`.
template <class S, class Req>
concept service = ready_service<S> && std::copy_constructible<S> &&
                  requires(S& s, Req req) { s.call(std::move(req)); } &&
                  detail::is_response_future<call_t<S, Req>>::value;

template <class S>
using readiness_error_t = typename poll_ready_t<S>::error_type;

template <class S, class Req>
using response_t = typename call_t<S, Req>::value_type::value_type;

template <class S, class Req>
using error_t = typename call_t<S, Req>::value_type::error_type;

/// A response_future that completes immediately.
template <class R, class E, class V>
auto ready_response(V v) -> response_future<R, E> {
  co_return std::move(v);
}

}  // namespace svcoro
