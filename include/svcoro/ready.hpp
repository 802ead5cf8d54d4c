#pragma once

#include <svcoro/awaitable.hpp>
#include <svcoro/expected.hpp>
#include <svcoro/service.hpp>
#include <svcoro/this_coro.hpp>
#include <svcoro/waker.hpp>

#include <concepts>
#include <utility>
#include <variant>

namespace svcoro {

/// Wait until `svc` is ready to accept a request.
///
/// Polls once, and after every wake of the waker handed to the service polls again. Between
/// polls the calling coroutine is suspended, never spinning. `svc` must outlive the wait.
template <ready_service S>
auto ready(S& svc) -> awaitable<expected<std::monostate, readiness_error_t<S>>> {
  auto ex = co_await this_coro::executor;
  wake_slot slot{ex};
  for (;;) {
    auto r = svc.poll_ready(slot.get_waker());
    if (!r) {
      co_return unexpected(std::move(r).error());
    }
    if (*r == readiness::ready) {
      co_return std::monostate{};
    }
    co_await slot.wait();
  }
}

/// Take ownership of `svc`, wait for readiness, issue a single request and await its response.
template <class S, class Req>
  requires service<S, Req> && std::convertible_to<readiness_error_t<S>, error_t<S, Req>>
auto oneshot(S svc, Req req) -> response_future<response_t<S, Req>, error_t<S, Req>> {
  auto r = co_await ready(svc);
  if (!r) {
    co_return unexpected<error_t<S, Req>>(std::move(r).error());
  }
  co_return co_await svc.call(std::move(req));
}

}  // namespace svcoro
