#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/awaitable.hpp>
#include <svcoro/executor.hpp>
#include <svcoro/steady_timer.hpp>
#include <svcoro/this_coro.hpp>

#include <chrono>

namespace svcoro {

/// Suspends the current coroutine for at least the given duration.
///
/// Resumption happens on `ex`. If the awaiting coroutine is destroyed first, the timer is
/// cancelled with it.
inline auto co_sleep(executor ex, std::chrono::steady_clock::duration d) -> awaitable<void> {
  SVCORO_ENSURE(ex, "co_sleep: requires a non-empty executor");

  steady_timer t{ex};
  (void)t.expires_after(d);
  (void)co_await t.async_wait();
}

inline auto co_sleep(std::chrono::steady_clock::duration d) -> awaitable<void> {
  auto ex = co_await this_coro::executor;
  SVCORO_ENSURE(ex, "co_sleep: requires a bound executor");
  co_await co_sleep(ex, d);
}

}  // namespace svcoro
