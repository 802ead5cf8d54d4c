// service_stack.cpp
//
// Purpose:
//   Wraps a slow leaf service in load_shed, concurrency_limit and timeout, then fires a burst
//   of concurrent requests at it and reports what happened to each.
//
// Notes:
//   - The first layer added to the builder is the outermost one.
//   - Requests that find the limit saturated are shed with `overloaded`. Admitted requests
//     slower than the deadline fail with `elapsed`.
//   - Set SVCORO_EXAMPLE_DEBUG=1 to see the middleware's debug log lines.

#include <svcoro/svcoro.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <system_error>

using namespace std::chrono_literals;

namespace {

// Takes `delay_ms` milliseconds to answer.
auto slow_lookup(int delay_ms) -> svcoro::response_future<std::string, std::error_code> {
  co_await svcoro::co_sleep(std::chrono::milliseconds{delay_ms});
  co_return "value after " + std::to_string(delay_ms) + "ms";
}

auto describe(svcoro::any_error const& e) -> std::string {
  if (e.is<svcoro::overloaded>()) {
    return "shed (" + e.message() + ")";
  }
  if (e.is<svcoro::elapsed>()) {
    return "timed out (" + e.message() + ")";
  }
  return "failed (" + e.message() + ")";
}

template <class S>
auto client(S svc, int id, int delay_ms) -> svcoro::awaitable<void> {
  auto r = co_await svcoro::oneshot(std::move(svc), delay_ms);
  if (r) {
    std::cout << "service_stack: request " << id << ": " << *r << "\n";
  } else {
    std::cout << "service_stack: request " << id << ": " << describe(r.error()) << "\n";
  }
}

}  // namespace

int main() {
  if (auto const* dbg = std::getenv("SVCORO_EXAMPLE_DEBUG"); dbg != nullptr && *dbg == '1') {
    svcoro::set_log_level(svcoro::log_level::debug);
  }

  svcoro::io_context ctx;
  auto ex = ctx.get_executor();

  auto svc = svcoro::service_builder{}
               .load_shed()
               .concurrency_limit(2)
               .timeout(50ms)
               .service(svcoro::service_fn<int>(&slow_lookup));

  int const delays[] = {10, 80, 20, 30, 5};
  for (int i = 0; i < 5; ++i) {
    svcoro::co_spawn(ex, client(svc, i, delays[i]), svcoro::detached);
  }

  ctx.run();
  return 0;
}
