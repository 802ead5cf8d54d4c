// hello_service.cpp
//
// Purpose:
//   Minimal runnable example: a leaf service built with service_fn, called once via oneshot.
//
// Notes:
//   - oneshot() takes the service by value, waits for poll_ready() and issues a single call.

#include <svcoro/svcoro.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <system_error>

using namespace std::chrono_literals;

namespace {

auto greet(std::string name) -> svcoro::response_future<std::string, std::error_code> {
  if (name.empty()) {
    co_return svcoro::unexpected(std::make_error_code(std::errc::invalid_argument));
  }
  co_await svcoro::co_sleep(10ms);
  co_return "hello, " + name;
}

auto co_main() -> svcoro::awaitable<void> {
  auto svc = svcoro::service_fn<std::string>(&greet);

  for (auto const* name : {"svcoro", ""}) {
    auto r = co_await svcoro::oneshot(svc, std::string{name});
    if (!r) {
      std::cout << "hello_service: error: " << r.error().message() << "\n";
      continue;
    }
    std::cout << "hello_service: " << *r << "\n";
  }
}

}  // namespace

int main() {
  svcoro::io_context ctx;

  svcoro::co_spawn(ctx.get_executor(), co_main(), svcoro::detached);

  ctx.run();
  return 0;
}
