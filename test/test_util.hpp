#pragma once

#include <svcoro/awaitable.hpp>
#include <svcoro/co_spawn.hpp>
#include <svcoro/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

// Blocking drivers for tests: run an io_context on the calling thread until one awaitable is
// done, then hand back its value (or rethrow its exception).

namespace svcoro {

/// Thrown by sync_wait_for when the awaitable is still running at the deadline.
class sync_wait_timeout : public std::runtime_error {
 public:
  explicit sync_wait_timeout(char const* msg) : std::runtime_error(msg) {}
};

namespace detail {

template <typename T>
auto unwrap_spawn_result(spawn_result<T>&& r) -> T {
  if (!r) {
    std::rethrow_exception(std::move(r).error());
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*r);
  }
}

/// Spawns `a` on `ctx`; its result lands in `out`.
template <typename T>
void spawn_into(io_context& ctx, awaitable<T> a, std::optional<spawn_result<T>>& out) {
  ctx.restart();
  co_spawn(ctx.get_executor(), std::move(a),
           [&out](spawn_result<T> r) { out.emplace(std::move(r)); });
}

}  // namespace detail

/// Run `ctx` until `a` completes. Throws std::logic_error if the context runs out of work
/// first, i.e. `a` is parked on something nothing will ever wake.
template <typename T>
auto sync_wait(io_context& ctx, awaitable<T> a) -> T {
  std::optional<spawn_result<T>> out;
  detail::spawn_into(ctx, std::move(a), out);

  while (!out.has_value()) {
    if (ctx.run_one() == 0) {
      throw std::logic_error("sync_wait: context ran out of work");
    }
  }
  // Frames torn down by the completion may still have posted cleanup.
  while (ctx.poll() != 0) {
  }
  return detail::unwrap_spawn_result<T>(std::move(*out));
}

/// Like sync_wait, but gives up with sync_wait_timeout once `limit` has passed.
template <typename Rep, typename Period, typename T>
auto sync_wait_for(io_context& ctx, std::chrono::duration<Rep, Period> limit, awaitable<T> a)
  -> T {
  using clock = std::chrono::steady_clock;
  auto const deadline = clock::now() + limit;

  std::optional<spawn_result<T>> out;
  detail::spawn_into(ctx, std::move(a), out);

  for (auto now = clock::now(); !out.has_value() && now < deadline; now = clock::now()) {
    auto const slice = std::max(std::chrono::ceil<std::chrono::milliseconds>(deadline - now),
                                std::chrono::milliseconds{1});
    if (ctx.run_for(slice) == 0 && ctx.poll() == 0 && !out.has_value()) {
      break;
    }
  }
  if (!out.has_value()) {
    throw sync_wait_timeout("sync_wait_for: timeout");
  }
  while (ctx.poll() != 0) {
  }
  return detail::unwrap_spawn_result<T>(std::move(*out));
}

}  // namespace svcoro
