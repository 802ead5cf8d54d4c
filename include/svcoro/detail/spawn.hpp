#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/awaitable.hpp>
#include <svcoro/completion_token.hpp>
#include <svcoro/detail/unique_function.hpp>
#include <svcoro/executor.hpp>
#include <svcoro/expected.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace svcoro {

/// Outcome handed to a co_spawn completion callback. `void` coroutines report
/// `std::monostate`.
template <typename T>
using spawn_result =
  expected<std::conditional_t<std::is_void_v<T>, std::monostate, T>, std::exception_ptr>;

}  // namespace svcoro

namespace svcoro::detail {

template <typename A>
struct awaitable_result {};

template <typename T>
struct awaitable_result<awaitable<T>> {
  using type = T;
};

/// `T` for a nullary callable returning `awaitable<T>`; ill-formed for anything else.
template <typename F>
using factory_result_t =
  typename awaitable_result<std::remove_cvref_t<std::invoke_result_t<F&>>>::type;

template <typename F>
concept awaitable_factory = std::invocable<F&> && requires { typename factory_result_t<F>; };

template <typename C, typename T>
concept spawn_completion =
  std::invocable<C&, spawn_result<T>> && (!std::same_as<std::remove_cvref_t<C>, detached_t>);

/// What a spawned frame owns: the factory (with whatever its closure captured) and the
/// completion callback. `on_done` is empty for detached spawns.
template <typename T>
struct spawn_job {
  unique_function<awaitable<T>()> make;
  unique_function<void(spawn_result<T>)> on_done;
};

template <typename T>
auto factory_of(awaitable<T> a) -> unique_function<awaitable<T>()> {
  return [a = std::move(a)]() mutable { return std::move(a); };
}

template <typename T>
auto run_job(spawn_job<T> job) -> awaitable<void> {
  if (!job.on_done) {
    co_await job.make();
    co_return;
  }

  std::optional<spawn_result<T>> outcome;
  try {
    if constexpr (std::is_void_v<T>) {
      co_await job.make();
      outcome.emplace(std::monostate{});
    } else {
      outcome.emplace(co_await job.make());
    }
  } catch (...) {
    outcome.emplace(unexpect, std::current_exception());
  }

  try {
    job.on_done(std::move(*outcome));
  } catch (std::exception const& e) {
    SVCORO_ENSURE(false, e.what());
  } catch (...) {
    SVCORO_ENSURE(false, "co_spawn: completion callback threw");
  }
}

/// Posted handler that resumes a fresh frame. A handler dropped unrun (its context shut
/// down first) destroys the frame instead.
class frame_starter {
 public:
  explicit frame_starter(std::coroutine_handle<> frame) noexcept : frame_(frame) {}
  frame_starter(frame_starter&& other) noexcept : frame_(std::exchange(other.frame_, {})) {}
  frame_starter(frame_starter const&) = delete;
  auto operator=(frame_starter const&) -> frame_starter& = delete;
  auto operator=(frame_starter&&) -> frame_starter& = delete;

  ~frame_starter() {
    if (frame_) {
      frame_.destroy();
    }
  }

  void operator()() { std::exchange(frame_, {}).resume(); }

 private:
  std::coroutine_handle<> frame_;
};

template <typename T>
void launch(executor ex, spawn_job<T> job) {
  SVCORO_ENSURE(ex, "co_spawn: requires a non-empty executor");
  auto frame = run_job<T>(std::move(job)).release();
  frame.promise().set_executor(ex);
  frame.promise().detach();
  ex.post(frame_starter{frame});
}

}  // namespace svcoro::detail
