#pragma once

#include <svcoro/completion_token.hpp>
#include <svcoro/detail/spawn.hpp>
#include <svcoro/executor.hpp>

#include <type_traits>
#include <utility>

// co_spawn starts a coroutine on an executor without awaiting it.
//
// The coroutine always begins from a posted handler, never inline. With `detached` its
// result is discarded; otherwise `completion` receives a spawn_result holding the value or
// the exception the coroutine exited with. The frame is freed once it finishes.
//
// Passing a factory (a callable returning awaitable<T>) instead of an awaitable keeps the
// callable, and so a coroutine lambda's captures, alive until the coroutine is done.

namespace svcoro {

template <typename T>
void co_spawn(executor ex, awaitable<T> a, detached_t) {
  detail::launch<T>(std::move(ex), {detail::factory_of(std::move(a)), nullptr});
}

template <typename F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
void co_spawn(executor ex, F&& f, detached_t) {
  using T = detail::factory_result_t<std::remove_cvref_t<F>>;
  detail::launch<T>(std::move(ex), {std::forward<F>(f), nullptr});
}

template <typename T, typename C>
  requires detail::spawn_completion<C, T>
void co_spawn(executor ex, awaitable<T> a, C&& completion) {
  detail::launch<T>(std::move(ex),
                    {detail::factory_of(std::move(a)), std::forward<C>(completion)});
}

template <typename F, typename C>
  requires detail::awaitable_factory<std::remove_cvref_t<F>> &&
           detail::spawn_completion<std::remove_cvref_t<C>,
                                    detail::factory_result_t<std::remove_cvref_t<F>>>
void co_spawn(executor ex, F&& f, C&& completion) {
  using T = detail::factory_result_t<std::remove_cvref_t<F>>;
  detail::launch<T>(std::move(ex), {std::forward<F>(f), std::forward<C>(completion)});
}

}  // namespace svcoro
