#pragma once

namespace svcoro::this_coro {

/// `co_await this_coro::executor` yields the executor the current coroutine runs on.
struct executor_t {};
inline constexpr executor_t executor{};

}  // namespace svcoro::this_coro
