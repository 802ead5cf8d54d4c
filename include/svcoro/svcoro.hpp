#pragma once

// Primary public header for the svcoro service composition library.
// Most users should include this header only.

// Error & result model
#include <svcoro/any_error.hpp>
#include <svcoro/error.hpp>
#include <svcoro/expected.hpp>
#include <svcoro/result.hpp>

// Coroutine & completion model
#include <svcoro/awaitable.hpp>
#include <svcoro/completion_token.hpp>
#include <svcoro/this_coro.hpp>

#include <svcoro/co_sleep.hpp>
#include <svcoro/co_spawn.hpp>

// Execution & lifetime
#include <svcoro/executor.hpp>
#include <svcoro/io_context.hpp>
#include <svcoro/work_guard.hpp>

// Timers & notification
#include <svcoro/steady_timer.hpp>
#include <svcoro/timer_handle.hpp>
#include <svcoro/waker.hpp>
#include <svcoro/semaphore.hpp>

// Services & layers
#include <svcoro/service.hpp>
#include <svcoro/ready.hpp>
#include <svcoro/service_fn.hpp>
#include <svcoro/layer.hpp>
#include <svcoro/builder.hpp>
#include <svcoro/any_service.hpp>

// Middleware
#include <svcoro/timeout.hpp>
#include <svcoro/concurrency_limit.hpp>
#include <svcoro/load_shed.hpp>
#include <svcoro/map.hpp>

// Diagnostics
#include <svcoro/log.hpp>
