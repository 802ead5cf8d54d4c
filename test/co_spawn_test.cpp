#include <gtest/gtest.h>

#include <svcoro/awaitable.hpp>
#include <svcoro/co_spawn.hpp>
#include <svcoro/io_context.hpp>
#include <svcoro/this_coro.hpp>

#include <exception>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

auto add_one(int v) -> svcoro::awaitable<int> { co_return v + 1; }

auto reject(std::string why) -> svcoro::awaitable<int> {
  (void)co_await svcoro::this_coro::executor;
  throw std::invalid_argument(why);
}

TEST(co_spawn_test, spawned_work_waits_for_the_loop) {
  svcoro::io_context ctx;
  int hits = 0;

  auto bump = [&]() -> svcoro::awaitable<void> {
    ++hits;
    co_return;
  };
  svcoro::co_spawn(ctx.get_executor(), bump(), svcoro::detached);
  svcoro::co_spawn(ctx.get_executor(), bump(), svcoro::detached);
  EXPECT_EQ(hits, 0);

  (void)ctx.run();
  EXPECT_EQ(hits, 2);
}

TEST(co_spawn_test, nested_awaits_run_on_the_spawning_executor) {
  svcoro::io_context ctx;
  auto ex = ctx.get_executor();

  bool same_executor = false;
  bool on_loop = false;
  int got = 0;

  auto chain = [&]() -> svcoro::awaitable<int> {
    auto inner = co_await svcoro::this_coro::executor;
    same_executor = inner == ex;
    co_return co_await add_one(co_await add_one(40));
  };

  svcoro::co_spawn(ex, chain(), [&](svcoro::spawn_result<int> r) {
    on_loop = ex.running_in_this_thread();
    got = r.value_or(-1);
  });

  (void)ctx.run();
  EXPECT_TRUE(same_executor);
  EXPECT_TRUE(on_loop);
  EXPECT_EQ(got, 42);
}

TEST(co_spawn_test, exception_is_handed_to_the_completion) {
  svcoro::io_context ctx;
  std::exception_ptr caught;

  svcoro::co_spawn(ctx.get_executor(), reject("bad port"), [&](svcoro::spawn_result<int> r) {
    ASSERT_FALSE(r);
    caught = r.error();
  });

  (void)ctx.run();
  ASSERT_TRUE(caught);
  EXPECT_THROW(std::rethrow_exception(caught), std::invalid_argument);
}

TEST(co_spawn_test, factory_closure_outlives_the_spawn_call) {
  svcoro::io_context ctx;
  int total = 0;

  {
    std::vector<int> weights{3, 5, 7};
    svcoro::co_spawn(
      ctx.get_executor(),
      [weights]() -> svcoro::awaitable<int> {
        (void)co_await svcoro::this_coro::executor;
        co_return std::accumulate(weights.begin(), weights.end(), 0);
      },
      [&](svcoro::spawn_result<int> r) { total = r.value_or(-1); });
  }

  (void)ctx.run();
  EXPECT_EQ(total, 15);
}

TEST(co_spawn_test, void_coroutine_reports_monostate) {
  svcoro::io_context ctx;
  bool reported = false;

  auto noop = []() -> svcoro::awaitable<void> { co_return; };
  svcoro::co_spawn(ctx.get_executor(), noop(),
                   [&](svcoro::spawn_result<void> r) { reported = r.has_value(); });

  (void)ctx.run();
  EXPECT_TRUE(reported);
}

TEST(co_spawn_test, unrun_spawn_is_freed_with_its_context) {
  auto token = std::make_shared<int>(1);
  std::weak_ptr<int> watch = token;
  bool completed = false;

  {
    svcoro::io_context ctx;
    svcoro::co_spawn(
      ctx.get_executor(),
      [token = std::move(token)]() -> svcoro::awaitable<int> { co_return *token; },
      [&](svcoro::spawn_result<int>) { completed = true; });
  }

  EXPECT_TRUE(watch.expired());
  EXPECT_FALSE(completed);
}

}  // namespace
