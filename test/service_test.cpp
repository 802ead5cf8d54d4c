#include <gtest/gtest.h>

#include <svcoro/any_error.hpp>
#include <svcoro/awaitable.hpp>
#include <svcoro/co_spawn.hpp>
#include <svcoro/error.hpp>
#include <svcoro/io_context.hpp>
#include <svcoro/ready.hpp>
#include <svcoro/service.hpp>
#include <svcoro/service_fn.hpp>

#include <optional>
#include <string>

#include "mock_service.hpp"
#include "test_util.hpp"

namespace svcoro::test {
namespace {

using mock = mock_service<std::string, std::string>;

static_assert(service<mock, std::string>);
static_assert(std::same_as<response_t<mock, std::string>, std::string>);
static_assert(std::same_as<error_t<mock, std::string>, any_error>);
static_assert(std::same_as<readiness_error_t<mock>, any_error>);

TEST(service_test, service_fn_is_always_ready_and_calls_through) {
  io_context ctx;
  auto svc = service_fn<int>([](int x) -> response_future<int, std::error_code> {
    co_return x * 2;
  });

  EXPECT_EQ(*svc.poll_ready(waker{}), readiness::ready);

  auto r = sync_wait(ctx, svc.call(21));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 42);
}

TEST(service_test, oneshot_waits_for_readiness_then_calls) {
  io_context ctx;
  auto [svc, handle] = make_mock<std::string, std::string>();
  handle.allow(0);

  std::optional<result<std::string>> out;
  co_spawn(ctx.get_executor(), oneshot(svc, std::string{"hello"}),
           [&](spawn_result<result<std::string>> r) { out = std::move(*r); });

  (void)ctx.poll();
  EXPECT_EQ(handle.calls(), 0U);
  EXPECT_EQ(handle.parked(), 1U);

  handle.allow(1);
  (void)ctx.poll();
  ASSERT_EQ(handle.pending_requests(), 1U);

  auto req = handle.next_request();
  ASSERT_TRUE(req.has_value());
  EXPECT_EQ(req->request(), "hello");
  req->send_response("world");

  (void)ctx.poll();
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(*out);
  EXPECT_EQ(**out, "world");
}

TEST(service_test, ready_reports_permanent_failure) {
  io_context ctx;
  auto [svc, handle] = make_mock<std::string, std::string>();
  handle.close();

  auto r = sync_wait(ctx, ready(svc));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code(), error::closed);
}

TEST(service_test, ready_failure_wakes_a_parked_caller) {
  io_context ctx;
  auto [svc, handle] = make_mock<std::string, std::string>();
  handle.allow(0);

  std::optional<expected<std::monostate, any_error>> out;
  co_spawn(ctx.get_executor(), ready(svc),
           [&](spawn_result<expected<std::monostate, any_error>> r) { out = std::move(*r); });
  (void)ctx.poll();
  EXPECT_FALSE(out.has_value());

  handle.fail_ready_with(any_error{error::unspecified});
  (void)ctx.poll();
  ASSERT_TRUE(out.has_value());
  ASSERT_FALSE(*out);
  EXPECT_EQ(out->error().code(), error::unspecified);
}

TEST(service_test, per_request_failure_leaves_service_usable) {
  io_context ctx;
  auto mocked = make_mock<std::string, std::string>();
  auto& svc = mocked.first;
  auto& handle = mocked.second;

  auto first = sync_wait(ctx, [&]() -> response_future<std::string, any_error> {
    auto r = co_await ready(svc);
    EXPECT_TRUE(r);
    auto fut = svc.call("a");
    handle.next_request()->send_error(any_error{std::make_error_code(std::errc::io_error)});
    co_return co_await std::move(fut);
  }());
  ASSERT_FALSE(first);
  EXPECT_TRUE(first.error().code() == std::errc::io_error);

  auto second = sync_wait(ctx, [&]() -> response_future<std::string, any_error> {
    auto r = co_await ready(svc);
    EXPECT_TRUE(r);
    auto fut = svc.call("b");
    handle.next_request()->send_response("ok");
    co_return co_await std::move(fut);
  }());
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "ok");
}

TEST(service_test, clones_share_capacity_but_not_reservations) {
  auto [svc, handle] = make_mock<std::string, std::string>();
  handle.allow(1);
  auto clone = svc;

  EXPECT_EQ(*svc.poll_ready(waker{}), readiness::ready);
  (void)svc.call("x");
  EXPECT_EQ(handle.calls(), 1U);

  EXPECT_EQ(*clone.poll_ready(waker{}), readiness::pending);
  EXPECT_EQ(handle.parked(), 1U);
}

void call_without_ready() {
  auto mocked = make_mock<std::string, std::string>();
  (void)mocked.first.call("no poll_ready first");
}

void call_twice_after_one_ready() {
  auto mocked = make_mock<std::string, std::string>();
  (void)mocked.first.poll_ready(waker{});
  (void)mocked.first.call("first");
  (void)mocked.first.call("second");
}

TEST(service_death_test, call_without_ready_is_fatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH(call_without_ready(), "poll_ready must be called first");
}

TEST(service_death_test, second_call_after_one_ready_is_fatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH(call_twice_after_one_ready(), "poll_ready must be called first");
}

}  // namespace
}  // namespace svcoro::test
