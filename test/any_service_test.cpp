#include <gtest/gtest.h>

#include <svcoro/any_error.hpp>
#include <svcoro/any_service.hpp>
#include <svcoro/builder.hpp>
#include <svcoro/error.hpp>
#include <svcoro/io_context.hpp>
#include <svcoro/ready.hpp>
#include <svcoro/service_fn.hpp>

#include <chrono>
#include <string>
#include <system_error>
#include <vector>

#include "mock_service.hpp"
#include "test_util.hpp"

namespace svcoro::test {
namespace {

using namespace std::chrono_literals;

using boxed = any_service<int, std::string>;

static_assert(service<boxed, int>);

auto make_to_string() {
  return service_fn<int>([](int x) -> response_future<std::string, std::error_code> {
    if (x < 0) {
      co_return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    co_return std::to_string(x);
  });
}

TEST(any_service_test, erases_a_leaf_service) {
  io_context ctx;
  boxed svc = make_to_string();

  auto r = sync_wait(ctx, oneshot(svc, 12));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, "12");
}

TEST(any_service_test, boxes_call_errors) {
  io_context ctx;
  boxed svc = make_to_string();

  auto r = sync_wait(ctx, oneshot(svc, -1));
  ASSERT_FALSE(r);
  auto const* ec = r.error().downcast<std::error_code>();
  ASSERT_NE(ec, nullptr);
  EXPECT_TRUE(*ec == std::errc::invalid_argument);
}

TEST(any_service_test, boxes_readiness_errors) {
  auto [inner, handle] = make_mock<int, std::string>();
  handle.close();
  boxed svc = std::move(inner);

  auto r = svc.poll_ready(waker{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code(), error::closed);
}

TEST(any_service_test, different_stacks_share_one_type) {
  io_context ctx;
  std::vector<boxed> services;
  services.emplace_back(make_to_string());
  services.emplace_back(service_builder{}.timeout(1s).service(make_to_string()));
  services.emplace_back(
    service_builder{}.map_response([](std::string s) { return s + s; }).service(make_to_string()));

  std::vector<std::string> out;
  for (auto& svc : services) {
    auto r = sync_wait(ctx, oneshot(svc, 7));
    ASSERT_TRUE(r);
    out.push_back(*r);
  }
  EXPECT_EQ(out, (std::vector<std::string>{"7", "7", "77"}));
}

TEST(any_service_test, copies_wrap_independent_copies) {
  auto [inner, handle] = make_mock<int, std::string>();
  handle.allow(1);
  boxed svc = std::move(inner);
  ASSERT_EQ(*svc.poll_ready(waker{}), readiness::ready);

  boxed copy = svc;
  // The copy shares the mock's budget but not the reservation.
  (void)svc.call(1);
  EXPECT_EQ(*copy.poll_ready(waker{}), readiness::pending);
  EXPECT_EQ(handle.calls(), 1U);
}

}  // namespace
}  // namespace svcoro::test
