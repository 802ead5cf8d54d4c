#include <gtest/gtest.h>

#include <svcoro/error.hpp>

#include <system_error>

TEST(error_test, error_category_name_and_messages) {
  auto ec = svcoro::make_error_code(svcoro::error::timed_out);
  EXPECT_STREQ(ec.category().name(), "svcoro");
  EXPECT_EQ(ec.message(), "request timed out");

  EXPECT_EQ(svcoro::make_error_code(svcoro::error::overloaded).message(), "service overloaded");
  EXPECT_EQ(svcoro::make_error_code(svcoro::error::closed).message(), "service closed");
  EXPECT_EQ(svcoro::make_error_code(svcoro::error::operation_aborted).message(),
            "operation aborted");
}

TEST(error_test, make_error_code_is_equatable) {
  auto ec1 = svcoro::make_error_code(svcoro::error::overloaded);
  auto ec2 = svcoro::make_error_code(svcoro::error::overloaded);
  auto ec3 = svcoro::make_error_code(svcoro::error::closed);

  EXPECT_EQ(ec1, ec2);
  EXPECT_NE(ec1, ec3);
}

TEST(error_test, enum_compares_against_error_code) {
  std::error_code ec = svcoro::error::timed_out;
  EXPECT_EQ(ec, svcoro::error::timed_out);
  EXPECT_NE(ec, svcoro::error::closed);
  EXPECT_NE(ec, std::make_error_code(std::errc::timed_out));
}
