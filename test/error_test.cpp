#include <gtest/gtest.h>

#include <netaddr/error.hpp>
#include <netaddr/result.hpp>

#include <system_error>

TEST(error_test, error_category_name_and_messages) {
  auto ec = netaddr::make_error_code(netaddr::error::out_of_range);
  EXPECT_STREQ(ec.category().name(), "netaddr");
  EXPECT_EQ(ec.message(), "value out of range");

  EXPECT_EQ(netaddr::make_error_code(netaddr::error::invalid_format).message(), "invalid format");
  EXPECT_EQ(netaddr::make_error_code(netaddr::error::invalid_token).message(), "invalid token");
  EXPECT_EQ(netaddr::make_error_code(netaddr::error::malformed_address).message(),
            "malformed address");
  EXPECT_EQ(netaddr::make_error_code(netaddr::error::invalid_length).message(),
            "invalid binary length");
  EXPECT_EQ(netaddr::make_error_code(netaddr::error::family_mismatch).message(),
            "address family mismatch");
}

TEST(error_test, make_error_code_is_equatable) {
  auto ec1 = netaddr::make_error_code(netaddr::error::invalid_token);
  auto ec2 = netaddr::make_error_code(netaddr::error::invalid_token);
  auto ec3 = netaddr::make_error_code(netaddr::error::invalid_length);

  EXPECT_EQ(ec1, ec2);
  EXPECT_NE(ec1, ec3);
}

TEST(error_test, error_enum_converts_to_error_code) {
  std::error_code ec = netaddr::error::family_mismatch;
  EXPECT_EQ(ec, netaddr::make_error_code(netaddr::error::family_mismatch));
  EXPECT_TRUE(ec);
}

TEST(error_test, error_info_carries_code_and_detail) {
  netaddr::error_info info{netaddr::error::out_of_range, "invalid IPv4 address component: 999"};
  EXPECT_EQ(info.code(), netaddr::make_error_code(netaddr::error::out_of_range));
  EXPECT_EQ(info.detail(), "invalid IPv4 address component: 999");
  EXPECT_EQ(info.message(), "invalid IPv4 address component: 999");
  EXPECT_TRUE(info == netaddr::error::out_of_range);
  EXPECT_FALSE(info == netaddr::error::invalid_token);
}

TEST(error_test, error_info_without_detail_uses_category_message) {
  netaddr::error_info info{netaddr::error::malformed_address, ""};
  EXPECT_EQ(info.message(), "malformed address");
}

TEST(error_test, fail_builds_error_side_of_result) {
  netaddr::result<int> r = netaddr::fail(netaddr::error::invalid_format, "bad");
  ASSERT_FALSE(r);
  EXPECT_TRUE(r.error() == netaddr::error::invalid_format);
  EXPECT_EQ(r.error().detail(), "bad");

  auto v = netaddr::ok();
  EXPECT_TRUE(v);
}
