#include <gtest/gtest.h>

#include <netaddr/detail/parse_decimal.hpp>

#include <string>
#include <system_error>

namespace {

using netaddr::detail::parse_decimal;

TEST(parse_decimal_test, reads_digits_and_sign) {
  auto a = parse_decimal("0", "port");
  ASSERT_TRUE(a) << a.error().message();
  EXPECT_EQ(*a, 0);

  auto b = parse_decimal("65535", "port");
  ASSERT_TRUE(b) << b.error().message();
  EXPECT_EQ(*b, 65535);

  auto c = parse_decimal("-1", "prefix length");
  ASSERT_TRUE(c) << c.error().message();
  EXPECT_EQ(*c, -1);

  auto d = parse_decimal("007", "port");
  ASSERT_TRUE(d) << d.error().message();
  EXPECT_EQ(*d, 7);
}

TEST(parse_decimal_test, rejects_non_numeric_text) {
  for (auto const* s : {"", "-", "+1", " 1", "1 ", "80x", "0x10", "1.5", "--1"}) {
    auto r = parse_decimal(s, "port");
    ASSERT_FALSE(r) << s;
    EXPECT_EQ(r.error().code(), std::error_code{netaddr::error::invalid_token}) << s;
  }
}

TEST(parse_decimal_test, overflow_is_out_of_range) {
  auto r = parse_decimal("99999999999999999999999", "prefix length");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code(), std::error_code{netaddr::error::out_of_range});
  EXPECT_EQ(r.error().message(), "prefix length out of range: 99999999999999999999999");

  auto n = parse_decimal("-99999999999999999999999", "port");
  ASSERT_FALSE(n);
  EXPECT_EQ(n.error().code(), std::error_code{netaddr::error::out_of_range});
}

TEST(parse_decimal_test, message_names_the_field) {
  auto r = parse_decimal("abc", "port");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().message(), "invalid port: abc");
}

}  // namespace
