#include <gtest/gtest.h>

#include <netaddr/address.hpp>

#include <string>
#include <string_view>
#include <system_error>

namespace {

struct valid_case {
  std::string_view input;
  std::string_view canonical;
};

struct invalid_case {
  std::string_view input;
  netaddr::error expected;
};

constexpr valid_case valid_cases[] = {
  // IPv4
  {"0.0.0.0", "0.0.0.0"},
  {"127.0.0.1", "127.0.0.1"},
  {"8.8.8.8", "8.8.8.8"},
  {"192.168.0.01", "192.168.0.1"},
  {"255.255.255.255", "255.255.255.255"},

  // IPv6
  {"::", "::"},
  {"::1", "::1"},
  {"1::", "1::"},
  {"1:2:3:4:5:6:7:8", "1:2:3:4:5:6:7:8"},
  {"::1:2:3:4:5", "::1:2:3:4:5"},
  {"2001:db8:85a3:8d3:1319:8a2e:370:7348", "2001:db8:85a3:8d3:1319:8a2e:370:7348"},
  {"fe80::1ff:fe23:4567:890a", "fe80::1ff:fe23:4567:890a"},
  {"0000:0000:0000:0000:0000:0000:0000:0001", "::1"},
  {"FE80::ABCD", "fe80::abcd"},
  {"2001:0db8::0001", "2001:db8::1"},

  // The first run of zero groups is the one compressed.
  {"1:0:0:2:0:0:0:3", "1::2:0:0:0:3"},
  {"2001:db8:0:0:1:0:0:1", "2001:db8::1:0:0:1"},

  // Embedded and mapped IPv4
  {"::ffff:192.168.1.1", "::ffff:192.168.1.1"},
  {"::ffff:0:0", "::ffff:0.0.0.0"},
  {"::ffff:0102:0304", "::ffff:1.2.3.4"},
  {"0:0:0:0:0:ffff:192.168.1.1", "::ffff:192.168.1.1"},
  {"1:2:3:4:5:6:1.2.3.4", "1:2:3:4:5:6:102:304"},
  {"::1.2.3.4", "::102:304"},

  // Zones
  {"fe80::%eth0", "fe80::%eth0"},
  {"::1%zone", "::1%zone"},
  {"2001:db8::%lo", "2001:db8::%lo"},
};

constexpr invalid_case invalid_cases[] = {
  // Top-level shape
  {"", netaddr::error::invalid_format},
  {"invalid-address", netaddr::error::invalid_format},
  {"1.2.3", netaddr::error::invalid_format},
  {"1.2..3.4", netaddr::error::invalid_format},
  {"1.1.1.1.", netaddr::error::invalid_format},
  {"192.168.1.1%eth0", netaddr::error::invalid_format},

  // IPv4 components
  {".192.168.1", netaddr::error::invalid_token},
  {"1.2.3.x", netaddr::error::invalid_token},
  {"255.255.255.256", netaddr::error::out_of_range},
  {"192.168.0.300", netaddr::error::out_of_range},

  // IPv6 lexical
  {"::g1", netaddr::error::invalid_token},
  {"abcd:1234::xyz", netaddr::error::invalid_token},
  {"12345::", netaddr::error::invalid_token},
  {"2001:db8::/64", netaddr::error::invalid_token},

  // IPv6 structure
  {":::", netaddr::error::malformed_address},
  {":::1", netaddr::error::malformed_address},
  {"1:", netaddr::error::malformed_address},
  {"1::2::3", netaddr::error::malformed_address},
  {"2001:db8:::1", netaddr::error::malformed_address},
  {"1:2:3:4:5:6:7", netaddr::error::malformed_address},
  {"1:2:3:4:5:6:7:8:9", netaddr::error::malformed_address},
  {"1:2:3::4:5:6:7:8", netaddr::error::malformed_address},
  {"2001:db8:85a3:8d3:1319:8a2e:370:7348::", netaddr::error::malformed_address},
  {"192.168.1.1::", netaddr::error::malformed_address},
  {"fe80::1%", netaddr::error::malformed_address},

  // Embedded IPv4
  {"::ffff:192.168.1", netaddr::error::malformed_address},
  {"::ffff:01.2.3.4", netaddr::error::malformed_address},
  {"1:2:3:4:5:6:7:1.2.3.4", netaddr::error::malformed_address},
  {"::ffff:256.256.256.256", netaddr::error::out_of_range},
  {"::1.2.3.4:5", netaddr::error::malformed_address},
  {"::ffff:1.2.3.4:", netaddr::error::malformed_address},
};

TEST(address_parse_test, valid_inputs_canonicalize) {
  for (auto const& c : valid_cases) {
    SCOPED_TRACE(std::string{c.input});
    auto a = netaddr::address::from_string(c.input);
    ASSERT_TRUE(a) << a.error().message();
    EXPECT_TRUE(a->is_valid());
    EXPECT_EQ(a->to_string(), c.canonical);
  }
}

TEST(address_parse_test, canonical_form_is_a_fixed_point) {
  for (auto const& c : valid_cases) {
    SCOPED_TRACE(std::string{c.input});
    auto a = netaddr::address::from_string(c.canonical);
    ASSERT_TRUE(a) << a.error().message();
    EXPECT_EQ(a->to_string(), c.canonical);
  }
}

TEST(address_parse_test, invalid_inputs_report_error_kind) {
  for (auto const& c : invalid_cases) {
    SCOPED_TRACE(std::string{c.input});
    auto a = netaddr::address::from_string(c.input);
    ASSERT_FALSE(a);
    EXPECT_EQ(a.error().code(), std::error_code{c.expected}) << a.error().message();
    EXPECT_THROW((void)netaddr::address::must_parse(c.input), std::system_error);
  }
}

TEST(address_parse_test, error_detail_names_offending_component) {
  auto a = netaddr::address::from_string("999.999.999.999");
  ASSERT_FALSE(a);
  EXPECT_EQ(a.error().code(), std::error_code{netaddr::error::out_of_range});
  EXPECT_EQ(a.error().message(), "invalid IPv4 address component: 999");

  auto b = netaddr::address::from_string("1.2.3.4x");
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error().message(), "invalid IPv4 address component: 4x");
}

TEST(address_parse_test, text_after_embedded_ipv4_is_trailing_garbage) {
  auto a = netaddr::address::from_string("::1.2.3.4:5");
  ASSERT_FALSE(a);
  EXPECT_EQ(a.error().code(), std::error_code{netaddr::error::malformed_address});
  EXPECT_EQ(a.error().message(), "trailing garbage after address: :5");
}

TEST(address_parse_test, zone_is_kept_verbatim) {
  auto a = netaddr::address::from_string("fe80::1%Ethernet 2");
  ASSERT_TRUE(a) << a.error().message();
  EXPECT_EQ(a->zone(), "Ethernet 2");
  EXPECT_EQ(a->to_string(), "fe80::1%Ethernet 2");
}

}  // namespace
