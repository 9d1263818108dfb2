#include <gtest/gtest.h>

#include <netaddr/detail/uint128.hpp>

#include <array>
#include <cstdint>

namespace {

using netaddr::detail::uint128;

TEST(uint128_test, low_bits_boundaries) {
  EXPECT_EQ(uint128::low_bits(0), (uint128{0, 0}));
  EXPECT_EQ(uint128::low_bits(1), (uint128{0, 1}));
  EXPECT_EQ(uint128::low_bits(8), (uint128{0, 0xff}));
  EXPECT_EQ(uint128::low_bits(64), (uint128{0, ~std::uint64_t{0}}));
  EXPECT_EQ(uint128::low_bits(65), (uint128{1, ~std::uint64_t{0}}));
  EXPECT_EQ(uint128::low_bits(96), (uint128{0xffffffffu, ~std::uint64_t{0}}));
  EXPECT_EQ(uint128::low_bits(128), (uint128{~std::uint64_t{0}, ~std::uint64_t{0}}));
}

TEST(uint128_test, addition_carries_into_high_half) {
  auto const v = uint128{0, ~std::uint64_t{0}} + uint128{0, 1};
  EXPECT_EQ(v.high(), 1u);
  EXPECT_EQ(v.low(), 0u);

  auto const w = uint128{~std::uint64_t{0}, ~std::uint64_t{0}} + uint128{0, 1};
  EXPECT_EQ(w, (uint128{0, 0}));
}

TEST(uint128_test, big_endian_bytes_roundtrip) {
  std::array<std::uint8_t, 16> in{0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x01};
  auto const v = uint128::from_bytes(in);
  EXPECT_EQ(v.high(), 0x20010db800000000ull);
  EXPECT_EQ(v.low(), 1u);

  std::array<std::uint8_t, 16> out{};
  v.to_bytes(out);
  EXPECT_EQ(out, in);
}

TEST(uint128_test, four_byte_values_use_the_low_word) {
  std::array<std::uint8_t, 4> in{192, 168, 1, 0};
  auto const v = uint128::from_bytes(in) + uint128::low_bits(8);
  EXPECT_EQ(v.high(), 0u);
  EXPECT_EQ(v.low(), 0xc0a801ffu);

  std::array<std::uint8_t, 4> out{};
  v.to_bytes(out);
  EXPECT_EQ(out, (std::array<std::uint8_t, 4>{192, 168, 1, 255}));
}

TEST(uint128_test, ordering_compares_high_then_low) {
  EXPECT_LT((uint128{0, ~std::uint64_t{0}}), (uint128{1, 0}));
  EXPECT_GT((uint128{2, 0}), (uint128{1, 5}));
}

}  // namespace
