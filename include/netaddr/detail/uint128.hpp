#pragma once

#include <netaddr/assert.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>

namespace netaddr::detail {

/// Fixed-width 128-bit unsigned integer, stored as two 64-bit halves.
///
/// Only the operations range computation needs: load/store from big-endian
/// bytes, addition with carry, and low-bit masks. Arithmetic wraps modulo 2^128.
class uint128 {
 public:
  constexpr uint128() noexcept = default;
  constexpr uint128(std::uint64_t hi, std::uint64_t lo) noexcept : hi_(hi), lo_(lo) {}

  constexpr auto high() const noexcept -> std::uint64_t { return hi_; }
  constexpr auto low() const noexcept -> std::uint64_t { return lo_; }

  /// Value with the low `n` bits set, for n in [0, 128].
  static constexpr auto low_bits(int n) noexcept -> uint128 {
    if (n <= 0) {
      return uint128{};
    }
    if (n >= 128) {
      return uint128{~std::uint64_t{0}, ~std::uint64_t{0}};
    }
    if (n >= 64) {
      auto const hi = n == 64 ? std::uint64_t{0} : (std::uint64_t{1} << (n - 64)) - 1;
      return uint128{hi, ~std::uint64_t{0}};
    }
    return uint128{0, (std::uint64_t{1} << n) - 1};
  }

  /// Interpret up to 16 big-endian bytes as an unsigned integer.
  static auto from_bytes(std::span<std::uint8_t const> bytes) noexcept -> uint128 {
    NETADDR_ASSERT(bytes.size() <= 16, "uint128::from_bytes(): more than 16 bytes");
    auto v = uint128{};
    for (auto const b : bytes) {
      v.hi_ = (v.hi_ << 8) | (v.lo_ >> 56);
      v.lo_ = (v.lo_ << 8) | b;
    }
    return v;
  }

  /// Write the low `out.size()` bytes of the value, big-endian.
  void to_bytes(std::span<std::uint8_t> out) const noexcept {
    NETADDR_ASSERT(out.size() <= 16, "uint128::to_bytes(): more than 16 bytes");
    auto hi = hi_;
    auto lo = lo_;
    for (auto i = out.size(); i > 0; --i) {
      out[i - 1] = static_cast<std::uint8_t>(lo & 0xff);
      lo = (lo >> 8) | (hi << 56);
      hi >>= 8;
    }
  }

  friend constexpr auto operator+(uint128 a, uint128 b) noexcept -> uint128 {
    auto const lo = a.lo_ + b.lo_;
    auto const carry = lo < a.lo_ ? std::uint64_t{1} : std::uint64_t{0};
    return uint128{a.hi_ + b.hi_ + carry, lo};
  }

  friend constexpr auto operator==(uint128 const&, uint128 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(uint128 const&, uint128 const&) noexcept = default;

 private:
  std::uint64_t hi_{0};
  std::uint64_t lo_{0};
};

}  // namespace netaddr::detail
