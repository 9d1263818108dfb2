#pragma once

#include <netaddr/address.hpp>
#include <netaddr/error.hpp>
#include <netaddr/result.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netaddr {

/// First and last address of a prefix block.
struct address_range {
  netaddr::address from;
  netaddr::address to;

  friend auto operator==(address_range const&, address_range const&) noexcept -> bool = default;
};

/// An IP network: an address and a prefix length ("192.168.1.0/24").
///
/// Valid iff the address is valid and 0 <= bits <= address().bit_length().
/// The address is kept as given; use masked() for the network address.
class address_prefix {
 public:
  address_prefix() noexcept = default;

  /// Raw construction. A prefix length outside [0, bit_length] is stored as -1,
  /// which makes the prefix invalid.
  address_prefix(netaddr::address addr, int bits) noexcept;

  static auto from(netaddr::address addr, int bits) noexcept -> address_prefix {
    return address_prefix{std::move(addr), bits};
  }

  /// Parse "addr/bits". Zones are rejected.
  static auto from_string(std::string_view s) -> result<address_prefix>;

  /// Throws std::system_error prefixed with "failed to parse prefix: ".
  static auto must_parse(std::string_view s) -> address_prefix;

  /// Decode address bytes followed by one prefix-length byte.
  static auto from_binary(std::span<std::uint8_t const> data) -> result<address_prefix>;

  auto address() const noexcept -> netaddr::address const& { return addr_; }
  auto bits() const noexcept -> int { return bits_; }

  auto is_valid() const noexcept -> bool { return addr_.is_valid() && bits_ >= 0; }
  auto is_single_ip() const noexcept -> bool {
    return is_valid() && bits_ == addr_.bit_length();
  }

  /// Whether `ip` falls inside this network. Always false across families.
  auto contains(netaddr::address const& ip) const noexcept -> bool;

  /// Same prefix with the host bits cleared.
  auto masked() const -> address_prefix;

  /// Whether the two networks share any address. Symmetric.
  auto overlaps(address_prefix const& other) const -> bool;

  /// Lowest and highest address of the block.
  ///
  /// Returns malformed_address for an invalid prefix.
  auto range() const -> result<address_range>;

  /// "addr/bits", or empty for an invalid prefix.
  auto to_string() const -> std::string;
  auto to_text() const -> std::string { return to_string(); }

  /// Address bytes followed by one byte holding bits().
  auto to_binary() const -> result<std::vector<std::uint8_t>>;

  /// Append the textual form to `buffer`.
  void append_to(std::vector<std::uint8_t>& buffer) const;

  friend auto operator==(address_prefix const&, address_prefix const&) noexcept -> bool = default;

 private:
  netaddr::address addr_{};
  int bits_{-1};
};

}  // namespace netaddr

#include <netaddr/impl/address_prefix.ipp>
