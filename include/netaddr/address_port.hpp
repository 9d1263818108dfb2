#pragma once

#include <netaddr/address.hpp>
#include <netaddr/error.hpp>
#include <netaddr/result.hpp>

#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netaddr {

/// An IP address and a port number ("1.2.3.4:80", "[2001:db8::1]:443").
///
/// Valid iff the address is valid. The raw constructor stores the port as
/// given; only from_string() enforces 0 <= port <= 65535.
class address_port {
 public:
  address_port() noexcept = default;
  address_port(netaddr::address addr, int port) noexcept : addr_(std::move(addr)), port_(port) {}

  static auto from(netaddr::address addr, int port) noexcept -> address_port {
    return address_port{std::move(addr), port};
  }

  /// Parse "ip:port" or "[ipv6]:port".
  ///
  /// An IPv6 host must be bracketed; "::1:80" is rejected as invalid_format.
  static auto from_string(std::string_view s) -> result<address_port>;

  /// Throws std::system_error prefixed with "failed to parse address-port: ".
  static auto must_parse(std::string_view s) -> address_port;

  /// Decode address bytes followed by a two-byte little-endian port.
  static auto from_binary(std::span<std::uint8_t const> data) -> result<address_port>;

  auto address() const noexcept -> netaddr::address const& { return addr_; }
  auto port() const noexcept -> int { return port_; }
  auto is_valid() const noexcept -> bool { return addr_.is_valid(); }

  /// Address first (zones ignored), then port: -1, 0 or 1.
  auto compare(address_port const& other) const noexcept -> int;

  /// Empty when invalid; "[ip]:port" for IPv6 (unless IPv4-mapped), else "ip:port".
  auto to_string() const -> std::string;
  auto to_text() const -> std::string { return to_string(); }

  /// Address bytes followed by the port, little-endian.
  auto to_binary() const -> result<std::vector<std::uint8_t>>;

  /// Append the textual form to `buffer`.
  void append_to(std::vector<std::uint8_t>& buffer) const;

  friend auto operator==(address_port const&, address_port const&) noexcept -> bool = default;
  friend auto operator<=>(address_port const& a, address_port const& b) noexcept
    -> std::strong_ordering;

 private:
  netaddr::address addr_{};
  int port_{0};
};

}  // namespace netaddr

#include <netaddr/impl/address_port.ipp>
