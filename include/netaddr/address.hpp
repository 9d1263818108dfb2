#pragma once

#include <netaddr/error.hpp>
#include <netaddr/result.hpp>

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace netaddr {

/// IPv4 address value type.
class address_v4 {
 public:
  using bytes_type = std::array<std::uint8_t, 4>;

  constexpr address_v4() noexcept = default;
  explicit constexpr address_v4(bytes_type bytes) noexcept : bytes_(bytes) {}

  constexpr auto to_bytes() const noexcept -> bytes_type const& { return bytes_; }

  friend constexpr auto operator==(address_v4 const&, address_v4 const&) noexcept -> bool = default;
  friend constexpr auto operator<=>(address_v4 const&, address_v4 const&) noexcept = default;

 private:
  bytes_type bytes_{};
};

/// IPv6 address value type, with an optional zone ("fe80::1%eth0").
class address_v6 {
 public:
  using bytes_type = std::array<std::uint8_t, 16>;

  address_v6() noexcept = default;
  explicit address_v6(bytes_type bytes, std::string zone = {}) noexcept
      : bytes_(bytes), zone_(std::move(zone)) {}

  auto to_bytes() const noexcept -> bytes_type const& { return bytes_; }
  auto zone() const noexcept -> std::string_view { return zone_; }

  friend auto operator==(address_v6 const&, address_v6 const&) noexcept -> bool = default;

 private:
  bytes_type bytes_{};
  std::string zone_;
};

/// Generic IP address value type (v4, v6, or the invalid sentinel).
///
/// A default-constructed address is invalid: it has no bytes, bit_length() is 0
/// and it renders as "invalid IP". Values are immutable; every transformation
/// returns a new address.
class address {
 public:
  address() noexcept = default;
  address(address_v4 v4) noexcept : storage_(v4) {}
  address(address_v6 v6) noexcept : storage_(std::move(v6)) {}

  /// Build an address from 4 or 16 raw big-endian bytes.
  ///
  /// Returns invalid_length for any other size.
  static auto from_bytes(std::span<std::uint8_t const> bytes) -> result<address>;

  /// Decode the binary form produced by to_binary(). Same rules as from_bytes().
  static auto from_binary(std::span<std::uint8_t const> data) -> result<address>;

  /// Parse a textual IP address (v4 or v6).
  ///
  /// Selection:
  /// - If the string contains ':', it is treated as IPv6 (optional "%zone").
  /// - Otherwise, if it contains '.', IPv4.
  /// - Otherwise invalid_format.
  static auto from_string(std::string_view s) -> result<address>;

  /// Parse a literal known to be well-formed.
  ///
  /// Throws std::system_error prefixed with "failed to parse address: ".
  static auto must_parse(std::string_view s) -> address;

  static auto v4_unspecified() noexcept -> address { return address_v4{}; }
  static auto v6_unspecified() noexcept -> address { return address_v6{}; }
  static auto v6_loopback() noexcept -> address;
  static auto v6_link_local_all_nodes() noexcept -> address;
  static auto v6_link_local_all_routers() noexcept -> address;

  auto is_valid() const noexcept -> bool { return !std::holds_alternative<std::monostate>(storage_); }
  auto is_v4() const noexcept -> bool { return std::holds_alternative<address_v4>(storage_); }
  auto is_v6() const noexcept -> bool { return std::holds_alternative<address_v6>(storage_); }
  auto is_v4_mapped_v6() const noexcept -> bool;

  /// 32 for IPv4, 128 for IPv6, 0 for the invalid sentinel.
  auto bit_length() const noexcept -> int;

  /// Raw bytes: 4, 16, or none.
  auto bytes() const noexcept -> std::span<std::uint8_t const>;
  auto to_bytes() const -> std::vector<std::uint8_t>;

  /// Returns family_mismatch unless this is IPv4.
  auto to_v4_bytes() const -> result<address_v4::bytes_type>;

  /// IPv4 addresses are converted to their IPv4-mapped form.
  /// Returns family_mismatch for the invalid sentinel.
  auto to_v6_bytes() const -> result<address_v6::bytes_type>;

  /// The zone of an IPv6 address, empty otherwise.
  auto zone() const noexcept -> std::string_view;

  /// Same IPv6 address with `zone` attached (empty removes it).
  /// IPv4 and invalid addresses are returned unchanged.
  auto with_zone(std::string zone) const -> address;

  /// IPv4-mapped IPv6 -> IPv4; everything else unchanged.
  auto unmap() const -> address;

  auto is_private() const noexcept -> bool;
  auto is_loopback() const noexcept -> bool;
  auto is_multicast() const noexcept -> bool;
  auto is_link_local_unicast() const noexcept -> bool;
  auto is_link_local_multicast() const noexcept -> bool;
  auto is_interface_local_multicast() const noexcept -> bool;
  auto is_unspecified() const noexcept -> bool;

  /// Not any of the other special categories for the family.
  auto is_global_unicast() const noexcept -> bool;

  /// Keep the top `bits` bits, zero the rest.
  ///
  /// Returns out_of_range unless 0 <= bits <= bit_length().
  auto mask(int bits) const -> result<address>;

  /// Successor / predecessor across the full width. Overflow and underflow
  /// yield the invalid sentinel.
  auto next() const -> address;
  auto previous() const -> address;

  /// Byte-wise big-endian comparison, zones ignored: -1, 0 or 1.
  /// Shorter byte sequences sort first.
  auto compare(address const& other) const noexcept -> int;
  auto less_than(address const& other) const noexcept -> bool { return compare(other) < 0; }

  /// Canonical text: dotted decimal, or compressed lowercase IPv6 with
  /// "::ffff:a.b.c.d" for IPv4-mapped addresses and "%zone" appended.
  auto to_string() const -> std::string;

  /// All eight hextets, zero-padded, no compression.
  auto to_expanded_string() const -> std::string;

  /// to_string() for a valid address, empty for the invalid sentinel.
  auto to_text() const -> std::string;

  /// Raw 4 or 16 bytes, zone dropped. Returns invalid_length when invalid.
  auto to_binary() const -> result<std::vector<std::uint8_t>>;

  /// Append the raw bytes to `buffer`.
  void append_to(std::vector<std::uint8_t>& buffer) const;

  friend auto operator==(address const&, address const&) noexcept -> bool = default;
  friend auto operator<=>(address const& a, address const& b) noexcept -> std::strong_ordering;

 private:
  std::variant<std::monostate, address_v4, address_v6> storage_;
};

}  // namespace netaddr

#include <netaddr/impl/address.ipp>
