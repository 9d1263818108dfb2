#include <netaddr/address_prefix.hpp>

#include <netaddr/assert.hpp>
#include <netaddr/detail/parse_decimal.hpp>
#include <netaddr/detail/uint128.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace netaddr {

inline address_prefix::address_prefix(netaddr::address addr, int bits) noexcept
    : addr_(std::move(addr)), bits_(bits) {
  if (bits_ < 0 || bits_ > addr_.bit_length()) {
    bits_ = -1;
  }
}

inline auto address_prefix::from_string(std::string_view s) -> result<address_prefix> {
  auto const slash = s.find('/');
  if (slash == std::string_view::npos) {
    return fail(error::invalid_format, "no '/' in prefix: " + std::string{s});
  }
  if (s.find('/', slash + 1) != std::string_view::npos) {
    return fail(error::invalid_format, "more than one '/' in prefix: " + std::string{s});
  }
  auto const addr_part = s.substr(0, slash);
  auto const bits_part = s.substr(slash + 1);
  if (bits_part.empty()) {
    return fail(error::invalid_format, "missing prefix length: " + std::string{s});
  }

  auto addr = netaddr::address::from_string(addr_part);
  if (!addr) {
    return unexpected<error_info>(std::move(addr).error());
  }
  if (!addr->zone().empty()) {
    return fail(error::malformed_address, "prefix cannot have a zone: " + std::string{s});
  }

  auto bits = detail::parse_decimal(bits_part, "prefix length");
  if (!bits) {
    return unexpected<error_info>(std::move(bits).error());
  }
  if (*bits < 0 || *bits > addr->bit_length()) {
    return fail(error::out_of_range, "prefix length out of range: " + std::string{bits_part});
  }
  return address_prefix{*std::move(addr), static_cast<int>(*bits)};
}

inline auto address_prefix::must_parse(std::string_view s) -> address_prefix {
  auto r = from_string(s);
  if (!r) {
    throw std::system_error(r.error().code(), "failed to parse prefix: " + r.error().message());
  }
  return *std::move(r);
}

inline auto address_prefix::from_binary(std::span<std::uint8_t const> data)
  -> result<address_prefix> {
  if (data.size() < 5) {
    return fail(error::invalid_length,
                "prefix encoding needs at least 5 bytes, got " + std::to_string(data.size()));
  }
  auto addr = netaddr::address::from_bytes(data.first(data.size() - 1));
  if (!addr) {
    return unexpected<error_info>(std::move(addr).error());
  }
  auto const bits = static_cast<int>(data.back());
  if (bits > addr->bit_length()) {
    return fail(error::out_of_range, "prefix length out of range: " + std::to_string(bits));
  }
  return address_prefix{*std::move(addr), bits};
}

inline auto address_prefix::contains(netaddr::address const& ip) const noexcept -> bool {
  if (!is_valid() || !ip.is_valid() || ip.bit_length() != addr_.bit_length()) {
    return false;
  }
  auto const net = addr_.bytes();
  auto const host = ip.bytes();
  auto remaining = bits_;
  for (std::size_t i = 0; i < net.size() && remaining > 0; ++i, remaining -= 8) {
    if (remaining >= 8) {
      if (net[i] != host[i]) {
        return false;
      }
      continue;
    }
    auto const m = static_cast<std::uint8_t>(0xff << (8 - remaining));
    return (net[i] & m) == (host[i] & m);
  }
  return true;
}

inline auto address_prefix::masked() const -> address_prefix {
  if (!is_valid()) {
    return address_prefix{};
  }
  auto m = addr_.mask(bits_);
  NETADDR_ENSURE(m.has_value(), "address_prefix::masked(): valid prefix failed to mask");
  return address_prefix{*std::move(m), bits_};
}

inline auto address_prefix::overlaps(address_prefix const& other) const -> bool {
  if (!is_valid() || !other.is_valid() || addr_.bit_length() != other.addr_.bit_length()) {
    return false;
  }
  auto const n = std::min(bits_, other.bits_);
  auto a = addr_.mask(n);
  auto b = other.addr_.mask(n);
  return a && b && a->compare(*b) == 0;
}

inline auto address_prefix::range() const -> result<address_range> {
  if (!is_valid()) {
    return fail(error::malformed_address, "invalid prefix has no range");
  }
  auto first = addr_.mask(bits_);
  if (!first) {
    return unexpected<error_info>(std::move(first).error());
  }

  auto const width = addr_.bit_length();
  auto const last_value =
    detail::uint128::from_bytes(first->bytes()) + detail::uint128::low_bits(width - bits_);

  std::array<std::uint8_t, 16> buf{};
  auto const out = std::span<std::uint8_t>{buf}.first(static_cast<std::size_t>(width / 8));
  last_value.to_bytes(out);

  auto last = netaddr::address::from_bytes(out);
  if (!last) {
    return unexpected<error_info>(std::move(last).error());
  }
  return address_range{*std::move(first), last->with_zone(std::string{addr_.zone()})};
}

inline auto address_prefix::to_string() const -> std::string {
  if (!is_valid()) {
    return {};
  }
  return addr_.to_string() + "/" + std::to_string(bits_);
}

inline auto address_prefix::to_binary() const -> result<std::vector<std::uint8_t>> {
  if (!is_valid()) {
    return fail(error::invalid_length, "cannot encode an invalid prefix");
  }
  auto out = addr_.to_bytes();
  out.push_back(static_cast<std::uint8_t>(bits_));
  return out;
}

inline void address_prefix::append_to(std::vector<std::uint8_t>& buffer) const {
  auto const s = to_string();
  buffer.insert(buffer.end(), s.begin(), s.end());
}

}  // namespace netaddr
