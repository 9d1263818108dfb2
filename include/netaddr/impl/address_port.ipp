#include <netaddr/address_port.hpp>

#include <netaddr/detail/parse_decimal.hpp>

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace netaddr {

namespace detail {

inline auto parse_port(std::string_view p) -> result<int> {
  auto v = parse_decimal(p, "port");
  if (!v) {
    return unexpected<error_info>(std::move(v).error());
  }
  if (*v < 0 || *v > 65535) {
    return fail(error::out_of_range, "invalid port number: " + std::string{p});
  }
  return static_cast<int>(*v);
}

}  // namespace detail

inline auto address_port::from_string(std::string_view s) -> result<address_port> {
  if (s.find(':') == std::string_view::npos) {
    return fail(error::invalid_format, "no ':' in address-port: " + std::string{s});
  }

  std::string_view host;
  std::string_view port_str;

  // Bracketed IPv6: [addr]:port
  if (s.front() == '[') {
    auto const close = s.find(']');
    if (close == std::string_view::npos || close + 1 >= s.size() || s[close + 1] != ':') {
      return fail(error::invalid_format, "invalid address-port format: " + std::string{s});
    }
    host = s.substr(1, close - 1);
    port_str = s.substr(close + 2);
  } else {
    // An unbracketed IPv6 host cannot be told apart from its port.
    if (std::ranges::count(s, ':') > 1) {
      return fail(error::invalid_format, "invalid address-port format: " + std::string{s});
    }
    auto const pos = s.find(':');
    host = s.substr(0, pos);
    port_str = s.substr(pos + 1);
  }

  auto addr = netaddr::address::from_string(host);
  if (!addr) {
    return unexpected<error_info>(std::move(addr).error());
  }
  auto port = detail::parse_port(port_str);
  if (!port) {
    return unexpected<error_info>(std::move(port).error());
  }
  return address_port{*std::move(addr), *port};
}

inline auto address_port::must_parse(std::string_view s) -> address_port {
  auto r = from_string(s);
  if (!r) {
    throw std::system_error(r.error().code(),
                            "failed to parse address-port: " + r.error().message());
  }
  return *std::move(r);
}

inline auto address_port::from_binary(std::span<std::uint8_t const> data)
  -> result<address_port> {
  if (data.size() < 2) {
    return fail(error::invalid_length,
                "address-port encoding needs at least 2 bytes, got " +
                  std::to_string(data.size()));
  }
  auto addr = netaddr::address::from_bytes(data.first(data.size() - 2));
  if (!addr) {
    return unexpected<error_info>(std::move(addr).error());
  }
  auto const lo = data[data.size() - 2];
  auto const hi = data[data.size() - 1];
  return address_port{*std::move(addr), static_cast<int>(lo) | (static_cast<int>(hi) << 8)};
}

inline auto address_port::compare(address_port const& other) const noexcept -> int {
  if (auto const c = addr_.compare(other.addr_); c != 0) {
    return c;
  }
  if (port_ < other.port_) {
    return -1;
  }
  if (port_ > other.port_) {
    return 1;
  }
  return 0;
}

inline auto address_port::to_string() const -> std::string {
  if (!is_valid()) {
    return {};
  }
  if (addr_.is_v6() && !addr_.is_v4_mapped_v6()) {
    return "[" + addr_.to_string() + "]:" + std::to_string(port_);
  }
  return addr_.to_string() + ":" + std::to_string(port_);
}

inline auto address_port::to_binary() const -> result<std::vector<std::uint8_t>> {
  if (!is_valid()) {
    return fail(error::invalid_length, "cannot encode an invalid address-port");
  }
  auto out = addr_.to_bytes();
  out.push_back(static_cast<std::uint8_t>(port_ & 0xff));
  out.push_back(static_cast<std::uint8_t>((port_ >> 8) & 0xff));
  return out;
}

inline void address_port::append_to(std::vector<std::uint8_t>& buffer) const {
  auto const s = to_string();
  buffer.insert(buffer.end(), s.begin(), s.end());
}

inline auto operator<=>(address_port const& a, address_port const& b) noexcept
  -> std::strong_ordering {
  if (auto const c = a.addr_ <=> b.addr_; c != 0) {
    return c;
  }
  return a.port_ <=> b.port_;
}

}  // namespace netaddr
