#include <netaddr/address.hpp>

#include <netaddr/assert.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace netaddr {

namespace detail {

inline constexpr char hex_digits[] = "0123456789abcdef";

inline auto hex_value(char c) noexcept -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Decimal digits only. The value saturates once it exceeds 255 so long
// components cannot overflow.
inline auto scan_octet(std::string_view part, unsigned& value) noexcept -> bool {
  if (part.empty()) {
    return false;
  }
  value = 0;
  for (auto const c : part) {
    if (c < '0' || c > '9') {
      return false;
    }
    if (value <= 255) {
      value = value * 10 + static_cast<unsigned>(c - '0');
    }
  }
  return true;
}

// Calls f(index, component) for each of the four dot-separated components.
// The caller has already checked there are exactly three dots.
template <class F>
inline auto for_each_octet(std::string_view s, F&& f) -> void_result {
  std::size_t start = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    auto const end = s.find('.', start);
    auto const part = s.substr(start, end == std::string_view::npos ? s.size() - start : end - start);
    if (auto r = f(i, part); !r) {
      return r;
    }
    start = end + 1;
  }
  return ok();
}

// Top-level IPv4 grammar. Leading zeros are accepted and read as decimal.
inline auto parse_v4(std::string_view s) -> result<address_v4> {
  if (s.find('%') != std::string_view::npos) {
    return fail(error::invalid_format, "IPv4 address cannot have a zone: " + std::string{s});
  }
  if (std::ranges::count(s, '.') != 3) {
    return fail(error::invalid_format, "invalid IPv4 address: " + std::string{s});
  }

  address_v4::bytes_type b{};
  auto r = for_each_octet(s, [&](std::size_t i, std::string_view part) -> void_result {
    unsigned value = 0;
    if (!scan_octet(part, value)) {
      return fail(error::invalid_token, "invalid IPv4 address component: " + std::string{part});
    }
    if (value > 255) {
      return fail(error::out_of_range, "invalid IPv4 address component: " + std::string{part});
    }
    b[i] = static_cast<std::uint8_t>(value);
    return ok();
  });
  if (!r) {
    return unexpected<error_info>(r.error());
  }
  return address_v4{b};
}

// Dotted quad embedded at the tail of an IPv6 literal. Stricter than the
// top-level grammar: leading zeros are rejected.
inline auto parse_embedded_v4(std::string_view s, std::uint8_t* out) -> void_result {
  if (std::ranges::count(s, '.') != 3) {
    return fail(error::malformed_address, "invalid embedded IPv4 address: " + std::string{s});
  }
  return for_each_octet(s, [&](std::size_t i, std::string_view part) -> void_result {
    if (part.empty()) {
      return fail(error::malformed_address, "empty octet in embedded IPv4 address");
    }
    if (part.size() > 1 && part.front() == '0') {
      return fail(error::malformed_address,
                  "leading zero in embedded IPv4 octet: " + std::string{part});
    }
    unsigned value = 0;
    if (!scan_octet(part, value)) {
      return fail(error::invalid_token, "invalid octet in embedded IPv4 address: " + std::string{part});
    }
    if (value > 255) {
      return fail(error::out_of_range, "invalid octet in embedded IPv4 address: " + std::string{part});
    }
    out[i] = static_cast<std::uint8_t>(value);
    return ok();
  });
}

inline auto parse_v6(std::string_view s) -> result<address_v6> {
  std::string zone;
  if (auto const pos = s.find('%'); pos != std::string_view::npos) {
    zone = std::string{s.substr(pos + 1)};
    s = s.substr(0, pos);
    if (zone.empty()) {
      return fail(error::malformed_address, "zone must be a non-empty string");
    }
  }

  address_v6::bytes_type ip{};
  int ellipsis = -1;

  if (s.size() >= 2 && s[0] == ':' && s[1] == ':') {
    ellipsis = 0;
    s.remove_prefix(2);
    if (s.empty()) {
      return address_v6{ip, std::move(zone)};
    }
  }

  int i = 0;
  while (i < 16) {
    std::size_t off = 0;
    std::uint32_t acc = 0;
    for (; off < s.size(); ++off) {
      auto const digit = hex_value(s[off]);
      if (digit < 0) {
        break;
      }
      acc = (acc << 4) + static_cast<std::uint32_t>(digit);
      if (off > 3) {
        return fail(error::invalid_token, "each IPv6 group must have 4 or fewer digits");
      }
      if (acc > 0xffff) {
        return fail(error::out_of_range, "IPv6 field has value >= 2^16");
      }
    }
    if (off == 0) {
      if (!s.empty() && s[0] != ':') {
        return fail(error::invalid_token,
                    std::string{"unexpected character in IPv6 address: "} + s[0]);
      }
      return fail(error::malformed_address,
                  "each colon-separated field must have at least one digit");
    }

    if (off < s.size() && s[off] == '.') {
      if (ellipsis < 0 && i != 12) {
        return fail(error::malformed_address,
                    "embedded IPv4 address must replace the final 2 fields of the address");
      }
      if (i + 4 > 16) {
        return fail(error::malformed_address,
                    "too many hex fields to fit an embedded IPv4 at the end of the address");
      }
      // The quad ends the address; a colon after it is left for the
      // trailing-garbage check below.
      auto const end = std::min(s.find(':'), s.size());
      if (auto r = parse_embedded_v4(s.substr(0, end), ip.data() + i); !r) {
        return unexpected<error_info>(r.error());
      }
      s.remove_prefix(end);
      i += 4;
      break;
    }

    ip[i] = static_cast<std::uint8_t>(acc >> 8);
    ip[i + 1] = static_cast<std::uint8_t>(acc & 0xff);
    i += 2;

    s.remove_prefix(off);
    if (s.empty()) {
      break;
    }

    if (s[0] != ':') {
      return fail(error::invalid_token,
                  std::string{"unexpected character in IPv6 address, expected colon: "} + s[0]);
    }
    if (s.size() == 1) {
      return fail(error::malformed_address, "colon must be followed by more characters");
    }
    s.remove_prefix(1);

    if (s[0] == ':') {
      if (ellipsis >= 0) {
        return fail(error::malformed_address, "multiple :: in address");
      }
      ellipsis = i;
      s.remove_prefix(1);
      if (s.empty()) {
        break;
      }
    }
  }

  if (!s.empty()) {
    return fail(error::malformed_address, "trailing garbage after address: " + std::string{s});
  }

  if (i < 16) {
    if (ellipsis < 0) {
      return fail(error::malformed_address, "address string too short");
    }
    NETADDR_ASSERT(ellipsis <= i, "parse_v6(): ellipsis past the parsed groups");
    auto const n = 16 - i;
    for (auto j = i - 1; j >= ellipsis; --j) {
      ip[j + n] = ip[j];
    }
    for (auto j = ellipsis; j < ellipsis + n; ++j) {
      ip[j] = 0;
    }
  } else if (ellipsis >= 0) {
    return fail(error::malformed_address, "the :: must expand to at least one field of zeros");
  }
  return address_v6{ip, std::move(zone)};
}

inline void append_decimal(std::string& out, unsigned v) {
  char buf[16]{};
  auto const r = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, r.ptr);
}

inline void append_dotted(std::string& out, std::span<std::uint8_t const> b) {
  NETADDR_ASSERT(b.size() == 4, "append_dotted(): expected 4 bytes");
  for (std::size_t i = 0; i < b.size(); ++i) {
    if (i != 0) {
      out.push_back('.');
    }
    append_decimal(out, b[i]);
  }
}

inline void append_hextet(std::string& out, std::uint16_t v, bool pad) {
  bool emitted = false;
  for (int shift = 12; shift >= 0; shift -= 4) {
    auto const nibble = (v >> shift) & 0xf;
    if (pad || emitted || nibble != 0 || shift == 0) {
      out.push_back(hex_digits[nibble]);
      emitted = true;
    }
  }
}

inline auto hextets(std::span<std::uint8_t const> b) noexcept -> std::array<std::uint16_t, 8> {
  NETADDR_ASSERT(b.size() == 16, "hextets(): expected 16 bytes");
  std::array<std::uint16_t, 8> h{};
  for (std::size_t i = 0; i < h.size(); ++i) {
    h[i] = static_cast<std::uint16_t>((b[2 * i] << 8) | b[2 * i + 1]);
  }
  return h;
}

template <class It>
inline void append_hextets(std::string& out, It first, It last) {
  for (auto it = first; it != last; ++it) {
    if (it != first) {
      out.push_back(':');
    }
    append_hextet(out, *it, false);
  }
}

// Copy the bytes of `a`, let `f` edit them, and rebuild an address of the same
// family and zone. `f` returns false to signal overflow, which yields the
// invalid sentinel.
template <class F>
inline auto rebuild(address const& a, F&& f) -> address {
  if (a.is_v4()) {
    address_v4::bytes_type b{};
    std::ranges::copy(a.bytes(), b.begin());
    if (!f(std::span<std::uint8_t>{b})) {
      return address{};
    }
    return address_v4{b};
  }
  if (a.is_v6()) {
    address_v6::bytes_type b{};
    std::ranges::copy(a.bytes(), b.begin());
    if (!f(std::span<std::uint8_t>{b})) {
      return address{};
    }
    return address_v6{b, std::string{a.zone()}};
  }
  return address{};
}

}  // namespace detail

inline auto address::from_bytes(std::span<std::uint8_t const> bytes) -> result<address> {
  if (bytes.size() == 4) {
    address_v4::bytes_type b{};
    std::ranges::copy(bytes, b.begin());
    return address{address_v4{b}};
  }
  if (bytes.size() == 16) {
    address_v6::bytes_type b{};
    std::ranges::copy(bytes, b.begin());
    return address{address_v6{b}};
  }
  return fail(error::invalid_length,
              "IP address must be 4 or 16 bytes, got " + std::to_string(bytes.size()));
}

inline auto address::from_binary(std::span<std::uint8_t const> data) -> result<address> {
  return from_bytes(data);
}

inline auto address::from_string(std::string_view s) -> result<address> {
  if (s.find(':') != std::string_view::npos) {
    return detail::parse_v6(s).transform([](address_v6 a) { return address{std::move(a)}; });
  }
  if (s.find('.') != std::string_view::npos) {
    return detail::parse_v4(s).transform([](address_v4 a) { return address{a}; });
  }
  return fail(error::invalid_format, "invalid IP address format: " + std::string{s});
}

inline auto address::must_parse(std::string_view s) -> address {
  auto r = from_string(s);
  if (!r) {
    throw std::system_error(r.error().code(), "failed to parse address: " + r.error().message());
  }
  return *std::move(r);
}

inline auto address::v6_loopback() noexcept -> address {
  auto b = address_v6::bytes_type{};
  b[15] = 1;
  return address_v6{b};
}

inline auto address::v6_link_local_all_nodes() noexcept -> address {
  auto b = address_v6::bytes_type{};
  b[0] = 0xff;
  b[1] = 0x02;
  b[15] = 0x01;
  return address_v6{b};
}

inline auto address::v6_link_local_all_routers() noexcept -> address {
  auto b = address_v6::bytes_type{};
  b[0] = 0xff;
  b[1] = 0x02;
  b[15] = 0x02;
  return address_v6{b};
}

inline auto address::is_v4_mapped_v6() const noexcept -> bool {
  if (!is_v6()) {
    return false;
  }
  auto const b = bytes();
  return std::all_of(b.begin(), b.begin() + 10, [](std::uint8_t x) { return x == 0; }) &&
         b[10] == 0xff && b[11] == 0xff;
}

inline auto address::bit_length() const noexcept -> int {
  if (is_v4()) {
    return 32;
  }
  if (is_v6()) {
    return 128;
  }
  return 0;
}

inline auto address::bytes() const noexcept -> std::span<std::uint8_t const> {
  if (auto const* v4 = std::get_if<address_v4>(&storage_)) {
    return v4->to_bytes();
  }
  if (auto const* v6 = std::get_if<address_v6>(&storage_)) {
    return v6->to_bytes();
  }
  return {};
}

inline auto address::to_bytes() const -> std::vector<std::uint8_t> {
  auto const b = bytes();
  return {b.begin(), b.end()};
}

inline auto address::to_v4_bytes() const -> result<address_v4::bytes_type> {
  if (auto const* v4 = std::get_if<address_v4>(&storage_)) {
    return v4->to_bytes();
  }
  return fail(error::family_mismatch, "address is not IPv4");
}

inline auto address::to_v6_bytes() const -> result<address_v6::bytes_type> {
  if (auto const* v6 = std::get_if<address_v6>(&storage_)) {
    return v6->to_bytes();
  }
  if (auto const* v4 = std::get_if<address_v4>(&storage_)) {
    address_v6::bytes_type b{};
    b[10] = 0xff;
    b[11] = 0xff;
    std::ranges::copy(v4->to_bytes(), b.begin() + 12);
    return b;
  }
  return fail(error::family_mismatch, "invalid address");
}

inline auto address::zone() const noexcept -> std::string_view {
  if (auto const* v6 = std::get_if<address_v6>(&storage_)) {
    return v6->zone();
  }
  return {};
}

inline auto address::with_zone(std::string zone) const -> address {
  if (auto const* v6 = std::get_if<address_v6>(&storage_)) {
    return address_v6{v6->to_bytes(), std::move(zone)};
  }
  return *this;
}

inline auto address::unmap() const -> address {
  if (!is_v4_mapped_v6()) {
    return *this;
  }
  auto const b = bytes();
  return address_v4{{b[12], b[13], b[14], b[15]}};
}

inline auto address::is_private() const noexcept -> bool {
  auto const b = bytes();
  if (is_v4()) {
    // 10/8, 172.16/12, 192.168/16
    return b[0] == 10 || (b[0] == 172 && b[1] >= 16 && b[1] <= 31) ||
           (b[0] == 192 && b[1] == 168);
  }
  if (is_v6()) {
    // fc00::/7
    return (b[0] & 0xfe) == 0xfc;
  }
  return false;
}

inline auto address::is_loopback() const noexcept -> bool {
  auto const b = bytes();
  if (is_v4()) {
    return b[0] == 127;
  }
  if (is_v6()) {
    return std::all_of(b.begin(), b.begin() + 15, [](std::uint8_t x) { return x == 0; }) &&
           b[15] == 1;
  }
  return false;
}

inline auto address::is_multicast() const noexcept -> bool {
  auto const b = bytes();
  if (is_v4()) {
    return (b[0] & 0xf0) == 0xe0;
  }
  if (is_v6()) {
    return b[0] == 0xff;
  }
  return false;
}

inline auto address::is_link_local_unicast() const noexcept -> bool {
  auto const b = bytes();
  if (is_v4()) {
    return b[0] == 169 && b[1] == 254;
  }
  if (is_v6()) {
    return b[0] == 0xfe && (b[1] & 0xc0) == 0x80;
  }
  return false;
}

inline auto address::is_link_local_multicast() const noexcept -> bool {
  auto const b = bytes();
  if (is_v4()) {
    return b[0] == 224 && b[1] == 0 && b[2] == 0;
  }
  if (is_v6()) {
    return b[0] == 0xff && (b[1] & 0x0f) == 0x02;
  }
  return false;
}

inline auto address::is_interface_local_multicast() const noexcept -> bool {
  auto const b = bytes();
  return is_v6() && b[0] == 0xff && (b[1] & 0x0f) == 0x01;
}

inline auto address::is_unspecified() const noexcept -> bool {
  auto const b = bytes();
  return std::all_of(b.begin(), b.end(), [](std::uint8_t x) { return x == 0; });
}

inline auto address::is_global_unicast() const noexcept -> bool {
  if (is_v4()) {
    return !is_private() && !is_unspecified() && !is_loopback() && !is_multicast();
  }
  if (is_v6()) {
    return !is_unspecified() && !is_loopback() && !is_multicast() && !is_link_local_unicast();
  }
  return false;
}

inline auto address::mask(int bits) const -> result<address> {
  if (bits < 0 || bits > bit_length()) {
    return fail(error::out_of_range, "invalid mask length: " + std::to_string(bits));
  }
  return detail::rebuild(*this, [bits](std::span<std::uint8_t> b) {
    for (std::size_t i = 0; i < b.size(); ++i) {
      auto const first_bit = static_cast<int>(i) * 8;
      if (bits >= first_bit + 8) {
        continue;
      }
      if (bits <= first_bit) {
        b[i] = 0;
      } else {
        b[i] &= static_cast<std::uint8_t>(0xff << (8 - (bits - first_bit)));
      }
    }
    return true;
  });
}

inline auto address::next() const -> address {
  return detail::rebuild(*this, [](std::span<std::uint8_t> b) {
    for (auto i = b.size(); i > 0; --i) {
      if (b[i - 1] < 0xff) {
        ++b[i - 1];
        return true;
      }
      b[i - 1] = 0;
    }
    return false;
  });
}

inline auto address::previous() const -> address {
  return detail::rebuild(*this, [](std::span<std::uint8_t> b) {
    for (auto i = b.size(); i > 0; --i) {
      if (b[i - 1] > 0) {
        --b[i - 1];
        return true;
      }
      b[i - 1] = 0xff;
    }
    return false;
  });
}

inline auto address::compare(address const& other) const noexcept -> int {
  auto const a = bytes();
  auto const b = other.bytes();
  auto const n = std::min(a.size(), b.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (a[i] < b[i]) {
      return -1;
    }
    if (a[i] > b[i]) {
      return 1;
    }
  }
  if (a.size() < b.size()) {
    return -1;
  }
  if (a.size() > b.size()) {
    return 1;
  }
  return 0;
}

inline auto address::to_string() const -> std::string {
  if (!is_valid()) {
    return "invalid IP";
  }
  std::string out;
  if (is_v4()) {
    detail::append_dotted(out, bytes());
    return out;
  }

  if (is_v4_mapped_v6()) {
    out = "::ffff:";
    detail::append_dotted(out, bytes().subspan(12));
  } else {
    // Collapse the first run of zero groups, not necessarily the longest one.
    auto const h = detail::hextets(bytes());
    auto const run_begin = std::find(h.begin(), h.end(), std::uint16_t{0});
    if (run_begin == h.end()) {
      detail::append_hextets(out, h.begin(), h.end());
    } else {
      auto const run_end = std::find_if(run_begin, h.end(), [](std::uint16_t x) { return x != 0; });
      detail::append_hextets(out, h.begin(), run_begin);
      out += "::";
      detail::append_hextets(out, run_end, h.end());
    }
  }

  if (auto const z = zone(); !z.empty()) {
    out.push_back('%');
    out += z;
  }
  return out;
}

inline auto address::to_expanded_string() const -> std::string {
  if (!is_valid()) {
    return "invalid IP";
  }
  std::string out;
  if (is_v4()) {
    detail::append_dotted(out, bytes());
    return out;
  }
  auto const h = detail::hextets(bytes());
  for (std::size_t i = 0; i < h.size(); ++i) {
    if (i != 0) {
      out.push_back(':');
    }
    detail::append_hextet(out, h[i], true);
  }
  if (auto const z = zone(); !z.empty()) {
    out.push_back('%');
    out += z;
  }
  return out;
}

inline auto address::to_text() const -> std::string {
  if (!is_valid()) {
    return {};
  }
  return to_string();
}

inline auto address::to_binary() const -> result<std::vector<std::uint8_t>> {
  if (!is_valid()) {
    return fail(error::invalid_length, "cannot encode an invalid address");
  }
  return to_bytes();
}

inline void address::append_to(std::vector<std::uint8_t>& buffer) const {
  auto const b = bytes();
  buffer.insert(buffer.end(), b.begin(), b.end());
}

inline auto operator<=>(address const& a, address const& b) noexcept -> std::strong_ordering {
  if (auto const c = a.compare(b); c != 0) {
    return c < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
  }
  return a.zone() <=> b.zone();
}

}  // namespace netaddr
