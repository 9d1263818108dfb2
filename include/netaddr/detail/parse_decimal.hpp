#pragma once

#include <netaddr/error.hpp>
#include <netaddr/result.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>

namespace netaddr::detail {

// Signed decimal integer: optional '-' then one or more digits, nothing else.
// Non-numeric input is invalid_token; a value that does not fit a long is
// out_of_range. Callers apply their own bounds.
inline auto parse_decimal(std::string_view s, char const* what) -> result<long> {
  auto const digits = !s.empty() && s.front() == '-' ? s.substr(1) : s;
  if (digits.empty() || !std::ranges::all_of(digits, [](char c) { return c >= '0' && c <= '9'; })) {
    return fail(error::invalid_token, std::string{"invalid "} + what + ": " + std::string{s});
  }
  long value = 0;
  auto const r = std::from_chars(s.data(), s.data() + s.size(), value);
  if (r.ec == std::errc::result_out_of_range) {
    return fail(error::out_of_range, std::string{what} + " out of range: " + std::string{s});
  }
  if (r.ec != std::errc{} || r.ptr != s.data() + s.size()) {
    return fail(error::invalid_token, std::string{"invalid "} + what + ": " + std::string{s});
  }
  return value;
}

}  // namespace netaddr::detail
