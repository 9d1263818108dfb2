#pragma once

#include <netaddr/error.hpp>
#include <netaddr/expected.hpp>

#include <string>
#include <variant>

namespace netaddr {

/// Common result type for parsing and decoding APIs.
template <class T>
using result = expected<T, error_info>;

/// Result type for checks that produce no value.
using void_result = expected<std::monostate, error_info>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }

/// Build the error side of a result.
[[nodiscard]] inline auto fail(error e, std::string detail) -> unexpected<error_info> {
  return unexpected<error_info>(error_info{e, std::move(detail)});
}

}  // namespace netaddr
