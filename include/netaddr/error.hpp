#pragma once

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace netaddr {

enum class error {
  /// Unrecognized top-level shape (no ':' or '.', wrong IPv4 component count,
  /// missing '/' or ':' separator).
  invalid_format = 1,

  /// Invalid character, or a hextet with too many digits.
  invalid_token,

  /// Octet, hextet, port, mask length or prefix length out of bounds.
  out_of_range,

  /// Structural problem: multiple "::", misplaced or malformed embedded IPv4,
  /// too few / too many hextets, zone where none is allowed.
  malformed_address,

  /// Binary buffer of the wrong length, or binary encoding of an invalid value.
  invalid_length,

  /// Operation requires a different address family.
  family_mismatch,
};

namespace detail {
inline auto error_category() -> std::error_category const&;
}  // namespace detail

inline auto make_error_code(error e) -> std::error_code;

/// Failure value returned by the parsing and decoding entry points.
///
/// Pairs the error kind (as a std::error_code in the netaddr category) with a
/// human-readable detail naming the offending input.
class error_info {
 public:
  error_info(error e, std::string detail) : code_(make_error_code(e)), detail_(std::move(detail)) {}

  auto code() const noexcept -> std::error_code { return code_; }
  auto detail() const noexcept -> std::string const& { return detail_; }

  /// The detail when present, otherwise the category message.
  auto message() const -> std::string { return detail_.empty() ? code_.message() : detail_; }

  friend auto operator==(error_info const& a, error_info const& b) noexcept -> bool {
    return a.code_ == b.code_ && a.detail_ == b.detail_;
  }

  friend auto operator==(error_info const& a, error e) noexcept -> bool {
    return a.code_ == make_error_code(e);
  }

 private:
  std::error_code code_;
  std::string detail_;
};

}  // namespace netaddr

namespace std {

template <>
struct is_error_code_enum<netaddr::error> : std::true_type {};

}  // namespace std

#include <netaddr/impl/error.ipp>
