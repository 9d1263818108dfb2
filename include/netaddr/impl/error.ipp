#include <netaddr/error.hpp>

namespace netaddr {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "netaddr"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      // Text codec
      case error::invalid_format:
        return "invalid format";
      case error::invalid_token:
        return "invalid token";
      case error::out_of_range:
        return "value out of range";
      case error::malformed_address:
        return "malformed address";

      // Binary codec / conversions
      case error::invalid_length:
        return "invalid binary length";
      case error::family_mismatch:
        return "address family mismatch";
      default:
        return "unknown error";
    }
  }
};

inline auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace netaddr
