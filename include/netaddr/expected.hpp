#pragma once

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace netaddr {

// `expected<T, E>`: `std::expected` where the standard library ships it,
// otherwise the subset the parsers and codecs here rely on (value or error,
// observers, transform). No `expected<void, E>`; use `void_result` from
// result.hpp.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

template <class T, class E>
using expected = std::expected<T, E>;

template <class E>
using bad_expected_access = std::bad_expected_access<E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& noexcept -> E const& { return err_; }
  auto error() && noexcept -> E&& { return std::move(err_); }

  auto what() const noexcept -> char const* override { return "bad expected access"; }

 private:
  E err_;
};

/// Tag wrapping the error side so it can be told apart from a value.
template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E const& e) : err_(e) {}
  constexpr explicit unexpected(E&& e) : err_(std::move(e)) {}

  constexpr auto error() const& noexcept -> E const& { return err_; }
  constexpr auto error() && noexcept -> E&& { return std::move(err_); }

 private:
  E err_;
};

template <class E>
unexpected(E) -> unexpected<E>;

template <class T, class E>
class expected {
  static_assert(!std::is_void_v<T>, "expected<void, E> is not provided; use void_result");

 public:
  using value_type = T;
  using error_type = E;

  constexpr expected(T const& v) : state_(std::in_place_index<0>, v) {}
  constexpr expected(T&& v) : state_(std::in_place_index<0>, std::move(v)) {}

  template <class G, class = std::enable_if_t<std::is_convertible_v<G const&, E>>>
  constexpr expected(unexpected<G> const& u) : state_(std::in_place_index<1>, E(u.error())) {}

  template <class G, class = std::enable_if_t<std::is_convertible_v<G&&, E>>>
  constexpr expected(unexpected<G>&& u) : state_(std::in_place_index<1>, E(std::move(u).error())) {}

  template <class... Args>
  constexpr explicit expected(std::in_place_t, Args&&... args)
      : state_(std::in_place_index<0>, std::forward<Args>(args)...) {}

  constexpr auto has_value() const noexcept -> bool { return state_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr auto value() const& -> T const& {
    if (!has_value()) {
      throw_bad_access();
    }
    return std::get<0>(state_);
  }

  constexpr auto value() && -> T&& {
    if (!has_value()) {
      throw_bad_access();
    }
    return std::get<0>(std::move(state_));
  }

  constexpr auto error() const& noexcept -> E const& { return *std::get_if<1>(&state_); }
  constexpr auto error() && noexcept -> E&& { return std::move(*std::get_if<1>(&state_)); }

  constexpr auto operator*() & noexcept -> T& { return *std::get_if<0>(&state_); }
  constexpr auto operator*() const& noexcept -> T const& { return *std::get_if<0>(&state_); }
  constexpr auto operator*() && noexcept -> T&& { return std::move(*std::get_if<0>(&state_)); }

  constexpr auto operator->() noexcept -> T* { return std::get_if<0>(&state_); }
  constexpr auto operator->() const noexcept -> T const* { return std::get_if<0>(&state_); }

  template <class F>
  constexpr auto transform(F&& f) const& {
    using U = std::remove_cv_t<std::invoke_result_t<F, T const&>>;
    if (!has_value()) {
      return expected<U, E>(unexpected<E>(error()));
    }
    return expected<U, E>(std::in_place, std::invoke(std::forward<F>(f), **this));
  }

  template <class F>
  constexpr auto transform(F&& f) && {
    using U = std::remove_cv_t<std::invoke_result_t<F, T&&>>;
    if (!has_value()) {
      return expected<U, E>(unexpected<E>(std::move(*this).error()));
    }
    return expected<U, E>(std::in_place, std::invoke(std::forward<F>(f), std::move(**this)));
  }

 private:
  [[noreturn]] void throw_bad_access() const { throw bad_expected_access<E>(error()); }

  std::variant<T, E> state_;
};

#endif

}  // namespace netaddr
