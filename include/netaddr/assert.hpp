#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define NETADDR_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define NETADDR_LIKELY(x) (x)
#endif

namespace netaddr::detail {

[[noreturn]] inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

}  // namespace netaddr::detail

// -------------------- ASSERT --------------------
#if !defined(NDEBUG)

#define NETADDR_ASSERT(expr, msg) \
  (NETADDR_LIKELY(expr) ? (void)0  \
                        : ::netaddr::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#else
#define NETADDR_ASSERT(expr, msg) ((void)0)
#endif

// -------------------- ENSURE --------------------

#define NETADDR_ENSURE(expr, msg) \
  (NETADDR_LIKELY(expr) ? (void)0  \
                        : ::netaddr::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#include <netaddr/impl/assert.ipp>
