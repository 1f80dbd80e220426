#pragma once

#include <cstdio>
#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define WSCORO_LIKELY(x) __builtin_expect(!!(x), 1)
#define WSCORO_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define WSCORO_LIKELY(x) (x)
#define WSCORO_UNLIKELY(x) (x)
#endif

namespace wscoro::detail {

/// Print a contract violation report and terminate.
///
/// `kind` is one of "ASSERT", "ENSURE", "UNREACHABLE"; `expr` and `msg` may be null.
[[noreturn]] inline void contract_fail(char const* kind, char const* expr, char const* msg,
                                       char const* file, int line, char const* func) noexcept {
  std::fprintf(stderr, "[wscoro] %s failure\n", kind);
  if (expr != nullptr) {
    std::fprintf(stderr, "  expression: %s\n", expr);
  }
  if (msg != nullptr) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr, "  location  : %s:%d\n  function  : %s\n", file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace wscoro::detail

#define WSCORO_CONTRACT_SELECTOR(_1, _2, NAME, ...) NAME

#define WSCORO_CONTRACT_CHECK(kind, expr, msg) \
  (WSCORO_LIKELY(expr)                         \
     ? (void)0                                 \
     : ::wscoro::detail::contract_fail(kind, #expr, msg, __FILE__, __LINE__, __func__))

// -------------------- ASSERT (debug builds only) --------------------
#if !defined(NDEBUG)

#define WSCORO_ASSERT_1(expr) WSCORO_CONTRACT_CHECK("ASSERT", expr, nullptr)
#define WSCORO_ASSERT_2(expr, msg) WSCORO_CONTRACT_CHECK("ASSERT", expr, msg)

#define WSCORO_ASSERT(...) \
  WSCORO_CONTRACT_SELECTOR(__VA_ARGS__, WSCORO_ASSERT_2, WSCORO_ASSERT_1)(__VA_ARGS__)

#else
#define WSCORO_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE (always on) --------------------

#define WSCORO_ENSURE_1(expr) WSCORO_CONTRACT_CHECK("ENSURE", expr, nullptr)
#define WSCORO_ENSURE_2(expr, msg) WSCORO_CONTRACT_CHECK("ENSURE", expr, msg)

#define WSCORO_ENSURE(...) \
  WSCORO_CONTRACT_SELECTOR(__VA_ARGS__, WSCORO_ENSURE_2, WSCORO_ENSURE_1)(__VA_ARGS__)

// -------------------- UNREACHABLE --------------------

#define WSCORO_UNREACHABLE() \
  ::wscoro::detail::contract_fail("UNREACHABLE", nullptr, nullptr, __FILE__, __LINE__, __func__)
