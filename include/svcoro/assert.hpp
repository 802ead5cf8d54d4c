#pragma once

// Contract checks.
//
// SVCORO_ASSERT(expr[, msg]) guards internal invariants and compiles away under NDEBUG.
// SVCORO_ENSURE(expr[, msg]) guards caller contracts and is always on. A failed ENSURE is a
// bug at the call site, not a runtime error: it prints the failure and aborts.

namespace svcoro::detail {

enum class contract_kind { assertion, precondition };

[[noreturn]] void contract_failure(contract_kind kind, char const* expr, char const* msg,
                                   char const* file, int line, char const* func) noexcept;

}  // namespace svcoro::detail

#define SVCORO_CONTRACT_PICK(_1, _2, NAME, ...) NAME

#define SVCORO_CONTRACT_CHECK(kind, expr, msg)                                          \
  (static_cast<bool>(expr) ? (void)0                                                    \
                           : ::svcoro::detail::contract_failure(                        \
                               ::svcoro::detail::contract_kind::kind, #expr, msg, __FILE__, \
                               __LINE__, __func__))

#define SVCORO_ENSURE_1(expr) SVCORO_CONTRACT_CHECK(precondition, expr, nullptr)
#define SVCORO_ENSURE_2(expr, msg) SVCORO_CONTRACT_CHECK(precondition, expr, msg)
#define SVCORO_ENSURE(...) \
  SVCORO_CONTRACT_PICK(__VA_ARGS__, SVCORO_ENSURE_2, SVCORO_ENSURE_1)(__VA_ARGS__)

#if !defined(NDEBUG)
#define SVCORO_ASSERT_1(expr) SVCORO_CONTRACT_CHECK(assertion, expr, nullptr)
#define SVCORO_ASSERT_2(expr, msg) SVCORO_CONTRACT_CHECK(assertion, expr, msg)
#define SVCORO_ASSERT(...) \
  SVCORO_CONTRACT_PICK(__VA_ARGS__, SVCORO_ASSERT_2, SVCORO_ASSERT_1)(__VA_ARGS__)
#else
#define SVCORO_ASSERT(...) ((void)0)
#endif
