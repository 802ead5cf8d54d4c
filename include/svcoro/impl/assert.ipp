#include <svcoro/assert.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <cstdlib>

namespace svcoro::detail {

void contract_failure(contract_kind kind, char const* expr, char const* msg, char const* file,
                      int line, char const* func) noexcept {
  auto const* what = kind == contract_kind::assertion ? "assertion" : "precondition";
  fmt::print(stderr, "[svcoro] {} failed: {}\n", what, expr);
  if (msg != nullptr) {
    fmt::print(stderr, "  {}\n", msg);
  }
  fmt::print(stderr, "  at {}:{} ({})\n", file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace svcoro::detail
