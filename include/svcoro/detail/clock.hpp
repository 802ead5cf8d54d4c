#pragma once

#include <chrono>

namespace svcoro::detail {

using steady_time_point = std::chrono::steady_clock::time_point;
using steady_duration = std::chrono::steady_clock::duration;

/// `from + d`, clamped to the representable range. A duration too large to add
/// (e.g. `duration::max()`, meaning "never") yields `time_point::max()`.
constexpr auto saturating_add(steady_time_point from, steady_duration d) noexcept
  -> steady_time_point {
  if (d > steady_duration::zero() && d > steady_time_point::max() - from) {
    return steady_time_point::max();
  }
  if (d < steady_duration::zero() && d < steady_time_point::min() - from) {
    return steady_time_point::min();
  }
  return from + d;
}

inline auto deadline_after(steady_duration d) noexcept -> steady_time_point {
  return saturating_add(std::chrono::steady_clock::now(), d);
}

}  // namespace svcoro::detail
