#pragma once

#include <svcoro/any_error.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace svcoro {

enum class log_level : std::uint8_t {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

auto to_string(log_level lvl) noexcept -> std::string_view;

/// Receives every line that passes the level filter. Calls are serialized.
///
/// A sink may log or replace the sink. Lines it logs itself go to stderr, and a replacement
/// takes effect from the next line.
using log_sink = std::function<void(log_level, std::string_view)>;

/// Default: `log_level::warn`.
void set_log_level(log_level lvl) noexcept;
auto get_log_level() noexcept -> log_level;

inline auto log_enabled(log_level lvl) noexcept -> bool {
  return lvl != log_level::off && lvl >= get_log_level();
}

/// Replace the sink. The default sink writes `[svcoro] <level>: <msg>` to stderr.
void set_log_sink(log_sink sink);
void reset_log_sink();

namespace detail {

void write_log(log_level lvl, std::string_view msg);

}  // namespace detail

template <class... Args>
void log(log_level lvl, fmt::format_string<Args...> fmt_str, Args&&... args) {
  if (!log_enabled(lvl)) {
    return;
  }
  detail::write_log(lvl, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <class... Args>
void log_trace(fmt::format_string<Args...> fmt_str, Args&&... args) {
  log(log_level::trace, fmt_str, std::forward<Args>(args)...);
}

template <class... Args>
void log_debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
  log(log_level::debug, fmt_str, std::forward<Args>(args)...);
}

template <class... Args>
void log_info(fmt::format_string<Args...> fmt_str, Args&&... args) {
  log(log_level::info, fmt_str, std::forward<Args>(args)...);
}

template <class... Args>
void log_warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
  log(log_level::warn, fmt_str, std::forward<Args>(args)...);
}

template <class... Args>
void log_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
  log(log_level::error, fmt_str, std::forward<Args>(args)...);
}

}  // namespace svcoro

template <>
struct fmt::formatter<svcoro::any_error> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(svcoro::any_error const& e, FormatContext& ctx) const {
    auto const msg = e.message();
    return fmt::formatter<std::string_view>::format(std::string_view{msg}, ctx);
  }
};
