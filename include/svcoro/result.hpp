#pragma once

#include <svcoro/any_error.hpp>
#include <svcoro/expected.hpp>

#include <utility>
#include <variant>

namespace svcoro {

/// Result type used by every svcoro middleware that erases its inner error.
template <class T>
using result = expected<T, any_error>;

/// Result type for value-less operations.
/// (The fallback `expected` does not support T=void.)
using void_result = expected<std::monostate, any_error>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }
[[nodiscard]] inline auto fail(any_error e) noexcept -> void_result { return unexpected(std::move(e)); }

}  // namespace svcoro
