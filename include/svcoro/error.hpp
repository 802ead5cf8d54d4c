#pragma once

#include <system_error>
#include <type_traits>

namespace svcoro {

enum class error {
  /// Operation cancelled (the pending computation or its context went away).
  operation_aborted = 1,

  /// A deadline elapsed before the response was produced.
  timed_out,

  /// The service was not ready and the request was shed instead of queued.
  overloaded,

  /// The service has been closed and will not accept further requests.
  closed,

  /// An erased error whose payload carries no error code.
  unspecified,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace svcoro

namespace std {

template <>
struct is_error_code_enum<svcoro::error> : std::true_type {};

}  // namespace std
