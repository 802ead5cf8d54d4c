#pragma once

#include <svcoro/assert.hpp>
#include <svcoro/error.hpp>

#include <concepts>
#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace svcoro {

/// A type that can be carried inside `any_error`.
///
/// Either a `std::exception` subclass, or any value type exposing `message()`
/// (which includes `std::error_code`).
template <class E>
concept error_value =
  std::is_object_v<E> && std::move_constructible<E> &&
  (std::derived_from<E, std::exception> || requires(E const& e) {
    { e.message() } -> std::convertible_to<std::string>;
  });

namespace detail {

template <class E>
auto error_message_of(E const& e) -> std::string {
  if constexpr (requires { { e.message() } -> std::convertible_to<std::string>; }) {
    return std::string(e.message());
  } else {
    return std::string(e.what());
  }
}

template <class E>
auto error_code_of(E const& e) noexcept -> std::error_code {
  if constexpr (std::same_as<E, std::error_code>) {
    return e;
  } else if constexpr (requires { { e.code() } -> std::convertible_to<std::error_code>; }) {
    return e.code();
  } else {
    return make_error_code(error::unspecified);
  }
}

}  // namespace detail

/// Type-erased error value.
///
/// Middleware that combine their own failures with an inner service's failures report them
/// as `any_error`, so stacking layers never grows the error type. The original value is kept
/// intact and can be recovered with `downcast<E>()`.
///
/// The payload is immutable after construction and shared between copies, so an `any_error`
/// may be copied and handed to other threads freely. An `any_error` is never empty: moving
/// from one leaves the source still referring to the same payload.
class any_error {
 public:
  template <class E>
    requires(!std::same_as<std::remove_cvref_t<E>, any_error> &&
             error_value<std::remove_cvref_t<E>>)
  any_error(E&& e)  // NOLINT(google-explicit-constructor)
      : impl_(std::make_shared<model<std::remove_cvref_t<E>>>(std::forward<E>(e))) {}

  template <class Enum>
    requires std::is_error_code_enum_v<Enum>
  any_error(Enum e)  // NOLINT(google-explicit-constructor)
      : any_error(std::error_code{make_error_code(e)}) {}

  any_error(any_error const&) noexcept = default;
  auto operator=(any_error const&) noexcept -> any_error& = default;

  any_error(any_error&& other) noexcept : impl_(other.impl_) {}
  auto operator=(any_error&& other) noexcept -> any_error& {
    impl_ = other.impl_;
    return *this;
  }

  ~any_error() = default;

  auto message() const -> std::string { return impl_->message(); }

  /// The payload's error code, or `error::unspecified` when it has none.
  auto code() const noexcept -> std::error_code { return impl_->code(); }

  /// Dynamic type of the payload.
  auto type() const noexcept -> std::type_info const& { return impl_->type(); }

  template <class E>
  auto is() const noexcept -> bool {
    return downcast<E>() != nullptr;
  }

  /// Recover the original value if the payload's dynamic type is exactly `E`.
  template <class E>
  auto downcast() const noexcept -> E const* {
    return static_cast<E const*>(impl_->target(typeid(E)));
  }

 private:
  struct concept_base {
    virtual ~concept_base() = default;
    virtual auto message() const -> std::string = 0;
    virtual auto code() const noexcept -> std::error_code = 0;
    virtual auto type() const noexcept -> std::type_info const& = 0;
    virtual auto target(std::type_info const& ti) const noexcept -> void const* = 0;
  };

  template <class E>
  struct model final : concept_base {
    template <class U>
    explicit model(U&& v) : value(std::forward<U>(v)) {}

    auto message() const -> std::string override { return detail::error_message_of(value); }
    auto code() const noexcept -> std::error_code override { return detail::error_code_of(value); }
    auto type() const noexcept -> std::type_info const& override { return typeid(E); }
    auto target(std::type_info const& ti) const noexcept -> void const* override {
      if (ti == typeid(E)) {
        return std::addressof(value);
      }
      return nullptr;
    }

    E value;
  };

  std::shared_ptr<concept_base const> impl_;
};

/// Convert any supported error into `any_error` (identity for `any_error` itself).
template <class E>
auto box_error(E&& e) -> any_error {
  return any_error(std::forward<E>(e));
}

}  // namespace svcoro
