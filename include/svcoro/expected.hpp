#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace svcoro {

// Compatibility shim for `std::expected` (C++23).
//
// - If the standard library provides `std::expected`, this header aliases it.
// - Otherwise it provides the subset svcoro relies on. `T = void` is not supported by the
//   fallback; svcoro uses `std::monostate` for value-less results (see result.hpp).
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

template <class E>
using bad_expected_access = std::bad_expected_access<E>;

using unexpect_t = std::unexpect_t;
inline constexpr unexpect_t unexpect = std::unexpect;

template <class T, class E>
using expected = std::expected<T, E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& noexcept -> E const& { return err_; }
  auto error() & noexcept -> E& { return err_; }
  auto error() && noexcept -> E&& { return std::move(err_); }

  auto what() const noexcept -> char const* override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  template <class G = E>
    requires(!std::same_as<std::remove_cvref_t<G>, unexpected> &&
             !std::same_as<std::remove_cvref_t<G>, std::in_place_t> &&
             std::is_constructible_v<E, G>)
  constexpr explicit unexpected(G&& e) : error_(std::forward<G>(e)) {}

  constexpr auto error() const& noexcept -> E const& { return error_; }
  constexpr auto error() & noexcept -> E& { return error_; }
  constexpr auto error() && noexcept -> E&& { return std::move(error_); }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

struct unexpect_t {
  explicit unexpect_t() = default;
};
inline constexpr unexpect_t unexpect{};

namespace detail {

template <class U>
inline constexpr bool is_unexpected_v = false;

template <class E>
inline constexpr bool is_unexpected_v<unexpected<E>> = true;

}  // namespace detail

template <class T, class E>
class expected {
  static_assert(!std::is_void_v<T>, "svcoro::expected: use std::monostate for void results");

 public:
  using value_type = T;
  using error_type = E;
  using unexpected_type = unexpected<E>;

  template <class U>
  using rebind = expected<U, E>;

  constexpr expected()
    requires std::default_initializable<T>
      : storage_(std::in_place_index<0>) {}

  template <class U = T>
    requires(!std::same_as<std::remove_cvref_t<U>, expected> &&
             !std::same_as<std::remove_cvref_t<U>, std::in_place_t> &&
             !std::same_as<std::remove_cvref_t<U>, unexpect_t> &&
             !detail::is_unexpected_v<std::remove_cvref_t<U>> && std::is_constructible_v<T, U>)
  constexpr explicit(!std::is_convertible_v<U, T>) expected(U&& v)
      : storage_(std::in_place_index<0>, std::forward<U>(v)) {}

  template <class G>
    requires std::is_constructible_v<E, G const&>
  constexpr explicit(!std::is_convertible_v<G const&, E>) expected(unexpected<G> const& u)
      : storage_(std::in_place_index<1>, u.error()) {}

  template <class G>
    requires std::is_constructible_v<E, G>
  constexpr explicit(!std::is_convertible_v<G, E>) expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, std::move(u).error()) {}

  template <class... Args>
  constexpr explicit expected(std::in_place_t, Args&&... args)
      : storage_(std::in_place_index<0>, std::forward<Args>(args)...) {}

  template <class... Args>
  constexpr explicit expected(unexpect_t, Args&&... args)
      : storage_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  constexpr auto has_value() const noexcept -> bool { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr auto operator*() & noexcept -> T& { return std::get<0>(storage_); }
  constexpr auto operator*() const& noexcept -> T const& { return std::get<0>(storage_); }
  constexpr auto operator*() && noexcept -> T&& { return std::get<0>(std::move(storage_)); }

  constexpr auto operator->() noexcept -> T* { return std::addressof(std::get<0>(storage_)); }
  constexpr auto operator->() const noexcept -> T const* {
    return std::addressof(std::get<0>(storage_));
  }

  constexpr auto value() & -> T& {
    throw_if_error();
    return std::get<0>(storage_);
  }
  constexpr auto value() const& -> T const& {
    throw_if_error();
    return std::get<0>(storage_);
  }
  constexpr auto value() && -> T&& {
    throw_if_error();
    return std::get<0>(std::move(storage_));
  }

  constexpr auto error() & noexcept -> E& { return std::get<1>(storage_); }
  constexpr auto error() const& noexcept -> E const& { return std::get<1>(storage_); }
  constexpr auto error() && noexcept -> E&& { return std::get<1>(std::move(storage_)); }

  template <class U>
  constexpr auto value_or(U&& fallback) const& -> T {
    return has_value() ? **this : static_cast<T>(std::forward<U>(fallback));
  }
  template <class U>
  constexpr auto value_or(U&& fallback) && -> T {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(fallback));
  }

  template <class F>
  constexpr auto and_then(F&& f) & {
    return and_then_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto and_then(F&& f) const& {
    return and_then_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto and_then(F&& f) && {
    return and_then_impl(std::move(*this), std::forward<F>(f));
  }

  template <class F>
  constexpr auto transform(F&& f) & {
    return transform_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto transform(F&& f) const& {
    return transform_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto transform(F&& f) && {
    return transform_impl(std::move(*this), std::forward<F>(f));
  }

  template <class F>
  constexpr auto transform_error(F&& f) & {
    return transform_error_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto transform_error(F&& f) const& {
    return transform_error_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto transform_error(F&& f) && {
    return transform_error_impl(std::move(*this), std::forward<F>(f));
  }

  template <class F>
  constexpr auto or_else(F&& f) & {
    return or_else_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto or_else(F&& f) const& {
    return or_else_impl(*this, std::forward<F>(f));
  }
  template <class F>
  constexpr auto or_else(F&& f) && {
    return or_else_impl(std::move(*this), std::forward<F>(f));
  }

 private:
  constexpr void throw_if_error() const {
    if (!has_value()) {
      throw bad_expected_access<E>(std::get<1>(storage_));
    }
  }

  template <class Self, class F>
  static constexpr auto and_then_impl(Self&& self, F&& f) {
    using result_t = std::remove_cvref_t<std::invoke_result_t<F, decltype(*std::forward<Self>(self))>>;
    if (self.has_value()) {
      return std::invoke(std::forward<F>(f), *std::forward<Self>(self));
    }
    return result_t(unexpect, std::forward<Self>(self).error());
  }

  template <class Self, class F>
  static constexpr auto transform_impl(Self&& self, F&& f) {
    using value_t = std::remove_cvref_t<std::invoke_result_t<F, decltype(*std::forward<Self>(self))>>;
    static_assert(!std::is_void_v<value_t>, "svcoro::expected::transform: void results unsupported");
    using result_t = expected<value_t, E>;
    if (self.has_value()) {
      return result_t(std::in_place, std::invoke(std::forward<F>(f), *std::forward<Self>(self)));
    }
    return result_t(unexpect, std::forward<Self>(self).error());
  }

  template <class Self, class F>
  static constexpr auto transform_error_impl(Self&& self, F&& f) {
    using error_t =
      std::remove_cvref_t<std::invoke_result_t<F, decltype(std::forward<Self>(self).error())>>;
    using result_t = expected<T, error_t>;
    if (self.has_value()) {
      return result_t(std::in_place, *std::forward<Self>(self));
    }
    return result_t(unexpect, std::invoke(std::forward<F>(f), std::forward<Self>(self).error()));
  }

  template <class Self, class F>
  static constexpr auto or_else_impl(Self&& self, F&& f) {
    using result_t =
      std::remove_cvref_t<std::invoke_result_t<F, decltype(std::forward<Self>(self).error())>>;
    if (self.has_value()) {
      return result_t(std::in_place, *std::forward<Self>(self));
    }
    return std::invoke(std::forward<F>(f), std::forward<Self>(self).error());
  }

  std::variant<T, E> storage_;
};

#endif

}  // namespace svcoro
