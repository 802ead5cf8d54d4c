#pragma once

#include <functional>
#include <type_traits>
#include <utility>

namespace svcoro {

/// `L` wraps an `S` into another service. Layers run once, when a stack is assembled.
template <class L, class S>
concept layer_for = requires(L const& l, S s) { l.layer(std::move(s)); };

template <class L, class S>
using layered_t = decltype(std::declval<L const&>().layer(std::declval<S>()));

/// Returns the service unchanged.
struct identity_layer {
  template <class S>
  auto layer(S s) const -> S {
    return s;
  }
};

/// Layer from a callable `S -> S'`.
template <class F>
class fn_layer {
 public:
  explicit fn_layer(F f) : f_(std::move(f)) {}

  template <class S>
    requires std::invocable<F const&, S>
  auto layer(S s) const {
    return std::invoke(f_, std::move(s));
  }

 private:
  F f_;
};

template <class F>
auto layer_fn(F&& f) -> fn_layer<std::decay_t<F>> {
  return fn_layer<std::decay_t<F>>{std::forward<F>(f)};
}

/// Two layers applied in sequence: `Inner` wraps the service first, `Outer` wraps the result.
template <class Inner, class Outer>
class stack {
 public:
  stack(Inner inner, Outer outer) : inner_(std::move(inner)), outer_(std::move(outer)) {}

  template <class S>
    requires layer_for<Inner, S> && layer_for<Outer, layered_t<Inner, S>>
  auto layer(S s) const {
    return outer_.layer(inner_.layer(std::move(s)));
  }

  auto inner() const noexcept -> Inner const& { return inner_; }
  auto outer() const noexcept -> Outer const& { return outer_; }

 private:
  Inner inner_;
  Outer outer_;
};

}  // namespace svcoro
