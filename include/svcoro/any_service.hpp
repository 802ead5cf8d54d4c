#pragma once

#include <svcoro/any_error.hpp>
#include <svcoro/service.hpp>
#include <svcoro/waker.hpp>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace svcoro {

namespace detail {

template <class Resp, class R, class E>
auto erase_response(response_future<R, E> fut) -> response_future<Resp, any_error> {
  auto r = co_await std::move(fut);
  if (!r) {
    co_return unexpected(box_error(std::move(r).error()));
  }
  co_return Resp(std::move(*r));
}

}  // namespace detail

/// Type-erased service from `Req` to `Resp`.
///
/// Copying an any_service copies the wrapped service. Errors from poll_ready() and from the
/// response futures are boxed into `any_error`.
template <class Req, class Resp>
class any_service {
 public:
  template <class S>
    requires(!std::same_as<std::remove_cvref_t<S>, any_service> &&
             service<std::remove_cvref_t<S>, Req> &&
             std::convertible_to<response_t<std::remove_cvref_t<S>, Req>, Resp>)
  any_service(S&& svc)  // NOLINT(google-explicit-constructor)
      : impl_(std::make_unique<model<std::remove_cvref_t<S>>>(std::forward<S>(svc))) {}

  any_service(any_service const& other) : impl_(other.impl_->clone()) {}
  auto operator=(any_service const& other) -> any_service& {
    if (this != &other) {
      impl_ = other.impl_->clone();
    }
    return *this;
  }

  any_service(any_service&&) noexcept = default;
  auto operator=(any_service&&) noexcept -> any_service& = default;

  ~any_service() = default;

  auto poll_ready(waker const& w) -> poll_ready_result<any_error> { return impl_->poll_ready(w); }

  auto call(Req req) -> response_future<Resp, any_error> { return impl_->call(std::move(req)); }

 private:
  struct concept_base {
    virtual ~concept_base() = default;
    virtual auto clone() const -> std::unique_ptr<concept_base> = 0;
    virtual auto poll_ready(waker const& w) -> poll_ready_result<any_error> = 0;
    virtual auto call(Req req) -> response_future<Resp, any_error> = 0;
  };

  template <class S>
  struct model final : concept_base {
    template <class U>
    explicit model(U&& s) : svc(std::forward<U>(s)) {}

    auto clone() const -> std::unique_ptr<concept_base> override {
      return std::make_unique<model>(svc);
    }

    auto poll_ready(waker const& w) -> poll_ready_result<any_error> override {
      auto r = svc.poll_ready(w);
      if (!r) {
        return unexpected(box_error(std::move(r).error()));
      }
      return *r;
    }

    auto call(Req req) -> response_future<Resp, any_error> override {
      if constexpr (std::same_as<call_t<S, Req>, response_future<Resp, any_error>>) {
        return svc.call(std::move(req));
      } else {
        return detail::erase_response<Resp>(svc.call(std::move(req)));
      }
    }

    S svc;
  };

  std::unique_ptr<concept_base> impl_;
};

}  // namespace svcoro
