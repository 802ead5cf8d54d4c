#pragma once

#include <svcoro/concurrency_limit.hpp>
#include <svcoro/layer.hpp>
#include <svcoro/load_shed.hpp>
#include <svcoro/map.hpp>
#include <svcoro/timeout.hpp>

#include <chrono>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace svcoro {

/// Assembles a chain of layers into a single one.
///
/// Layers added first end up outermost: a request passes through them before the ones added
/// after. `service(s)` wraps `s` in the whole chain.
///
/// \code
///   auto svc = service_builder{}
///                .load_shed()
///                .concurrency_limit(64)
///                .timeout(std::chrono::seconds{1})
///                .service(std::move(leaf));
/// \endcode
template <class L = identity_layer>
class service_builder {
 public:
  service_builder() = default;
  explicit service_builder(L l) : layer_(std::move(l)) {}

  template <class Next>
  auto layer(Next next) const -> service_builder<stack<Next, L>> {
    return service_builder<stack<Next, L>>{stack<Next, L>{std::move(next), layer_}};
  }

  auto timeout(std::chrono::steady_clock::duration d) const {
    return layer(timeout_layer{d});
  }

  auto concurrency_limit(std::size_t max) const {
    return layer(concurrency_limit_layer{max});
  }

  auto load_shed() const { return layer(load_shed_layer{}); }

  template <class F>
  auto map_request(F f) const {
    return layer(map_request_layer<F>{std::move(f)});
  }

  template <class F>
  auto map_response(F f) const {
    return layer(map_response_layer<F>{std::move(f)});
  }

  template <class F>
  auto map_err(F f) const {
    return layer(map_err_layer<F>{std::move(f)});
  }

  auto into_inner() const -> L { return layer_; }

  template <class S>
    requires layer_for<L, S>
  auto service(S s) const {
    return layer_.layer(std::move(s));
  }

 private:
  L layer_{};
};

}  // namespace svcoro
