#pragma once

#include <svcoro/any_error.hpp>
#include <svcoro/assert.hpp>
#include <svcoro/error.hpp>
#include <svcoro/result.hpp>
#include <svcoro/service.hpp>
#include <svcoro/this_coro.hpp>
#include <svcoro/waker.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Scriptable service double.
//
// make_mock<Req, Resp>() returns a service and a handle sharing one state. The test drives
// readiness through the handle (allow, close, fail_ready_with) and answers the requests the
// service recorded (next_request, then send_response / send_error).

namespace svcoro::test {

namespace detail {

template <class Req, class Resp>
struct mock_request_state {
  explicit mock_request_state(Req r) : request(std::move(r)) {}

  Req request;
  std::mutex m;
  std::optional<result<Resp>> outcome{};
  waker w{};
  bool future_alive = true;
  bool delivered = false;
};

template <class Req, class Resp>
struct mock_state {
  std::mutex m;
  std::uint64_t budget = std::numeric_limits<std::uint64_t>::max();
  bool closed = false;
  std::optional<any_error> ready_error{};
  std::deque<std::shared_ptr<mock_request_state<Req, Resp>>> requests{};
  std::map<std::uint64_t, waker> parked{};
  std::uint64_t next_id = 0;
  std::size_t calls = 0;
  std::size_t in_flight = 0;
  std::size_t max_in_flight = 0;

  void wake_all() {
    std::vector<waker> to_wake;
    {
      std::scoped_lock lk{m};
      for (auto& [id, w] : parked) {
        to_wake.push_back(std::move(w));
      }
      parked.clear();
    }
    for (auto const& w : to_wake) {
      w.wake();
    }
  }
};

/// Owned by the response future's frame from the moment call() creates it, so it goes away
/// with the future whether or not the future was ever awaited.
template <class Req, class Resp>
struct mock_future_tracker {
  std::shared_ptr<mock_state<Req, Resp>> svc;
  std::shared_ptr<mock_request_state<Req, Resp>> req;

  mock_future_tracker(std::shared_ptr<mock_state<Req, Resp>> s,
                      std::shared_ptr<mock_request_state<Req, Resp>> r)
      : svc(std::move(s)), req(std::move(r)) {
    std::scoped_lock lk{svc->m};
    ++svc->in_flight;
    if (svc->in_flight > svc->max_in_flight) {
      svc->max_in_flight = svc->in_flight;
    }
  }

  mock_future_tracker(mock_future_tracker const&) = delete;
  auto operator=(mock_future_tracker const&) -> mock_future_tracker& = delete;

  mock_future_tracker(mock_future_tracker&& other) noexcept
      : svc(std::move(other.svc)), req(std::move(other.req)) {}
  auto operator=(mock_future_tracker&&) -> mock_future_tracker& = delete;

  ~mock_future_tracker() {
    if (req == nullptr) {
      return;
    }
    {
      std::scoped_lock lk{req->m};
      req->future_alive = false;
    }
    std::scoped_lock lk{svc->m};
    --svc->in_flight;
  }
};

template <class Req, class Resp>
auto await_mock_response(mock_future_tracker<Req, Resp> tracker)
  -> response_future<Resp, any_error> {
  auto req = tracker.req;
  auto ex = co_await this_coro::executor;
  wake_slot slot{ex};
  for (;;) {
    std::optional<result<Resp>> out;
    {
      std::scoped_lock lk{req->m};
      if (req->outcome.has_value()) {
        out = std::move(req->outcome);
        req->outcome.reset();
        req->delivered = true;
      } else {
        req->w = slot.get_waker();
      }
    }
    if (out.has_value()) {
      co_return std::move(*out);
    }
    co_await slot.wait();
  }
}

}  // namespace detail

template <class Req, class Resp>
class mock_handle;

/// A request recorded by a mock_service, waiting for the test to answer it.
template <class Req, class Resp>
class pending_request {
 public:
  explicit pending_request(std::shared_ptr<detail::mock_request_state<Req, Resp>> st)
      : st_(std::move(st)) {}

  auto request() const -> Req const& { return st_->request; }

  void send_response(Resp r) { complete(result<Resp>{std::move(r)}); }

  void send_error(any_error e) { complete(result<Resp>{unexpected(std::move(e))}); }

  /// True once the response future has been destroyed without delivering a result.
  auto canceled() const -> bool {
    std::scoped_lock lk{st_->m};
    return !st_->future_alive && !st_->delivered;
  }

 private:
  void complete(result<Resp> r) {
    waker w{};
    {
      std::scoped_lock lk{st_->m};
      SVCORO_ENSURE(!st_->outcome.has_value() && !st_->delivered,
                    "pending_request: response already sent");
      st_->outcome.emplace(std::move(r));
      w = st_->w;
    }
    w.wake();
  }

  std::shared_ptr<detail::mock_request_state<Req, Resp>> st_;
};

template <class Req, class Resp>
class mock_service {
 public:
  explicit mock_service(std::shared_ptr<detail::mock_state<Req, Resp>> st)
      : st_(std::move(st)), id_(next_id(*st_)) {}

  mock_service(mock_service const& other) : st_(other.st_), id_(next_id(*st_)) {}
  auto operator=(mock_service const&) -> mock_service& = delete;

  mock_service(mock_service&& other) noexcept
      : st_(std::move(other.st_)), id_(other.id_), can_send_(std::exchange(other.can_send_, false)) {}
  auto operator=(mock_service&&) -> mock_service& = delete;

  ~mock_service() {
    if (st_) {
      std::scoped_lock lk{st_->m};
      st_->parked.erase(id_);
    }
  }

  auto poll_ready(waker const& w) -> poll_ready_result<any_error> {
    std::scoped_lock lk{st_->m};
    if (st_->closed) {
      return unexpected(any_error{error::closed});
    }
    if (st_->ready_error.has_value()) {
      auto e = std::move(*st_->ready_error);
      st_->ready_error.reset();
      return unexpected(std::move(e));
    }
    if (can_send_) {
      return readiness::ready;
    }
    if (st_->budget > 0) {
      can_send_ = true;
      return readiness::ready;
    }
    st_->parked.insert_or_assign(id_, w);
    return readiness::pending;
  }

  auto call(Req req) -> response_future<Resp, any_error> {
    std::unique_lock lk{st_->m};
    if (st_->closed) {
      lk.unlock();
      return ready_response<Resp, any_error>(unexpected(any_error{error::closed}));
    }
    SVCORO_ENSURE(can_send_, "mock_service: service not ready; poll_ready must be called first");
    can_send_ = false;
    if (st_->budget != std::numeric_limits<std::uint64_t>::max()) {
      --st_->budget;
    }
    auto r = std::make_shared<detail::mock_request_state<Req, Resp>>(std::move(req));
    st_->requests.push_back(r);
    ++st_->calls;
    lk.unlock();
    return detail::await_mock_response<Req, Resp>(
      detail::mock_future_tracker<Req, Resp>{st_, std::move(r)});
  }

 private:
  static auto next_id(detail::mock_state<Req, Resp>& st) -> std::uint64_t {
    std::scoped_lock lk{st.m};
    return st.next_id++;
  }

  std::shared_ptr<detail::mock_state<Req, Resp>> st_;
  std::uint64_t id_;
  bool can_send_ = false;
};

template <class Req, class Resp>
class mock_handle {
 public:
  explicit mock_handle(std::shared_ptr<detail::mock_state<Req, Resp>> st) : st_(std::move(st)) {}

  /// Let `n` more requests through; further polls answer pending until the next allow().
  void allow(std::uint64_t n) {
    {
      std::scoped_lock lk{st_->m};
      st_->budget = n;
    }
    if (n > 0) {
      st_->wake_all();
    }
  }

  /// Every later poll_ready() fails with `error::closed`.
  void close() {
    {
      std::scoped_lock lk{st_->m};
      st_->closed = true;
    }
    st_->wake_all();
  }

  /// The next poll_ready() fails with `e`.
  void fail_ready_with(any_error e) {
    {
      std::scoped_lock lk{st_->m};
      st_->ready_error.emplace(std::move(e));
    }
    st_->wake_all();
  }

  /// Oldest request not yet taken, if any.
  auto next_request() -> std::optional<pending_request<Req, Resp>> {
    std::scoped_lock lk{st_->m};
    if (st_->requests.empty()) {
      return std::nullopt;
    }
    auto r = std::move(st_->requests.front());
    st_->requests.pop_front();
    return pending_request<Req, Resp>{std::move(r)};
  }

  auto pending_requests() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->requests.size();
  }

  auto calls() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->calls;
  }

  /// Response futures created and not yet destroyed.
  auto in_flight() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->in_flight;
  }

  auto max_in_flight() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->max_in_flight;
  }

  /// Number of service copies parked on a pending poll_ready().
  auto parked() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->parked.size();
  }

 private:
  std::shared_ptr<detail::mock_state<Req, Resp>> st_;
};

template <class Req, class Resp>
auto make_mock() -> std::pair<mock_service<Req, Resp>, mock_handle<Req, Resp>> {
  auto st = std::make_shared<detail::mock_state<Req, Resp>>();
  return {mock_service<Req, Resp>{st}, mock_handle<Req, Resp>{st}};
}

}  // namespace svcoro::test
