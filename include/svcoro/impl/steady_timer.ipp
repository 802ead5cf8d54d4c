#include <svcoro/assert.hpp>
#include <svcoro/detail/clock.hpp>
#include <svcoro/error.hpp>
#include <svcoro/steady_timer.hpp>

#include <coroutine>
#include <memory>
#include <mutex>
#include <utility>

namespace svcoro::detail {

/// Shared between the steady_timer, its armed timer callback and the suspended waiter.
/// Exactly one outcome (fire or cancel) is recorded; the waiter is resumed from a posted
/// handler, and only if it still exists then.
class timer_waiter : public std::enable_shared_from_this<timer_waiter> {
 public:
  explicit timer_waiter(executor ex) : ex_(std::move(ex)) {}

  auto finish(std::error_code ec) -> bool {
    {
      std::scoped_lock lk{mtx_};
      if (finished_) {
        return false;
      }
      finished_ = true;
      result_ = ec;
      (void)armed_.cancel();
    }
    ex_.post([self = shared_from_this()] {
      std::coroutine_handle<> h;
      {
        std::scoped_lock lk{self->mtx_};
        h = std::exchange(self->suspended_, {});
      }
      if (h) {
        h.resume();
      }
    });
    return true;
  }

  void suspend(std::coroutine_handle<> h, steady_timer::time_point at) {
    std::weak_ptr<timer_waiter> weak = weak_from_this();
    auto armed = ex_.schedule_timer(at, [weak] {
      if (auto self = weak.lock()) {
        (void)self->finish({});
      }
    });
    std::scoped_lock lk{mtx_};
    suspended_ = h;
    armed_ = std::move(armed);
  }

  /// The waiting frame is being destroyed.
  void abandon() noexcept {
    std::scoped_lock lk{mtx_};
    suspended_ = {};
    (void)armed_.cancel();
  }

  auto result() -> std::error_code {
    std::scoped_lock lk{mtx_};
    return result_;
  }

 private:
  executor ex_;
  std::mutex mtx_;
  std::coroutine_handle<> suspended_{};
  timer_handle armed_{};
  std::error_code result_{};
  bool finished_ = false;
};

namespace {

class timer_wait_op {
 public:
  timer_wait_op(std::shared_ptr<timer_waiter> w, steady_timer::time_point at)
      : waiter_(std::move(w)), at_(at) {}
  timer_wait_op(timer_wait_op const&) = delete;
  auto operator=(timer_wait_op const&) -> timer_wait_op& = delete;
  timer_wait_op(timer_wait_op&&) noexcept = default;
  ~timer_wait_op() {
    if (waiter_) {
      waiter_->abandon();
    }
  }

  auto await_ready() const noexcept -> bool { return false; }
  void await_suspend(std::coroutine_handle<> h) { waiter_->suspend(h, at_); }
  auto await_resume() -> std::error_code { return waiter_->result(); }

 private:
  std::shared_ptr<timer_waiter> waiter_;
  steady_timer::time_point at_;
};

}  // namespace

}  // namespace svcoro::detail

namespace svcoro {

steady_timer::steady_timer(executor ex) noexcept : ex_(std::move(ex)), expiry_(clock::now()) {}

steady_timer::steady_timer(executor ex, time_point at) noexcept
    : ex_(std::move(ex)), expiry_(at) {}

steady_timer::steady_timer(executor ex, duration after) noexcept
    : ex_(std::move(ex)), expiry_(detail::deadline_after(after)) {}

steady_timer::~steady_timer() { (void)cancel(); }

auto steady_timer::expires_at(time_point at) noexcept -> std::size_t {
  expiry_ = at;
  return cancel();
}

auto steady_timer::expires_after(duration d) noexcept -> std::size_t {
  expiry_ = detail::deadline_after(d);
  return cancel();
}

auto steady_timer::async_wait() -> awaitable<std::error_code> {
  SVCORO_ENSURE(ex_, "steady_timer::async_wait: requires a bound executor");
  SVCORO_ENSURE(wait_.expired(), "steady_timer::async_wait: a wait is already pending");

  if (ex_.stopped()) {
    co_return error::operation_aborted;
  }

  auto waiter = std::make_shared<detail::timer_waiter>(ex_);
  wait_ = waiter;
  co_return co_await detail::timer_wait_op{std::move(waiter), expiry_};
}

auto steady_timer::cancel() noexcept -> std::size_t {
  auto waiter = std::exchange(wait_, {}).lock();
  return waiter && waiter->finish(error::operation_aborted) ? 1 : 0;
}

}  // namespace svcoro
