#pragma once

#include <svcoro/detail/timer_entry.hpp>
#include <svcoro/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace svcoro::detail {

/// Single-threaded event loop: a posted-task queue plus a timer heap.
///
/// Any thread may post or schedule timers. Handlers run only on the thread currently inside
/// one of the run functions. The loop blocks on a condition variable while idle; it returns
/// once nothing is queued, no timer is pending and no work guard is held.
class io_context_impl {
 public:
  using clock = std::chrono::steady_clock;

  io_context_impl() = default;
  ~io_context_impl() = default;

  io_context_impl(io_context_impl const&) = delete;
  auto operator=(io_context_impl const&) -> io_context_impl& = delete;
  io_context_impl(io_context_impl&&) = delete;
  auto operator=(io_context_impl&&) -> io_context_impl& = delete;

  auto run() -> std::size_t;
  auto run_one() -> std::size_t;
  auto run_for(std::chrono::milliseconds timeout) -> std::size_t;
  auto poll() -> std::size_t;
  auto poll_one() -> std::size_t;

  void stop() noexcept;
  void restart() noexcept;
  auto stopped() const noexcept -> bool { return stopped_.load(std::memory_order_acquire); }

  void post(unique_function<void()> f);

  auto schedule_timer(clock::time_point expiry, unique_function<void()> cb)
    -> std::shared_ptr<timer_entry>;

  void add_work_guard() noexcept;
  void remove_work_guard() noexcept;

  auto running_in_this_thread() const noexcept -> bool;

  /// Drop every queued handler and timer without running them. Later posts and timers are
  /// discarded as they arrive.
  void shutdown() noexcept;

 private:
  struct thread_token {
    io_context_impl* ctx;
    explicit thread_token(io_context_impl& c) noexcept;
    ~thread_token();
    thread_token(thread_token const&) = delete;
    auto operator=(thread_token const&) -> thread_token& = delete;
  };

  /// Run at most one handler. Blocks while `block` is set and work remains, up to `limit`.
  auto do_one(std::optional<clock::time_point> limit, bool block) -> std::size_t;

  void purge_cancelled_timers_locked();

  mutable std::mutex mtx_;
  std::condition_variable cv_;

  std::deque<unique_function<void()>> posted_;
  std::priority_queue<std::shared_ptr<timer_entry>, std::vector<std::shared_ptr<timer_entry>>,
                      timer_entry_later>
    timers_;
  std::uint64_t next_timer_id_ = 0;
  bool prefer_timers_ = false;
  bool shut_down_ = false;

  std::atomic<bool> stopped_{false};
  std::atomic<std::size_t> work_guard_count_{0};
  std::atomic<std::thread::id> thread_id_{};
};

}  // namespace svcoro::detail
