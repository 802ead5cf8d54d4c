#include <svcoro/assert.hpp>
#include <svcoro/detail/io_context_impl.hpp>

#include <limits>
#include <utility>

namespace svcoro::detail {

io_context_impl::thread_token::thread_token(io_context_impl& c) noexcept : ctx(&c) {
  auto const self = std::this_thread::get_id();
  auto const prev = ctx->thread_id_.exchange(self, std::memory_order_acq_rel);
  SVCORO_ENSURE(prev == std::thread::id{} || prev == self,
                "io_context: concurrent run() is not allowed");
}

io_context_impl::thread_token::~thread_token() {
  ctx->thread_id_.store(std::thread::id{}, std::memory_order_release);
}

auto io_context_impl::run() -> std::size_t {
  thread_token tok{*this};
  std::size_t n = 0;
  while (do_one(std::nullopt, true) != 0) {
    if (n != std::numeric_limits<std::size_t>::max()) {
      ++n;
    }
  }
  return n;
}

auto io_context_impl::run_one() -> std::size_t {
  thread_token tok{*this};
  return do_one(std::nullopt, true);
}

auto io_context_impl::run_for(std::chrono::milliseconds timeout) -> std::size_t {
  thread_token tok{*this};
  auto const now = clock::now();
  auto const headroom =
    std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
  auto const deadline = timeout >= headroom ? clock::time_point::max() : now + timeout;
  std::size_t n = 0;
  while (do_one(deadline, true) != 0) {
    ++n;
  }
  return n;
}

auto io_context_impl::poll() -> std::size_t {
  thread_token tok{*this};
  std::size_t n = 0;
  while (do_one(std::nullopt, false) != 0) {
    ++n;
  }
  return n;
}

auto io_context_impl::poll_one() -> std::size_t {
  thread_token tok{*this};
  return do_one(std::nullopt, false);
}

void io_context_impl::stop() noexcept {
  {
    std::scoped_lock lk{mtx_};
    stopped_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

void io_context_impl::restart() noexcept { stopped_.store(false, std::memory_order_release); }

void io_context_impl::post(unique_function<void()> f) {
  {
    std::scoped_lock lk{mtx_};
    if (shut_down_) {
      return;
    }
    posted_.push_back(std::move(f));
  }
  cv_.notify_one();
}

auto io_context_impl::schedule_timer(clock::time_point expiry, unique_function<void()> cb)
  -> std::shared_ptr<timer_entry> {
  auto entry = std::make_shared<timer_entry>();
  entry->expiry = expiry;
  entry->callback = std::move(cb);
  bool rejected = false;
  {
    std::scoped_lock lk{mtx_};
    entry->id = next_timer_id_++;
    rejected = shut_down_;
    if (!rejected) {
      timers_.push(entry);
    }
  }
  if (rejected) {
    if (entry->cancel()) {
      entry->callback = nullptr;
    }
    return entry;
  }
  cv_.notify_one();
  return entry;
}

void io_context_impl::add_work_guard() noexcept {
  work_guard_count_.fetch_add(1, std::memory_order_acq_rel);
}

void io_context_impl::remove_work_guard() noexcept {
  auto const old = work_guard_count_.fetch_sub(1, std::memory_order_acq_rel);
  SVCORO_ASSERT(old > 0);
  if (old == 1) {
    std::scoped_lock lk{mtx_};
    cv_.notify_all();
  }
}

auto io_context_impl::running_in_this_thread() const noexcept -> bool {
  return thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

void io_context_impl::shutdown() noexcept {
  stopped_.store(true, std::memory_order_release);
  std::deque<unique_function<void()>> posted;
  std::vector<std::shared_ptr<timer_entry>> timers;
  {
    std::scoped_lock lk{mtx_};
    shut_down_ = true;
    posted.swap(posted_);
    while (!timers_.empty()) {
      timers.push_back(timers_.top());
      timers_.pop();
    }
  }
  for (auto& t : timers) {
    if (t->cancel()) {
      t->callback = nullptr;
    }
  }
  // Handlers are destroyed here, outside the lock.
}

void io_context_impl::purge_cancelled_timers_locked() {
  while (!timers_.empty() && timers_.top()->is_cancelled()) {
    timers_.pop();
  }
}

auto io_context_impl::do_one(std::optional<clock::time_point> limit, bool block)
  -> std::size_t {
  for (;;) {
    unique_function<void()> task;
    std::shared_ptr<timer_entry> timer;
    {
      std::unique_lock lk{mtx_};
      for (;;) {
        if (stopped()) {
          return 0;
        }

        purge_cancelled_timers_locked();
        auto const now = clock::now();
        bool const timer_due = !timers_.empty() && timers_.top()->expiry <= now;
        bool const have_posted = !posted_.empty();

        // Alternate between the two sources so neither can starve the other.
        if (timer_due && (prefer_timers_ || !have_posted)) {
          timer = timers_.top();
          timers_.pop();
          prefer_timers_ = false;
          break;
        }
        if (have_posted) {
          task = std::move(posted_.front());
          posted_.pop_front();
          prefer_timers_ = true;
          break;
        }

        if (!block) {
          return 0;
        }
        bool const has_timers = !timers_.empty();
        if (!has_timers && work_guard_count_.load(std::memory_order_acquire) == 0) {
          return 0;
        }
        if (limit.has_value() && now >= *limit) {
          return 0;
        }

        auto until = has_timers ? timers_.top()->expiry : clock::time_point::max();
        if (limit.has_value() && *limit < until) {
          until = *limit;
        }
        if (until == clock::time_point::max()) {
          cv_.wait(lk);
        } else {
          cv_.wait_until(lk, until);
        }
      }
    }

    if (task) {
      task();
      return 1;
    }

    // Lost the race against cancel(): nothing ran, look for the next handler.
    if (!timer->mark_fired()) {
      continue;
    }
    auto cb = std::move(timer->callback);
    timer->callback = nullptr;
    if (cb) {
      cb();
    }
    return 1;
  }
}

}  // namespace svcoro::detail
