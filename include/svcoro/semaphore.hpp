#pragma once

#include <svcoro/waker.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace svcoro {

namespace detail {

struct semaphore_waiter {
  waker w{};
  bool granted = false;
};

struct semaphore_state {
  explicit semaphore_state(std::size_t n) : permits(n), max(n) {}

  std::mutex m;
  std::size_t permits;
  std::size_t const max;
  // FIFO. Invariant: `permits > 0` implies no waiter is queued.
  std::deque<std::shared_ptr<semaphore_waiter>> waiters{};

  /// Return one permit: hand it to the oldest waiter if there is one, else to the pool.
  void release() {
    waker to_wake{};
    {
      std::scoped_lock lk{m};
      if (waiters.empty()) {
        ++permits;
        return;
      }
      auto next = std::move(waiters.front());
      waiters.pop_front();
      next->granted = true;
      to_wake = next->w;
    }
    to_wake.wake();
  }
};

}  // namespace detail

/// Counting semaphore polled through wakers.
///
/// Copies share the permit pool. Each copy owns its own place in the wait queue, so two copies
/// polled from different coroutines queue independently. Permits are granted strictly in
/// queue order: a release hands the permit to the oldest waiter before anyone else can take it.
class semaphore {
 public:
  /// One acquired unit of capacity. Returned to the pool on destruction.
  class permit {
   public:
    permit() noexcept = default;
    explicit permit(std::shared_ptr<detail::semaphore_state> st) noexcept
        : st_(std::move(st)) {}

    permit(permit const&) = delete;
    auto operator=(permit const&) -> permit& = delete;

    permit(permit&& other) noexcept : st_(std::move(other.st_)) {}
    auto operator=(permit&& other) noexcept -> permit& {
      if (this != &other) {
        reset();
        st_ = std::move(other.st_);
      }
      return *this;
    }

    ~permit() { reset(); }

    void reset() {
      if (auto st = std::exchange(st_, nullptr)) {
        st->release();
      }
    }

    explicit operator bool() const noexcept { return st_ != nullptr; }

   private:
    std::shared_ptr<detail::semaphore_state> st_{};
  };

  explicit semaphore(std::size_t permits)
      : st_(std::make_shared<detail::semaphore_state>(permits)) {}

  semaphore(semaphore const& other) : st_(other.st_) {}
  auto operator=(semaphore const& other) -> semaphore& {
    if (this != &other) {
      abandon();
      st_ = other.st_;
    }
    return *this;
  }

  semaphore(semaphore&& other) noexcept
      : st_(std::move(other.st_)), node_(std::move(other.node_)) {}
  auto operator=(semaphore&& other) noexcept -> semaphore& {
    if (this != &other) {
      abandon();
      st_ = std::move(other.st_);
      node_ = std::move(other.node_);
    }
    return *this;
  }

  ~semaphore() { abandon(); }

  /// Try to take a permit. On failure this copy joins (or stays in) the wait queue and `w` is
  /// woken once a permit has been set aside for it; poll again to collect it.
  auto poll_acquire(waker const& w) -> std::optional<permit> {
    std::scoped_lock lk{st_->m};
    if (node_ != nullptr) {
      if (node_->granted) {
        node_.reset();
        return permit{st_};
      }
      node_->w = w;
      return std::nullopt;
    }
    if (st_->permits > 0) {
      --st_->permits;
      return permit{st_};
    }
    node_ = std::make_shared<detail::semaphore_waiter>();
    node_->w = w;
    st_->waiters.push_back(node_);
    return std::nullopt;
  }

  auto available_permits() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->permits;
  }

  auto max_permits() const noexcept -> std::size_t { return st_->max; }

  /// Number of copies currently queued for a permit.
  auto waiting() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->waiters.size();
  }

 private:
  /// Leave the wait queue. A permit already set aside for this copy is passed on.
  void abandon() {
    if (st_ == nullptr || node_ == nullptr) {
      return;
    }
    auto node = std::exchange(node_, nullptr);
    bool granted = false;
    {
      std::scoped_lock lk{st_->m};
      granted = node->granted;
      if (!granted) {
        std::erase(st_->waiters, node);
      }
    }
    if (granted) {
      st_->release();
    }
  }

  std::shared_ptr<detail::semaphore_state> st_;
  std::shared_ptr<detail::semaphore_waiter> node_{};
};

}  // namespace svcoro
