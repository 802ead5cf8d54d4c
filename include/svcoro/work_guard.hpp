#pragma once

#include <svcoro/executor.hpp>

#include <utility>

namespace svcoro {

/// Keeps an io_context's run() from returning while the guard is alive, even with no
/// queued work.
class work_guard {
 public:
  explicit work_guard(executor ex) noexcept : ex_(std::move(ex)), owns_(true) {
    ex_.add_work_guard();
  }

  work_guard(work_guard const&) = delete;
  auto operator=(work_guard const&) -> work_guard& = delete;

  work_guard(work_guard&& other) noexcept
      : ex_(std::move(other.ex_)), owns_(std::exchange(other.owns_, false)) {}
  auto operator=(work_guard&& other) noexcept -> work_guard& {
    if (this != &other) {
      reset();
      ex_ = std::move(other.ex_);
      owns_ = std::exchange(other.owns_, false);
    }
    return *this;
  }

  ~work_guard() { reset(); }

  void reset() noexcept {
    if (std::exchange(owns_, false)) {
      ex_.remove_work_guard();
    }
  }

  auto get_executor() const noexcept -> executor { return ex_; }
  auto owns_work() const noexcept -> bool { return owns_; }

 private:
  executor ex_;
  bool owns_ = false;
};

}  // namespace svcoro
