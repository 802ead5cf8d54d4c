#pragma once

#include <svcoro/detail/io_context_impl.hpp>
#include <svcoro/executor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace svcoro {

/// Owns an event loop and hands out executors bound to it.
///
/// Exactly one thread at a time may be inside a run function. Executors obtained from the
/// context keep the loop state alive, but handlers only make progress while some thread runs
/// the context. Destroying the context discards queued handlers without running them.
class io_context {
 public:
  io_context() : impl_(std::make_shared<detail::io_context_impl>()) {}

  ~io_context() { impl_->shutdown(); }

  io_context(io_context const&) = delete;
  auto operator=(io_context const&) -> io_context& = delete;
  io_context(io_context&&) = delete;
  auto operator=(io_context&&) -> io_context& = delete;

  /// Run until stopped or until no queued handlers, pending timers or work guards remain.
  auto run() -> std::size_t { return impl_->run(); }

  /// Run at most one handler, blocking until one is available.
  auto run_one() -> std::size_t { return impl_->run_one(); }

  /// Like run(), but give up once `timeout` has passed.
  template <class Rep, class Period>
  auto run_for(std::chrono::duration<Rep, Period> timeout) -> std::size_t {
    return impl_->run_for(std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
  }

  /// Run every handler that is ready now without blocking.
  auto poll() -> std::size_t { return impl_->poll(); }
  auto poll_one() -> std::size_t { return impl_->poll_one(); }

  void stop() noexcept { impl_->stop(); }
  void restart() noexcept { impl_->restart(); }
  auto stopped() const noexcept -> bool { return impl_->stopped(); }

  auto get_executor() const noexcept -> executor { return executor{impl_}; }

 private:
  std::shared_ptr<detail::io_context_impl> impl_;
};

}  // namespace svcoro
