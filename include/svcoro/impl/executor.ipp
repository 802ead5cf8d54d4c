#include <svcoro/assert.hpp>
#include <svcoro/detail/executor_guard.hpp>
#include <svcoro/detail/io_context_impl.hpp>
#include <svcoro/executor.hpp>

#include <utility>

namespace svcoro {

auto executor::ensure_impl() const -> detail::io_context_impl& {
  SVCORO_ENSURE(impl_ != nullptr, "executor: empty impl");
  return *impl_;
}

void executor::post(detail::unique_function<void()> f) const {
  auto& impl = ensure_impl();
  impl.post([ex = *this, fn = std::move(f)]() mutable {
    detail::executor_guard g{ex};
    fn();
  });
}

void executor::dispatch(detail::unique_function<void()> f) const {
  auto& impl = ensure_impl();
  if (impl.running_in_this_thread() && !impl.stopped()) {
    detail::executor_guard g{*this};
    f();
    return;
  }
  post(std::move(f));
}

auto executor::schedule_timer(clock::time_point at, detail::unique_function<void()> f) const
  -> timer_handle {
  auto& impl = ensure_impl();
  auto entry = impl.schedule_timer(at, [ex = *this, fn = std::move(f)]() mutable {
    detail::executor_guard g{ex};
    fn();
  });
  return timer_handle{std::move(entry)};
}

auto executor::stopped() const noexcept -> bool { return impl_ == nullptr || impl_->stopped(); }

auto executor::running_in_this_thread() const noexcept -> bool {
  return impl_ != nullptr && impl_->running_in_this_thread();
}

void executor::add_work_guard() const noexcept {
  if (impl_ != nullptr) {
    impl_->add_work_guard();
  }
}

void executor::remove_work_guard() const noexcept {
  if (impl_ != nullptr) {
    impl_->remove_work_guard();
  }
}

}  // namespace svcoro
