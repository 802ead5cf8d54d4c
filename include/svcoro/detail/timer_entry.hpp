#pragma once

#include <svcoro/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace svcoro::detail {

/// One scheduled callback, shared by the context's timer heap and any `timer_handle`.
///
/// The context fills in `id`, `expiry` and `callback` before publishing the entry. After
/// that the state only ever leaves `pending` once; the side that moves it owns `callback`.
struct timer_entry {
  enum class phase : std::uint8_t { pending, fired, cancelled };

  std::uint64_t id{};
  std::chrono::steady_clock::time_point expiry{};
  unique_function<void()> callback{};

  timer_entry() = default;
  timer_entry(timer_entry const&) = delete;
  auto operator=(timer_entry const&) -> timer_entry& = delete;

  auto current() const noexcept -> phase { return phase_.load(std::memory_order_acquire); }

  auto is_pending() const noexcept -> bool { return current() == phase::pending; }
  auto is_fired() const noexcept -> bool { return current() == phase::fired; }
  auto is_cancelled() const noexcept -> bool { return current() == phase::cancelled; }

  auto mark_fired() noexcept -> bool { return leave_pending(phase::fired); }
  auto cancel() noexcept -> bool { return leave_pending(phase::cancelled); }

 private:
  auto leave_pending(phase to) noexcept -> bool {
    auto from = phase::pending;
    return phase_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
  }

  std::atomic<phase> phase_{phase::pending};
};

/// Max-heap ordering that puts the earliest deadline on top; ties go to the older entry.
struct timer_entry_later {
  auto operator()(std::shared_ptr<timer_entry> const& a,
                  std::shared_ptr<timer_entry> const& b) const noexcept -> bool {
    return a->expiry != b->expiry ? a->expiry > b->expiry : a->id > b->id;
  }
};

}  // namespace svcoro::detail
