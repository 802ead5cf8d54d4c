#include <svcoro/log.hpp>

#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

namespace svcoro {

namespace {

std::atomic<log_level> g_level{log_level::warn};

// Installed sink. Swapped under `registry_mutex`; writers take a reference and call it
// without that lock held.
auto registry_mutex() -> std::mutex& {
  static std::mutex m;
  return m;
}

auto sink_slot() -> std::shared_ptr<log_sink const>& {
  static std::shared_ptr<log_sink const> sink{};
  return sink;
}

auto current_sink() -> std::shared_ptr<log_sink const> {
  std::scoped_lock lk{registry_mutex()};
  return sink_slot();
}

// Serializes sink calls.
auto write_mutex() -> std::mutex& {
  static std::mutex m;
  return m;
}

// Set while this thread is inside a sink.
thread_local bool in_sink = false;

void stderr_sink(log_level lvl, std::string_view msg) {
  fmt::print(stderr, "[svcoro] {}: {}\n", to_string(lvl), msg);
}

}  // namespace

auto to_string(log_level lvl) noexcept -> std::string_view {
  switch (lvl) {
    case log_level::trace:
      return "trace";
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warn:
      return "warn";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
  }
  return "unknown";
}

void set_log_level(log_level lvl) noexcept { g_level.store(lvl, std::memory_order_relaxed); }

auto get_log_level() noexcept -> log_level { return g_level.load(std::memory_order_relaxed); }

void set_log_sink(log_sink sink) {
  auto next = sink ? std::make_shared<log_sink const>(std::move(sink)) : nullptr;
  std::scoped_lock lk{registry_mutex()};
  sink_slot().swap(next);
}

void reset_log_sink() { set_log_sink(nullptr); }

namespace detail {

void write_log(log_level lvl, std::string_view msg) {
  // A line logged from inside a sink goes straight to stderr.
  if (in_sink) {
    stderr_sink(lvl, msg);
    return;
  }

  auto sink = current_sink();
  if (!sink) {
    stderr_sink(lvl, msg);
    return;
  }

  std::scoped_lock lk{write_mutex()};
  in_sink = true;
  struct reset_flag {
    ~reset_flag() { in_sink = false; }
  } reset;
  (*sink)(lvl, msg);
}

}  // namespace detail

}  // namespace svcoro
