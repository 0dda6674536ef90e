#include "vista/core/log.hpp"
#include "vista/core/platform_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace vista::core {

namespace {

auto threshold_from_env() noexcept -> log_level {
  const auto v = getenv_nonempty("VISTA_LOG_LEVEL");
  if (!v) return log_level::warn;
  if (equals_ci(*v, "off")) return log_level::off;
  if (equals_ci(*v, "error")) return log_level::error;
  if (equals_ci(*v, "warn")) return log_level::warn;
  if (equals_ci(*v, "info")) return log_level::info;
  if (equals_ci(*v, "debug")) return log_level::debug;
  return log_level::warn;
}

// -1 = not yet initialized
std::atomic<int> g_threshold{-1};
std::mutex g_write_mutex;

auto level_name(log_level level) noexcept -> std::string_view {
  switch (level) {
    case log_level::error: return "error";
    case log_level::warn: return "warn";
    case log_level::info: return "info";
    case log_level::debug: return "debug";
    case log_level::off: break;
  }
  return "off";
}

} // anonymous namespace

auto log_threshold() noexcept -> log_level {
  int t = g_threshold.load(std::memory_order_acquire);
  if (t < 0) {
    int expected = -1;
    const int fresh = static_cast<int>(threshold_from_env());
    g_threshold.compare_exchange_strong(expected, fresh, std::memory_order_acq_rel);
    t = g_threshold.load(std::memory_order_acquire);
  }
  return static_cast<log_level>(t);
}

auto set_log_threshold(log_level level) noexcept -> void {
  g_threshold.store(static_cast<int>(level), std::memory_order_release);
}

auto log_line(log_level level, std::string_view component, std::string_view message) -> void {
  if (!log_enabled(level)) return;
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << "[VISTA][" << component << "][" << level_name(level) << "] " << message << '\n';
}

} // namespace vista::core
