#pragma once

/** \file log.hpp
 *  \brief Minimal leveled logger writing tagged lines to stderr.
 *
 * Output format: `[VISTA][<component>][<level>] <message>`.
 * The threshold is read once from VISTA_LOG_LEVEL (error|warn|info|debug|off);
 * the default is warn. Writers are serialized so lines never interleave.
 */

#include <sstream>
#include <string>
#include <string_view>

namespace vista::core {

enum class log_level : int { off = 0, error = 1, warn = 2, info = 3, debug = 4 };

/** \brief Current threshold (initialized lazily from the environment). */
auto log_threshold() noexcept -> log_level;

/** \brief Override the threshold; mainly for tests and tools. */
auto set_log_threshold(log_level level) noexcept -> void;

[[nodiscard]] inline auto log_enabled(log_level level) noexcept -> bool {
  return level != log_level::off &&
         static_cast<int>(level) <= static_cast<int>(log_threshold());
}

/** \brief Emit one line if `level` passes the threshold. */
auto log_line(log_level level, std::string_view component, std::string_view message) -> void;

/** \brief Stream-style helper: `log_fmt(log_level::info, "consistency", "swap v=", v)`. */
template <typename... Args>
auto log_fmt(log_level level, std::string_view component, const Args&... args) -> void {
  if (!log_enabled(level)) return;
  std::ostringstream oss;
  (oss << ... << args);
  log_line(level, component, oss.str());
}

} // namespace vista::core
