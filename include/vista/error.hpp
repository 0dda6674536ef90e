#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once released.
 * - Human-readable message and originating component for diagnostics.
 * - Store and query errors are returned synchronously; build errors are captured by
 *   the consistency manager and surfaced through its status.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vista::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  dimension_mismatch = 4001,
  duplicate_id = 4002,
  invalid_k = 4003,
  metric_mismatch = 4004,
  not_found = 6001,
  empty_collection = 6002,
  build_timeout = 7001,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.insert" */
};

/** \brief Stable lowercase name of an error code (used in logs and status output). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::duplicate_id: return "duplicate_id";
    case error_code::invalid_k: return "invalid_k";
    case error_code::metric_mismatch: return "metric_mismatch";
    case error_code::not_found: return "not_found";
    case error_code::empty_collection: return "empty_collection";
    case error_code::build_timeout: return "build_timeout";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace vista::core
