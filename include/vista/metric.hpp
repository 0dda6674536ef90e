#pragma once

/** \file metric.hpp
 *  \brief Distance metric selection shared by the builder, query engine and persistence.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "vista/core/platform_utils.hpp"
#include "vista/error.hpp"

namespace vista {

/** \brief Metric fixed per collection. Values are persisted; do not renumber. */
enum class Metric : std::uint8_t {
  Euclidean = 0,   /**< sqrt(sum((a-b)^2)) */
  Cosine = 1,      /**< 1 - cos(a, b) */
  DotProduct = 2,  /**< -(a . b), so that smaller is closer */
};

constexpr auto to_string(Metric m) noexcept -> std::string_view {
  switch (m) {
    case Metric::Euclidean: return "euclidean";
    case Metric::Cosine: return "cosine";
    case Metric::DotProduct: return "dot_product";
  }
  return "unknown";
}

/** \brief Parse a metric name; also accepts the short forms "l2" and "ip". */
inline auto parse_metric(std::string_view s) -> std::expected<Metric, core::error> {
  if (core::equals_ci(s, "euclidean") || core::equals_ci(s, "l2")) return Metric::Euclidean;
  if (core::equals_ci(s, "cosine")) return Metric::Cosine;
  if (core::equals_ci(s, "dot_product") || core::equals_ci(s, "dot") || core::equals_ci(s, "ip")) {
    return Metric::DotProduct;
  }
  return core::make_unexpected(core::error_code::config_invalid,
                               "unknown metric '" + std::string(s) + "'", "metric");
}

/** \brief True for values decoded from persisted bytes. */
constexpr auto is_valid_metric(std::uint8_t raw) noexcept -> bool { return raw <= 2; }

} // namespace vista
