#pragma once

/**
 * \file config.hpp
 * \brief Collection configuration: defaults, environment overrides and validation.
 *
 * Environment overrides (malformed values are ignored and logged at warn):
 * - VISTA_INDEX_STRATEGY     exact | partitioned
 * - VISTA_NUM_PARTITIONS     partition count for the partitioned strategy
 * - VISTA_PROBE_COUNT        partitions probed per query
 * - VISTA_MAX_PENDING        pending mutations that trigger a rebuild
 * - VISTA_MAX_STALENESS_MS   maximum time dirty before a rebuild
 * - VISTA_BUILD_TIMEOUT_MS   deadline per build attempt
 * - VISTA_BUILD_RETRIES      retries after a failed build
 */

#include <cstddef>
#include <expected>

#include "vista/consistency/consistency_manager.hpp"
#include "vista/error.hpp"
#include "vista/index/index_config.hpp"
#include "vista/metric.hpp"

namespace vista {

/** \brief Everything needed to create a collection. */
struct collection_config {
  std::size_t dimension{0};                 /**< embedding length, fixed for the collection */
  Metric metric{Metric::Euclidean};         /**< copied into index.metric on create */
  index::IndexBuildConfig index;            /**< strategy and build parameters */
  consistency::ConsistencyConfig consistency;
};

/** \brief Apply VISTA_* environment overrides in place. */
auto apply_env_overrides(collection_config& config) -> void;

/**
 * \brief Reject configurations no collection can serve.
 * Errors: config_invalid for dimension 0, zero partitions, zero probe count,
 * probe count above the partition count, or a negative timeout.
 */
auto validate(const collection_config& config) -> std::expected<void, core::error>;

} // namespace vista
