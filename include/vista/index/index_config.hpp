#pragma once

/** \file index_config.hpp
 *  \brief Index strategy selection and build parameters.
 */

#include <cstdint>
#include <string_view>

#include "vista/metric.hpp"

namespace vista::index {

/** \brief Index strategy. Values are persisted; do not renumber. */
enum class IndexStrategy : std::uint8_t {
    Exact = 0,        /**< Flat scan over all vectors; correctness oracle */
    Partitioned = 1,  /**< k-means inverted lists, probe a subset per query */
};

constexpr auto to_string(IndexStrategy s) noexcept -> std::string_view {
    switch (s) {
        case IndexStrategy::Exact: return "exact";
        case IndexStrategy::Partitioned: return "partitioned";
    }
    return "unknown";
}

/** \brief Build configuration; a snapshot is a pure function of (records, config). */
struct IndexBuildConfig {
    IndexStrategy strategy{IndexStrategy::Exact};
    Metric metric{Metric::Euclidean};
    std::uint32_t num_partitions{16};  /**< Partition (centroid) count; clamped to n */
    std::uint32_t probe_count{4};      /**< Partitions scanned per query */
    std::uint32_t max_iter{25};        /**< Max Lloyd iterations */
    float epsilon{1e-4f};              /**< Relative inertia change for convergence */
    std::uint32_t seed{42};            /**< Random seed for reproducibility */
    bool verbose{false};               /**< Build progress output (debug log level) */
};

} // namespace vista::index
