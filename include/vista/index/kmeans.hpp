#pragma once

/** \file kmeans.hpp
 *  \brief K-means clustering used to partition vectors into inverted lists.
 *
 * Implements k-means++ initialization and Lloyd's algorithm.
 * Features:
 * - K-means++ seeding for better initial centroids
 * - Early stopping on relative inertia change
 * - Cooperative cancellation / deadline through BuildControl
 *
 * Thread-safety: Training is internally parallelized (OpenMP) but not re-entrant
 * on shared outputs.
 * Determinism: Fixed seed produces identical centroids and assignments.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "vista/error.hpp"
#include "vista/index/build_control.hpp"

namespace vista::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{16};                 /**< Number of clusters */
    std::uint32_t max_iter{25};          /**< Maximum iterations */
    float epsilon{1e-4f};                /**< Convergence threshold */
    std::uint32_t seed{42};              /**< Random seed */
    bool verbose{false};                 /**< Progress output */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< Cluster centers [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    std::vector<std::uint32_t> cluster_sizes;   /**< Points per cluster [k] */
    float inertia{0.0f};                        /**< Sum of squared distances */
    std::uint32_t iterations{0};                /**< Iterations performed */
};

/** \brief K-means clustering algorithm.
 *
 * \param data Input vectors [n x dim], row-major
 * \param n Number of vectors
 * \param dim Vector dimensionality
 * \param params Clustering parameters
 * \param control Cancellation / deadline, checked per seeded centroid and per iteration
 * \return Clustering result or error (precondition_failed, cancelled, build_timeout)
 *
 * Preconditions: 0 < k <= n; data contains finite values
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params, const BuildControl& control = {})
    -> std::expected<KmeansResult, core::error>;

/** \brief K-means++ initialization.
 *
 * Selects initial centroids with probability proportional to squared distance.
 * `control` is checked before each centroid after the first.
 * Complexity: O(n * k * dim)
 */
auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed, const BuildControl& control = {})
    -> std::expected<std::vector<std::vector<float>>, core::error>;

/** \brief Assign points to nearest centroids (ties to the lower centroid index).
 *
 * \return Total inertia (sum of squared distances)
 */
auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float;

/** \brief Recompute centroids as the mean of their members; empty clusters keep their center. */
auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void;

} // namespace vista::index
