#include "vista/index/kmeans.hpp"
#include "vista/core/log.hpp"
#include "vista/kernels/distance.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <random>
#include <utility>

namespace vista::index {

namespace {

/** \brief Find nearest centroid for a point; lower index wins ties. */
auto find_nearest_centroid(const float* point,
                           const std::vector<std::vector<float>>& centroids,
                           std::size_t dim) -> std::pair<std::uint32_t, float> {
    std::uint32_t best_idx = 0;
    float best_dist = std::numeric_limits<float>::max();

    for (std::uint32_t i = 0; i < centroids.size(); ++i) {
        const float dist = kernels::l2_sq(std::span(point, dim), centroids[i]);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }

    return {best_idx, best_dist};
}

} // anonymous namespace

auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed, const BuildControl& control)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    std::vector<std::vector<float>> centroids;
    centroids.reserve(k);

    std::mt19937 gen(seed);

    std::uniform_int_distribution<std::size_t> index_dist(0, n - 1);
    const std::size_t first_idx = index_dist(gen);
    centroids.emplace_back(data + first_idx * dim, data + (first_idx + 1) * dim);

    // D² weighting for the remaining centroids
    std::vector<float> min_distances(n, std::numeric_limits<float>::max());
    std::vector<double> cumsum(n);

    for (std::uint32_t c = 1; c < k; ++c) {
        // Each seeding round is a full O(n * dim) pass.
        if (auto ok = control.check("kmeans.init"); !ok) return std::unexpected(ok.error());

        const auto& last_centroid = centroids.back();

        #pragma omp parallel for
        for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
            const float dist = kernels::l2_sq(
                std::span(data + static_cast<std::size_t>(i) * dim, dim), last_centroid);
            min_distances[static_cast<std::size_t>(i)] =
                std::min(min_distances[static_cast<std::size_t>(i)], dist);
        }

        cumsum[0] = min_distances[0];
        for (std::size_t i = 1; i < n; ++i) {
            cumsum[i] = cumsum[i - 1] + min_distances[i];
        }

        std::size_t idx;
        if (!(cumsum.back() > 0.0)) {
            // Every point coincides with a centroid already; any choice is equivalent.
            idx = index_dist(gen);
        } else {
            std::uniform_real_distribution<double> sample_dist(0.0, cumsum.back());
            const double target = sample_dist(gen);
            const auto it = std::upper_bound(cumsum.begin(), cumsum.end(), target);
            idx = std::min<std::size_t>(static_cast<std::size_t>(std::distance(cumsum.begin(), it)),
                                        n - 1);
        }

        centroids.emplace_back(data + idx * dim, data + (idx + 1) * dim);
    }

    return centroids;
}

auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float {
    const std::size_t dim = centroids[0].size();
    double total_inertia = 0.0;

    #pragma omp parallel for reduction(+:total_inertia)
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(n); ++i) {
        const auto [idx, dist] =
            find_nearest_centroid(data + static_cast<std::size_t>(i) * dim, centroids, dim);
        assignments[static_cast<std::size_t>(i)] = idx;
        total_inertia += dist;
    }

    return static_cast<float>(total_inertia);
}

auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void {
    std::vector<std::vector<double>> sums(k, std::vector<double>(dim, 0.0));
    std::vector<std::uint32_t> counts(k, 0);

    for (std::size_t i = 0; i < n; ++i) {
        const std::uint32_t cluster = assignments[i];
        counts[cluster]++;
        const float* point = data + i * dim;
        for (std::size_t d = 0; d < dim; ++d) {
            sums[cluster][d] += point[d];
        }
    }

    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] == 0) continue;  // empty cluster keeps its previous centroid
        for (std::size_t d = 0; d < dim; ++d) {
            centroids[c][d] = static_cast<float>(sums[c][d] / counts[c]);
        }
    }
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params, const BuildControl& control)
    -> std::expected<KmeansResult, core::error> {
    using core::error_code;

    if (params.k == 0) {
        return core::make_unexpected(error_code::invalid_argument, "k must be > 0", "kmeans");
    }
    if (n < params.k) {
        return core::make_unexpected(error_code::invalid_argument,
                                     "not enough data points for k clusters", "kmeans");
    }
    if (dim == 0) {
        return core::make_unexpected(error_code::invalid_argument, "dim must be > 0", "kmeans");
    }

    const auto start_time = std::chrono::steady_clock::now();

    KmeansResult result;
    auto seeded = kmeans_plusplus_init(data, n, dim, params.k, params.seed, control);
    if (!seeded) return std::unexpected(seeded.error());
    result.centroids = std::move(*seeded);
    result.assignments.assign(n, 0);

    float prev_inertia = std::numeric_limits<float>::max();
    std::uint32_t iter = 0;

    // Lloyd iterations
    for (; iter < params.max_iter; ++iter) {
        if (auto ok = control.check("kmeans"); !ok) return std::unexpected(ok.error());

        const float inertia = kmeans_assign(data, n, result.centroids, result.assignments);
        const float change = std::abs(prev_inertia - inertia) / (prev_inertia + 1e-10f);
        if (params.verbose) {
            core::log_fmt(core::log_level::debug, "kmeans", "iter=", iter, " inertia=", inertia);
        }
        if (change < params.epsilon) {
            break;
        }
        prev_inertia = inertia;
        kmeans_update_centroids(data, n, dim, result.assignments, params.k, result.centroids);
    }

    // Final assignment against the final centroids so lists and centers agree
    result.inertia = kmeans_assign(data, n, result.centroids, result.assignments);
    result.iterations = iter;

    result.cluster_sizes.assign(params.k, 0);
    for (std::uint32_t a : result.assignments) result.cluster_sizes[a]++;

    if (params.verbose) {
        const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);
        core::log_fmt(core::log_level::debug, "kmeans", "k=", params.k, " n=", n,
                      " iterations=", iter, " inertia=", result.inertia,
                      " time=", secs.count(), "s");
    }

    return result;
}

} // namespace vista::index
