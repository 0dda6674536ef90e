#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "vista/config.hpp"

namespace vista::test {

/** \brief Zero-padded ids so lexical order equals numeric order. */
inline auto make_id(std::size_t i) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "img-%06zu", i);
    return buf;
}

/** \brief Gaussian blobs; point i belongs to cluster i / points_per_cluster. */
inline auto clustered_vectors(std::size_t n_clusters, std::size_t points_per_cluster,
                              std::size_t dim, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
    std::mt19937 gen(seed);
    std::normal_distribution<float> center_dist(0.0f, 10.0f);
    std::normal_distribution<float> noise_dist(0.0f, 0.5f);

    std::vector<std::vector<float>> out;
    out.reserve(n_clusters * points_per_cluster);
    for (std::size_t c = 0; c < n_clusters; ++c) {
        std::vector<float> center(dim);
        for (auto& x : center) x = center_dist(gen);
        for (std::size_t p = 0; p < points_per_cluster; ++p) {
            std::vector<float> v(dim);
            for (std::size_t d = 0; d < dim; ++d) v[d] = center[d] + noise_dist(gen);
            out.push_back(std::move(v));
        }
    }
    return out;
}

inline auto random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<std::vector<float>> out(n, std::vector<float>(dim));
    for (auto& v : out) {
        for (auto& x : v) x = dist(gen);
    }
    return out;
}

/** \brief Configuration whose index is only rebuilt by explicit calls. */
inline auto foreground_config(std::size_t dim, Metric metric = Metric::Euclidean,
                              index::IndexStrategy strategy = index::IndexStrategy::Exact)
    -> collection_config {
    collection_config cfg;
    cfg.dimension = dim;
    cfg.metric = metric;
    cfg.index.strategy = strategy;
    cfg.consistency.background = false;
    return cfg;
}

} // namespace vista::test
