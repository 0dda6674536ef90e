#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <set>
#include <stop_token>
#include <vector>

#include "vista/index/kmeans.hpp"
#include "../support/test_data.hpp"

using namespace vista;
using namespace vista::index;

namespace {

auto flatten(const std::vector<std::vector<float>>& rows) -> std::vector<float> {
    std::vector<float> out;
    for (const auto& r : rows) out.insert(out.end(), r.begin(), r.end());
    return out;
}

} // anonymous namespace

TEST_CASE("K-means clustering", "[kmeans]") {
    const std::size_t dim = 8;
    const auto rows = test::clustered_vectors(4, 50, dim, 7);
    const auto data = flatten(rows);
    const std::size_t n = rows.size();

    KmeansParams params;
    params.k = 4;
    params.max_iter = 50;
    params.seed = 123;

    SECTION("K-means++ initialization produces k distinct centroids") {
        auto centroids = kmeans_plusplus_init(data.data(), n, dim, 4, 123);
        REQUIRE(centroids.has_value());
        REQUIRE(centroids->size() == 4);
        std::set<std::vector<float>> unique(centroids->begin(), centroids->end());
        REQUIRE(unique.size() == 4);
    }

    SECTION("well separated blobs are recovered") {
        auto result = kmeans_cluster(data.data(), n, dim, params);
        REQUIRE(result.has_value());
        REQUIRE(result->centroids.size() == 4);
        REQUIRE(result->assignments.size() == n);

        // Every blob maps to a single cluster.
        for (std::size_t c = 0; c < 4; ++c) {
            const auto first = result->assignments[c * 50];
            for (std::size_t p = 1; p < 50; ++p) {
                REQUIRE(result->assignments[c * 50 + p] == first);
            }
        }
        std::uint32_t total = 0;
        for (auto s : result->cluster_sizes) total += s;
        REQUIRE(total == n);
    }

    SECTION("same seed gives identical clustering") {
        auto a = kmeans_cluster(data.data(), n, dim, params);
        auto b = kmeans_cluster(data.data(), n, dim, params);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->assignments == b->assignments);
        REQUIRE(a->centroids == b->centroids);
    }
}

TEST_CASE("K-means rejects bad parameters", "[kmeans]") {
    const std::vector<float> data(4 * 2, 1.0f);
    KmeansParams params;

    params.k = 0;
    auto zero = kmeans_cluster(data.data(), 4, 2, params);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().code == core::error_code::invalid_argument);

    params.k = 5;
    auto too_many = kmeans_cluster(data.data(), 4, 2, params);
    REQUIRE_FALSE(too_many.has_value());
    REQUIRE(too_many.error().code == core::error_code::invalid_argument);
}

TEST_CASE("K-means handles identical points", "[kmeans]") {
    const std::vector<float> data(10 * 3, 2.5f);
    KmeansParams params;
    params.k = 3;
    auto result = kmeans_cluster(data.data(), 10, 3, params);
    REQUIRE(result.has_value());
    REQUIRE(result->inertia == 0.0f);
}

TEST_CASE("K-means observes cancellation and deadline", "[kmeans][control]") {
    const std::size_t dim = 4;
    const auto data = flatten(test::clustered_vectors(2, 20, dim, 3));
    KmeansParams params;
    params.k = 2;

    SECTION("stop requested") {
        std::stop_source source;
        source.request_stop();
        BuildControl control{source.get_token()};
        auto result = kmeans_cluster(data.data(), 40, dim, params, control);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == core::error_code::cancelled);
    }
    SECTION("deadline already passed") {
        BuildControl control;
        control.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
        auto result = kmeans_cluster(data.data(), 40, dim, params, control);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == core::error_code::build_timeout);
    }
}

TEST_CASE("K-means++ seeding observes cancellation and deadline", "[kmeans][control]") {
    const std::size_t dim = 4;
    const auto data = flatten(test::clustered_vectors(4, 20, dim, 8));

    SECTION("stop requested") {
        std::stop_source source;
        source.request_stop();
        auto seeded = kmeans_plusplus_init(data.data(), 80, dim, 4, 1, BuildControl{source.get_token()});
        REQUIRE_FALSE(seeded.has_value());
        REQUIRE(seeded.error().code == core::error_code::cancelled);
    }
    SECTION("a single centroid needs no check") {
        std::stop_source source;
        source.request_stop();
        auto seeded = kmeans_plusplus_init(data.data(), 80, dim, 1, 1, BuildControl{source.get_token()});
        REQUIRE(seeded.has_value());
        REQUIRE(seeded->size() == 1);
    }
}

TEST_CASE("K-means deadline bounds a long seeding phase", "[kmeans][control]") {
    // Seeding alone is n * k * dim = 20000 * 1000 * 32 multiply-adds.
    const std::size_t n = 20000;
    const std::size_t dim = 32;
    const auto data = flatten(test::random_vectors(n, dim, 77));
    KmeansParams params;
    params.k = 1000;

    BuildControl control;
    control.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(10);
    const auto t0 = std::chrono::steady_clock::now();
    auto result = kmeans_cluster(data.data(), n, dim, params, control);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == core::error_code::build_timeout);
    REQUIRE(elapsed < std::chrono::milliseconds(500));
}
