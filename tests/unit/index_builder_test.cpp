#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stop_token>
#include <vector>

#include "vista/index/index_builder.hpp"
#include "vista/store/vector_store.hpp"
#include "../support/test_data.hpp"

using namespace vista;
using namespace vista::index;

TEST_CASE("IndexBuilder rejects an empty view", "[index][builder]") {
    store::VectorStore store(4);
    IndexBuilder builder(IndexBuildConfig{}, 4);
    auto snap = builder.build(store.view());
    REQUIRE_FALSE(snap.has_value());
    REQUIRE(snap.error().code == core::error_code::empty_collection);

    SECTION("a store emptied by deletes is empty too") {
        REQUIRE(store.insert("a", {1, 2, 3, 4}).has_value());
        REQUIRE(store.remove("a").has_value());
        auto again = builder.build(store.view());
        REQUIRE(again.error().code == core::error_code::empty_collection);
    }
}

TEST_CASE("IndexBuilder snapshot reflects the view", "[index][builder]") {
    store::VectorStore store(2);
    REQUIRE(store.insert("b", {1.0f, 1.0f}).has_value());
    REQUIRE(store.insert("a", {0.0f, 0.0f}).has_value());
    REQUIRE(store.insert("c", {2.0f, 2.0f}).has_value());
    REQUIRE(store.remove("c").has_value());

    IndexBuilder builder(IndexBuildConfig{}, 2);
    auto snap = builder.build(store.view());
    REQUIRE(snap.has_value());
    REQUIRE((*snap)->size() == 2);
    REQUIRE((*snap)->store_version() == 4);
    REQUIRE((*snap)->entry(0).record->id == "a");
    REQUIRE((*snap)->entry(1).record->id == "b");
}

TEST_CASE("IndexBuilder partitioned builds are deterministic", "[index][builder]") {
    store::VectorStore store(8);
    const auto rows = test::clustered_vectors(6, 30, 8, 21);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(store.insert(test::make_id(i), rows[i]).has_value());
    }

    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    cfg.num_partitions = 6;
    cfg.probe_count = 2;
    IndexBuilder builder(cfg, 8);

    auto a = builder.build(store.view());
    auto b = builder.build(store.view());
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    const auto& pa = std::get<PartitionedIndex>((*a)->index());
    const auto& pb = std::get<PartitionedIndex>((*b)->index());
    REQUIRE(pa.centroids() == pb.centroids());
    for (std::size_t l = 0; l < pa.lists().size(); ++l) {
        REQUIRE(pa.lists()[l].entries == pb.lists()[l].entries);
    }
}

TEST_CASE("IndexBuilder cosine partitions hold the raw vectors", "[index][builder][cosine]") {
    store::VectorStore store(3);
    REQUIRE(store.insert("a", {10.0f, 0.0f, 0.0f}).has_value());
    REQUIRE(store.insert("b", {0.0f, 5.0f, 0.0f}).has_value());
    REQUIRE(store.insert("c", {0.0f, 0.0f, 2.0f}).has_value());

    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    cfg.metric = Metric::Cosine;
    cfg.num_partitions = 3;
    cfg.probe_count = 3;
    auto snap = IndexBuilder(cfg, 3).build(store.view());
    REQUIRE(snap.has_value());

    // Scale does not matter for cosine: a long query along x still finds "a" at distance 0.
    const auto hits = (*snap)->search(std::vector<float>{3.0f, 0.0f, 0.0f}, 1, SearchParams{}, {});
    REQUIRE(hits.size() == 1);
    REQUIRE((*snap)->entry(hits[0].entry).record->id == "a");
    REQUIRE(hits[0].distance < 1e-6f);
}

TEST_CASE("IndexBuilder honours cancellation and timeout", "[index][builder][control]") {
    store::VectorStore store(4);
    const auto rows = test::random_vectors(64, 4, 3);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(store.insert(test::make_id(i), rows[i]).has_value());
    }
    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    cfg.num_partitions = 4;
    cfg.probe_count = 1;
    IndexBuilder builder(cfg, 4);

    SECTION("cancelled") {
        std::stop_source source;
        source.request_stop();
        auto snap = builder.build(store.view(), BuildControl{source.get_token()});
        REQUIRE_FALSE(snap.has_value());
        REQUIRE(snap.error().code == core::error_code::cancelled);
    }
    SECTION("deadline exceeded") {
        BuildControl control;
        control.deadline = std::chrono::steady_clock::now();
        auto snap = builder.build(store.view(), control);
        REQUIRE_FALSE(snap.has_value());
        REQUIRE(snap.error().code == core::error_code::build_timeout);
    }
}

TEST_CASE("validate_build_config", "[index][builder][config]") {
    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    REQUIRE(validate_build_config(cfg).has_value());

    cfg.num_partitions = 0;
    REQUIRE(validate_build_config(cfg).error().code == core::error_code::config_invalid);

    cfg.num_partitions = 4;
    cfg.probe_count = 0;
    REQUIRE(validate_build_config(cfg).error().code == core::error_code::config_invalid);

    // The exact strategy ignores partition settings.
    cfg.strategy = IndexStrategy::Exact;
    REQUIRE(validate_build_config(cfg).has_value());
}
