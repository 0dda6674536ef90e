#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include "vista/index/index_builder.hpp"
#include "vista/kernels/distance.hpp"
#include "vista/store/vector_store.hpp"
#include "../support/test_data.hpp"

using namespace vista;
using namespace vista::index;

namespace {

auto fill_store(store::VectorStore& store, const std::vector<std::vector<float>>& rows) -> void {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(store.insert(test::make_id(i), rows[i]).has_value());
    }
}

auto build(const store::VectorStore& store, IndexBuildConfig cfg) -> SnapshotPtr {
    IndexBuilder builder(cfg, store.dimension());
    auto snap = builder.build(store.view());
    REQUIRE(snap.has_value());
    return *snap;
}

} // anonymous namespace

TEST_CASE("TopK keeps the k best with ties by entry", "[index][topk]") {
    TopK top(3);
    top.offer({4, 1.0f}, {});
    top.offer({2, 1.0f}, {});
    top.offer({9, 0.5f}, {});
    top.offer({1, 2.0f}, {});
    top.offer({0, 1.0f}, {});
    const auto out = top.take_sorted();
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].entry == 9);
    REQUIRE(out[1].entry == 0);
    REQUIRE(out[2].entry == 2);
}

TEST_CASE("TopK filter only sees admitted candidates", "[index][topk]") {
    TopK top(1);
    std::vector<std::uint32_t> asked;
    const EntryFilter filter = [&](std::uint32_t e) {
        asked.push_back(e);
        return e != 0;
    };
    top.offer({0, 0.1f}, filter);   // rejected by the filter
    top.offer({1, 0.2f}, filter);   // admitted
    top.offer({2, 0.9f}, filter);   // never reaches the filter
    REQUIRE(asked == std::vector<std::uint32_t>{0, 1});
    REQUIRE(top.take_sorted()[0].entry == 1);
}

TEST_CASE("Flat index finds the exact match first", "[index][flat]") {
    store::VectorStore store(3);
    const std::vector<std::vector<float>> rows{
        {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 2.0f, 0.0f},
        {0.0f, 0.0f, 3.0f}, {1.0f, 1.0f, 1.0f}};
    fill_store(store, rows);

    const auto snap = build(store, IndexBuildConfig{});
    REQUIRE(snap->strategy() == IndexStrategy::Exact);
    const auto hits = snap->search(rows[3], 3, SearchParams{}, {});
    REQUIRE(hits.size() == 3);
    REQUIRE(snap->entry(hits[0].entry).record->id == test::make_id(3));
    REQUIRE(hits[0].distance == 0.0f);
    for (std::size_t i = 1; i < hits.size(); ++i) {
        REQUIRE(hits[i - 1].distance <= hits[i].distance);
    }
}

TEST_CASE("Equal distances are ordered by ascending id", "[index][flat]") {
    store::VectorStore store(2);
    // Inserted out of order; all four are at distance 1 from the origin.
    REQUIRE(store.insert("d", {0.0f, -1.0f}).has_value());
    REQUIRE(store.insert("b", {0.0f, 1.0f}).has_value());
    REQUIRE(store.insert("c", {-1.0f, 0.0f}).has_value());
    REQUIRE(store.insert("a", {1.0f, 0.0f}).has_value());

    const auto snap = build(store, IndexBuildConfig{});
    const std::vector<float> origin{0.0f, 0.0f};
    const auto hits = snap->search(origin, 4, SearchParams{}, {});
    REQUIRE(hits.size() == 4);
    std::vector<std::string> ids;
    for (const auto& h : hits) ids.push_back(snap->entry(h.entry).record->id);
    REQUIRE(ids == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE("Partitioned index with one partition equals exact search", "[index][partitioned]") {
    store::VectorStore store(8);
    fill_store(store, test::random_vectors(300, 8, 11));

    IndexBuildConfig exact_cfg;
    IndexBuildConfig part_cfg;
    part_cfg.strategy = IndexStrategy::Partitioned;
    part_cfg.num_partitions = 1;
    part_cfg.probe_count = 1;

    const auto exact = build(store, exact_cfg);
    const auto part = build(store, part_cfg);
    REQUIRE(part->strategy() == IndexStrategy::Partitioned);

    for (const auto& q : test::random_vectors(20, 8, 99)) {
        const auto a = exact->search(q, 10, SearchParams{}, {});
        const auto b = part->search(q, 10, SearchParams{}, {});
        REQUIRE(a.size() == b.size());
        for (std::size_t i = 0; i < a.size(); ++i) {
            REQUIRE(a[i].entry == b[i].entry);
            REQUIRE(a[i].distance == b[i].distance);
        }
    }
}

TEST_CASE("Partitioned index probing", "[index][partitioned]") {
    store::VectorStore store(16);
    fill_store(store, test::clustered_vectors(8, 40, 16, 5));

    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    cfg.num_partitions = 8;
    cfg.probe_count = 2;
    const auto snap = build(store, cfg);
    const auto& part = std::get<PartitionedIndex>(snap->index());
    REQUIRE(part.num_partitions() == 8);
    REQUIRE(part.size() == 320);

    const auto exact = build(store, IndexBuildConfig{});
    const auto queries = test::clustered_vectors(8, 2, 16, 5);

    SECTION("exhaustive search matches the exact strategy") {
        SearchParams all;
        all.exhaustive = true;
        for (const auto& q : queries) {
            const auto a = exact->search(q, 5, SearchParams{}, {});
            const auto b = snap->search(q, 5, all, {});
            REQUIRE(a.size() == b.size());
            for (std::size_t i = 0; i < a.size(); ++i) REQUIRE(a[i].entry == b[i].entry);
        }
    }

    SECTION("results are real entries ordered by distance") {
        for (const auto& q : queries) {
            const auto hits = snap->search(q, 10, SearchParams{}, {});
            REQUIRE_FALSE(hits.empty());
            for (std::size_t i = 0; i < hits.size(); ++i) {
                REQUIRE(hits[i].entry < snap->size());
                if (i > 0) REQUIRE_FALSE(ranks_before(hits[i], hits[i - 1]));
            }
        }
    }

    SECTION("probe order starts at the closest centroid") {
        const auto order = part.probe_order(queries[0], Metric::Euclidean, 3);
        REQUIRE(order.size() == 3);
        const auto d0 = kernels::distance(Metric::Euclidean, queries[0], part.centroids()[order[0]]);
        for (std::uint32_t c = 0; c < part.num_partitions(); ++c) {
            REQUIRE(d0 <= kernels::distance(Metric::Euclidean, queries[0], part.centroids()[c]));
        }
    }
}

TEST_CASE("Partition count is clamped to the collection size", "[index][partitioned]") {
    store::VectorStore store(2);
    fill_store(store, test::random_vectors(3, 2, 1));

    IndexBuildConfig cfg;
    cfg.strategy = IndexStrategy::Partitioned;
    cfg.num_partitions = 16;
    cfg.probe_count = 4;
    const auto snap = build(store, cfg);
    REQUIRE(std::get<PartitionedIndex>(snap->index()).num_partitions() == 3);
    REQUIRE(snap->search(std::vector<float>{0.0f, 0.0f}, 10, SearchParams{}, {}).size() == 3);
}
