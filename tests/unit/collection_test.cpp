#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "vista/collection.hpp"
#include "../support/test_data.hpp"

using namespace vista;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

TEST_CASE("collection create validates and fixes the metric", "[collection]") {
    auto bad = collection::create(test::foreground_config(0));
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::error_code::config_invalid);

    auto cfg = test::foreground_config(4, Metric::Cosine);
    cfg.index.metric = Metric::Euclidean;  // overridden by cfg.metric
    auto c = collection::create(cfg);
    REQUIRE(c.has_value());
    REQUIRE(c->metric() == Metric::Cosine);
    REQUIRE(c->config().index.metric == Metric::Cosine);
}

TEST_CASE("collection end to end in the foreground", "[collection]") {
    auto c = collection::create(test::foreground_config(3));
    REQUIRE(c.has_value());

    const std::vector<std::vector<float>> rows{
        {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f},
        {0.0f, 0.0f, 1.0f}, {5.0f, 5.0f, 5.0f}};
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(c->insert(test::make_id(i), rows[i], {{"label", std::string("x")}}).has_value());
    }

    // Writes are visible before any index exists.
    REQUIRE(c->get(test::make_id(4)).has_value());
    REQUIRE(c->snapshot_ids().size() == 5);
    REQUIRE(c->query(rows[4], 3)->empty());
    REQUIRE(c->status().state == consistency::CollectionState::Dirty);

    REQUIRE(c->rebuild().has_value());
    auto r = c->query(rows[4], 3);
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 3);
    REQUIRE((*r)[0].id == test::make_id(4));
    REQUIRE((*r)[0].distance == 0.0f);

    SECTION("remove hides the record at once") {
        REQUIRE(c->remove(test::make_id(4)).has_value());
        REQUIRE_FALSE(c->get(test::make_id(4)).has_value());
        auto after = c->query(rows[4], 5);
        REQUIRE(after->size() == 4);
        for (const auto& hit : *after) REQUIRE(hit.id != test::make_id(4));
        REQUIRE(c->remove(test::make_id(4)).error().code == core::error_code::not_found);
    }
    SECTION("insert errors pass through") {
        REQUIRE(c->insert(test::make_id(0), rows[0]).error().code ==
                core::error_code::duplicate_id);
        REQUIRE(c->insert("short", {1.0f}).error().code == core::error_code::dimension_mismatch);
        REQUIRE(c->size() == 5);
    }
}

TEST_CASE("collection save and open", "[collection][persist]") {
    const auto dir = fs::temp_directory_path() / "vista_collection_test";
    fs::create_directories(dir);
    const auto path = dir / "gallery.vsnp";

    auto cfg = test::foreground_config(8, Metric::Euclidean, index::IndexStrategy::Partitioned);
    cfg.index.num_partitions = 4;
    cfg.index.probe_count = 2;
    auto c = collection::create(cfg);
    REQUIRE(c.has_value());
    const auto rows = test::clustered_vectors(4, 25, 8, 77);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(c->insert(test::make_id(i), rows[i], {{"cluster", std::int64_t(i / 25)}}).has_value());
    }
    REQUIRE(c->remove(test::make_id(3)).has_value());

    // save() indexes pending mutations first.
    REQUIRE(c->save(path).has_value());
    REQUIRE(c->status().pending_mutations == 0);

    consistency::ConsistencyConfig cc;
    cc.background = false;
    auto reopened = collection::open(path, cc);
    REQUIRE(reopened.has_value());
    REQUIRE(reopened->size() == 99);
    REQUIRE(reopened->dimension() == 8);
    REQUIRE(reopened->config().index.strategy == index::IndexStrategy::Partitioned);
    REQUIRE(reopened->status().state == consistency::CollectionState::Clean);
    REQUIRE(reopened->status().has_snapshot);
    REQUIRE(reopened->snapshot_ids() == c->snapshot_ids());

    for (std::size_t i = 0; i < rows.size(); i += 10) {
        auto a = c->query(rows[i], 5);
        auto b = reopened->query(rows[i], 5);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*a == *b);
    }

    // The reopened collection keeps accepting writes.
    REQUIRE(reopened->insert(test::make_id(3), rows[3]).has_value());
    REQUIRE(reopened->rebuild().has_value());
    REQUIRE((*reopened->query(rows[3], 1))[0].id == test::make_id(3));

    fs::remove(path);
}

TEST_CASE("collection background mode converges", "[collection][background]") {
    auto cfg = test::foreground_config(4);
    cfg.consistency.background = true;
    cfg.consistency.max_staleness = 5ms;
    auto c = collection::create(cfg);
    REQUIRE(c.has_value());

    const auto rows = test::random_vectors(50, 4, 8);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        REQUIRE(c->insert(test::make_id(i), rows[i]).has_value());
    }
    REQUIRE(c->wait_until_clean(5s));
    const auto st = c->status();
    REQUIRE(st.serving_size == 50);
    REQUIRE(st.pending_mutations == 0);
    REQUIRE((*c->query(rows[17], 1))[0].id == test::make_id(17));
}

TEST_CASE("collection recovers from exhausted retries on the next insert",
          "[collection][background][failure]") {
    auto cfg = test::foreground_config(2);
    cfg.consistency.background = true;
    cfg.consistency.max_staleness = 1ms;
    cfg.consistency.retry.max_retries = 1;
    cfg.consistency.retry.initial_backoff = 1ms;
    auto c = collection::create(cfg);
    REQUIRE(c.has_value());

    REQUIRE(c->insert("a", {1.0f, 1.0f}).has_value());
    REQUIRE(c->wait_until_clean(5s));

    // Deleting the only record makes every unforced build fail with empty_collection.
    REQUIRE(c->remove("a").has_value());
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!c->status().retries_exhausted && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    auto st = c->status();
    REQUIRE(st.retries_exhausted);
    REQUIRE(st.state == consistency::CollectionState::Degraded);
    REQUIRE(st.last_error->code == core::error_code::empty_collection);

    REQUIRE(c->insert("b", {2.0f, 2.0f}).has_value());
    REQUIRE(c->wait_until_clean(5s));
    auto hits = c->query(std::vector<float>{2.0f, 2.0f}, 5);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 1);
    REQUIRE((*hits)[0].id == "b");
}
