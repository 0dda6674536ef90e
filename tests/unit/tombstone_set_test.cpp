#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "vista/store/tombstone_set.hpp"

using vista::store::TombstoneSet;

TEST_CASE("TombstoneSet marks and compacts slots", "[store][tombstone]") {
    TombstoneSet set;
    REQUIRE(set.mark(7).has_value());
    REQUIRE(set.mark(3).has_value());
    REQUIRE(set.mark(11).has_value());
    REQUIRE(set.count() == 3);
    REQUIRE(set.contains(3));
    REQUIRE_FALSE(set.contains(4));
    REQUIRE(set.slots() == std::vector<std::uint32_t>{3, 7, 11});

    SECTION("double mark is rejected") {
        auto again = set.mark(7);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == vista::core::error_code::not_found);
        REQUIRE(set.stats().total_marked == 3);
    }

    SECTION("compact removes only present slots") {
        const std::vector<std::uint32_t> request{11, 5, 3};
        const auto removed = set.compact(request);
        REQUIRE(removed == std::vector<std::uint32_t>{3, 11});
        REQUIRE(set.count() == 1);
        REQUIRE(set.contains(7));
        REQUIRE(set.stats().total_compacted == 2);
        REQUIRE(set.stats().compaction_count == 1);
    }
}
