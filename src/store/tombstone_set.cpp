/** \file tombstone_set.cpp
 *  \brief Roaring-backed tombstone bookkeeping.
 */

#include "vista/store/tombstone_set.hpp"

#include <algorithm>

namespace vista::store {

namespace {
// Run-length optimize the bitmap every this many marks.
constexpr std::uint64_t kOptimizeEvery = 4096;
} // anonymous namespace

auto TombstoneSet::mark(std::uint32_t slot) -> std::expected<void, core::error> {
    if (bitmap_.contains(slot)) {
        return core::make_unexpected(core::error_code::not_found,
                                     "slot already tombstoned", "store.tombstone");
    }
    bitmap_.add(slot);
    stats_.total_marked++;
    if (stats_.total_marked % kOptimizeEvery == 0) {
        bitmap_.runOptimize();
    }
    return {};
}

auto TombstoneSet::compact(std::span<const std::uint32_t> slots) -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> removed;
    removed.reserve(slots.size());
    for (std::uint32_t s : slots) {
        if (bitmap_.contains(s)) {
            bitmap_.remove(s);
            removed.push_back(s);
        }
    }
    if (!removed.empty()) {
        stats_.total_compacted += removed.size();
        stats_.compaction_count++;
        bitmap_.runOptimize();
    }
    std::sort(removed.begin(), removed.end());
    return removed;
}

auto TombstoneSet::slots() const -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> out;
    out.reserve(static_cast<std::size_t>(bitmap_.cardinality()));
    for (auto it = bitmap_.begin(); it != bitmap_.end(); ++it) {
        out.push_back(*it);
    }
    return out;
}

} // namespace vista::store
