/** \file tombstone_set.hpp
 *  \brief Deleted-slot bookkeeping backed by a Roaring bitmap.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include <roaring/roaring.hh>

#include "vista/error.hpp"

namespace vista::store {

/** \brief Tombstone counters (plain values; the owning store synchronizes access). */
struct TombstoneStats {
    std::uint64_t total_marked{0};
    std::uint64_t total_compacted{0};
    std::uint64_t compaction_count{0};
};

/**
 * \brief Set of tombstoned slots awaiting compaction.
 *
 * Thread-safety: none. VectorStore guards every call with its own lock.
 */
class TombstoneSet {
public:
    TombstoneSet() = default;

    /** \brief Mark a slot deleted; fails if it already is. */
    auto mark(std::uint32_t slot) -> std::expected<void, core::error>;

    [[nodiscard]] auto contains(std::uint32_t slot) const -> bool { return bitmap_.contains(slot); }

    /**
     * \brief Drop the given slots from the set (they have been compacted by a rebuild).
     * \return Slots that were actually present and removed, in ascending order.
     */
    auto compact(std::span<const std::uint32_t> slots) -> std::vector<std::uint32_t>;

    /** \brief All tombstoned slots in ascending order. */
    [[nodiscard]] auto slots() const -> std::vector<std::uint32_t>;

    [[nodiscard]] auto count() const -> std::uint64_t { return bitmap_.cardinality(); }
    [[nodiscard]] auto stats() const -> const TombstoneStats& { return stats_; }

private:
    roaring::Roaring bitmap_;
    TombstoneStats stats_;
};

} // namespace vista::store
