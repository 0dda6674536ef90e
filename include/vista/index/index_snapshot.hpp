#pragma once

/** \file index_snapshot.hpp
 *  \brief Immutable, point-in-time searchable index.
 *
 * A snapshot owns its index structure and shares the (immutable) records with the
 * store. Entries are sorted by ascending record id, so ranking ties broken by entry
 * index are broken by id. Snapshots are published as std::shared_ptr<const IndexSnapshot>;
 * a query keeps its snapshot alive for its whole duration.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <variant>
#include <vector>

#include "vista/index/flat_index.hpp"
#include "vista/index/index_config.hpp"
#include "vista/index/partitioned_index.hpp"
#include "vista/record.hpp"

namespace vista::index {

/** \brief Strategy-specific structure; every alternative offers the same search capability. */
using IndexVariant = std::variant<FlatIndex, PartitionedIndex>;

/** \brief Record reference captured at build time. */
struct SnapshotEntry {
    Handle handle;
    RecordPtr record;
};

class IndexSnapshot {
public:
    IndexSnapshot(IndexBuildConfig config, std::size_t dimension, std::uint64_t store_version,
                  std::vector<SnapshotEntry> entries, IndexVariant index);

    /** \brief Snapshot with no entries (used for forced commits of an empty store). */
    static auto make_empty(IndexBuildConfig config, std::size_t dimension,
                           std::uint64_t store_version) -> std::shared_ptr<const IndexSnapshot>;

    /** \brief Top-k by (distance, id) using the build metric. */
    [[nodiscard]] auto search(std::span<const float> query, std::size_t k,
                              const SearchParams& params, const EntryFilter& filter) const
        -> std::vector<Neighbor>;

    [[nodiscard]] auto config() const noexcept -> const IndexBuildConfig& { return config_; }
    [[nodiscard]] auto metric() const noexcept -> Metric { return config_.metric; }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dimension_; }
    [[nodiscard]] auto store_version() const noexcept -> std::uint64_t { return store_version_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto entries() const noexcept -> const std::vector<SnapshotEntry>& { return entries_; }
    [[nodiscard]] auto entry(std::size_t i) const -> const SnapshotEntry& { return entries_[i]; }
    [[nodiscard]] auto index() const noexcept -> const IndexVariant& { return index_; }

    /** \brief Strategy of the structure actually held (empty snapshots are flat). */
    [[nodiscard]] auto strategy() const noexcept -> IndexStrategy;

private:
    IndexBuildConfig config_;
    std::size_t dimension_;
    std::uint64_t store_version_;
    std::vector<SnapshotEntry> entries_;
    IndexVariant index_;
};

using SnapshotPtr = std::shared_ptr<const IndexSnapshot>;

} // namespace vista::index
