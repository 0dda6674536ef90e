#include "vista/index/index_snapshot.hpp"

namespace vista::index {

IndexSnapshot::IndexSnapshot(IndexBuildConfig config, std::size_t dimension,
                             std::uint64_t store_version, std::vector<SnapshotEntry> entries,
                             IndexVariant index)
    : config_(config),
      dimension_(dimension),
      store_version_(store_version),
      entries_(std::move(entries)),
      index_(std::move(index)) {}

auto IndexSnapshot::make_empty(IndexBuildConfig config, std::size_t dimension,
                               std::uint64_t store_version) -> SnapshotPtr {
    return std::make_shared<const IndexSnapshot>(config, dimension, store_version,
                                                 std::vector<SnapshotEntry>{},
                                                 IndexVariant{FlatIndex(dimension, {})});
}

auto IndexSnapshot::search(std::span<const float> query, std::size_t k,
                           const SearchParams& params, const EntryFilter& filter) const
    -> std::vector<Neighbor> {
    if (entries_.empty() || k == 0) return {};
    return std::visit(
        [&](const auto& idx) { return idx.search(query, k, config_.metric, params, filter); },
        index_);
}

auto IndexSnapshot::strategy() const noexcept -> IndexStrategy {
    return std::holds_alternative<PartitionedIndex>(index_) ? IndexStrategy::Partitioned
                                                            : IndexStrategy::Exact;
}

} // namespace vista::index
