#include "vista/index/partitioned_index.hpp"
#include "vista/kernels/distance.hpp"

#include <algorithm>

namespace vista::index {

PartitionedIndex::PartitionedIndex(std::size_t dim, std::uint32_t probe_count,
                                   std::vector<std::vector<float>> centroids,
                                   const std::vector<std::vector<std::uint32_t>>& list_entries,
                                   std::span<const float> rows)
    : dim_(dim), probe_count_(probe_count), centroids_(std::move(centroids)) {
    lists_.resize(list_entries.size());
    for (std::size_t l = 0; l < list_entries.size(); ++l) {
        InvertedList& list = lists_[l];
        list.entries = list_entries[l];
        list.vectors.reserve(list.entries.size() * dim_);
        for (std::uint32_t e : list.entries) {
            const float* src = rows.data() + static_cast<std::size_t>(e) * dim_;
            list.vectors.insert(list.vectors.end(), src, src + dim_);
        }
    }
}

auto PartitionedIndex::size() const noexcept -> std::size_t {
    std::size_t n = 0;
    for (const auto& l : lists_) n += l.entries.size();
    return n;
}

auto PartitionedIndex::probe_order(std::span<const float> query, Metric metric,
                                   std::uint32_t nprobe) const -> std::vector<std::uint32_t> {
    const std::uint32_t nlist = num_partitions();
    const std::uint32_t take = std::min(nprobe, nlist);

    std::vector<Neighbor> scored;
    scored.reserve(nlist);
    for (std::uint32_t c = 0; c < nlist; ++c) {
        scored.push_back(Neighbor{c, kernels::distance(metric, query, centroids_[c])});
    }
    std::partial_sort(scored.begin(), scored.begin() + take, scored.end(), ranks_before);

    std::vector<std::uint32_t> order;
    order.reserve(take);
    for (std::uint32_t i = 0; i < take; ++i) order.push_back(scored[i].entry);
    return order;
}

auto PartitionedIndex::search(std::span<const float> query, std::size_t k, Metric metric,
                              const SearchParams& params, const EntryFilter& filter) const
    -> std::vector<Neighbor> {
    std::uint32_t nprobe = params.probe_count > 0 ? params.probe_count : probe_count_;
    if (params.exhaustive) nprobe = num_partitions();

    TopK top(k);
    for (std::uint32_t list_id : probe_order(query, metric, nprobe)) {
        const InvertedList& list = lists_[list_id];
        for (std::size_t j = 0; j < list.entries.size(); ++j) {
            const std::span<const float> v(list.vectors.data() + j * dim_, dim_);
            top.offer(Neighbor{list.entries[j], kernels::distance(metric, query, v)}, filter);
        }
    }
    return top.take_sorted();
}

} // namespace vista::index
