#include "vista/index/flat_index.hpp"
#include "vista/kernels/distance.hpp"

namespace vista::index {

FlatIndex::FlatIndex(std::size_t dim, std::vector<float> rows)
    : dim_(dim), rows_(std::move(rows)) {}

auto FlatIndex::search(std::span<const float> query, std::size_t k, Metric metric,
                       const SearchParams& /*params*/, const EntryFilter& filter) const
    -> std::vector<Neighbor> {
    TopK top(k);
    const std::size_t n = size();
    for (std::size_t i = 0; i < n; ++i) {
        const float d = kernels::distance(metric, query, row(i));
        top.offer(Neighbor{static_cast<std::uint32_t>(i), d}, filter);
    }
    return top.take_sorted();
}

} // namespace vista::index
