#pragma once

/** \file partitioned_index.hpp
 *  \brief Inverted-file (IVF-flat) index: k-means centroids plus full-precision lists.
 *
 * A query ranks centroids by the collection metric, scans the `probe_count`
 * closest lists and keeps the top-k by (distance, entry). Results are always real
 * entries; true neighbors living in unprobed lists may be missed (bounded recall).
 * With a single partition, or with `exhaustive`, the answer equals FlatIndex.
 *
 * Memory: O(nlist*d + n*d + n).
 * Thread-safety: immutable after construction; search is safe for concurrent calls.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "vista/index/flat_index.hpp"
#include "vista/index/topk.hpp"
#include "vista/metric.hpp"

namespace vista::index {

/** \brief One partition: entry indices (ascending) and their vectors, row-major. */
struct InvertedList {
    std::vector<std::uint32_t> entries;
    std::vector<float> vectors;
};

class PartitionedIndex {
public:
    /**
     * \param dim Vector dimensionality
     * \param probe_count Default partitions scanned per query
     * \param centroids Partition centers [nlist x dim]
     * \param list_entries Entry indices per partition
     * \param rows Row-major vectors [n x dim] in snapshot entry order
     *
     * Preconditions: every index in list_entries is < n.
     */
    PartitionedIndex(std::size_t dim, std::uint32_t probe_count,
                     std::vector<std::vector<float>> centroids,
                     const std::vector<std::vector<std::uint32_t>>& list_entries,
                     std::span<const float> rows);

    [[nodiscard]] auto search(std::span<const float> query, std::size_t k, Metric metric,
                              const SearchParams& params, const EntryFilter& filter) const
        -> std::vector<Neighbor>;

    /** \brief The `nprobe` partitions closest to `query`, closest first (ties: lower index). */
    [[nodiscard]] auto probe_order(std::span<const float> query, Metric metric,
                                   std::uint32_t nprobe) const -> std::vector<std::uint32_t>;

    [[nodiscard]] auto num_partitions() const noexcept -> std::uint32_t {
        return static_cast<std::uint32_t>(centroids_.size());
    }
    [[nodiscard]] auto probe_count() const noexcept -> std::uint32_t { return probe_count_; }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto centroids() const noexcept -> const std::vector<std::vector<float>>& {
        return centroids_;
    }
    [[nodiscard]] auto lists() const noexcept -> const std::vector<InvertedList>& { return lists_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t;

private:
    std::size_t dim_;
    std::uint32_t probe_count_;
    std::vector<std::vector<float>> centroids_;
    std::vector<InvertedList> lists_;
};

} // namespace vista::index
