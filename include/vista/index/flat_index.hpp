#pragma once

/** \file flat_index.hpp
 *  \brief Exact (brute-force) index over a contiguous row-major matrix.
 *
 * Query cost O(n * d). Used for small collections and as the correctness oracle
 * for the partitioned strategy.
 * Thread-safety: immutable after construction; search is safe for concurrent calls.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "vista/index/topk.hpp"
#include "vista/metric.hpp"

namespace vista::index {

/** \brief Per-query knobs understood by every strategy. */
struct SearchParams {
    std::uint32_t probe_count{0};  /**< partitions to scan; 0 => build default */
    bool exhaustive{false};        /**< scan every partition (exact answer) */
};

class FlatIndex {
public:
    FlatIndex() = default;

    /** \param rows Row-major vectors [n x dim] in snapshot entry order. */
    FlatIndex(std::size_t dim, std::vector<float> rows);

    /** \brief Top-k entries by (distance, entry). */
    [[nodiscard]] auto search(std::span<const float> query, std::size_t k, Metric metric,
                              const SearchParams& params, const EntryFilter& filter) const
        -> std::vector<Neighbor>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return dim_ ? rows_.size() / dim_ : 0; }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto row(std::size_t i) const -> std::span<const float> {
        return {rows_.data() + i * dim_, dim_};
    }

private:
    std::size_t dim_{0};
    std::vector<float> rows_;
};

} // namespace vista::index
