#pragma once

/** \file topk.hpp
 *  \brief Bounded top-k selection with deterministic tie-breaking.
 *
 * Ordering: ascending by distance; ties broken by smaller entry index. Snapshot
 * entries are sorted by record id, so entry order is id order.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace vista::index {

/** \brief Candidate produced by an index scan. */
struct Neighbor {
    std::uint32_t entry{0};   /**< index into the snapshot's entry table */
    float distance{0.0f};     /**< metric distance, smaller is closer */
};

/** \brief Strict "a ranks before b". */
[[nodiscard]] constexpr bool ranks_before(const Neighbor& a, const Neighbor& b) noexcept {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.entry < b.entry;
}

/** \brief Predicate deciding whether an entry may appear in results (e.g. not tombstoned). */
using EntryFilter = std::function<bool(std::uint32_t entry)>;

/** \brief Max-heap of the k best candidates seen so far. */
class TopK {
public:
    explicit TopK(std::size_t k) : k_(k) { heap_.reserve(k + 1); }

    /** \brief True if a candidate with this rank would enter the current top-k. */
    [[nodiscard]] bool admits(const Neighbor& n) const noexcept {
        if (k_ == 0) return false;
        if (heap_.size() < k_) return true;
        return ranks_before(n, heap_.front());
    }

    /** \brief Offer a candidate; the filter runs only for candidates that would be admitted. */
    void offer(const Neighbor& n, const EntryFilter& filter) {
        if (!admits(n)) return;
        if (filter && !filter(n.entry)) return;
        if (heap_.size() < k_) {
            heap_.push_back(n);
            std::push_heap(heap_.begin(), heap_.end(), ranks_before);
        } else {
            std::pop_heap(heap_.begin(), heap_.end(), ranks_before);
            heap_.back() = n;
            std::push_heap(heap_.begin(), heap_.end(), ranks_before);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }

    /** \brief Results in ascending rank order; the collector is left empty. */
    [[nodiscard]] std::vector<Neighbor> take_sorted() {
        std::sort_heap(heap_.begin(), heap_.end(), ranks_before);
        std::vector<Neighbor> out;
        out.swap(heap_);
        return out;
    }

private:
    std::size_t k_;
    std::vector<Neighbor> heap_;
};

} // namespace vista::index
