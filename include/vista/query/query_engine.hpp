#pragma once

/** \file query_engine.hpp
 *  \brief k-NN queries against the latest committed IndexSnapshot.
 *
 * A query pins the snapshot current at its start and ranks against it for its whole
 * duration; a concurrent commit never changes an in-flight result. Candidates whose
 * record has been deleted since the snapshot was built are skipped, so results never
 * contain an id that is tombstoned at query time.
 *
 * Thread-safety: query() is const and safe for concurrent calls.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "vista/consistency/consistency_manager.hpp"
#include "vista/error.hpp"
#include "vista/metric.hpp"
#include "vista/record.hpp"
#include "vista/store/vector_store.hpp"

namespace vista::query {

/** \brief Per-query overrides. */
struct QueryOptions {
    std::optional<std::uint32_t> probe_count;           /**< partitions to scan (approximate only) */
    bool exact{false};                                   /**< scan every partition */
    std::function<bool(const Record&)> filter;           /**< keep only records passing this */
};

struct QueryHit {
    std::string id;
    float distance{0.0f};

    friend bool operator==(const QueryHit&, const QueryHit&) = default;
};

/** \brief Ascending by distance, ties by ascending id; at most k hits. */
using QueryResult = std::vector<QueryHit>;

class QueryEngine {
public:
    /**
     * \brief Bind an engine to a collection's manager and store.
     * Errors: metric_mismatch when `metric` differs from the manager's build metric.
     */
    static auto create(std::shared_ptr<const consistency::ConsistencyManager> manager,
                       std::shared_ptr<const store::VectorStore> store, Metric metric)
        -> std::expected<QueryEngine, core::error>;

    /**
     * \brief Top-k most similar records.
     * Errors: dimension_mismatch (vector length), invalid_argument (NaN or infinite
     * component), invalid_k (k <= 0).
     * An empty result is returned while no snapshot has been committed.
     */
    auto query(std::span<const float> vector, std::int64_t k, const QueryOptions& options = {}) const
        -> std::expected<QueryResult, core::error>;

    [[nodiscard]] auto metric() const noexcept -> Metric { return metric_; }

private:
    QueryEngine(std::shared_ptr<const consistency::ConsistencyManager> manager,
                std::shared_ptr<const store::VectorStore> store, Metric metric);

    std::shared_ptr<const consistency::ConsistencyManager> manager_;
    std::shared_ptr<const store::VectorStore> store_;
    Metric metric_;
};

} // namespace vista::query
