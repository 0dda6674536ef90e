#include "vista/query/query_engine.hpp"
#include "vista/kernels/distance.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace vista::query {

QueryEngine::QueryEngine(std::shared_ptr<const consistency::ConsistencyManager> manager,
                         std::shared_ptr<const store::VectorStore> store, Metric metric)
    : manager_(std::move(manager)), store_(std::move(store)), metric_(metric) {}

auto QueryEngine::create(std::shared_ptr<const consistency::ConsistencyManager> manager,
                         std::shared_ptr<const store::VectorStore> store, Metric metric)
    -> std::expected<QueryEngine, core::error> {
    if (!manager || !store) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "manager and store are required", "query.create");
    }
    const Metric built_with = manager->build_config().metric;
    if (metric != built_with) {
        return core::make_unexpected(core::error_code::metric_mismatch,
                                     "query metric " + std::string(to_string(metric)) +
                                         " differs from index metric " +
                                         std::string(to_string(built_with)),
                                     "query.create");
    }
    return QueryEngine(std::move(manager), std::move(store), metric);
}

auto QueryEngine::query(std::span<const float> vector, std::int64_t k,
                        const QueryOptions& options) const
    -> std::expected<QueryResult, core::error> {
    if (vector.size() != store_->dimension()) {
        return core::make_unexpected(core::error_code::dimension_mismatch,
                                     "query has " + std::to_string(vector.size()) +
                                         " components, expected " +
                                         std::to_string(store_->dimension()),
                                     "query");
    }
    if (!kernels::all_finite(vector)) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "query has a non-finite component", "query");
    }
    if (k <= 0) {
        return core::make_unexpected(core::error_code::invalid_k,
                                     "k must be positive, got " + std::to_string(k), "query");
    }

    const auto snapshot = manager_->current();
    if (!snapshot || snapshot->empty()) return QueryResult{};

    index::SearchParams params;
    params.exhaustive = options.exact;
    if (options.probe_count) params.probe_count = *options.probe_count;

    const auto& entries = snapshot->entries();
    const index::EntryFilter keep = [&](std::uint32_t e) {
        const auto& entry = entries[e];
        if (!store_->is_live(entry.handle)) return false;
        return !options.filter || options.filter(*entry.record);
    };

    // More than the snapshot holds can never be returned.
    const auto limit = std::min<std::uint64_t>(static_cast<std::uint64_t>(k), snapshot->size());
    const auto neighbors = snapshot->search(vector, static_cast<std::size_t>(limit), params, keep);

    QueryResult out;
    out.reserve(neighbors.size());
    for (const auto& n : neighbors) {
        out.push_back(QueryHit{entries[n.entry].record->id, n.distance});
    }
    return out;
}

} // namespace vista::query
