#pragma once

/** \file retrieval_eval.hpp
 *  \brief Retrieval quality: rank-cutoff metrics over labelled queries and oracle recall.
 *
 * A retrieved record is relevant when its metadata value under `label_key` equals the
 * query's label. For each cutoff k:
 * - precision@k: relevant hits among the first k, divided by k
 * - recall@k:    fraction of queries with at least one relevant hit in the first k
 * Mean average precision is computed over the largest cutoff.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vista/collection.hpp"
#include "vista/error.hpp"
#include "vista/query/query_engine.hpp"
#include "vista/record.hpp"

namespace vista::eval {

/** \brief One evaluation query: an embedding with its ground-truth label. */
struct LabelledQuery {
    std::vector<float> vector;
    MetadataValue label;
    std::optional<std::string> exclude_id;  /**< e.g. the query image itself when it is in the gallery */
};

/** \brief Ranked output of one query, kept for inspection and visualization. */
struct QueryOutcome {
    std::vector<std::string> retrieved;
    std::vector<float> distances;
    std::vector<bool> relevant;
};

struct RetrievalMetrics {
    std::vector<std::uint32_t> cutoffs;   /**< ascending, deduplicated */
    std::vector<double> precision;        /**< precision@cutoffs[i] */
    std::vector<double> recall;           /**< hit-rate recall@cutoffs[i] */
    double mean_average_precision{0.0};   /**< at the largest cutoff */
    std::vector<QueryOutcome> per_query;
};

/**
 * \brief Run every query against `coll` and aggregate the metrics.
 * Errors: invalid_argument for no queries, no cutoffs or a zero cutoff; query errors
 * (e.g. dimension_mismatch) are passed through.
 */
auto evaluate_retrieval(const collection& coll, std::span<const LabelledQuery> queries,
                        std::span<const std::uint32_t> cutoffs, std::string_view label_key,
                        const query::QueryOptions& options = {})
    -> std::expected<RetrievalMetrics, core::error>;

/** \brief Share of `exact` ids also present in `approx` (1.0 when `exact` is empty). */
auto recall_at_k(const query::QueryResult& approx, const query::QueryResult& exact) -> double;

} // namespace vista::eval
