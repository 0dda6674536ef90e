#include "vista/eval/retrieval_eval.hpp"
#include "vista/core/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace vista::eval {

namespace {

auto is_relevant(const collection& coll, const std::string& id, std::string_view label_key,
                 const MetadataValue& label) -> bool {
    const auto rec = coll.get(id);
    if (!rec) return false;
    const auto it = rec->metadata.find(std::string(label_key));
    return it != rec->metadata.end() && it->second == label;
}

} // anonymous namespace

auto evaluate_retrieval(const collection& coll, std::span<const LabelledQuery> queries,
                        std::span<const std::uint32_t> cutoffs, std::string_view label_key,
                        const query::QueryOptions& options)
    -> std::expected<RetrievalMetrics, core::error> {
    using core::error_code;
    if (queries.empty()) {
        return core::make_unexpected(error_code::invalid_argument, "no queries", "eval");
    }
    if (cutoffs.empty()) {
        return core::make_unexpected(error_code::invalid_argument, "no cutoffs", "eval");
    }

    RetrievalMetrics m;
    m.cutoffs.assign(cutoffs.begin(), cutoffs.end());
    std::sort(m.cutoffs.begin(), m.cutoffs.end());
    m.cutoffs.erase(std::unique(m.cutoffs.begin(), m.cutoffs.end()), m.cutoffs.end());
    if (m.cutoffs.front() == 0) {
        return core::make_unexpected(error_code::invalid_argument, "cutoffs must be > 0", "eval");
    }
    const std::uint32_t max_k = m.cutoffs.back();

    m.precision.assign(m.cutoffs.size(), 0.0);
    m.recall.assign(m.cutoffs.size(), 0.0);
    m.per_query.reserve(queries.size());
    double ap_sum = 0.0;

    for (const auto& q : queries) {
        const std::int64_t k = static_cast<std::int64_t>(max_k) + (q.exclude_id ? 1 : 0);
        auto result = coll.query(q.vector, k, options);
        if (!result) return std::unexpected(result.error());

        QueryOutcome out;
        for (const auto& hit : *result) {
            if (q.exclude_id && hit.id == *q.exclude_id) continue;
            if (out.retrieved.size() == max_k) break;
            out.retrieved.push_back(hit.id);
            out.distances.push_back(hit.distance);
            out.relevant.push_back(is_relevant(coll, hit.id, label_key, q.label));
        }

        for (std::size_t c = 0; c < m.cutoffs.size(); ++c) {
            const auto upto = std::min<std::size_t>(m.cutoffs[c], out.relevant.size());
            const auto hits = std::count(out.relevant.begin(), out.relevant.begin() + upto, true);
            m.precision[c] += static_cast<double>(hits) / m.cutoffs[c];
            if (hits > 0) m.recall[c] += 1.0;
        }

        double ap = 0.0;
        std::size_t seen = 0;
        for (std::size_t i = 0; i < out.relevant.size(); ++i) {
            if (!out.relevant[i]) continue;
            ++seen;
            ap += static_cast<double>(seen) / static_cast<double>(i + 1);
        }
        if (seen > 0) ap_sum += ap / static_cast<double>(seen);

        m.per_query.push_back(std::move(out));
    }

    const auto nq = static_cast<double>(queries.size());
    for (std::size_t c = 0; c < m.cutoffs.size(); ++c) {
        m.precision[c] /= nq;
        m.recall[c] /= nq;
    }
    m.mean_average_precision = ap_sum / nq;

    core::log_fmt(core::log_level::info, "eval", "queries=", queries.size(), " mAP@", max_k, "=",
                  m.mean_average_precision, " R@", m.cutoffs.front(), "=", m.recall.front());
    return m;
}

auto recall_at_k(const query::QueryResult& approx, const query::QueryResult& exact) -> double {
    if (exact.empty()) return 1.0;
    std::unordered_set<std::string> truth;
    for (const auto& h : exact) truth.insert(h.id);
    std::size_t found = 0;
    for (const auto& h : approx) found += truth.count(h.id);
    return static_cast<double>(found) / static_cast<double>(exact.size());
}

} // namespace vista::eval
