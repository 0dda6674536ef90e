#include "vista/index/index_builder.hpp"
#include "vista/core/log.hpp"
#include "vista/index/kmeans.hpp"
#include "vista/kernels/distance.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

namespace vista::index {

namespace {
// Rows copied between BuildControl checks.
constexpr std::size_t kCheckEvery = 4096;
} // anonymous namespace

auto validate_build_config(const IndexBuildConfig& config) -> std::expected<void, core::error> {
    using core::error_code;
    if (config.strategy == IndexStrategy::Partitioned) {
        if (config.num_partitions == 0) {
            return core::make_unexpected(error_code::config_invalid, "num_partitions must be > 0",
                                         "index.config");
        }
        if (config.probe_count == 0) {
            return core::make_unexpected(error_code::config_invalid, "probe_count must be > 0",
                                         "index.config");
        }
        if (config.max_iter == 0) {
            return core::make_unexpected(error_code::config_invalid, "max_iter must be > 0",
                                         "index.config");
        }
    }
    return {};
}

IndexBuilder::IndexBuilder(IndexBuildConfig config, std::size_t dimension)
    : config_(config), dimension_(dimension) {}

auto IndexBuilder::build(const store::StoreView& view, const BuildControl& control) const
    -> std::expected<SnapshotPtr, core::error> {
    using core::error_code;

    if (auto ok = validate_build_config(config_); !ok) return std::unexpected(ok.error());
    if (view.live.empty()) {
        return core::make_unexpected(error_code::empty_collection, "no live records to index",
                                     "index.build");
    }

    const auto t0 = std::chrono::steady_clock::now();
    const std::size_t n = view.live.size();

    std::vector<SnapshotEntry> entries;
    entries.reserve(n);
    std::vector<float> rows;
    rows.reserve(n * dimension_);
    for (std::size_t i = 0; i < n; ++i) {
        if (i % kCheckEvery == 0) {
            if (auto ok = control.check("index.build"); !ok) return std::unexpected(ok.error());
        }
        const auto& e = view.live[i];
        if (e.record->vector.size() != dimension_) {
            return core::make_unexpected(error_code::dimension_mismatch,
                                         "record '" + e.record->id + "' has wrong dimension",
                                         "index.build");
        }
        entries.push_back(SnapshotEntry{e.handle, e.record});
        rows.insert(rows.end(), e.record->vector.begin(), e.record->vector.end());
    }

    IndexVariant index;
    if (config_.strategy == IndexStrategy::Partitioned) {
        auto built = build_partitioned(std::move(rows), n, control);
        if (!built) return std::unexpected(built.error());
        index = std::move(*built);
    } else {
        index = FlatIndex(dimension_, std::move(rows));
    }

    if (auto ok = control.check("index.build"); !ok) return std::unexpected(ok.error());

    const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0);
    core::log_fmt(core::log_level::info, "index.build", "strategy=", to_string(config_.strategy),
                  " metric=", to_string(config_.metric), " n=", n, " version=", view.version,
                  " time=", ms.count(), "ms");

    return std::make_shared<const IndexSnapshot>(config_, dimension_, view.version,
                                                 std::move(entries), std::move(index));
}

auto IndexBuilder::build_partitioned(std::vector<float> rows, std::size_t n,
                                     const BuildControl& control) const
    -> std::expected<IndexVariant, core::error> {
    const std::uint32_t nlist =
        static_cast<std::uint32_t>(std::min<std::size_t>(config_.num_partitions, n));

    // Cosine partitions are learned on the unit sphere; lists keep the raw vectors.
    std::vector<float> train;
    const float* train_data = rows.data();
    if (config_.metric == Metric::Cosine) {
        train = rows;
        for (std::size_t i = 0; i < n; ++i) {
            kernels::normalize_in_place(std::span(train.data() + i * dimension_, dimension_));
        }
        train_data = train.data();
    }

    KmeansParams kp;
    kp.k = nlist;
    kp.max_iter = config_.max_iter;
    kp.epsilon = config_.epsilon;
    kp.seed = config_.seed;
    kp.verbose = config_.verbose;

    auto km = kmeans_cluster(train_data, n, dimension_, kp, control);
    if (!km) {
        return std::unexpected(core::error{km.error().code, km.error().message, "index.build.kmeans"});
    }

    std::vector<std::vector<std::uint32_t>> list_entries(nlist);
    for (std::uint32_t c = 0; c < nlist; ++c) list_entries[c].reserve(km->cluster_sizes[c]);
    for (std::size_t i = 0; i < n; ++i) {
        list_entries[km->assignments[i]].push_back(static_cast<std::uint32_t>(i));
    }

    if (auto ok = control.check("index.build"); !ok) return std::unexpected(ok.error());

    if (config_.verbose) {
        const auto [mn, mx] = std::minmax_element(km->cluster_sizes.begin(), km->cluster_sizes.end());
        core::log_fmt(core::log_level::debug, "index.build", "partitions=", nlist,
                      " min_list=", *mn, " max_list=", *mx, " iterations=", km->iterations);
    }

    return IndexVariant{PartitionedIndex(dimension_, config_.probe_count,
                                         std::move(km->centroids), list_entries, rows)};
}

} // namespace vista::index
