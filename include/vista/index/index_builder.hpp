#pragma once

/** \file index_builder.hpp
 *  \brief Turns a point-in-time store view into an immutable IndexSnapshot.
 *
 * Build is a pure function of (view.live, config): identical inputs and seed give an
 * identical snapshot. Errors:
 * - empty_collection: the view holds no live records
 * - config_invalid: zero partitions / probe count for the partitioned strategy
 * - cancelled / build_timeout: reported from BuildControl checks
 *
 * Thread-safety: build() is const and may run on any thread.
 */

#include <cstddef>
#include <expected>

#include "vista/error.hpp"
#include "vista/index/build_control.hpp"
#include "vista/index/index_config.hpp"
#include "vista/index/index_snapshot.hpp"
#include "vista/store/vector_store.hpp"

namespace vista::index {

/** \brief Check a build configuration independently of any data. */
auto validate_build_config(const IndexBuildConfig& config) -> std::expected<void, core::error>;

class IndexBuilder {
public:
    IndexBuilder(IndexBuildConfig config, std::size_t dimension);

    auto build(const store::StoreView& view, const BuildControl& control = {}) const
        -> std::expected<SnapshotPtr, core::error>;

    [[nodiscard]] auto config() const noexcept -> const IndexBuildConfig& { return config_; }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dimension_; }

private:
    auto build_partitioned(std::vector<float> rows, std::size_t n,
                           const BuildControl& control) const
        -> std::expected<IndexVariant, core::error>;

    IndexBuildConfig config_;
    std::size_t dimension_;
};

} // namespace vista::index
