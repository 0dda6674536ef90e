#include "vista/config.hpp"
#include "vista/core/log.hpp"
#include "vista/core/platform_utils.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <string>

namespace vista {

namespace {

auto env_u64(const char* name) -> std::optional<std::uint64_t> {
  auto raw = core::getenv_nonempty(name);
  if (!raw) return std::nullopt;
  auto v = core::parse_u64(*raw);
  if (!v) {
    core::log_fmt(core::log_level::warn, "config", "ignoring ", name, "='", *raw,
                  "': not an unsigned integer");
  }
  return v;
}

auto env_u32(const char* name) -> std::optional<std::uint32_t> {
  auto v = env_u64(name);
  if (v && *v > std::numeric_limits<std::uint32_t>::max()) {
    core::log_fmt(core::log_level::warn, "config", "ignoring ", name, ": out of range");
    return std::nullopt;
  }
  if (!v) return std::nullopt;
  return static_cast<std::uint32_t>(*v);
}

} // anonymous namespace

auto apply_env_overrides(collection_config& config) -> void {
  if (auto s = core::getenv_nonempty("VISTA_INDEX_STRATEGY")) {
    if (core::equals_ci(*s, "exact") || core::equals_ci(*s, "flat")) {
      config.index.strategy = index::IndexStrategy::Exact;
    } else if (core::equals_ci(*s, "partitioned") || core::equals_ci(*s, "ivf")) {
      config.index.strategy = index::IndexStrategy::Partitioned;
    } else {
      core::log_fmt(core::log_level::warn, "config", "ignoring VISTA_INDEX_STRATEGY='", *s, "'");
    }
  }
  if (auto v = env_u32("VISTA_NUM_PARTITIONS")) config.index.num_partitions = *v;
  if (auto v = env_u32("VISTA_PROBE_COUNT")) config.index.probe_count = *v;
  if (auto v = env_u64("VISTA_MAX_PENDING")) {
    config.consistency.max_pending_mutations = static_cast<std::size_t>(*v);
  }
  if (auto v = env_u32("VISTA_MAX_STALENESS_MS")) {
    config.consistency.max_staleness = std::chrono::milliseconds(*v);
  }
  if (auto v = env_u32("VISTA_BUILD_TIMEOUT_MS")) {
    config.consistency.build_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = env_u32("VISTA_BUILD_RETRIES")) config.consistency.retry.max_retries = *v;
}

auto validate(const collection_config& config) -> std::expected<void, core::error> {
  using core::error_code;
  if (config.dimension == 0) {
    return core::make_unexpected(error_code::config_invalid, "dimension must be > 0", "config");
  }
  if (config.index.num_partitions == 0) {
    return core::make_unexpected(error_code::config_invalid, "num_partitions must be > 0",
                                 "config");
  }
  if (config.index.probe_count == 0) {
    return core::make_unexpected(error_code::config_invalid, "probe_count must be > 0", "config");
  }
  if (config.index.probe_count > config.index.num_partitions) {
    return core::make_unexpected(error_code::config_invalid,
                                 "probe_count " + std::to_string(config.index.probe_count) +
                                     " exceeds num_partitions " +
                                     std::to_string(config.index.num_partitions),
                                 "config");
  }
  if (config.index.max_iter == 0) {
    return core::make_unexpected(error_code::config_invalid, "max_iter must be > 0", "config");
  }
  const auto& c = config.consistency;
  if (c.max_staleness.count() < 0 || c.build_timeout.count() < 0 ||
      c.retry.initial_backoff.count() < 0 || c.retry.max_backoff.count() < 0 ||
      c.retry.multiplier < 1.0) {
    return core::make_unexpected(error_code::config_invalid,
                                 "timeouts must be non-negative and backoff multiplier >= 1",
                                 "config");
  }
  return {};
}

} // namespace vista
