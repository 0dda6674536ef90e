#pragma once

/**
 * \file collection.hpp
 * \brief Public C++ API: one similarity-search collection over image embeddings.
 *
 * A collection owns a VectorStore, a ConsistencyManager and a QueryEngine. Writes go to
 * the store immediately (read-your-write through get()/snapshot_ids()); queries rank
 * against the latest committed index snapshot, which trails the store by at most the
 * configured staleness bounds.
 *
 * Thread-safety: all members are safe to call concurrently. Mutations are serialized
 * by the store (single writer); queries and reads run in parallel with them and with
 * background index builds. No exceptions are thrown along hot paths; errors are
 * propagated via std::expected.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vista/config.hpp"
#include "vista/consistency/consistency_manager.hpp"
#include "vista/error.hpp"
#include "vista/query/query_engine.hpp"
#include "vista/record.hpp"

namespace vista {

struct collection_impl;

class collection {
public:
  /**
   * \brief Create an empty collection.
   * \return collection on success; config_invalid otherwise
   * The background rebuild worker is started when config.consistency.background is set.
   */
  static auto create(collection_config config) -> std::expected<collection, core::error>;

  /**
   * \brief Reopen a collection saved with save(); the index is served without a rebuild.
   * Errors: not_found, io_failed, data_integrity.
   */
  static auto open(const std::filesystem::path& path,
                   consistency::ConsistencyConfig consistency = {})
      -> std::expected<collection, core::error>;

  collection(collection&&) noexcept;
  collection& operator=(collection&&) noexcept;
  collection(const collection&) = delete;
  collection& operator=(const collection&) = delete;
  ~collection();

  /**
   * \brief Add a record. Errors: dimension_mismatch, duplicate_id, invalid_argument.
   * Preconditions: finite components; id not currently live.
   */
  auto insert(std::string id, std::vector<float> vector, Metadata metadata = {})
      -> std::expected<void, core::error>;

  /** \brief Delete (tombstone) a record. Errors: not_found. */
  auto remove(std::string_view id) -> std::expected<void, core::error>;

  /** \brief Current record for `id`, regardless of index staleness. */
  [[nodiscard]] auto get(std::string_view id) const -> std::optional<Record>;

  /** \brief Live ids, ascending. */
  [[nodiscard]] auto snapshot_ids() const -> std::vector<std::string>;

  /**
   * \brief k most similar records, closest first, ties by ascending id.
   * Errors: dimension_mismatch, invalid_k.
   */
  auto query(std::span<const float> vector, std::int64_t k,
             const query::QueryOptions& options = {}) const
      -> std::expected<query::QueryResult, core::error>;

  /** \brief Build and commit an index synchronously. */
  auto rebuild(bool force = false) -> std::expected<void, core::error>;
  /** \brief Schedule a rebuild on the background worker. */
  auto request_rebuild(bool force = false) -> void;
  /** \brief Run a due build on the calling thread (foreground mode). */
  auto poll() -> std::expected<bool, core::error>;
  /** \brief Wait for the index to catch up with the store. */
  auto wait_until_clean(std::chrono::milliseconds timeout) const -> bool;

  [[nodiscard]] auto status() const -> consistency::CollectionStatus;

  /**
   * \brief Persist the collection. Pending mutations are indexed first so the file
   * reflects every live record.
   */
  auto save(const std::filesystem::path& path) -> std::expected<void, core::error>;

  [[nodiscard]] auto config() const noexcept -> const collection_config&;
  [[nodiscard]] auto dimension() const noexcept -> std::size_t;
  [[nodiscard]] auto metric() const noexcept -> Metric;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  explicit collection(std::unique_ptr<collection_impl> impl);

  std::unique_ptr<collection_impl> impl_;
};

} // namespace vista
