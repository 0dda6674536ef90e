#pragma once

/** \file vector_store.hpp
 *  \brief In-memory record container with handle recycling and tombstones.
 *
 * Thread-safety: mutations (insert/remove/compact/restore) take an exclusive lock, so
 * there is a single writer at a time; reads take a shared lock and run concurrently.
 * Every successful insert/remove bumps a monotonic version used by the consistency
 * manager to measure staleness. Failed mutations never change the version.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vista/error.hpp"
#include "vista/record.hpp"
#include "vista/store/tombstone_set.hpp"

namespace vista::store {

/** \brief Live record together with the handle it occupies. */
struct StoreEntry {
  Handle handle;
  RecordPtr record;
};

/** \brief Point-in-time consistent capture of the store, used as build input. */
struct StoreView {
  std::uint64_t version{0};                    /**< store version at capture */
  std::vector<StoreEntry> live;                /**< ascending by record id */
  std::vector<std::uint32_t> tombstoned_slots; /**< ascending */
};

class VectorStore {
public:
  explicit VectorStore(std::size_t dimension);

  VectorStore(const VectorStore&) = delete;
  VectorStore& operator=(const VectorStore&) = delete;

  [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dimension_; }

  /**
   * \brief Insert a new record.
   * \return Handle of the occupied slot.
   * Errors: dimension_mismatch, duplicate_id (live id exists), invalid_argument
   * (empty id or non-finite component).
   */
  auto insert(std::string id, std::vector<float> vector, Metadata metadata = {})
      -> std::expected<Handle, core::error>;

  /** \brief Tombstone a live record. Errors: not_found (absent or already deleted). */
  auto remove(std::string_view id) -> std::expected<void, core::error>;

  /** \brief Copy of the live record, if any. Independent of index staleness. */
  [[nodiscard]] auto get(std::string_view id) const -> std::optional<Record>;

  [[nodiscard]] auto contains(std::string_view id) const -> bool;

  /** \brief Live ids at call time, ascending. */
  [[nodiscard]] auto snapshot_ids() const -> std::vector<std::string>;

  /** \brief Consistent capture of version, live records and tombstones. */
  [[nodiscard]] auto view() const -> StoreView;

  /** \brief True if the handle still names a live (non-tombstoned, non-recycled) record. */
  [[nodiscard]] auto is_live(Handle handle) const -> bool;

  /**
   * \brief Release tombstoned slots that a committed snapshot no longer references.
   * Freed slots get a new generation and become available for reuse.
   * \return Number of slots released.
   */
  auto compact(std::span<const std::uint32_t> slots) -> std::size_t;

  /**
   * \brief Populate an empty store from persisted records, assigning slots 0..n-1 in order.
   * Errors: invalid_argument if the store is not empty, plus the insert validation errors.
   */
  auto restore(std::span<const RecordPtr> records, std::uint64_t version)
      -> std::expected<std::vector<Handle>, core::error>;

  [[nodiscard]] auto version() const noexcept -> std::uint64_t {
    return version_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto tombstone_count() const -> std::size_t;
  [[nodiscard]] auto tombstone_stats() const -> TombstoneStats;
  [[nodiscard]] auto slot_count() const -> std::size_t;

private:
  struct Slot {
    RecordPtr record;            // null when free
    std::uint32_t generation{0};
  };

  auto validate(std::string_view id, std::span<const float> vector) const
      -> std::expected<void, core::error>;

  const std::size_t dimension_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::uint32_t, std::less<>> by_id_;  // live ids only
  std::vector<Slot> slots_;
  std::vector<std::uint32_t> free_slots_;
  TombstoneSet tombstones_;
  std::atomic<std::uint64_t> version_{0};
};

} // namespace vista::store
