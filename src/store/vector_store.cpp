#include "vista/store/vector_store.hpp"
#include "vista/kernels/distance.hpp"

#include <memory>
#include <mutex>

namespace vista::store {

using core::error_code;
using core::make_unexpected;

VectorStore::VectorStore(std::size_t dimension) : dimension_(dimension) {}

auto VectorStore::validate(std::string_view id, std::span<const float> vector) const
    -> std::expected<void, core::error> {
  if (id.empty()) {
    return make_unexpected(error_code::invalid_argument, "empty id", "store.insert");
  }
  if (vector.size() != dimension_) {
    return make_unexpected(error_code::dimension_mismatch,
                           "vector length " + std::to_string(vector.size()) +
                               " != dimension " + std::to_string(dimension_),
                           "store.insert");
  }
  if (!kernels::all_finite(vector)) {
    return make_unexpected(error_code::invalid_argument, "non-finite vector component",
                           "store.insert");
  }
  return {};
}

auto VectorStore::insert(std::string id, std::vector<float> vector, Metadata metadata)
    -> std::expected<Handle, core::error> {
  if (auto ok = validate(id, vector); !ok) return std::unexpected(ok.error());

  auto record = std::make_shared<const Record>(Record{id, std::move(vector), std::move(metadata)});

  std::unique_lock lock(mutex_);
  if (by_id_.find(id) != by_id_.end()) {
    return make_unexpected(error_code::duplicate_id, "id '" + id + "' already exists",
                           "store.insert");
  }

  std::uint32_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
  } else {
    slot = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  slots_[slot].record = std::move(record);
  by_id_.emplace(std::move(id), slot);
  version_.fetch_add(1, std::memory_order_acq_rel);
  return Handle{slot, slots_[slot].generation};
}

auto VectorStore::remove(std::string_view id) -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return make_unexpected(error_code::not_found, "id '" + std::string(id) + "' not found",
                           "store.remove");
  }
  if (auto marked = tombstones_.mark(it->second); !marked) {
    // A live id always maps to a non-tombstoned slot.
    return make_unexpected(error_code::internal, marked.error().message, "store.remove");
  }
  by_id_.erase(it);
  version_.fetch_add(1, std::memory_order_acq_rel);
  return {};
}

auto VectorStore::get(std::string_view id) const -> std::optional<Record> {
  std::shared_lock lock(mutex_);
  auto it = by_id_.find(id);
  if (it == by_id_.end()) return std::nullopt;
  return *slots_[it->second].record;
}

auto VectorStore::contains(std::string_view id) const -> bool {
  std::shared_lock lock(mutex_);
  return by_id_.find(id) != by_id_.end();
}

auto VectorStore::snapshot_ids() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(by_id_.size());
  for (const auto& [id, slot] : by_id_) ids.push_back(id);
  return ids;
}

auto VectorStore::view() const -> StoreView {
  std::shared_lock lock(mutex_);
  StoreView v;
  v.version = version_.load(std::memory_order_acquire);
  v.live.reserve(by_id_.size());
  for (const auto& [id, slot] : by_id_) {
    v.live.push_back(StoreEntry{Handle{slot, slots_[slot].generation}, slots_[slot].record});
  }
  v.tombstoned_slots = tombstones_.slots();
  return v;
}

auto VectorStore::is_live(Handle handle) const -> bool {
  std::shared_lock lock(mutex_);
  if (handle.slot >= slots_.size()) return false;
  const Slot& s = slots_[handle.slot];
  return s.record != nullptr && s.generation == handle.generation &&
         !tombstones_.contains(handle.slot);
}

auto VectorStore::compact(std::span<const std::uint32_t> slots) -> std::size_t {
  std::unique_lock lock(mutex_);
  const auto released = tombstones_.compact(slots);
  for (std::uint32_t s : released) {
    slots_[s].record.reset();
    slots_[s].generation++;
    free_slots_.push_back(s);
  }
  return released.size();
}

auto VectorStore::restore(std::span<const RecordPtr> records, std::uint64_t version)
    -> std::expected<std::vector<Handle>, core::error> {
  for (const auto& r : records) {
    if (!r) return make_unexpected(error_code::invalid_argument, "null record", "store.restore");
    if (auto ok = validate(r->id, r->vector); !ok) return std::unexpected(ok.error());
  }

  std::unique_lock lock(mutex_);
  if (!slots_.empty()) {
    return make_unexpected(error_code::invalid_argument, "restore requires an empty store",
                           "store.restore");
  }
  std::map<std::string, std::uint32_t, std::less<>> ids;
  std::vector<Handle> handles;
  handles.reserve(records.size());
  for (std::uint32_t i = 0; i < records.size(); ++i) {
    if (!ids.emplace(records[i]->id, i).second) {
      return make_unexpected(error_code::duplicate_id,
                             "id '" + records[i]->id + "' appears twice", "store.restore");
    }
    handles.push_back(Handle{i, 0});
  }
  slots_.resize(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) slots_[i].record = records[i];
  by_id_ = std::move(ids);
  version_.store(version, std::memory_order_release);
  return handles;
}

auto VectorStore::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return by_id_.size();
}

auto VectorStore::tombstone_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return static_cast<std::size_t>(tombstones_.count());
}

auto VectorStore::tombstone_stats() const -> TombstoneStats {
  std::shared_lock lock(mutex_);
  return tombstones_.stats();
}

auto VectorStore::slot_count() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return slots_.size();
}

} // namespace vista::store
