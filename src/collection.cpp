#include "vista/collection.hpp"
#include "vista/core/log.hpp"
#include "vista/index/index_builder.hpp"
#include "vista/persist/snapshot_io.hpp"
#include "vista/store/vector_store.hpp"

#include <utility>

namespace vista {

struct collection_impl {
  collection_config config;
  std::shared_ptr<store::VectorStore> store;
  std::shared_ptr<consistency::ConsistencyManager> manager;
  std::optional<query::QueryEngine> engine;

  ~collection_impl() {
    if (manager) manager->stop();
  }
};

namespace {

auto wire(std::unique_ptr<collection_impl>& impl) -> std::expected<void, core::error> {
  impl->manager = std::make_shared<consistency::ConsistencyManager>(
      impl->store, impl->config.index, impl->config.consistency);
  auto engine = query::QueryEngine::create(impl->manager, impl->store, impl->config.metric);
  if (!engine) return std::unexpected(engine.error());
  impl->engine.emplace(std::move(*engine));
  return {};
}

} // anonymous namespace

collection::collection(std::unique_ptr<collection_impl> impl) : impl_(std::move(impl)) {}
collection::collection(collection&&) noexcept = default;
collection& collection::operator=(collection&&) noexcept = default;
collection::~collection() = default;

auto collection::create(collection_config config) -> std::expected<collection, core::error> {
  config.index.metric = config.metric;
  if (auto ok = validate(config); !ok) return std::unexpected(ok.error());
  if (auto ok = index::validate_build_config(config.index); !ok) return std::unexpected(ok.error());

  auto impl = std::make_unique<collection_impl>();
  impl->config = std::move(config);
  impl->store = std::make_shared<store::VectorStore>(impl->config.dimension);
  if (auto ok = wire(impl); !ok) return std::unexpected(ok.error());
  impl->manager->start();

  core::log_fmt(core::log_level::info, "collection", "created dim=", impl->config.dimension,
                " metric=", to_string(impl->config.metric),
                " strategy=", to_string(impl->config.index.strategy));
  return collection(std::move(impl));
}

auto collection::open(const std::filesystem::path& path,
                      consistency::ConsistencyConfig consistency)
    -> std::expected<collection, core::error> {
  auto loaded = persist::load_snapshot(path);
  if (!loaded) return std::unexpected(loaded.error());
  const index::SnapshotPtr snapshot = std::move(*loaded);

  auto impl = std::make_unique<collection_impl>();
  impl->config.dimension = snapshot->dimension();
  impl->config.metric = snapshot->metric();
  impl->config.index = snapshot->config();
  impl->config.consistency = std::move(consistency);
  if (auto ok = validate(impl->config); !ok) return std::unexpected(ok.error());

  impl->store = std::make_shared<store::VectorStore>(impl->config.dimension);
  std::vector<RecordPtr> records;
  records.reserve(snapshot->size());
  for (const auto& e : snapshot->entries()) records.push_back(e.record);
  if (auto restored = impl->store->restore(records, snapshot->store_version()); !restored) {
    return std::unexpected(core::error{core::error_code::data_integrity,
                                       restored.error().message, "collection.open"});
  }

  if (auto ok = wire(impl); !ok) return std::unexpected(ok.error());
  impl->manager->install(snapshot);
  impl->manager->start();
  return collection(std::move(impl));
}

auto collection::insert(std::string id, std::vector<float> vector, Metadata metadata)
    -> std::expected<void, core::error> {
  auto handle = impl_->store->insert(std::move(id), std::move(vector), std::move(metadata));
  if (!handle) return std::unexpected(handle.error());
  impl_->manager->notify_mutation();
  return {};
}

auto collection::remove(std::string_view id) -> std::expected<void, core::error> {
  if (auto ok = impl_->store->remove(id); !ok) return ok;
  impl_->manager->notify_mutation();
  return {};
}

auto collection::get(std::string_view id) const -> std::optional<Record> {
  return impl_->store->get(id);
}

auto collection::snapshot_ids() const -> std::vector<std::string> {
  return impl_->store->snapshot_ids();
}

auto collection::query(std::span<const float> vector, std::int64_t k,
                       const query::QueryOptions& options) const
    -> std::expected<query::QueryResult, core::error> {
  return impl_->engine->query(vector, k, options);
}

auto collection::rebuild(bool force) -> std::expected<void, core::error> {
  return impl_->manager->rebuild_now(force);
}

auto collection::request_rebuild(bool force) -> void { impl_->manager->request_rebuild(force); }

auto collection::poll() -> std::expected<bool, core::error> { return impl_->manager->poll(); }

auto collection::wait_until_clean(std::chrono::milliseconds timeout) const -> bool {
  return impl_->manager->wait_until_clean(timeout);
}

auto collection::status() const -> consistency::CollectionStatus {
  return impl_->manager->status();
}

auto collection::save(const std::filesystem::path& path) -> std::expected<void, core::error> {
  const auto st = impl_->manager->status();
  if (!st.has_snapshot || st.pending_mutations > 0) {
    // An emptied store is saved as such rather than as the last non-empty index.
    if (auto ok = impl_->manager->rebuild_now(/*force=*/true); !ok) return ok;
  }
  const auto snapshot = impl_->manager->current();
  if (!snapshot) {
    return core::make_unexpected(core::error_code::internal, "no snapshot after rebuild",
                                 "collection.save");
  }
  return persist::save_snapshot(path, *snapshot);
}

auto collection::config() const noexcept -> const collection_config& { return impl_->config; }
auto collection::dimension() const noexcept -> std::size_t { return impl_->config.dimension; }
auto collection::metric() const noexcept -> Metric { return impl_->config.metric; }
auto collection::size() const -> std::size_t { return impl_->store->size(); }

} // namespace vista
