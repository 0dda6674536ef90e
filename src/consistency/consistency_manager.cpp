#include "vista/consistency/consistency_manager.hpp"
#include "vista/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vista::consistency {

using Clock = std::chrono::steady_clock;

auto RetryPolicy::backoff(std::uint32_t attempt) const -> std::chrono::milliseconds {
    if (attempt <= 1) return std::min(initial_backoff, max_backoff);
    const double scaled = static_cast<double>(initial_backoff.count()) *
                          std::pow(multiplier, static_cast<double>(attempt - 1));
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(max_backoff.count())) {
        return max_backoff;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(scaled));
}

ConsistencyManager::ConsistencyManager(std::shared_ptr<store::VectorStore> store,
                                       index::IndexBuildConfig build_config,
                                       ConsistencyConfig config)
    : store_(std::move(store)),
      builder_(build_config, store_->dimension()),
      config_(std::move(config)) {}

ConsistencyManager::~ConsistencyManager() { stop(); }

auto ConsistencyManager::start() -> void {
    if (!config_.background || worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
}

auto ConsistencyManager::stop() -> void {
    {
        std::lock_guard lock(mutex_);
        if (build_stop_) build_stop_->request_stop();
    }
    if (worker_.joinable()) {
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();
    }
}

auto ConsistencyManager::notify_mutation() -> void {
    std::lock_guard lock(mutex_);
    if (state_ == CollectionState::Clean) {
        dirty_since_ = Clock::now();
        transition(CollectionState::Dirty, "mutation");
    } else if (state_ == CollectionState::Building && config_.cancel_superseded && build_stop_) {
        const auto newer = store_->version() - building_view_version_;
        if (newer >= config_.max_pending_mutations && !build_stop_->stop_requested()) {
            core::log_fmt(core::log_level::info, "consistency", "cancelling build of version ",
                          building_view_version_, ": ", newer, " newer mutations");
            build_stop_->request_stop();
        }
    } else if (state_ == CollectionState::Degraded && retries_exhausted_) {
        // New data starts a fresh retry cycle; the failed builds saw an older store.
        core::log_fmt(core::log_level::info, "consistency",
                      "mutation while degraded, restarting retries after ", failed_attempts_,
                      " failed attempts");
        retries_exhausted_ = false;
        failed_attempts_ = 0;
        retry_at_ = Clock::now();
    }
    cv_.notify_all();
}

auto ConsistencyManager::request_rebuild(bool force) -> void {
    std::lock_guard lock(mutex_);
    rebuild_requested_ = true;
    force_requested_ = force_requested_ || force;
    // An explicit request starts a fresh retry cycle.
    retries_exhausted_ = false;
    failed_attempts_ = 0;
    cv_.notify_all();
}

auto ConsistencyManager::rebuild_now(bool force) -> std::expected<void, core::error> {
    {
        std::lock_guard lock(mutex_);
        retries_exhausted_ = false;
        failed_attempts_ = 0;
        force = force || force_requested_;
    }
    return run_build(BuildRequest{force});
}

auto ConsistencyManager::poll() -> std::expected<bool, core::error> {
    BuildRequest request;
    {
        std::lock_guard lock(mutex_);
        if (!build_due(Clock::now())) return false;
        request.force = force_requested_;
    }
    if (auto built = run_build(request); !built) return std::unexpected(built.error());
    return true;
}

auto ConsistencyManager::wait_until_clean(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_ == CollectionState::Clean; });
}

auto ConsistencyManager::install(index::SnapshotPtr snapshot) -> void {
    const auto snapshot_version = snapshot ? snapshot->store_version() : 0;
    current_.store(std::move(snapshot), std::memory_order_release);
    std::lock_guard lock(mutex_);
    if (store_->version() > snapshot_version) {
        dirty_since_ = Clock::now();
        transition(CollectionState::Dirty, "installed snapshot is behind the store");
    } else {
        transition(CollectionState::Clean, "snapshot installed");
    }
    cv_.notify_all();
}

auto ConsistencyManager::status() const -> CollectionStatus {
    const auto snapshot = current();
    std::lock_guard lock(mutex_);
    CollectionStatus s;
    s.state = state_;
    s.store_version = store_->version();
    s.has_snapshot = snapshot != nullptr;
    s.serving_version = snapshot ? snapshot->store_version() : 0;
    s.serving_size = snapshot ? snapshot->size() : 0;
    s.pending_mutations = s.store_version > s.serving_version
                              ? static_cast<std::size_t>(s.store_version - s.serving_version)
                              : 0;
    s.failed_attempts = failed_attempts_;
    s.retries_exhausted = retries_exhausted_;
    s.last_error = last_error_;
    s.builds_committed = builds_committed_;
    s.builds_failed = builds_failed_;
    s.builds_cancelled = builds_cancelled_;
    const auto tombstones = store_->tombstone_stats();
    s.tombstones_pending =
        static_cast<std::size_t>(tombstones.total_marked - tombstones.total_compacted);
    s.slots_reclaimed = tombstones.total_compacted;
    return s;
}

auto ConsistencyManager::state() const -> CollectionState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto ConsistencyManager::build_due(Clock::time_point now) const -> bool {
    switch (state_) {
        case CollectionState::Building:
            return false;
        case CollectionState::Clean:
            return rebuild_requested_;
        case CollectionState::Dirty: {
            if (rebuild_requested_) return true;
            const auto snapshot = current();
            const std::uint64_t serving = snapshot ? snapshot->store_version() : 0;
            const std::uint64_t stored = store_->version();
            if (stored > serving && stored - serving >= config_.max_pending_mutations) return true;
            return now - dirty_since_ >= config_.max_staleness;
        }
        case CollectionState::Degraded:
            if (rebuild_requested_) return true;
            return !retries_exhausted_ && now >= retry_at_;
    }
    return false;
}

auto ConsistencyManager::next_wakeup() const -> Clock::time_point {
    auto wake = Clock::time_point::max();
    if (state_ == CollectionState::Dirty) wake = std::min(wake, dirty_since_ + config_.max_staleness);
    if (state_ == CollectionState::Degraded && !retries_exhausted_) wake = std::min(wake, retry_at_);
    return wake;
}

auto ConsistencyManager::worker_loop(std::stop_token stop) -> void {
    core::log_fmt(core::log_level::debug, "consistency", "worker started");
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (build_due(Clock::now())) {
            const BuildRequest request{force_requested_};
            lock.unlock();
            // Failures are recorded in status() and retried per the retry policy.
            auto built = run_build(request);
            lock.lock();
            if (!built && stop.stop_requested()) break;
            continue;
        }
        // Sleep until a build is due or an earlier wake-up time appears.
        const auto wake = next_wakeup();
        const auto changed = [&] {
            const auto t = Clock::now();
            return build_due(t) || next_wakeup() < wake;
        };
        if (wake == Clock::time_point::max()) {
            cv_.wait(lock, stop, changed);
        } else {
            cv_.wait_until(lock, stop, wake, changed);
        }
    }
    core::log_fmt(core::log_level::debug, "consistency", "worker stopped");
}

auto ConsistencyManager::run_build(BuildRequest request) -> std::expected<void, core::error> {
    std::lock_guard build_lock(build_mutex_);

    std::stop_source source;
    const auto previous = current();
    {
        std::lock_guard lock(mutex_);
        rebuild_requested_ = false;
        force_requested_ = false;
        build_stop_ = source;
        // The view captured below is at least this recent.
        building_view_version_ = store_->version();
        transition(CollectionState::Building, request.force ? "forced rebuild" : "rebuild");
    }

    const auto view = store_->view();
    {
        std::lock_guard lock(mutex_);
        building_view_version_ = view.version;
    }
    if (config_.on_view_captured) config_.on_view_captured(view);

    const index::BuildControl control{source.get_token(), Clock::now() + config_.build_timeout};
    auto built = builder_.build(view, control);

    // An emptied store is committed as an empty snapshot only when asked to, or when
    // there is nothing better to serve.
    if (!built && built.error().code == core::error_code::empty_collection &&
        (request.force || !previous || previous->empty())) {
        built = index::IndexSnapshot::make_empty(builder_.config(), builder_.dimension(),
                                                 view.version);
    }

    if (built) {
        current_.store(*built, std::memory_order_release);
        const auto released = store_->compact(view.tombstoned_slots);

        std::lock_guard lock(mutex_);
        build_stop_.reset();
        ++builds_committed_;
        failed_attempts_ = 0;
        retries_exhausted_ = false;
        last_error_.reset();
        core::log_fmt(core::log_level::info, "consistency", "committed version ", view.version,
                      " entries=", (*built)->size(), " released_slots=", released);
        if (store_->version() > view.version) {
            dirty_since_ = Clock::now();
            transition(CollectionState::Dirty, "mutations during build");
        } else {
            transition(CollectionState::Clean, "commit");
        }
        cv_.notify_all();
        return {};
    }

    const core::error err = built.error();
    std::lock_guard lock(mutex_);
    build_stop_.reset();

    if (err.code == core::error_code::cancelled) {
        ++builds_cancelled_;
        rebuild_requested_ = true;
        dirty_since_ = Clock::now();
        transition(CollectionState::Dirty, "build cancelled");
        cv_.notify_all();
        return std::unexpected(err);
    }

    ++builds_failed_;
    ++failed_attempts_;
    last_error_ = err;
    transition(CollectionState::Degraded, to_string(err.code));
    if (failed_attempts_ > config_.retry.max_retries) {
        retries_exhausted_ = true;
        core::log_fmt(core::log_level::error, "consistency", "build failed (", to_string(err.code),
                      ": ", err.message, "); retries exhausted after ", failed_attempts_,
                      " attempts, serving version ", previous ? previous->store_version() : 0);
    } else {
        const auto delay = config_.retry.backoff(failed_attempts_);
        retry_at_ = Clock::now() + delay;
        core::log_fmt(core::log_level::warn, "consistency", "build failed (", to_string(err.code),
                      ": ", err.message, "); attempt ", failed_attempts_, ", retry in ",
                      delay.count(), "ms");
    }
    cv_.notify_all();
    return std::unexpected(err);
}

auto ConsistencyManager::transition(CollectionState to, std::string_view why) -> void {
    if (state_ == to) return;
    core::log_fmt(core::log_level::info, "consistency", to_string(state_), " -> ", to_string(to),
                  " (", why, ")");
    state_ = to;
    state_cv_.notify_all();
}

} // namespace vista::consistency
