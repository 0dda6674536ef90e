#pragma once

/** \file consistency_manager.hpp
 *  \brief Keeps the serving IndexSnapshot in step with the VectorStore.
 *
 * State machine per collection:
 *
 *   Clean    --mutation-------------------------------> Dirty
 *   Dirty    --threshold | staleness | request--------> Building
 *   Building --commit, no newer mutation--------------> Clean
 *   Building --commit, mutations during build---------> Dirty
 *   Building --cancelled (superseded)-----------------> Dirty
 *   Building --failure (timeout, empty, ...)----------> Degraded
 *   Degraded --retry (backoff) | request--------------> Building
 *   Degraded --mutation after retries ran out---------> Degraded, retries restarted
 *
 * The serving snapshot is published through an atomic shared_ptr swap. Queries that
 * already hold a snapshot keep it; new queries see the newly committed one. A failed
 * build never replaces the last good snapshot.
 *
 * Thread-safety: every public member is safe to call concurrently. Builds run on a
 * dedicated worker thread (background mode) or on the caller of rebuild_now(); at
 * most one build runs at a time.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

#include "vista/error.hpp"
#include "vista/index/index_builder.hpp"
#include "vista/index/index_snapshot.hpp"
#include "vista/store/vector_store.hpp"

namespace vista::consistency {

enum class CollectionState { Clean, Dirty, Building, Degraded };

constexpr auto to_string(CollectionState s) noexcept -> std::string_view {
    switch (s) {
        case CollectionState::Clean: return "clean";
        case CollectionState::Dirty: return "dirty";
        case CollectionState::Building: return "building";
        case CollectionState::Degraded: return "degraded";
    }
    return "unknown";
}

/** \brief Bounded retry with exponential backoff for failed builds. */
struct RetryPolicy {
    std::uint32_t max_retries{3};
    std::chrono::milliseconds initial_backoff{100};
    double multiplier{2.0};
    std::chrono::milliseconds max_backoff{10'000};

    /** \brief Delay before retry number `attempt` (1-based). */
    [[nodiscard]] auto backoff(std::uint32_t attempt) const -> std::chrono::milliseconds;
};

/** \brief Rebuild triggering and failure policy. */
struct ConsistencyConfig {
    std::size_t max_pending_mutations{1024};           /**< rebuild once this many are pending */
    std::chrono::milliseconds max_staleness{1000};     /**< rebuild once dirty for this long */
    std::chrono::milliseconds build_timeout{30'000};   /**< deadline per build attempt */
    RetryPolicy retry;
    bool background{true};          /**< run a worker thread; otherwise only rebuild_now() builds */
    bool cancel_superseded{false};  /**< cancel a build once max_pending newer mutations arrive */
    /** Invoked on the building thread right after the store view is captured. */
    std::function<void(const store::StoreView&)> on_view_captured;
};

/** \brief Snapshot of manager state for callers and operators. */
struct CollectionStatus {
    CollectionState state{CollectionState::Clean};
    std::uint64_t store_version{0};
    std::uint64_t serving_version{0};      /**< store version the serving snapshot reflects */
    std::size_t pending_mutations{0};      /**< store_version - serving_version */
    std::size_t serving_size{0};           /**< entries in the serving snapshot */
    bool has_snapshot{false};
    std::uint32_t failed_attempts{0};      /**< consecutive failures */
    bool retries_exhausted{false};
    std::optional<core::error> last_error;
    std::uint64_t builds_committed{0};
    std::uint64_t builds_failed{0};
    std::uint64_t builds_cancelled{0};
    std::size_t tombstones_pending{0};     /**< deleted slots not yet reclaimed by a commit */
    std::uint64_t slots_reclaimed{0};      /**< deleted slots released by commits so far */
};

class ConsistencyManager {
public:
    ConsistencyManager(std::shared_ptr<store::VectorStore> store,
                       index::IndexBuildConfig build_config, ConsistencyConfig config);
    ~ConsistencyManager();

    ConsistencyManager(const ConsistencyManager&) = delete;
    ConsistencyManager& operator=(const ConsistencyManager&) = delete;

    /** \brief Start the background worker (no-op unless config.background). */
    auto start() -> void;
    /** \brief Cancel any running build and join the worker. Idempotent. */
    auto stop() -> void;

    /**
     * \brief Called after each successful store mutation. Never blocks on a build.
     * A mutation that arrives after retries are exhausted schedules a new retry cycle.
     */
    auto notify_mutation() -> void;

    /** \brief Ask the worker to rebuild as soon as possible. `force` allows empty commits. */
    auto request_rebuild(bool force = false) -> void;

    /**
     * \brief Build and commit on the calling thread (waits for a running build first).
     * \return The build error on failure; the manager is then Degraded.
     */
    auto rebuild_now(bool force = false) -> std::expected<void, core::error>;

    /**
     * \brief Run a build on the calling thread if one is due (threshold, staleness, retry or
     * request). Lets a single-threaded event loop drive the same state machine as the worker.
     * \return true if a snapshot was committed, false if nothing was due.
     */
    auto poll() -> std::expected<bool, core::error>;

    /** \brief Wait until the state is Clean; false on timeout. */
    auto wait_until_clean(std::chrono::milliseconds timeout) const -> bool;

    /** \brief Install an externally loaded snapshot (e.g. from disk) as the serving one. */
    auto install(index::SnapshotPtr snapshot) -> void;

    /** \brief Latest committed snapshot; null until the first commit. */
    [[nodiscard]] auto current() const -> index::SnapshotPtr {
        return current_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto status() const -> CollectionStatus;
    [[nodiscard]] auto state() const -> CollectionState;
    [[nodiscard]] auto build_config() const noexcept -> const index::IndexBuildConfig& {
        return builder_.config();
    }
    [[nodiscard]] auto config() const noexcept -> const ConsistencyConfig& { return config_; }

private:
    struct BuildRequest {
        bool force{false};
    };

    auto worker_loop(std::stop_token stop) -> void;
    /** \brief Decide whether a build is due; caller holds mutex_. */
    auto build_due(std::chrono::steady_clock::time_point now) const -> bool;
    /** \brief Next instant the worker must wake up on its own; caller holds mutex_. */
    auto next_wakeup() const -> std::chrono::steady_clock::time_point;
    auto run_build(BuildRequest request) -> std::expected<void, core::error>;
    auto transition(CollectionState to, std::string_view why) -> void;

    std::shared_ptr<store::VectorStore> store_;
    index::IndexBuilder builder_;
    ConsistencyConfig config_;

    std::atomic<index::SnapshotPtr> current_;

    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;   // wakes the worker
    mutable std::condition_variable state_cv_; // wakes wait_until_clean()
    std::mutex build_mutex_;                   // one build at a time

    CollectionState state_{CollectionState::Clean};
    bool rebuild_requested_{false};
    bool force_requested_{false};
    std::chrono::steady_clock::time_point dirty_since_{};
    std::chrono::steady_clock::time_point retry_at_{};
    std::uint64_t building_view_version_{0};
    std::optional<std::stop_source> build_stop_;

    std::uint32_t failed_attempts_{0};
    bool retries_exhausted_{false};
    std::optional<core::error> last_error_;
    std::uint64_t builds_committed_{0};
    std::uint64_t builds_failed_{0};
    std::uint64_t builds_cancelled_{0};

    std::jthread worker_;
};

} // namespace vista::consistency
