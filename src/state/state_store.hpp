#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "state/clock.hpp"
#include "state/errors.hpp"
#include "state/file_probe.hpp"
#include "state/project_state.hpp"
#include "state/snapshot.hpp"
#include "state/transaction_guard.hpp"

namespace projstate {

// ── StoreOptions ─────────────────────────────────────────────────────────────

struct StoreOptions {
    std::size_t max_snapshots    = 10;   // Snapshot history length (FIFO eviction)
    std::size_t max_transactions = 50;   // Resolved transactions kept (FIFO eviction)
    double      mtime_tolerance  = 0.0;  // Seconds an mtime may differ before it counts as drift
};

// ── ConsistencyReport ────────────────────────────────────────────────────────

struct ConsistencyReport {
    bool                     consistent = true;
    std::vector<std::string> issues;
};

// ── StateStore ───────────────────────────────────────────────────────────────
//
// Transactional, snapshot-based store for the analysis state of one project.
//
// State machine:
//   Uninitialized ──set_state()──▶ Ready
//   Transactions: NoActiveTransaction ⇄ TransactionActive
//   (begin_transaction / commit_transaction or rollback_transaction)
//
// Mutations made while a transaction is active are applied live; the
// transaction only remembers the pre-image so rollback can restore it.  At
// most one transaction may be active at a time.
//
// Every value handed in or out is a copy: callers can never alias the live
// state or the histories.
//
// Concurrency model:
//   One std::shared_mutex guards the live state, both histories and the
//   active-transaction slot together.  Readers take a shared lock, mutators an
//   exclusive lock.  No filesystem I/O happens while the lock is held.
//
// One instance per project; construct it at the pipeline entry point and
// pass it by reference to every stage.

class StateStore {
public:
    // Constructor.
    //   options – history bounds and drift tolerance
    //   logger  – per-project logger (null disables logging)
    //   clock   – timestamp source (owned externally; must outlive the store;
    //             null selects the system clock)
    //   probe   – filesystem view for consistency checks (owned externally;
    //             must outlive the store; null selects the local filesystem)
    //
    // Throws std::invalid_argument if max_snapshots or max_transactions is 0,
    // or mtime_tolerance is negative.
    explicit StateStore(StoreOptions options = {},
                        std::shared_ptr<spdlog::logger> logger = {},
                        const Clock* clock = nullptr,
                        const FileProbe* probe = nullptr);

    // Non-copyable, non-movable – owns a mutex and is shared by reference.
    StateStore(const StateStore&)            = delete;
    StateStore& operator=(const StateStore&) = delete;
    StateStore(StateStore&&)                 = delete;
    StateStore& operator=(StateStore&&)      = delete;

    // ── Read / write ─────────────────────────────────────────────────────────

    // Returns a copy of the live state.  Throws NoStateError before the first
    // successful set_state().
    [[nodiscard]] ProjectState get_state() const;

    // Validates `new_state` and makes a copy of it the live state, appending a
    // snapshot.  Throws ValidationError (live state unchanged) on violations.
    void set_state(const ProjectState& new_state);

    // Pure shape check; see projstate::validate_state().
    [[nodiscard]] std::vector<std::string> validate_state(const ProjectState& state) const;

    // Removes the record(s) named `class_name` from the live state and stores
    // the result like set_state() under operation "invalidate_class:<name>".
    // No-op (no snapshot) when no such class exists.
    // Throws NoStateError when no state has been set.
    void invalidate_class_state(std::string_view class_name);

    // ── Transactions ─────────────────────────────────────────────────────────

    // Captures the live state as the pre-image and returns the transaction id.
    // Allowed before the first set_state(); rollback then returns the store to
    // Uninitialized.  Throws TransactionConflictError if one is already active.
    [[nodiscard]] uint64_t begin_transaction(std::string operation_name);

    // Re-validates the live state, appends a snapshot of it and records the
    // transaction as committed.
    // Throws TransactionNotFoundError if `id` is not the active transaction,
    // ValidationError if the live state is invalid (transaction stays active).
    void commit_transaction(uint64_t id);

    // Restores the pre-image and records the transaction as rolled back.
    // Throws TransactionNotFoundError if `id` is not the active transaction.
    void rollback_transaction(uint64_t id,
                              std::optional<std::string> error = std::nullopt);

    // Like rollback_transaction() but reports a mismatching id by returning
    // false instead of throwing.  Used on unwinding paths.  The live state is
    // restored without allocating; if recording the history entry runs out
    // of memory the entry is dropped and logged.
    bool abandon_transaction(uint64_t id, std::string error) noexcept;

    // Runs `operation` inside a transaction.  Commits and returns its result
    // on success.  If `operation` throws (or the final commit fails
    // validation), the transaction is rolled back and the original exception
    // is rethrown unchanged.
    template <typename Fn>
    std::invoke_result_t<Fn&> execute_with_rollback(std::string operation_name,
                                                    Fn&& operation);

    // As above, and calls `on_error` with the caught exception after the
    // rollback and before the rethrow.  Exceptions not derived from
    // std::exception skip `on_error`.
    template <typename Fn>
    std::invoke_result_t<Fn&> execute_with_rollback(
        std::string operation_name, Fn&& operation,
        const std::function<void(const std::exception&)>& on_error);

    // Copy of the active transaction, if any.
    [[nodiscard]] std::optional<StateTransaction> active_transaction() const;

    // Resolved transactions, most recent first, at most `limit` entries.
    [[nodiscard]] std::vector<StateTransaction> get_transaction_history(std::size_t limit) const;

    // ── Consistency ──────────────────────────────────────────────────────────

    // Compares the live state's class records with the filesystem.  Reports a
    // missing project directory, missing files and files whose mtime differs
    // from last_modified by more than mtime_tolerance.  Relative file paths
    // are resolved against project_path.  Read-only.
    // Throws NoStateError when no state has been set.
    [[nodiscard]] ConsistencyReport verify_state_consistency() const;

    // Same check against a caller-supplied state.
    [[nodiscard]] ConsistencyReport verify_state_consistency(const ProjectState& state) const;

    // ── Snapshot history ─────────────────────────────────────────────────────

    // Throws NotFoundError if `sequence` was evicted or never issued.
    [[nodiscard]] StateSnapshot get_snapshot(uint64_t sequence) const;

    // Throws NotFoundError if the history is empty.
    [[nodiscard]] StateSnapshot get_latest_snapshot() const;

    // Retained snapshots with timestamp >= `since`, oldest first.
    [[nodiscard]] std::vector<StateSnapshot> get_snapshots_since(Clock::time_point since) const;

    [[nodiscard]] std::size_t snapshot_count() const;
    [[nodiscard]] bool has_state() const;

    // ── Reset ────────────────────────────────────────────────────────────────

    // Hard reset for teardown: drops the live state, both histories and any
    // active transaction (without rollback).  Id counters keep counting so a
    // stale transaction id can never match a later transaction.
    void clear_state();

    [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }

private:
    void store_validated(const ProjectState& state, std::string operation);
    uint64_t push_snapshot_locked(StateSnapshot snapshot);
    void rollback_locked(std::optional<std::string> error);
    void record_locked(StateTransaction txn);
    [[nodiscard]] bool is_active_locked(uint64_t id) const noexcept;

    StoreOptions                    options_;
    std::shared_ptr<spdlog::logger> logger_;
    const Clock*                    clock_;
    const FileProbe*                probe_;

    mutable std::shared_mutex        mutex_;
    std::optional<ProjectState>      current_;
    std::deque<StateSnapshot>        snapshots_;     // Oldest first
    std::deque<StateTransaction>     transactions_;  // Oldest first
    std::optional<StateTransaction>  active_;
    uint64_t                         live_sequence_       = 0;   // Snapshot holding current_
    uint64_t                         next_sequence_       = 1;
    uint64_t                         next_transaction_id_ = 1;
};

// ── execute_with_rollback ────────────────────────────────────────────────────

template <typename Fn>
std::invoke_result_t<Fn&> StateStore::execute_with_rollback(std::string operation_name,
                                                            Fn&& operation) {
    return execute_with_rollback(std::move(operation_name), std::forward<Fn>(operation),
                                 nullptr);
}

template <typename Fn>
std::invoke_result_t<Fn&> StateStore::execute_with_rollback(
    std::string operation_name, Fn&& operation,
    const std::function<void(const std::exception&)>& on_error) {
    using Result = std::invoke_result_t<Fn&>;

    // Exceptions not derived from std::exception unwind through ~TransactionGuard.
    TransactionGuard txn(*this, std::move(operation_name));
    try {
        if constexpr (std::is_void_v<Result>) {
            operation();
            txn.commit();
        } else {
            Result result = operation();
            txn.commit();
            return result;
        }
    } catch (const std::exception& e) {
        txn.rollback(e.what());
        if (on_error) {
            on_error(e);
        }
        throw;
    }
}

} // namespace projstate
