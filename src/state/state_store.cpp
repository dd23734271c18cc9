#include "state/state_store.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <mutex>
#include <new>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

#include "state/checksum.hpp"

namespace projstate {

namespace {

const Clock& default_clock() {
    static const SystemClock clock;
    return clock;
}

const FileProbe& default_probe() {
    static const LocalFileProbe probe;
    return probe;
}

// Class-record fields needed by the filesystem check, copied out of the
// store so the lock is released before any stat() call.
struct TrackedFile {
    std::string           class_name;
    std::filesystem::path path;
    std::optional<double> last_modified;
};

} // anonymous namespace

StateStore::StateStore(StoreOptions options,
                       std::shared_ptr<spdlog::logger> logger,
                       const Clock* clock,
                       const FileProbe* probe)
    : options_(options)
    , logger_(std::move(logger))
    , clock_(clock ? clock : &default_clock())
    , probe_(probe ? probe : &default_probe())
{
    if (options_.max_snapshots == 0) {
        throw std::invalid_argument("max_snapshots must be > 0");
    }
    if (options_.max_transactions == 0) {
        throw std::invalid_argument("max_transactions must be > 0");
    }
    if (!(options_.mtime_tolerance >= 0.0)) {
        throw std::invalid_argument("mtime_tolerance must be >= 0");
    }
}

// ── Read / write ─────────────────────────────────────────────────────────────

ProjectState StateStore::get_state() const {
    std::shared_lock lock(mutex_);
    if (!current_) {
        throw NoStateError();
    }
    return *current_;
}

void StateStore::set_state(const ProjectState& new_state) {
    store_validated(new_state, "set_state");
}

std::vector<std::string> StateStore::validate_state(const ProjectState& state) const {
    return projstate::validate_state(state);
}

void StateStore::invalidate_class_state(std::string_view class_name) {
    std::unique_lock lock(mutex_);
    if (!current_) {
        throw NoStateError();
    }

    ProjectState next = *current_;
    if (!remove_class(next, class_name)) {
        if (logger_) {
            logger_->debug("[state] invalidate: class {} not tracked", class_name);
        }
        return;
    }

    StateSnapshot snapshot;
    snapshot.operation = std::format("invalidate_class:{}", class_name);
    snapshot.checksum  = state_checksum(next);
    snapshot.state     = next;

    current_ = std::move(next);
    const auto seq = push_snapshot_locked(std::move(snapshot));

    if (logger_) {
        logger_->info("[state] Invalidated class {} (snapshot {})", class_name, seq);
    }
}

void StateStore::store_validated(const ProjectState& state, std::string operation) {
    auto violations = projstate::validate_state(state);
    if (!violations.empty()) {
        if (logger_) {
            logger_->warn("[state] Rejected {}: {} violation(s), first: {}",
                          operation, violations.size(), violations.front());
        }
        throw ValidationError(std::move(violations));
    }

    // Both copies are made before taking the lock.
    StateSnapshot snapshot;
    snapshot.operation = std::move(operation);
    snapshot.checksum  = state_checksum(state);
    snapshot.state     = state;
    ProjectState live  = state;

    std::unique_lock lock(mutex_);
    current_ = std::move(live);
    push_snapshot_locked(std::move(snapshot));
}

// ── Transactions ─────────────────────────────────────────────────────────────

uint64_t StateStore::begin_transaction(std::string operation_name) {
    std::unique_lock lock(mutex_);
    if (active_) {
        if (logger_) {
            logger_->warn("[txn] Cannot begin '{}': transaction {} ('{}') is active",
                          operation_name, active_->id, active_->operation);
        }
        throw TransactionConflictError(active_->id);
    }

    StateTransaction txn;
    txn.id         = next_transaction_id_++;
    txn.operation  = std::move(operation_name);
    txn.started_at = clock_->now();

    if (current_) {
        StateSnapshot pre;
        pre.sequence  = live_sequence_;
        pre.timestamp = txn.started_at;
        pre.operation = txn.operation;
        pre.checksum  = state_checksum(*current_);
        pre.state     = *current_;
        txn.pre_image = std::move(pre);
    }

    const auto id = txn.id;
    active_ = std::move(txn);

    if (logger_) {
        logger_->info("[txn] Begin {} '{}'{}", id, active_->operation,
                      active_->pre_image ? "" : " (no prior state)");
    }
    return id;
}

void StateStore::commit_transaction(uint64_t id) {
    std::unique_lock lock(mutex_);
    if (!is_active_locked(id)) {
        throw TransactionNotFoundError(id);
    }

    if (current_) {
        auto violations = projstate::validate_state(*current_);
        if (!violations.empty()) {
            if (logger_) {
                logger_->warn("[txn] Commit {} rejected: {} violation(s)",
                              id, violations.size());
            }
            throw ValidationError(std::move(violations));
        }

        StateSnapshot snapshot;
        snapshot.operation = active_->operation;
        snapshot.checksum  = state_checksum(*current_);
        snapshot.state     = *current_;
        active_->result_sequence = push_snapshot_locked(std::move(snapshot));
    }

    StateTransaction txn = std::move(*active_);
    active_.reset();
    txn.status      = TransactionStatus::Committed;
    txn.finished_at = clock_->now();

    if (logger_) {
        if (txn.result_sequence) {
            logger_->info("[txn] Commit {} '{}' -> snapshot {}",
                          txn.id, txn.operation, *txn.result_sequence);
        } else {
            logger_->info("[txn] Commit {} '{}' (no state)", txn.id, txn.operation);
        }
    }
    record_locked(std::move(txn));
}

void StateStore::rollback_transaction(uint64_t id, std::optional<std::string> error) {
    std::unique_lock lock(mutex_);
    if (!is_active_locked(id)) {
        throw TransactionNotFoundError(id);
    }
    rollback_locked(std::move(error));
}

bool StateStore::abandon_transaction(uint64_t id, std::string error) noexcept {
    std::unique_lock lock(mutex_);
    if (!is_active_locked(id)) {
        if (logger_) {
            logger_->debug("[txn] Abandon {}: not active, nothing to undo", id);
        }
        return false;
    }
    try {
        rollback_locked(std::move(error));
    } catch (const std::bad_alloc&) {
        // Live state is already restored; only the history record is lost.
        if (logger_) {
            logger_->error("[txn] Abandon {}: out of memory recording history", id);
        }
    }
    return true;
}

void StateStore::rollback_locked(std::optional<std::string> error) {
    StateTransaction txn = std::move(*active_);
    active_.reset();

    // The restore only moves, so it cannot fail partway through.
    if (txn.pre_image) {
        current_       = std::move(txn.pre_image->state);
        live_sequence_ = txn.pre_image->sequence;
    } else {
        current_.reset();
        live_sequence_ = 0;
    }

    txn.status      = TransactionStatus::RolledBack;
    txn.finished_at = clock_->now();
    txn.error       = std::move(error);

    if (logger_) {
        logger_->info("[txn] Rollback {} '{}'{}{}", txn.id, txn.operation,
                      txn.error ? ": " : "", txn.error.value_or(""));
    }

    // History keeps its own copy of the pre-image.
    if (txn.pre_image) {
        txn.pre_image->state = *current_;
    }
    record_locked(std::move(txn));
}

void StateStore::record_locked(StateTransaction txn) {
    transactions_.push_back(std::move(txn));
    while (transactions_.size() > options_.max_transactions) {
        transactions_.pop_front();
    }
}

bool StateStore::is_active_locked(uint64_t id) const noexcept {
    return active_ && active_->id == id;
}

std::optional<StateTransaction> StateStore::active_transaction() const {
    std::shared_lock lock(mutex_);
    return active_;
}

std::vector<StateTransaction> StateStore::get_transaction_history(std::size_t limit) const {
    std::shared_lock lock(mutex_);
    const auto n = std::min(limit, transactions_.size());
    return std::vector<StateTransaction>(
        transactions_.rbegin(), transactions_.rbegin() + static_cast<std::ptrdiff_t>(n));
}

// ── Consistency ──────────────────────────────────────────────────────────────

ConsistencyReport StateStore::verify_state_consistency() const {
    std::optional<ProjectState> state;
    {
        std::shared_lock lock(mutex_);
        state = current_;
    }
    if (!state) {
        throw NoStateError();
    }
    return verify_state_consistency(*state);
}

ConsistencyReport StateStore::verify_state_consistency(const ProjectState& state) const {
    const std::filesystem::path root{state.project_path};

    std::vector<TrackedFile> files;
    files.reserve(state.classes.size());
    for (const auto& cls : state.classes) {
        if (!cls.file_path) {
            continue;
        }
        std::filesystem::path path{*cls.file_path};
        if (path.is_relative()) {
            path = root / path;
        }
        files.push_back({cls.name, std::move(path), cls.last_modified});
    }

    ConsistencyReport report;

    const auto root_status = probe_->stat(root);
    if (!root_status.exists || !root_status.is_directory) {
        report.issues.push_back(
            std::format("project directory does not exist: {}", state.project_path));
    }

    for (const auto& file : files) {
        const auto status = probe_->stat(file.path);
        if (!status.exists) {
            report.issues.push_back(std::format("missing file: {} (class {})",
                                                file.path.string(), file.class_name));
            continue;
        }
        if (file.last_modified &&
            std::abs(status.last_modified - *file.last_modified) > options_.mtime_tolerance) {
            report.issues.push_back(std::format(
                "file modified since analysis: {} (class {}, recorded {:.6f}, on disk {:.6f})",
                file.path.string(), file.class_name, *file.last_modified,
                status.last_modified));
        }
    }

    report.consistent = report.issues.empty();

    if (logger_) {
        if (report.consistent) {
            logger_->debug("[consistency] {} tracked file(s) match disk", files.size());
        } else {
            logger_->warn("[consistency] {} issue(s) in project '{}'",
                          report.issues.size(), state.project_name);
        }
    }
    return report;
}

// ── Snapshot history ─────────────────────────────────────────────────────────

uint64_t StateStore::push_snapshot_locked(StateSnapshot snapshot) {
    snapshot.sequence  = next_sequence_++;
    live_sequence_     = snapshot.sequence;
    snapshot.timestamp = clock_->now();
    const auto seq = snapshot.sequence;

    if (logger_) {
        logger_->debug("[snapshot] {} '{}' crc={:#010x}",
                       seq, snapshot.operation, snapshot.checksum);
    }

    snapshots_.push_back(std::move(snapshot));
    while (snapshots_.size() > options_.max_snapshots) {
        if (logger_) {
            logger_->debug("[snapshot] Evicting {}", snapshots_.front().sequence);
        }
        snapshots_.pop_front();
    }
    return seq;
}

StateSnapshot StateStore::get_snapshot(uint64_t sequence) const {
    std::shared_lock lock(mutex_);
    // Sequences are contiguous within the retained window.
    if (!snapshots_.empty()) {
        const auto first = snapshots_.front().sequence;
        if (sequence >= first && sequence <= snapshots_.back().sequence) {
            return snapshots_[static_cast<std::size_t>(sequence - first)];
        }
    }
    throw NotFoundError(std::format("snapshot {} not found", sequence));
}

StateSnapshot StateStore::get_latest_snapshot() const {
    std::shared_lock lock(mutex_);
    if (snapshots_.empty()) {
        throw NotFoundError("snapshot history is empty");
    }
    return snapshots_.back();
}

std::vector<StateSnapshot> StateStore::get_snapshots_since(Clock::time_point since) const {
    std::shared_lock lock(mutex_);
    std::vector<StateSnapshot> result;
    for (const auto& snap : snapshots_) {
        if (snap.timestamp >= since) {
            result.push_back(snap);
        }
    }
    return result;
}

std::size_t StateStore::snapshot_count() const {
    std::shared_lock lock(mutex_);
    return snapshots_.size();
}

bool StateStore::has_state() const {
    std::shared_lock lock(mutex_);
    return current_.has_value();
}

// ── Reset ────────────────────────────────────────────────────────────────────

void StateStore::clear_state() {
    std::unique_lock lock(mutex_);
    if (active_ && logger_) {
        logger_->warn("[state] Clearing with transaction {} ('{}') still active",
                      active_->id, active_->operation);
    }
    current_.reset();
    snapshots_.clear();
    transactions_.clear();
    active_.reset();
    live_sequence_ = 0;

    if (logger_) {
        logger_->info("[state] Store cleared");
    }
}

} // namespace projstate
