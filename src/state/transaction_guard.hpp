#pragma once

#include <cstdint>
#include <string>

namespace projstate {

class StateStore;

// ── TransactionGuard ─────────────────────────────────────────────────────────
//
// Scoped transaction: begins a transaction on construction and rolls it back
// on destruction unless commit() succeeded.  Rollback therefore happens on
// every exit path, including early returns and exceptions.
//
//   TransactionGuard txn(store, "generate_tests");
//   store.set_state(next);
//   txn.commit();
//
// Not thread-safe; a guard belongs to the scope that created it.

class TransactionGuard {
public:
    // Throws TransactionConflictError if `store` already has an active
    // transaction.
    TransactionGuard(StateStore& store, std::string operation_name);

    // Rolls back if still armed.  Never throws.
    ~TransactionGuard();

    // Non-copyable, non-movable.
    TransactionGuard(const TransactionGuard&)            = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    TransactionGuard(TransactionGuard&&)                 = delete;
    TransactionGuard& operator=(TransactionGuard&&)      = delete;

    // Commits the transaction and disarms the guard.  On failure (e.g.
    // ValidationError) the guard stays armed and the error propagates.
    void commit();

    // Rolls back now, recording `reason`, and disarms the guard.  Never
    // throws; a transaction that is no longer active (e.g. after
    // clear_state()) is left alone.
    void rollback(std::string reason) noexcept;

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    // True until commit() or rollback() has resolved the transaction.
    [[nodiscard]] bool armed() const noexcept { return armed_; }

private:
    StateStore& store_;
    uint64_t    id_;
    bool        armed_ = true;
};

} // namespace projstate
