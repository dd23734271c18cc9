#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace projstate {

// ── StateError ───────────────────────────────────────────────────────────────
//
// Base class for every failure reported by StateStore.  All store errors are
// synchronous: they are thrown from the call that detected them and the live
// state is left as it was before that call.

class StateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// get_state() (or an operation needing the live state) before any set_state().
class NoStateError : public StateError {
public:
    NoStateError() : StateError("no project state has been set") {}
};

// Payload failed the shape checks of validate_state().
class ValidationError : public StateError {
public:
    explicit ValidationError(std::vector<std::string> violations)
        : StateError(join(violations))
        , violations_(std::move(violations)) {}

    [[nodiscard]] const std::vector<std::string>& violations() const noexcept {
        return violations_;
    }

private:
    static std::string join(const std::vector<std::string>& violations) {
        std::string msg = "invalid project state";
        for (std::size_t i = 0; i < violations.size(); ++i) {
            msg += (i == 0) ? ": " : "; ";
            msg += violations[i];
        }
        return msg;
    }

    std::vector<std::string> violations_;
};

// begin_transaction() while another transaction is still active.
class TransactionConflictError : public StateError {
public:
    explicit TransactionConflictError(uint64_t active_id)
        : StateError("transaction " + std::to_string(active_id) + " is already active")
        , active_id_(active_id) {}

    [[nodiscard]] uint64_t active_id() const noexcept { return active_id_; }

private:
    uint64_t active_id_;
};

// commit/rollback with an id that is not the active transaction.
class TransactionNotFoundError : public StateError {
public:
    explicit TransactionNotFoundError(uint64_t id)
        : StateError("no active transaction with id " + std::to_string(id))
        , id_(id) {}

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

private:
    uint64_t id_;
};

// Snapshot lookup for an evicted or never-issued sequence id.
class NotFoundError : public StateError {
public:
    using StateError::StateError;
};

} // namespace projstate
