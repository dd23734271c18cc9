#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "state/clock.hpp"
#include "state/project_state.hpp"

namespace projstate {

// ── StateSnapshot ────────────────────────────────────────────────────────────
//
// Immutable point-in-time copy of a ProjectState.  Created by every successful
// set_state(), transaction commit and class invalidation.

struct StateSnapshot {
    uint64_t          sequence = 0;   // Monotonically increasing, starts at 1
    Clock::time_point timestamp{};
    std::string       operation;      // What produced it ("set_state", txn name, …)
    uint32_t          checksum = 0;   // state_checksum(state)
    ProjectState      state;
};

// ── StateTransaction ─────────────────────────────────────────────────────────

enum class TransactionStatus : uint8_t {
    Active     = 0,
    Committed  = 1,
    RolledBack = 2,
};

[[nodiscard]] std::string_view to_string(TransactionStatus status) noexcept;

struct StateTransaction {
    uint64_t                         id = 0;
    std::string                      operation;
    // State as it was when the transaction began.  Its sequence is that of
    // the snapshot holding that state; it may since have been evicted.
    // nullopt when the transaction began before any state was set.
    std::optional<StateSnapshot>     pre_image;
    TransactionStatus                status = TransactionStatus::Active;
    Clock::time_point                started_at{};
    std::optional<Clock::time_point> finished_at;
    std::optional<std::string>       error;            // Reason given at rollback
    std::optional<uint64_t>          result_sequence;  // Snapshot created at commit
};

} // namespace projstate
