#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "state/project_state.hpp"

namespace projstate {

// ── State diff ───────────────────────────────────────────────────────────────
//
// Structural comparison of two ProjectStates, e.g. a transaction's pre-image
// against the snapshot produced by its commit.  Classes are matched by name,
// or by name and file path when several records share a name.
// Volatile bookkeeping extensions (see kVolatileExtensions) are ignored both
// in the change list and in the reported checksums.

enum class ChangeType : uint8_t {
    Added    = 0,
    Removed  = 1,
    Modified = 2,
};

[[nodiscard]] std::string_view to_string(ChangeType type) noexcept;

struct DiffChange {
    ChangeType  type;
    std::string component;   // "project" | "classes" | "class_attributes" | "extensions"
    std::string identifier;  // e.g. "Foo", "Foo.status", "build_status"
    std::string details;
};

struct DiffSummary {
    std::size_t added              = 0;
    std::size_t removed            = 0;
    std::size_t modified           = 0;
    std::size_t classes_changed    = 0;
    std::size_t extensions_changed = 0;
};

struct DiffReport {
    uint32_t                before_checksum = 0;
    uint32_t                after_checksum  = 0;
    std::vector<DiffChange> changes;
    DiffSummary             summary;

    [[nodiscard]] bool identical() const noexcept { return changes.empty(); }
};

// Extension keys that change on every pipeline step and carry no analysis.
inline constexpr std::string_view kVolatileExtensions[] = {
    "last_action",
    "retry_count",
    "summary_report",
};

[[nodiscard]] DiffReport diff_states(const ProjectState& before, const ProjectState& after);

} // namespace projstate
