#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace projstate {

// ── ClassRecord ──────────────────────────────────────────────────────────────
//
// Cached analysis of one source class.  The store only looks at `name`
// (invalidation), `file_path` and `last_modified` (consistency checks); the
// rest of the analysis travels in `attributes` untouched.

struct ClassRecord {
    std::string                        name;
    std::optional<std::string>         file_path;      // Source file the record was built from
    std::optional<double>              last_modified;  // mtime of file_path, seconds since epoch
    std::map<std::string, std::string> attributes;     // Pipeline-specific fields (status, package, …)

    bool operator==(const ClassRecord&) const = default;
};

// ── ProjectState ─────────────────────────────────────────────────────────────
//
// Full analysis state of one project.  Value type: copying a ProjectState
// copies everything, so a copy never aliases another instance.

struct ProjectState {
    std::string                        project_path;  // Absolute path of the project root
    std::string                        project_name;
    std::vector<ClassRecord>           classes;
    std::map<std::string, std::string> extensions;    // Build status, retry counters, …

    bool operator==(const ProjectState&) const = default;
};

// Checks the fields the store relies on.  Returns one human-readable message
// per violation; an empty vector means the state is valid.  No side effects.
//
// Validates:
//   - project_path is non-empty and absolute
//   - project_name is non-empty
//   - every class record has a non-empty name
//   - a class record's file_path, when present, is non-empty
//   - a class record's last_modified, when present, is finite
[[nodiscard]] std::vector<std::string> validate_state(const ProjectState& state);

// Returns the first class record named `name`, or nullptr.
[[nodiscard]] const ClassRecord* find_class(const ProjectState& state,
                                            std::string_view name);

// Removes every class record named `name`.  Returns true if any was removed.
bool remove_class(ProjectState& state, std::string_view name);

} // namespace projstate
