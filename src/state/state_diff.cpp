#include "state/state_diff.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <set>
#include <utility>

#include "state/checksum.hpp"

namespace projstate {

namespace {

bool is_volatile(const std::string& key) {
    return std::find(std::begin(kVolatileExtensions), std::end(kVolatileExtensions),
                     key) != std::end(kVolatileExtensions);
}

ProjectState without_volatile(const ProjectState& state) {
    ProjectState copy = state;
    std::erase_if(copy.extensions, [](const auto& kv) { return is_volatile(kv.first); });
    return copy;
}

std::string describe(const std::optional<std::string>& v) {
    return v ? "'" + *v + "'" : "<none>";
}

std::string describe(const std::optional<double>& v) {
    return v ? std::format("{:.6f}", *v) : "<none>";
}

// Names carried by more than one record in either state.
std::set<std::string> shared_names(const ProjectState& before, const ProjectState& after) {
    std::set<std::string> shared;
    for (const auto* state : {&before, &after}) {
        std::set<std::string> local;
        for (const auto& cls : state->classes) {
            if (!local.insert(cls.name).second) {
                shared.insert(cls.name);
            }
        }
    }
    return shared;
}

// Records keyed by name; a shared name is qualified with its file path
// ("Util (a/Util.java)") so same-named classes in different files are
// compared separately.  First record wins if name and path both repeat.
std::map<std::string, const ClassRecord*> index_records(const ProjectState& state,
                                                        const std::set<std::string>& shared) {
    std::map<std::string, const ClassRecord*> index;
    for (const auto& cls : state.classes) {
        std::string key = cls.name;
        if (shared.contains(cls.name)) {
            key += std::format(" ({})", cls.file_path.value_or(""));
        }
        index.emplace(std::move(key), &cls);
    }
    return index;
}

class DiffBuilder {
public:
    explicit DiffBuilder(DiffReport& report) : report_(report) {}

    void add(ChangeType type, std::string component, std::string identifier,
             std::string details) {
        switch (type) {
            case ChangeType::Added:    ++report_.summary.added;    break;
            case ChangeType::Removed:  ++report_.summary.removed;  break;
            case ChangeType::Modified: ++report_.summary.modified; break;
        }
        report_.changes.push_back(
            {type, std::move(component), std::move(identifier), std::move(details)});
    }

    // Diff two string maps; returns true if anything differed.
    bool diff_map(const std::map<std::string, std::string>& before,
                  const std::map<std::string, std::string>& after,
                  const std::string& component,
                  const std::string& prefix,
                  bool skip_volatile) {
        bool changed = false;
        for (const auto& [key, value] : before) {
            if (skip_volatile && is_volatile(key)) continue;
            auto it = after.find(key);
            if (it == after.end()) {
                add(ChangeType::Removed, component, prefix + key,
                    std::format("{} removed", key));
                changed = true;
            } else if (it->second != value) {
                add(ChangeType::Modified, component, prefix + key,
                    std::format("{}: '{}' -> '{}'", key, value, it->second));
                changed = true;
            }
        }
        for (const auto& [key, value] : after) {
            if (skip_volatile && is_volatile(key)) continue;
            if (!before.contains(key)) {
                add(ChangeType::Added, component, prefix + key,
                    std::format("{} added: '{}'", key, value));
                changed = true;
            }
        }
        return changed;
    }

private:
    DiffReport& report_;
};

} // anonymous namespace

std::string_view to_string(ChangeType type) noexcept {
    switch (type) {
        case ChangeType::Added:    return "added";
        case ChangeType::Removed:  return "removed";
        case ChangeType::Modified: return "modified";
    }
    return "unknown";
}

DiffReport diff_states(const ProjectState& before, const ProjectState& after) {
    DiffReport report;
    report.before_checksum = state_checksum(without_volatile(before));
    report.after_checksum  = state_checksum(without_volatile(after));

    DiffBuilder diff(report);

    // ── Project identity ─────────────────────────────────────────────────────
    if (before.project_path != after.project_path) {
        diff.add(ChangeType::Modified, "project", "project_path",
                 std::format("'{}' -> '{}'", before.project_path, after.project_path));
    }
    if (before.project_name != after.project_name) {
        diff.add(ChangeType::Modified, "project", "project_name",
                 std::format("'{}' -> '{}'", before.project_name, after.project_name));
    }

    // ── Classes ──────────────────────────────────────────────────────────────
    const auto shared      = shared_names(before, after);
    const auto old_classes = index_records(before, shared);
    const auto new_classes = index_records(after, shared);

    for (const auto& [name, old_cls] : old_classes) {
        auto it = new_classes.find(name);
        if (it == new_classes.end()) {
            diff.add(ChangeType::Removed, "classes", name,
                     std::format("class {} removed", name));
            ++report.summary.classes_changed;
            continue;
        }

        const ClassRecord& new_cls = *it->second;
        if (*old_cls == new_cls) {
            continue;
        }

        if (old_cls->file_path != new_cls.file_path ||
            old_cls->last_modified != new_cls.last_modified) {
            diff.add(ChangeType::Modified, "classes", name,
                     std::format("class {} source: {} @ {} -> {} @ {}", name,
                                 describe(old_cls->file_path), describe(old_cls->last_modified),
                                 describe(new_cls.file_path), describe(new_cls.last_modified)));
        }
        diff.diff_map(old_cls->attributes, new_cls.attributes,
                      "class_attributes", name + ".", false);
        ++report.summary.classes_changed;
    }

    for (const auto& [name, new_cls] : new_classes) {
        if (!old_classes.contains(name)) {
            diff.add(ChangeType::Added, "classes", name,
                     std::format("class {} added", name));
            ++report.summary.classes_changed;
        }
    }

    // ── Extensions ───────────────────────────────────────────────────────────
    const auto before_count = report.changes.size();
    diff.diff_map(before.extensions, after.extensions, "extensions", "", true);
    report.summary.extensions_changed = report.changes.size() - before_count;

    return report;
}

} // namespace projstate
