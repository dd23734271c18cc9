#include "state/project_state.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>

namespace projstate {

std::vector<std::string> validate_state(const ProjectState& state) {
    std::vector<std::string> violations;

    if (state.project_path.empty()) {
        violations.emplace_back("project_path must not be empty");
    } else if (!std::filesystem::path(state.project_path).is_absolute()) {
        violations.push_back(
            std::format("project_path must be absolute, got '{}'", state.project_path));
    }

    if (state.project_name.empty()) {
        violations.emplace_back("project_name must not be empty");
    }

    for (std::size_t i = 0; i < state.classes.size(); ++i) {
        const auto& cls = state.classes[i];
        if (cls.name.empty()) {
            violations.push_back(std::format("classes[{}]: name must not be empty", i));
        }
        if (cls.file_path && cls.file_path->empty()) {
            violations.push_back(
                std::format("classes[{}]: file_path must not be empty when present", i));
        }
        if (cls.last_modified && !std::isfinite(*cls.last_modified)) {
            violations.push_back(
                std::format("classes[{}]: last_modified must be a finite timestamp", i));
        }
    }

    return violations;
}

const ClassRecord* find_class(const ProjectState& state, std::string_view name) {
    auto it = std::find_if(state.classes.begin(), state.classes.end(),
                           [name](const ClassRecord& c) { return c.name == name; });
    return it == state.classes.end() ? nullptr : &*it;
}

bool remove_class(ProjectState& state, std::string_view name) {
    return std::erase_if(state.classes,
                         [name](const ClassRecord& c) { return c.name == name; }) > 0;
}

} // namespace projstate
