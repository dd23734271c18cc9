#include "scan/project_scanner.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace projstate {

namespace fs = std::filesystem;

namespace {

const FileProbe& default_probe() {
    static const LocalFileProbe probe;
    return probe;
}

fs::path normalize_root(const fs::path& dir) {
    std::error_code ec;
    auto abs = fs::absolute(dir, ec);
    if (ec) {
        abs = dir;
    }
    abs = abs.lexically_normal();
    // "/a/b/" → "/a/b" so the name and string form are stable.
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

} // anonymous namespace

ProjectScanner::ProjectScanner(fs::path project_dir,
                               std::string project_name,
                               ScanOptions options,
                               const FileProbe* probe,
                               std::shared_ptr<spdlog::logger> logger)
    : project_dir_(normalize_root(project_dir))
    , project_name_(std::move(project_name))
    , options_(std::move(options))
    , probe_(probe ? probe : &default_probe())
    , logger_(std::move(logger))
{
    if (project_name_.empty()) {
        project_name_ = project_dir_.filename().string();
    }
}

bool ProjectScanner::is_source(const fs::path& path) const {
    const auto ext = path.extension().string();
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) !=
           options_.extensions.end();
}

bool ProjectScanner::is_excluded(const fs::path& dir) const {
    const auto name = dir.filename().string();
    return std::find(options_.excluded_dirs.begin(), options_.excluded_dirs.end(), name) !=
           options_.excluded_dirs.end();
}

ProjectState ProjectScanner::scan() const {
    const auto root_status = probe_->stat(project_dir_);
    if (!root_status.exists || !root_status.is_directory) {
        throw std::runtime_error(
            std::format("project directory does not exist: {}", project_dir_.string()));
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(
        project_dir_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error(std::format("cannot read project directory {}: {}",
                                             project_dir_.string(), ec.message()));
    }

    std::vector<fs::path> sources;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error(std::format("error while scanning {}: {}",
                                                 project_dir_.string(), ec.message()));
        }
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (is_excluded(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(ec) && is_source(entry.path())) {
            sources.push_back(entry.path());
        }
    }
    if (ec) {
        throw std::runtime_error(std::format("error while scanning {}: {}",
                                             project_dir_.string(), ec.message()));
    }
    std::sort(sources.begin(), sources.end());

    ProjectState state;
    state.project_path = project_dir_.string();
    state.project_name = project_name_;
    state.classes.reserve(sources.size());

    for (const auto& path : sources) {
        const auto status = probe_->stat(path);
        if (!status.exists) {
            // Deleted between listing and stat.
            if (logger_) {
                logger_->debug("[scan] {} vanished during scan", path.string());
            }
            continue;
        }

        const auto relative = path.lexically_relative(project_dir_);
        const bool is_test = std::any_of(relative.begin(), relative.end(),
                                         [](const fs::path& part) { return part == "test"; });

        ClassRecord record;
        record.name          = path.stem().string();
        record.file_path     = path.string();
        record.last_modified = status.last_modified;
        record.attributes["kind"]    = is_test ? "test" : "main";
        record.attributes["package"] = relative.parent_path().generic_string();
        record.attributes["status"]  = "pending";
        state.classes.push_back(std::move(record));
    }

    state.extensions["source_file_count"] = std::to_string(state.classes.size());

    if (logger_) {
        logger_->info("[scan] {}: {} source file(s) under {}",
                      project_name_, state.classes.size(), project_dir_.string());
    }
    return state;
}

ProjectState sync_project(StateStore& store, const ProjectScanner& scanner) {
    return store.execute_with_rollback("sync_with_filesystem", [&] {
        ProjectState state = scanner.scan();
        store.set_state(state);
        return state;
    });
}

} // namespace projstate
