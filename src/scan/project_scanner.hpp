#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "state/file_probe.hpp"
#include "state/project_state.hpp"
#include "state/state_store.hpp"

namespace projstate {

struct ScanOptions {
    std::vector<std::string> extensions{".java"};                      // Source file suffixes
    std::vector<std::string> excluded_dirs{"target", "build", ".git"};  // Not descended into
};

// ── ProjectScanner ───────────────────────────────────────────────────────────
//
// Builds a fresh ProjectState from the files under a project directory: one
// ClassRecord per source file, named after the file stem, with its absolute
// path and current mtime.  Records are ordered by path.
//
// Attributes set on each record:
//   kind    – "test" for files under a `test` directory, otherwise "main"
//   package – directory of the file relative to the project root
//   status  – "pending"
//
// Extensions set on the state: source_file_count.

class ProjectScanner {
public:
    // `project_name` defaults to the directory's own name.
    //   probe – owned externally; must outlive the scanner (null selects the
    //           local filesystem)
    explicit ProjectScanner(std::filesystem::path project_dir,
                            std::string project_name = {},
                            ScanOptions options = {},
                            const FileProbe* probe = nullptr,
                            std::shared_ptr<spdlog::logger> logger = {});

    // Throws std::runtime_error if the project directory cannot be read.
    [[nodiscard]] ProjectState scan() const;

    [[nodiscard]] const std::filesystem::path& project_dir() const noexcept { return project_dir_; }
    [[nodiscard]] const std::string& project_name() const noexcept { return project_name_; }

private:
    [[nodiscard]] bool is_source(const std::filesystem::path& path) const;
    [[nodiscard]] bool is_excluded(const std::filesystem::path& dir) const;

    std::filesystem::path           project_dir_;
    std::string                     project_name_;
    ScanOptions                     options_;
    const FileProbe*                probe_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Re-reads the project from disk and stores it as the live state inside a
// "sync_with_filesystem" transaction.  If the scan or validation fails, the
// previous state is restored and the error propagates.  Returns the stored
// state.
ProjectState sync_project(StateStore& store, const ProjectScanner& scanner);

} // namespace projstate
