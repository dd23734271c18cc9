#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "state/state_store.hpp"

namespace projstate {

// ── StoreConfig ───────────────────────────────────────────────────────────────
// Full configuration for one projstate-scan run.
// Populated by parse_config() from CLI arguments.

struct StoreConfig {
    std::string              project_dir;        // Project root to scan (required)
    std::string              project_name;       // Defaults to the directory name
    std::vector<std::string> extensions;         // Source file suffixes, each starting with '.'
    std::size_t              max_snapshots;      // Snapshot history length
    std::size_t              max_transactions;   // Transaction history length
    double                   mtime_tolerance;    // Seconds of mtime drift tolerated
    std::vector<std::string> invalidate;         // Classes to drop after the scan
    std::string              log_level;          // spdlog level string

    [[nodiscard]] StoreOptions store_options() const;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a StoreConfig.
//
// On success: returns a fully validated StoreConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - project_dir is non-empty
//   - max_snapshots and max_transactions are > 0
//   - mtime_tolerance is >= 0
//   - every extension is non-empty and starts with '.'
//   - every --invalidate name is non-empty
//
// Extensions format: --extension .java[,.kt,...]  (option may also repeat)

[[nodiscard]] StoreConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with projstate-scan
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace projstate
