#include "common/store_config.hpp"

#include <cmath>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace projstate {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Split every value on ',' and drop empty pieces between separators.
[[nodiscard]] std::vector<std::string> split_list(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    for (const auto& value : values) {
        std::string_view remaining{value};
        while (!remaining.empty()) {
            auto comma_pos = remaining.find(',');
            std::string_view item = (comma_pos == std::string_view::npos)
                ? remaining
                : remaining.substr(0, comma_pos);

            if (comma_pos == std::string_view::npos) {
                remaining = {};
            } else {
                remaining = remaining.substr(comma_pos + 1);
            }

            if (!item.empty()) {
                result.emplace_back(item);
            }
        }
    }
    return result;
}

// Validate the fully populated StoreConfig.
void validate(const StoreConfig& cfg) {
    if (cfg.project_dir.empty()) {
        throw std::runtime_error("--project-dir must not be empty");
    }
    if (cfg.max_snapshots == 0) {
        throw std::runtime_error("--max-snapshots must be > 0");
    }
    if (cfg.max_transactions == 0) {
        throw std::runtime_error("--max-transactions must be > 0");
    }
    if (!std::isfinite(cfg.mtime_tolerance) || cfg.mtime_tolerance < 0.0) {
        throw std::runtime_error(
            std::format("--mtime-tolerance must be >= 0, got {}", cfg.mtime_tolerance));
    }

    if (cfg.extensions.empty()) {
        throw std::runtime_error("At least one --extension is required");
    }
    for (const auto& ext : cfg.extensions) {
        if (ext.size() < 2 || ext.front() != '.') {
            throw std::runtime_error(
                std::format("Extension must start with '.', got '{}'", ext));
        }
    }

    for (const auto& name : cfg.invalidate) {
        if (name.empty()) {
            throw std::runtime_error("--invalidate requires a class name");
        }
    }
}

} // anonymous namespace

StoreOptions StoreConfig::store_options() const {
    StoreOptions options;
    options.max_snapshots    = max_snapshots;
    options.max_transactions = max_transactions;
    options.mtime_tolerance  = mtime_tolerance;
    return options;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("project-dir",
            po::value<std::string>()->required(),
            "Project root directory to scan")
        ("project-name",
            po::value<std::string>()->default_value(""),
            "Project name (defaults to the directory name)")
        ("extension",
            po::value<std::vector<std::string>>()->composing(),
            "Source file suffix(es), comma-separated or repeated (default .java)")
        ("max-snapshots",
            po::value<std::size_t>()->default_value(10),
            "Number of state snapshots kept in history")
        ("max-transactions",
            po::value<std::size_t>()->default_value(50),
            "Number of resolved transactions kept in history")
        ("mtime-tolerance",
            po::value<double>()->default_value(0.0),
            "Seconds an mtime may differ from the recorded one before it counts as drift")
        ("invalidate",
            po::value<std::vector<std::string>>()->composing(),
            "Class name whose cached analysis is dropped after the scan (repeatable)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

StoreConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("projstate-scan options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        // Handle --help before notify() so missing required options don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    StoreConfig cfg;
    cfg.project_dir      = vm["project-dir"].as<std::string>();
    cfg.project_name     = vm["project-name"].as<std::string>();
    cfg.max_snapshots    = vm["max-snapshots"].as<std::size_t>();
    cfg.max_transactions = vm["max-transactions"].as<std::size_t>();
    cfg.mtime_tolerance  = vm["mtime-tolerance"].as<double>();
    cfg.log_level        = vm["log-level"].as<std::string>();

    if (vm.count("extension")) {
        cfg.extensions = split_list(vm["extension"].as<std::vector<std::string>>());
    } else {
        cfg.extensions = {".java"};
    }
    if (vm.count("invalidate")) {
        cfg.invalidate = vm["invalidate"].as<std::vector<std::string>>();
    }

    validate(cfg);
    return cfg;
}

} // namespace projstate
