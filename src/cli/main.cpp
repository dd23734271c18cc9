#include "common/logger.hpp"
#include "common/store_config.hpp"
#include "scan/project_scanner.hpp"
#include "state/errors.hpp"
#include "state/snapshot.hpp"
#include "state/state_diff.hpp"
#include "state/state_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitConsistent = 0;
constexpr int kExitFailure    = 1;
constexpr int kExitDrift      = 2;

std::string format_time(projstate::Clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

void print_history(const projstate::StateStore& store) {
    fprintf(stdout, "Snapshots (%zu retained):\n", store.snapshot_count());
    for (const auto& snap : store.get_snapshots_since({})) {
        fprintf(stdout, "  #%-4llu %s  %-28s classes=%-5zu crc=%08x\n",
                static_cast<unsigned long long>(snap.sequence),
                format_time(snap.timestamp).c_str(),
                snap.operation.c_str(),
                snap.state.classes.size(),
                snap.checksum);
    }

    const auto history = store.get_transaction_history(store.options().max_transactions);
    fprintf(stdout, "Transactions (%zu):\n", history.size());
    for (const auto& txn : history) {
        fprintf(stdout, "  txn %-4llu %-24s %-12s%s%s\n",
                static_cast<unsigned long long>(txn.id),
                txn.operation.c_str(),
                std::string(projstate::to_string(txn.status)).c_str(),
                txn.error ? " error: " : "",
                txn.error ? txn.error->c_str() : "");
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    projstate::StoreConfig cfg;
    try {
        cfg = projstate::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return kExitFailure;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = projstate::parse_log_level(cfg.log_level);
    projstate::init_default_logger(level);

    projstate::ScanOptions scan_options;
    scan_options.extensions = cfg.extensions;
    projstate::ProjectScanner scanner{cfg.project_dir, cfg.project_name, scan_options,
                                      nullptr, spdlog::default_logger()};

    auto logger = projstate::make_store_logger(scanner.project_name(), level);
    logger->info("projstate-scan starting – project={} dir={} max_snapshots={} "
                 "mtime_tolerance={}s",
                 scanner.project_name(), scanner.project_dir().string(),
                 cfg.max_snapshots, cfg.mtime_tolerance);

    // ── Store ────────────────────────────────────────────────────────────────
    projstate::StateStore store{cfg.store_options(), logger};

    try {
        const auto state = projstate::sync_project(store, scanner);
        logger->info("Tracked {} class(es)", state.classes.size());

        for (const auto& name : cfg.invalidate) {
            store.invalidate_class_state(name);
        }
        if (!cfg.invalidate.empty()) {
            const auto after = store.get_state();
            const auto diff  = projstate::diff_states(state, after);
            fprintf(stdout, "Invalidation dropped %zu class(es):\n",
                    state.classes.size() - after.classes.size());
            for (const auto& change : diff.changes) {
                fprintf(stdout, "  %-8s %s\n",
                        std::string(projstate::to_string(change.type)).c_str(),
                        change.identifier.c_str());
            }
        }

        const auto report = store.verify_state_consistency();
        print_history(store);

        if (report.consistent) {
            fprintf(stdout, "State is consistent with the filesystem.\n");
            return kExitConsistent;
        }

        fprintf(stdout, "State drift detected (%zu issue(s)):\n", report.issues.size());
        for (const auto& issue : report.issues) {
            fprintf(stdout, "  - %s\n", issue.c_str());
        }
        return kExitDrift;
    } catch (const projstate::StateError& e) {
        logger->error("State store error: {}", e.what());
    } catch (const std::runtime_error& e) {
        logger->error("Scan failed: {}", e.what());
    }
    return kExitFailure;
}
