#pragma once

#include <filesystem>

namespace projstate {

// Result of probing one path.  `last_modified` is seconds since the Unix
// epoch with sub-second precision; meaningless when `exists` is false.
struct FileStatus {
    bool   exists       = false;
    bool   is_directory = false;
    double last_modified = 0.0;
};

// ── FileProbe ────────────────────────────────────────────────────────────────
//
// Read-only view of the filesystem used by consistency verification and the
// project scanner.  Implementations must never throw: a path that cannot be
// inspected is reported as not existing.

class FileProbe {
public:
    virtual ~FileProbe() = default;

    [[nodiscard]] virtual FileStatus stat(const std::filesystem::path& path) const = 0;
};

// ── LocalFileProbe ───────────────────────────────────────────────────────────
//
// Production implementation backed by ::stat(2).

class LocalFileProbe final : public FileProbe {
public:
    [[nodiscard]] FileStatus stat(const std::filesystem::path& path) const override;
};

} // namespace projstate
