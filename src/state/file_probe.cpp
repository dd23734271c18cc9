#include "state/file_probe.hpp"

#include <sys/stat.h>

namespace projstate {

FileStatus LocalFileProbe::stat(const std::filesystem::path& path) const {
    struct ::stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return {};
    }

    FileStatus status;
    status.exists        = true;
    status.is_directory  = S_ISDIR(st.st_mode);
    status.last_modified = static_cast<double>(st.st_mtim.tv_sec) +
                           static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    return status;
}

} // namespace projstate
