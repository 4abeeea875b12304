/**
 * @file size_sampler.cpp
 * @brief Recursive destination walk used as the progress signal.
 */

#include "size_sampler.hpp"
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

SizeSampler::SizeSampler(std::string skippedFileName) : skippedFileName(std::move(skippedFileName)) {}

DirectoryUsage SizeSampler::sample(const fs::path& root, std::chrono::system_clock::time_point since) {
    DirectoryUsage usage;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        // Root missing or unreadable: no progress this tick.
        return {};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // The iterator cannot resume after a failed increment. The partial total is
            // returned unless the root itself is gone; a total below the previous tick is
            // ignored by the rate estimator.
            break;
        }
        const auto& entry = *it;

        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entryEc) {
            continue;
        }
        if (entry.path().filename() == skippedFileName) {
            continue;
        }

        auto lastWrite = entry.last_write_time(entryEc);
        if (entryEc) {
            continue;
        }
        if (std::chrono::file_clock::to_sys(lastWrite) < since) {
            continue;
        }

        auto size = entry.file_size(entryEc);
        if (entryEc) {
            continue;
        }
        usage.totalBytes += size;
        ++usage.fileCount;
    }

    if (ec) {
        std::error_code existsEc;
        if (!fs::exists(root, existsEc)) {
            // The destination vanished mid-walk.
            return {};
        }
    }
    return usage;
}
