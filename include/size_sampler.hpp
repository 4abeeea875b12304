/**
 * @file size_sampler.hpp
 * @brief Destination usage sampling for progress estimation.
 *
 * The copy tool exposes no progress API, so progress is measured by walking the
 * destination directory and summing the files written since the session started.
 */

#ifndef SIZE_SAMPLER_HPP
#define SIZE_SAMPLER_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <filesystem>

/**
 * @brief Aggregate usage of the files counted by one walk.
 */
struct DirectoryUsage {
    std::uint64_t totalBytes = 0; ///< Sum of the counted file sizes.
    std::uint64_t fileCount = 0;  ///< Number of counted files.

    bool operator==(const DirectoryUsage&) const = default;
};

/**
 * @brief Interface for progress samplers.
 *
 * Lets the transfer monitor be driven by a fake sampler in tests.
 */
class ProgressSampler {
public:
    virtual ~ProgressSampler() = default;

    /**
     * @brief Measures the files under a root modified at or after a reference time.
     *
     * Must not throw for unreadable entries or a missing root.
     *
     * @param root Directory to walk.
     * @param since Files with an earlier modification time are ignored.
     * @return DirectoryUsage Bytes and file count of the matching files.
     */
    virtual DirectoryUsage sample(const std::filesystem::path& root,
                                  std::chrono::system_clock::time_point since) = 0;
};

/**
 * @brief Recursive filesystem walker implementing ProgressSampler.
 *
 * Files that cannot be stat'ed are excluded, and a root that is missing or vanishes
 * during the walk counts as zero progress. The diagnostic log is skipped by name so
 * the monitor never counts its own output.
 */
class SizeSampler : public ProgressSampler {
public:
    /**
     * @brief Constructs a sampler.
     *
     * @param skippedFileName File name excluded from every walk (the diagnostic log).
     */
    explicit SizeSampler(std::string skippedFileName);

    DirectoryUsage sample(const std::filesystem::path& root,
                          std::chrono::system_clock::time_point since) override;

private:
    std::string skippedFileName; ///< Sentinel file name never counted.
};

#endif // SIZE_SAMPLER_HPP
