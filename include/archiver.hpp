/**
 * @file archiver.hpp
 * @brief Top-level orchestration of a device backup.
 *
 * Brings together device discovery, backup type and size selection, destination
 * preparation and the monitored transfer, and turns the session outcome into the
 * operator-facing summary and the process exit status.
 */

#ifndef ARCHIVER_HPP
#define ARCHIVER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>
#include <expected>
#include <functional>
#include <filesystem>
#include "archiver_config.hpp"
#include "adb_client.hpp"
#include "transfer_session.hpp"

/**
 * @brief Options given on the command line; unset values are asked for interactively.
 */
struct ArchiveOptions {
    std::string configFile = "archiver_config.json"; ///< JSON configuration file.
    std::optional<std::string> deviceSerial;          ///< --device
    std::optional<std::string> destination;           ///< --dest
    std::optional<std::string> folder;                ///< --folder (partial backup)
    bool fullBackup = false;                          ///< --full
    std::optional<double> estimateGb;                 ///< --estimate-gb
    bool merge = false;                               ///< --merge
    bool fresh = false;                               ///< --fresh
    bool assumeYes = false;                           ///< --yes
    bool showHelp = false;                            ///< --help
};

/**
 * @brief Parses the command line.
 *
 * @return std::expected<ArchiveOptions, std::string> Options or a usage error.
 */
std::expected<ArchiveOptions, std::string> parseArguments(const std::vector<std::string>& args);

/**
 * @brief Converts an operator size estimate in GB (1024^3 bytes) to bytes.
 *
 * @return std::expected<std::uint64_t, std::string> Bytes, or an error for values that are not
 *         finite, not positive, below one byte or beyond the 64-bit range.
 */
std::expected<std::uint64_t, std::string> estimateToBytes(double gb);

/**
 * @brief Returns the usage text.
 */
std::string usage(const std::string& program);

/**
 * @brief How an existing non-empty destination is handled.
 */
enum class ExistingDestination {
    Merge, ///< Reuse it; it is never deleted automatically.
    Fresh  ///< Delete its contents and start over.
};

/**
 * @brief Result of destination preparation.
 */
struct PreparedDestination {
    std::filesystem::path path;   ///< Normalized destination.
    bool createdByRun = false;    ///< The directory is owned by this run.
};

/**
 * @brief Returns true for directories that must never be used as a destination
 * (home, Documents, Downloads, Desktop, Pictures, the filesystem root).
 */
bool isCriticalDirectory(const std::filesystem::path& path);

/**
 * @brief Creates the destination, or applies the chosen policy to an existing one.
 *
 * @param path Destination directory.
 * @param existing Policy for a non-empty existing directory; required in that case.
 * @return std::expected<PreparedDestination, std::string> The prepared destination or an error message.
 */
std::expected<PreparedDestination, std::string> prepareDestination(const std::filesystem::path& path,
                                                                   std::optional<ExistingDestination> existing);

/**
 * @brief Returns the free space available at a path or its nearest existing parent.
 */
std::expected<std::uint64_t, std::string> availableSpace(const std::filesystem::path& path);

/**
 * @brief Main backup orchestration class.
 */
class Archiver {
public:
    /**
     * @brief Constructs an archiver.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the configuration is invalid.
     */
    explicit Archiver(const std::string& configFile);

    /**
     * @brief Runs one backup.
     *
     * @param options Command line options.
     * @param cancelRequested Polled between setup steps and during the transfer; true interrupts it.
     * @return int Process exit status: 0 success, 1 failure, 130 interrupted.
     */
    int run(const ArchiveOptions& options, const std::function<bool()>& cancelRequested);

private:
    std::expected<std::string, std::string> selectDevice(const ArchiveOptions& options) const;
    std::expected<std::pair<std::string, bool>, std::string> selectSource(const std::string& serial,
                                                                          const ArchiveOptions& options) const;
    std::expected<std::uint64_t, std::string> resolveEstimate(const ArchiveOptions& options) const;
    std::expected<PreparedDestination, std::string> resolveDestination(const ArchiveOptions& options) const;
    void printSummary(const TransferSession& session, const SessionOutcome& outcome) const;

    ArchiverConfig config; ///< Archiver configuration.
    AdbClient adb;         ///< Device queries.
};

#endif // ARCHIVER_HPP
