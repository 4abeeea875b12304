/**
 * @file archiver_config.hpp
 * @brief Configuration management for the DeviceArchiver backup tool.
 *
 * Defines the configuration class holding the copy tool location, the destination
 * defaults and the tuning of the transfer monitor (tick, rate window, timeouts,
 * diagnostic markers). Settings come from a JSON file; missing keys fall back to
 * defaults.
 *
 * @note When the configuration file does not exist it is created with the defaults.
 */

#ifndef ARCHIVER_CONFIG_HPP
#define ARCHIVER_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <json/json.h>

/**
 * @brief Configuration class for the archiver.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and validation.
 * Also owns the tool's own log files.
 */
class ArchiverConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Loads settings from the specified file, applying defaults where needed. A missing
     * file is replaced by one holding the defaults.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file exists but cannot be parsed, or a value is out of range.
     */
    explicit ArchiverConfig(const std::string& configFile);

    /**
     * @brief Logs a message to stdout and the configured log file.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Returns the default backup location.
     *
     * @return std::string "$HOME/Documents/AndroidBackup".
     */
    static std::string getDefaultBackupLocation();

    /**
     * @brief Serializes the current settings to JSON.
     *
     * @return Json::Value Object with the same keys the constructor reads.
     */
    Json::Value toJson() const;

    std::string configFile;                         ///< Path the settings were loaded from.
    std::string backupLocation;                     ///< Default destination directory.
    std::string adbPath;                            ///< Copy tool executable.
    std::string logDir;                             ///< Directory of archiver.log and errors.log.
    std::string logFile;                            ///< Path to the log file.
    std::string errorLogFile;                       ///< Path to the error log file.
    std::chrono::milliseconds tickInterval{1000};   ///< Progress polling tick.
    std::size_t rateWindow = 5;                     ///< Rate samples averaged for throughput.
    std::chrono::seconds probeTimeout{5};           ///< Source existence probe timeout.
    std::chrono::seconds commandTimeout{10};        ///< Timeout of other adb queries.
    std::chrono::milliseconds terminateGrace{2000}; ///< Delay between SIGTERM and SIGKILL.
    std::chrono::milliseconds collectorGrace{1000}; ///< Wait for diagnostics after exit.
    std::vector<std::string> failureMarkers;        ///< Substrings that mark a diagnostic line.
    std::string restrictedSubtree;                  ///< Folder excluded from full backups.
    double minFreeSpaceGb = 10.0;                   ///< Free-space warning threshold.
    std::string diagnosticLogName = "backup_errors.log";
    std::string completionMarkerName = "backup_completed.txt";
};

/**
 * @brief Expands $VAR and ${VAR} references from the environment.
 *
 * Unknown variables expand to nothing. A leading "~/" expands to $HOME.
 *
 * @param value Raw path from the configuration.
 * @return std::string The expanded path.
 */
std::string expandEnvironment(const std::string& value);

#endif // ARCHIVER_CONFIG_HPP
