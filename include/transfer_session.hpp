/**
 * @file transfer_session.hpp
 * @brief Session and outcome records shared by the monitor, the cleanup policy and the CLI.
 */

#ifndef TRANSFER_SESSION_HPP
#define TRANSFER_SESSION_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

/**
 * @brief Parameters of one backup run.
 *
 * Built once by the caller before monitoring starts and never modified afterwards.
 */
struct TransferSession {
    std::string deviceId;                             ///< adb serial of the source device.
    std::string sourcePath;                           ///< Path on the device, e.g. "/sdcard".
    std::filesystem::path destinationPath;            ///< Local backup directory.
    std::chrono::system_clock::time_point startTime;  ///< Files older than this are not progress.
    std::uint64_t totalEstimatedBytes = 0;            ///< Operator estimate of the backup size.
    bool excludesRestrictedSubtree = false;           ///< Full backup that skips the restricted folder.
    bool directoryCreatedByMonitor = false;           ///< Destination did not exist before this run.
};

/**
 * @brief States of the transfer monitor.
 *
 * Verifying -> Running -> Completed, Verifying/Running -> Interrupted, Verifying -> Aborted.
 */
enum class MonitorState {
    Verifying,   ///< Probing the source path on the device.
    Running,     ///< Copy process and diagnostic collector active.
    Completed,   ///< The copy process exited on its own.
    Interrupted, ///< The operator cancelled the run.
    Aborted      ///< Verification or launch failed; nothing was copied.
};

/**
 * @brief Returns a lower-case name for a monitor state.
 */
const char* monitorStateName(MonitorState state);

/**
 * @brief Result of one session, computed once when it ends.
 */
struct SessionOutcome {
    MonitorState state = MonitorState::Aborted; ///< Terminal state.
    bool success = false;                                ///< True iff completed with bytes transferred.
    std::uint64_t bytesTransferred = 0;                  ///< Final (or last sampled) byte count.
    std::uint64_t fileCount = 0;                         ///< Final (or last sampled) file count.
    std::chrono::duration<double> elapsedTime{0};        ///< From session start to outcome.
    bool diagnosticsPresent = false;                     ///< At least one failure line was logged.
    std::optional<int> exitCode;                         ///< Copy tool exit status when it was reaped.
    std::optional<std::filesystem::path> completionMarker; ///< Marker file written on success.
    std::string message;                                 ///< Operator-facing summary of the outcome.
};

#endif // TRANSFER_SESSION_HPP
