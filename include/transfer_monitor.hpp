/**
 * @file transfer_monitor.hpp
 * @brief Orchestration of one monitored copy session.
 *
 * The monitor verifies the source, launches the external copy tool, polls the
 * destination on a fixed tick to report progress, and arbitrates the final outcome.
 * A run counts as successful when any bytes reached the destination, whatever the
 * copy tool's exit status: restricted folders on the device make the tool exit with
 * errors even when the requested data was copied.
 *
 * Collaborators (launcher, probe, sampler, reporter, clock) are interfaces so the
 * monitor can be exercised without a device.
 */

#ifndef TRANSFER_MONITOR_HPP
#define TRANSFER_MONITOR_HPP

#include <string>
#include <memory>
#include <chrono>
#include <expected>
#include <optional>
#include <functional>
#include <filesystem>
#include "archiver_config.hpp"
#include "cleanup_policy.hpp"
#include "progress_reporter.hpp"
#include "size_sampler.hpp"
#include "subprocess.hpp"
#include "transfer_session.hpp"

/**
 * @brief Handle on a running copy operation.
 */
class TransferProcess {
public:
    virtual ~TransferProcess() = default;

    /**
     * @brief Non-blocking liveness check.
     */
    virtual bool isRunning() = 0;

    /**
     * @brief Requests termination and reaps the process.
     */
    virtual void terminate() = 0;

    /**
     * @brief Hands over the diagnostic (stderr) stream; returns nullptr on later calls.
     */
    virtual std::unique_ptr<LineSource> takeDiagnostics() = 0;

    /**
     * @brief Exit status once the process has been reaped.
     */
    virtual std::optional<int> exitCode() const = 0;
};

/**
 * @brief Interface for starting copy operations.
 */
class TransferLauncher {
public:
    virtual ~TransferLauncher() = default;

    /**
     * @brief Starts copying a device path into a local directory.
     *
     * @param deviceId Device serial.
     * @param sourcePath Path on the device.
     * @param destinationPath Local directory.
     * @return std::expected<std::unique_ptr<TransferProcess>, std::string> The running copy or a launch error.
     */
    virtual std::expected<std::unique_ptr<TransferProcess>, std::string> launch(const std::string& deviceId,
                                                                                const std::string& sourcePath,
                                                                                const std::filesystem::path& destinationPath) = 0;
};

/**
 * @brief Interface for checking that a device path exists.
 */
class PathProbe {
public:
    virtual ~PathProbe() = default;

    /**
     * @brief Returns true when the path exists on the device.
     *
     * Timeouts and errors must be reported as false.
     */
    virtual bool exists(const std::string& deviceId, const std::string& path) = 0;
};

/**
 * @brief Time source and tick timer of the polling loop.
 */
class MonitorClock {
public:
    virtual ~MonitorClock() = default;

    virtual std::chrono::steady_clock::time_point now() = 0;

    /**
     * @brief Waits for a duration, returning early once cancelled() reports true.
     */
    virtual void sleepFor(std::chrono::steady_clock::duration duration, const std::function<bool()>& cancelled) = 0;
};

/**
 * @brief MonitorClock backed by the steady clock and sliced sleeps.
 */
class SteadyMonitorClock : public MonitorClock {
public:
    std::chrono::steady_clock::time_point now() override;
    void sleepFor(std::chrono::steady_clock::duration duration, const std::function<bool()>& cancelled) override;
};

/**
 * @brief Runs copy sessions and decides their outcome.
 */
class TransferMonitor {
public:
    /**
     * @brief Constructs a monitor.
     *
     * All references must outlive the monitor.
     *
     * @param config Tick, rate window, grace periods, file names, and logging.
     * @param launcher Starts the copy tool.
     * @param probe Checks the source path before launching.
     * @param sampler Measures the destination each tick.
     * @param reporter Displays progress.
     * @param clock Time source and tick timer.
     */
    TransferMonitor(const ArchiverConfig& config,
                    TransferLauncher& launcher,
                    PathProbe& probe,
                    ProgressSampler& sampler,
                    ProgressReporter& reporter,
                    MonitorClock& clock);

    /**
     * @brief Runs one session to a terminal state.
     *
     * Verification and launch failures end the session as Aborted and come back as an
     * error; completed and interrupted sessions come back as an outcome. Failed sessions
     * go through the cleanup policy before returning.
     *
     * @param session Parameters of the run.
     * @param cancelRequested Polled at least once per tick; true stops the run.
     * @return std::expected<SessionOutcome, std::string> The outcome, or why the session was aborted.
     */
    std::expected<SessionOutcome, std::string> run(const TransferSession& session,
                                                   const std::function<bool()>& cancelRequested);

    /**
     * @brief Current state; the terminal state after run() returns.
     */
    MonitorState state() const { return currentState; }

private:
    /**
     * @brief Writes the completion marker into the destination.
     *
     * @return std::expected<std::filesystem::path, std::string> Path of the marker or the write error.
     */
    std::expected<std::filesystem::path, std::string> writeCompletionMarker(const TransferSession& session,
                                                                            const SessionOutcome& outcome) const;

    void applyCleanup(const TransferSession& session, const SessionOutcome& outcome) const;

    const ArchiverConfig& config;
    TransferLauncher& launcher;
    PathProbe& probe;
    ProgressSampler& sampler;
    ProgressReporter& reporter;
    MonitorClock& clock;
    CleanupPolicy cleanupPolicy;
    MonitorState currentState = MonitorState::Verifying;
};

#endif // TRANSFER_MONITOR_HPP
