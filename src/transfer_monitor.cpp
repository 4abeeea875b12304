/**
 * @file transfer_monitor.cpp
 * @brief Polling loop and outcome arbitration for copy sessions.
 */

#include "transfer_monitor.hpp"
#include "diagnostic_collector.hpp"
#include "formatting.hpp"
#include "rate_estimator.hpp"
#include <fstream>
#include <thread>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

const char* monitorStateName(MonitorState state) {
    switch (state) {
        case MonitorState::Verifying:
            return "verifying";
        case MonitorState::Running:
            return "running";
        case MonitorState::Completed:
            return "completed";
        case MonitorState::Interrupted:
            return "interrupted";
        case MonitorState::Aborted:
            return "aborted";
    }
    return "unknown";
}

std::chrono::steady_clock::time_point SteadyMonitorClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyMonitorClock::sleepFor(std::chrono::steady_clock::duration duration, const std::function<bool()>& cancelled) {
    constexpr auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
}

TransferMonitor::TransferMonitor(const ArchiverConfig& config,
                                 TransferLauncher& launcher,
                                 PathProbe& probe,
                                 ProgressSampler& sampler,
                                 ProgressReporter& reporter,
                                 MonitorClock& clock)
    : config(config), launcher(launcher), probe(probe), sampler(sampler), reporter(reporter), clock(clock) {}

std::expected<SessionOutcome, std::string> TransferMonitor::run(const TransferSession& session,
                                                                const std::function<bool()>& cancelRequested) {
    auto runStart = clock.now();
    auto abort = [&](const std::string& errorMsg) -> std::expected<SessionOutcome, std::string> {
        currentState = MonitorState::Aborted;
        config.logError(errorMsg);
        SessionOutcome aborted;
        aborted.state = MonitorState::Aborted;
        aborted.elapsedTime = clock.now() - runStart;
        aborted.message = errorMsg;
        applyCleanup(session, aborted);
        return std::unexpected(errorMsg);
    };

    auto interruptBeforeLaunch = [&]() -> std::expected<SessionOutcome, std::string> {
        currentState = MonitorState::Interrupted;
        SessionOutcome outcome;
        outcome.state = MonitorState::Interrupted;
        outcome.elapsedTime = clock.now() - runStart;
        outcome.message = "Backup interrupted by user.";
        config.logMessage(fmt::format("{} The copy tool was not started.", outcome.message));
        applyCleanup(session, outcome);
        return outcome;
    };

    currentState = MonitorState::Verifying;
    if (cancelRequested()) {
        return interruptBeforeLaunch();
    }
    if (!probe.exists(session.deviceId, session.sourcePath)) {
        return abort(fmt::format("Source path {} not found on device {}", session.sourcePath, session.deviceId));
    }
    // The probe can take seconds; nothing is spawned once a cancellation is pending.
    if (cancelRequested()) {
        return interruptBeforeLaunch();
    }

    auto launched = launcher.launch(session.deviceId, session.sourcePath, session.destinationPath);
    if (!launched) {
        return abort(fmt::format("Failed to start copy tool: {}", launched.error()));
    }
    std::unique_ptr<TransferProcess> process = std::move(*launched);

    currentState = MonitorState::Running;
    config.logMessage(fmt::format("Copying {} from {} to {}", session.sourcePath, session.deviceId, session.destinationPath.string()));

    DiagnosticCollector collector(session.destinationPath / config.diagnosticLogName, FailureFilter(config.failureMarkers));
    collector.start(process->takeDiagnostics());

    RateEstimator estimator(session.totalEstimatedBytes, config.rateWindow, config.tickInterval,
                            ProgressSample{runStart, 0, 0});
    DirectoryUsage usage;
    bool interrupted = false;

    while (true) {
        if (cancelRequested()) {
            interrupted = true;
            break;
        }
        clock.sleepFor(config.tickInterval, cancelRequested);
        if (cancelRequested()) {
            interrupted = true;
            break;
        }

        usage = sampler.sample(session.destinationPath, session.startTime);
        auto estimate = estimator.update(ProgressSample{clock.now(), usage.totalBytes, usage.fileCount});

        ProgressReport report;
        report.currentBytes = usage.totalBytes;
        report.totalBytes = session.totalEstimatedBytes;
        report.fileCount = usage.fileCount;
        report.percent = progressPercent(usage.totalBytes, session.totalEstimatedBytes);
        report.bytesPerSecond = estimate.bytesPerSecond;
        report.etaSeconds = estimate.etaSeconds;
        reporter.onProgress(report);

        if (!process->isRunning()) {
            break;
        }
    }
    reporter.onFinish();

    SessionOutcome outcome;
    if (interrupted) {
        process->terminate();
        if (!collector.finish(config.collectorGrace)) {
            config.logMessage("Diagnostic stream still open after termination; no longer collecting diagnostics");
        }
        currentState = MonitorState::Interrupted;
        outcome.state = MonitorState::Interrupted;
        outcome.bytesTransferred = usage.totalBytes;
        outcome.fileCount = usage.fileCount;
        outcome.elapsedTime = clock.now() - runStart;
        outcome.diagnosticsPresent = collector.recordCount() > 0;
        outcome.exitCode = process->exitCode();
        outcome.message = "Backup interrupted by user.";
        config.logMessage(outcome.message);
        applyCleanup(session, outcome);
        return outcome;
    }

    // The process has been reaped; only now is the destination final.
    usage = sampler.sample(session.destinationPath, session.startTime);
    if (!collector.finish(config.collectorGrace)) {
        config.logMessage("Diagnostic stream still open after the copy tool exited; no longer collecting diagnostics");
    }

    currentState = MonitorState::Completed;
    outcome.state = MonitorState::Completed;
    outcome.bytesTransferred = usage.totalBytes;
    outcome.fileCount = usage.fileCount;
    outcome.elapsedTime = clock.now() - runStart;
    outcome.diagnosticsPresent = collector.recordCount() > 0;
    outcome.exitCode = process->exitCode();
    outcome.success = usage.totalBytes > 0;

    if (!outcome.success) {
        outcome.message = "Backup failed - no files were transferred";
        config.logError(fmt::format("{} (copy tool exit status {})", outcome.message, outcome.exitCode.value_or(-1)));
        applyCleanup(session, outcome);
        return outcome;
    }

    if (outcome.exitCode.value_or(0) != 0) {
        config.logMessage(fmt::format("Copy tool exited with status {} after transferring {}; treating the backup as complete",
                                      *outcome.exitCode, formatSize(static_cast<double>(outcome.bytesTransferred))));
    }

    auto marker = writeCompletionMarker(session, outcome);
    if (marker) {
        outcome.completionMarker = *marker;
    } else {
        config.logError(fmt::format("Could not create completion file: {}", marker.error()));
    }
    outcome.message = "Backup completed successfully!";
    config.logMessage(fmt::format("{} {} in {} files, elapsed {}", outcome.message,
                                  formatSize(static_cast<double>(outcome.bytesTransferred)), outcome.fileCount,
                                  formatDuration(outcome.elapsedTime.count())));
    return outcome;
}

std::expected<fs::path, std::string> TransferMonitor::writeCompletionMarker(const TransferSession& session,
                                                                           const SessionOutcome& outcome) const {
    fs::path markerPath = session.destinationPath / config.completionMarkerName;
    std::ofstream marker(markerPath, std::ios::trunc);
    if (!marker.is_open()) {
        return std::unexpected(fmt::format("cannot open {}", markerPath.string()));
    }

    marker << fmt::format("Backup completed on: {}\n", formatTimestamp(std::chrono::system_clock::now(), "%Y-%m-%d_%H-%M-%S"));
    marker << fmt::format("Device: {}\n", session.deviceId);
    marker << fmt::format("Source: {}\n", session.sourcePath);
    marker << fmt::format("Total files: {}\n", outcome.fileCount);
    marker << fmt::format("Total size: {}\n", formatSize(static_cast<double>(outcome.bytesTransferred)));
    marker << fmt::format("Elapsed time: {}\n", formatDuration(outcome.elapsedTime.count()));
    if (session.excludesRestrictedSubtree) {
        marker << fmt::format("Note: {} folder was excluded due to permission restrictions\n", config.restrictedSubtree);
    }
    if (outcome.diagnosticsPresent) {
        marker << fmt::format("Note: Some files were skipped - see {} for details\n", config.diagnosticLogName);
    }
    marker.flush();
    if (!marker) {
        return std::unexpected(fmt::format("write to {} failed", markerPath.string()));
    }
    return markerPath;
}

void TransferMonitor::applyCleanup(const TransferSession& session, const SessionOutcome& outcome) const {
    auto result = cleanupPolicy.maybeCleanup(session, outcome);
    if (!result) {
        config.logError(fmt::format("Cleanup failed: {}", result.error()));
        return;
    }
    switch (*result) {
        case CleanupAction::Deleted:
            config.logMessage(fmt::format("Removed incomplete backup directory {}", session.destinationPath.string()));
            break;
        case CleanupAction::KeptExisting:
            config.logMessage(fmt::format("Backup directory not cleaned (it held files before this run): {}",
                                          session.destinationPath.string()));
            break;
        case CleanupAction::NotNeeded:
            break;
    }
}
