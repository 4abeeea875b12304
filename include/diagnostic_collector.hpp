/**
 * @file diagnostic_collector.hpp
 * @brief Background capture of copy tool failure messages.
 *
 * The collector drains the copy tool's diagnostic stream on its own thread and appends
 * the lines that look like failures to a log file. It never reports errors to the
 * monitor: losing diagnostics is acceptable, stalling or crashing the transfer is not.
 */

#ifndef DIAGNOSTIC_COLLECTOR_HPP
#define DIAGNOSTIC_COLLECTOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include "subprocess.hpp"

/**
 * @brief One captured failure line.
 */
struct DiagnosticRecord {
    std::chrono::system_clock::time_point timestamp; ///< When the line was read.
    std::string message;                             ///< Trimmed line text.

    /**
     * @brief Renders the record as a log line, "[HH:MM:SS] message".
     */
    std::string format() const;
};

/**
 * @brief Case-insensitive failure marker matcher.
 */
class FailureFilter {
public:
    /**
     * @brief Constructs a filter.
     *
     * @param markers Substrings that identify a failure line; matched case-insensitively.
     */
    explicit FailureFilter(std::vector<std::string> markers);

    /**
     * @brief Returns true when the line contains any marker.
     */
    bool matches(const std::string& line) const;

private:
    std::vector<std::string> markers; ///< Lower-cased markers.
};

/**
 * @brief Concurrent drain of a diagnostic stream into an append-only log.
 *
 * start() launches a thread that reads the stream until it closes. finish() waits a
 * bounded time for that thread and abandons it if the stream is still open, so a
 * cancelled session never blocks on a pipe held open by another process.
 */
class DiagnosticCollector {
public:
    /**
     * @brief Constructs an idle collector.
     *
     * @param logPath File the matching lines are appended to; created on first match.
     * @param filter Failure marker matcher.
     */
    DiagnosticCollector(std::filesystem::path logPath, FailureFilter filter);

    /**
     * @brief Abandons a still-running drain thread.
     */
    ~DiagnosticCollector();

    DiagnosticCollector(const DiagnosticCollector&) = delete;
    DiagnosticCollector& operator=(const DiagnosticCollector&) = delete;

    /**
     * @brief Starts draining the stream on a new thread.
     *
     * Calling start() twice has no effect.
     *
     * @param source Stream to drain; ownership moves to the drain thread.
     */
    void start(std::unique_ptr<LineSource> source);

    /**
     * @brief Waits for the drain thread to see end of stream.
     *
     * @param timeout Longest wait; after that the thread is detached and left to finish on its own.
     * @return bool True when the stream was fully drained.
     */
    bool finish(std::chrono::milliseconds timeout);

    /**
     * @brief Number of records written so far.
     */
    std::size_t recordCount() const;

    const std::filesystem::path& path() const { return logPath; }

private:
    /**
     * @brief State shared with the drain thread, which may outlive the collector.
     */
    struct SharedState {
        std::mutex mutex;
        std::condition_variable done;
        bool finished = false;
        std::atomic<std::size_t> records{0};
    };

    static void drain(std::unique_ptr<LineSource> source,
                      std::filesystem::path logPath,
                      FailureFilter filter,
                      std::shared_ptr<SharedState> state);

    std::filesystem::path logPath;
    FailureFilter filter;
    std::shared_ptr<SharedState> state;
    std::thread worker;
};

#endif // DIAGNOSTIC_COLLECTOR_HPP
