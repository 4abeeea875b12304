/**
 * @file progress_reporter.hpp
 * @brief Operator-facing progress line.
 */

#ifndef PROGRESS_REPORTER_HPP
#define PROGRESS_REPORTER_HPP

#include <string>
#include <cstdint>
#include <cstdio>

/**
 * @brief Data shown on one tick of the progress line.
 */
struct ProgressReport {
    std::uint64_t currentBytes = 0; ///< Bytes counted in the destination.
    std::uint64_t totalBytes = 0;   ///< Operator estimate.
    std::uint64_t fileCount = 0;    ///< Files counted in the destination.
    double percent = 0.0;           ///< Clamped to [0, 100].
    double bytesPerSecond = 0.0;    ///< Smoothed throughput.
    double etaSeconds = 0.0;        ///< Raw ETA; clamped when rendered.
};

/**
 * @brief Renders a report as "[bar] P% current/total (N files) [rate/s] ETA: HH:MM:SS".
 */
std::string renderProgressLine(const ProgressReport& report);

/**
 * @brief Interface for progress sinks.
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    /**
     * @brief Shows the state after one tick.
     */
    virtual void onProgress(const ProgressReport& report) = 0;

    /**
     * @brief Ends the in-place line once monitoring stops.
     */
    virtual void onFinish() = 0;
};

/**
 * @brief Rewrites the progress line in place on a terminal stream.
 */
class ConsoleProgressReporter : public ProgressReporter {
public:
    explicit ConsoleProgressReporter(std::FILE* out = stdout);

    void onProgress(const ProgressReport& report) override;
    void onFinish() override;

private:
    std::FILE* out;
    std::size_t lastWidth = 0; ///< Length of the previous line, for blanking leftovers.
    bool active = false;
};

#endif // PROGRESS_REPORTER_HPP
