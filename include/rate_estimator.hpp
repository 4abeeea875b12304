/**
 * @file rate_estimator.hpp
 * @brief Smoothed throughput and ETA from periodic size samples.
 */

#ifndef RATE_ESTIMATOR_HPP
#define RATE_ESTIMATOR_HPP

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <deque>

/**
 * @brief One progress observation taken by the monitor loop.
 */
struct ProgressSample {
    std::chrono::steady_clock::time_point timestamp; ///< When the sample was taken.
    std::uint64_t cumulativeBytes = 0;                ///< Bytes counted at that time.
    std::uint64_t fileCount = 0;                      ///< Files counted at that time.
};

/**
 * @brief Throughput and remaining time derived from the rate window.
 */
struct RateEstimate {
    double bytesPerSecond = 0.0; ///< Mean of the rate window, never negative.
    double etaSeconds = 0.0;     ///< Remaining time; 0 when the rate is unknown. May be negative past the estimate.
};

/**
 * @brief Moving-average throughput estimator.
 *
 * Keeps the last accepted sample and a bounded FIFO window of instantaneous rates.
 * A sample is accepted only when at least one tick has passed since the last accepted
 * sample and its byte count has not shrunk; rejected samples leave the window and the
 * rate untouched.
 *
 * A zero rate reports an ETA of zero rather than an unbounded one.
 */
class RateEstimator {
public:
    /**
     * @brief Constructs an estimator.
     *
     * @param totalEstimatedBytes Operator-supplied total used for the ETA.
     * @param windowCapacity Maximum number of rate observations averaged (at least 1).
     * @param minInterval Minimum time between accepted samples (one tick).
     * @param origin Initial accepted sample, normally zero bytes at session start.
     * @throws std::invalid_argument If windowCapacity is 0.
     */
    RateEstimator(std::uint64_t totalEstimatedBytes,
                  std::size_t windowCapacity,
                  std::chrono::steady_clock::duration minInterval,
                  ProgressSample origin);

    /**
     * @brief Feeds one sample and returns the current estimate.
     *
     * The ETA always uses the bytes of the given sample, accepted or not.
     *
     * @param sample Latest observation.
     * @return RateEstimate Current throughput and ETA.
     */
    RateEstimate update(const ProgressSample& sample);

    double currentRate() const { return rate; }
    std::size_t windowSize() const { return window.size(); }
    std::size_t windowCapacity() const { return capacity; }
    const ProgressSample& lastAccepted() const { return last; }

private:
    std::uint64_t totalEstimatedBytes;
    std::size_t capacity;
    std::chrono::steady_clock::duration minInterval;
    ProgressSample last;
    std::deque<double> window; ///< Instantaneous rates, oldest first.
    double rate = 0.0;
};

#endif // RATE_ESTIMATOR_HPP
