#include "rate_estimator.hpp"
#include <numeric>
#include <stdexcept>

RateEstimator::RateEstimator(std::uint64_t totalEstimatedBytes,
                             std::size_t windowCapacity,
                             std::chrono::steady_clock::duration minInterval,
                             ProgressSample origin)
    : totalEstimatedBytes(totalEstimatedBytes), capacity(windowCapacity), minInterval(minInterval), last(origin) {
    if (capacity == 0) {
        throw std::invalid_argument("Rate window capacity must be at least 1");
    }
}

RateEstimate RateEstimator::update(const ProgressSample& sample) {
    auto elapsed = sample.timestamp - last.timestamp;
    if (elapsed >= minInterval && elapsed.count() > 0 && sample.cumulativeBytes >= last.cumulativeBytes) {
        double seconds = std::chrono::duration<double>(elapsed).count();
        double instant = static_cast<double>(sample.cumulativeBytes - last.cumulativeBytes) / seconds;
        window.push_back(instant);
        if (window.size() > capacity) {
            window.pop_front();
        }
        rate = std::accumulate(window.begin(), window.end(), 0.0) / static_cast<double>(window.size());
        last = sample;
    }

    RateEstimate estimate;
    estimate.bytesPerSecond = rate;
    if (rate > 0) {
        double remaining = static_cast<double>(totalEstimatedBytes) - static_cast<double>(sample.cumulativeBytes);
        estimate.etaSeconds = remaining / rate;
    }
    return estimate;
}
