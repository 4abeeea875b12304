#include <gtest/gtest.h>

#include <stdexcept>
#include "rate_estimator.hpp"

using namespace std::chrono_literals;

namespace {

const auto kOrigin = std::chrono::steady_clock::time_point{} + 1h;

ProgressSample at(std::chrono::steady_clock::duration offset, std::uint64_t bytes) {
    return ProgressSample{kOrigin + offset, bytes, 0};
}

} // namespace

TEST(RateEstimator, RejectsEmptyWindow) {
    EXPECT_THROW(RateEstimator(100, 0, 1s, at(0s, 0)), std::invalid_argument);
}

TEST(RateEstimator, AveragesInstantaneousRates) {
    RateEstimator estimator(10'000, 5, 1s, at(0s, 0));
    estimator.update(at(1s, 100));
    auto estimate = estimator.update(at(2s, 400));

    EXPECT_DOUBLE_EQ(estimate.bytesPerSecond, 200.0);
    EXPECT_DOUBLE_EQ(estimate.etaSeconds, (10'000.0 - 400.0) / 200.0);
    EXPECT_EQ(estimator.windowSize(), 2u);
}

TEST(RateEstimator, WindowIsBounded) {
    RateEstimator estimator(0, 3, 1s, at(0s, 0));
    std::uint64_t bytes = 0;
    for (int i = 1; i <= 10; ++i) {
        bytes += static_cast<std::uint64_t>(i) * 10;
        estimator.update(at(std::chrono::seconds(i), bytes));
        EXPECT_LE(estimator.windowSize(), 3u);
    }
    // Last three deltas: 80, 90, 100.
    EXPECT_DOUBLE_EQ(estimator.currentRate(), 90.0);
}

TEST(RateEstimator, IgnoresSamplesInsideMinInterval) {
    RateEstimator estimator(1000, 5, 1s, at(0s, 0));
    estimator.update(at(500ms, 100));
    EXPECT_EQ(estimator.windowSize(), 0u);
    EXPECT_DOUBLE_EQ(estimator.currentRate(), 0.0);

    estimator.update(at(1s, 100));
    EXPECT_EQ(estimator.windowSize(), 1u);
    EXPECT_DOUBLE_EQ(estimator.currentRate(), 100.0);
}

TEST(RateEstimator, IgnoresShrinkingTotals) {
    RateEstimator estimator(1000, 5, 1s, at(0s, 0));
    estimator.update(at(1s, 500));
    double rateBefore = estimator.currentRate();
    ASSERT_DOUBLE_EQ(rateBefore, 500.0);

    auto estimate = estimator.update(at(2s, 200));

    EXPECT_DOUBLE_EQ(estimator.currentRate(), rateBefore);
    EXPECT_DOUBLE_EQ(estimate.bytesPerSecond, rateBefore);
    EXPECT_EQ(estimator.windowSize(), 1u);
    EXPECT_EQ(estimator.lastAccepted().cumulativeBytes, 500u);
}

TEST(RateEstimator, UnknownRateGivesZeroEta) {
    RateEstimator estimator(1000, 5, 1s, at(0s, 0));
    auto estimate = estimator.update(at(1s, 0));
    EXPECT_DOUBLE_EQ(estimate.bytesPerSecond, 0.0);
    EXPECT_DOUBLE_EQ(estimate.etaSeconds, 0.0);
}

TEST(RateEstimator, EtaGoesNegativePastEstimate) {
    RateEstimator estimator(100, 5, 1s, at(0s, 0));
    auto estimate = estimator.update(at(1s, 200));
    EXPECT_LT(estimate.etaSeconds, 0.0);
}
