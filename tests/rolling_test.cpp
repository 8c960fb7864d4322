// rolling_test.cpp — NaN-aware rolling primitives and element-wise helpers.

#include <gtest/gtest.h>

#include "indicators/rolling.hpp"
#include "test_series_helpers.hpp"

#include <cmath>
#include <vector>

using rolling::Series;
using rolling::UNDEFINED;

class RollingTest : public ::testing::Test {
protected:
    Series ramp_ = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
};

TEST_F(RollingTest, MeanWarmupIsWindowMinusOne) {
    auto m = rolling::mean(ramp_, 5);
    for (size_t i = 0; i < 4; ++i) EXPECT_TRUE(std::isnan(m[i])) << "row " << i;
    EXPECT_DOUBLE_EQ(m[4], 3.0);
    EXPECT_DOUBLE_EQ(m[5], 4.0);
}

TEST_F(RollingTest, WindowLongerThanSeriesIsAllUndefined) {
    auto m = rolling::mean(ramp_, 10);
    EXPECT_EQ(test_helpers::count_undefined(m), ramp_.size());
}

TEST_F(RollingTest, UndefinedInputPoisonsCoveringWindows) {
    Series x = {1.0, 2.0, UNDEFINED, 4.0, 5.0, 6.0, 7.0};
    auto m = rolling::mean(x, 2);
    EXPECT_DOUBLE_EQ(m[1], 1.5);
    EXPECT_TRUE(std::isnan(m[2]));
    EXPECT_TRUE(std::isnan(m[3]));
    EXPECT_DOUBLE_EQ(m[4], 4.5);
}

TEST_F(RollingTest, SampleStddev) {
    Series x = {1.0, 2.0, 3.0, 4.0};
    auto sd = rolling::stddev(x, 4);
    EXPECT_NEAR(sd[3], std::sqrt(5.0 / 3.0), 1e-12);
    auto single = rolling::stddev(x, 1);
    EXPECT_EQ(test_helpers::count_undefined(single), x.size());
}

TEST_F(RollingTest, MinMaxSum) {
    Series x = {3.0, 1.0, 4.0, 1.0, 5.0};
    auto lo = rolling::min(x, 3);
    auto hi = rolling::max(x, 3);
    auto s = rolling::sum(x, 3);
    EXPECT_DOUBLE_EQ(lo[2], 1.0);
    EXPECT_DOUBLE_EQ(hi[2], 4.0);
    EXPECT_DOUBLE_EQ(hi[4], 5.0);
    EXPECT_DOUBLE_EQ(s[4], 10.0);
}

TEST_F(RollingTest, MeanAbsoluteDeviation) {
    Series x = {1.0, 2.0, 3.0};
    EXPECT_NEAR(rolling::mad(x, 3)[2], 2.0 / 3.0, 1e-12);
}

TEST_F(RollingTest, SkewOfSymmetricWindowIsZero) {
    auto sk = rolling::skew(ramp_, 5);
    EXPECT_NEAR(sk[4], 0.0, 1e-12);
    EXPECT_NEAR(sk[5], 0.0, 1e-12);
}

TEST_F(RollingTest, SkewAndKurtosisUndefinedOnFlatWindow) {
    Series flat(8, 2.5);
    EXPECT_EQ(test_helpers::count_undefined(rolling::skew(flat, 5)), flat.size());
    EXPECT_EQ(test_helpers::count_undefined(rolling::kurtosis(flat, 5)), flat.size());
}

TEST_F(RollingTest, KurtosisOfUniformRampIsNegative) {
    // Excess kurtosis of evenly spaced values is -1.2 for n = 5 (bias-corrected).
    auto k = rolling::kurtosis(ramp_, 5);
    EXPECT_NEAR(k[4], -1.2, 1e-12);
}

TEST_F(RollingTest, CorrelationOfLinearRelations) {
    Series up(ramp_.size()), down(ramp_.size());
    for (size_t i = 0; i < ramp_.size(); ++i) {
        up[i] = 2.0 * ramp_[i] + 1.0;
        down[i] = -ramp_[i];
    }
    auto pos = rolling::correlation(ramp_, up, 4);
    auto neg = rolling::correlation(ramp_, down, 4);
    for (size_t i = 0; i < 3; ++i) EXPECT_TRUE(std::isnan(pos[i]));
    EXPECT_NEAR(pos[3], 1.0, 1e-12);
    EXPECT_NEAR(neg[5], -1.0, 1e-12);
}

TEST_F(RollingTest, CorrelationWithConstantIsUndefined) {
    Series flat(ramp_.size(), 7.0);
    auto c = rolling::correlation(ramp_, flat, 3);
    EXPECT_EQ(test_helpers::count_undefined(c), ramp_.size());
}

TEST_F(RollingTest, CorrelationBoundedOnNoise) {
    auto a = test_helpers::random_walk(300, 1);
    auto b = test_helpers::random_walk(300, 2);
    auto c = rolling::correlation(rolling::pct_change(a), rolling::pct_change(b), 24);
    for (double v : c) {
        if (std::isnan(v)) continue;
        EXPECT_GE(v, -1.0);
        EXPECT_LE(v, 1.0);
    }
}

TEST_F(RollingTest, ShiftAndDiff) {
    auto s = rolling::shift(ramp_, 2);
    EXPECT_TRUE(std::isnan(s[1]));
    EXPECT_DOUBLE_EQ(s[2], 1.0);
    auto d = rolling::diff(ramp_);
    EXPECT_TRUE(std::isnan(d[0]));
    EXPECT_DOUBLE_EQ(d[5], 1.0);
}

TEST_F(RollingTest, PctChangeUndefinedOnZeroBase) {
    Series x = {0.0, 2.0, 3.0};
    auto p = rolling::pct_change(x);
    EXPECT_TRUE(std::isnan(p[1]));
    EXPECT_DOUBLE_EQ(p[2], 0.5);
}

TEST_F(RollingTest, EmaOfConstantIsConstant) {
    Series flat(10, 4.0);
    auto e = rolling::ema(flat, 5);
    for (double v : e) EXPECT_DOUBLE_EQ(v, 4.0);
}

TEST_F(RollingTest, EmaAdjustedWeights) {
    // span 3 -> alpha 0.5: y1 = (2 + 0.5 * 1) / 1.5
    Series x = {1.0, 2.0};
    auto e = rolling::ema(x, 3);
    EXPECT_DOUBLE_EQ(e[0], 1.0);
    EXPECT_NEAR(e[1], 2.5 / 1.5, 1e-12);
}

TEST_F(RollingTest, EmaRestartsAfterUndefined) {
    Series x = {1.0, UNDEFINED, 5.0};
    auto e = rolling::ema(x, 3);
    EXPECT_TRUE(std::isnan(e[1]));
    EXPECT_DOUBLE_EQ(e[2], 5.0);
}

TEST_F(RollingTest, LeadingUndefined) {
    EXPECT_EQ(rolling::leading_undefined({UNDEFINED, UNDEFINED, 1.0, UNDEFINED}), 2u);
    EXPECT_EQ(rolling::leading_undefined(ramp_), 0u);
    EXPECT_EQ(rolling::leading_undefined(Series(3, UNDEFINED)), 3u);
}

TEST_F(RollingTest, SafeRatio) {
    EXPECT_TRUE(std::isnan(rolling::safe_ratio(1.0, 0.0)));
    EXPECT_DOUBLE_EQ(rolling::safe_ratio(3.0, 2.0), 1.5);
}
