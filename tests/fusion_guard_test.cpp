// fusion_guard_test.cpp — FusionGuard: block join, column-name collision
// resolution, infinity handling and the single fill pass.

#include <gtest/gtest.h>

#include "fusion/fusion_guard.hpp"
#include "fusion_error.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "test_series_helpers.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using rolling::UNDEFINED;

namespace {
constexpr double INF = std::numeric_limits<double>::infinity();
}

class FusionGuardTest : public ::testing::Test {
protected:
    CanonicalTimeline timeline_ = test_helpers::make_timeline(6);

    FeatureBlock block(const std::string& name, const std::string& column, std::vector<double> v) {
        FeatureBlock b(name, timeline_);
        b.add(column, std::move(v));
        return b;
    }
};

// ===========================================================================
// Fill primitives
// ===========================================================================

TEST_F(FusionGuardTest, ForwardFillHoldsLastValue) {
    std::vector<double> col = {UNDEFINED, 1.0, UNDEFINED, UNDEFINED, 4.0, UNDEFINED};
    EXPECT_EQ(FusionGuard::forward_fill(col), 3u);
    EXPECT_TRUE(std::isnan(col[0]));
    EXPECT_DOUBLE_EQ(col[2], 1.0);
    EXPECT_DOUBLE_EQ(col[3], 1.0);
    EXPECT_DOUBLE_EQ(col[5], 4.0);
}

TEST_F(FusionGuardTest, BackwardFillTouchesLeadingGapOnly) {
    std::vector<double> col = {UNDEFINED, UNDEFINED, 2.0, 3.0};
    EXPECT_EQ(FusionGuard::backward_fill_leading(col), 2u);
    EXPECT_DOUBLE_EQ(col[0], 2.0);
    EXPECT_DOUBLE_EQ(col[1], 2.0);

    std::vector<double> interior = {1.0, UNDEFINED, 3.0};
    EXPECT_EQ(FusionGuard::backward_fill_leading(interior), 0u);
    EXPECT_TRUE(std::isnan(interior[1]));
}

TEST_F(FusionGuardTest, AllUndefinedColumnStaysUndefined) {
    std::vector<double> col(4, UNDEFINED);
    EXPECT_EQ(FusionGuard::forward_fill(col), 0u);
    EXPECT_EQ(FusionGuard::backward_fill_leading(col), 0u);
    EXPECT_EQ(FusionGuard::count_undefined(col), 4u);
}

TEST_F(FusionGuardTest, InfinitiesBecomeUndefined) {
    std::vector<double> col = {1.0, INF, -INF, 2.0};
    EXPECT_EQ(FusionGuard::replace_infinities(col), 2u);
    EXPECT_TRUE(std::isnan(col[1]));
    EXPECT_TRUE(std::isnan(col[2]));
    EXPECT_DOUBLE_EQ(col[3], 2.0);
}

// ===========================================================================
// fuse()
// ===========================================================================

TEST_F(FusionGuardTest, FuseForwardThenBackward) {
    auto b = block("technical", "x", {UNDEFINED, UNDEFINED, 5.0, INF, UNDEFINED, 7.0});
    FusionGuard guard(timeline_, FusionConfig{});
    FusionReport report;
    auto m = guard.fuse("EUR_USD", {&b}, &report);

    const auto& x = m.column("x");
    EXPECT_DOUBLE_EQ(x[0], 5.0);
    EXPECT_DOUBLE_EQ(x[1], 5.0);
    EXPECT_DOUBLE_EQ(x[3], 5.0);  // inf replaced, then forward-filled
    EXPECT_DOUBLE_EQ(x[4], 5.0);
    EXPECT_DOUBLE_EQ(x[5], 7.0);
    EXPECT_EQ(report.inf_replaced, 1u);
    EXPECT_EQ(report.forward_filled, 2u);
    EXPECT_EQ(report.backward_filled, 2u);
    EXPECT_EQ(report.rows, 6u);
    EXPECT_EQ(report.columns, 1u);
    EXPECT_EQ(report.instrument, "EUR_USD");
}

TEST_F(FusionGuardTest, ForwardOnlyPolicyKeepsLeadingGap) {
    auto b = block("technical", "x", {UNDEFINED, 2.0, UNDEFINED, 4.0, 5.0, 6.0});
    FusionConfig config;
    config.fill = FillPolicy::FORWARD;
    auto m = FusionGuard(timeline_, config).fuse("EUR_USD", {&b});
    const auto& x = m.column("x");
    EXPECT_TRUE(std::isnan(x[0]));
    EXPECT_DOUBLE_EQ(x[2], 2.0);
}

TEST_F(FusionGuardTest, NoInfinityInOutput) {
    auto b = block("technical", "x", {INF, -INF, INF, -INF, INF, -INF});
    auto m = FusionGuard(timeline_, FusionConfig{}).fuse("EUR_USD", {&b});
    for (double v : m.column("x")) EXPECT_FALSE(std::isinf(v));
}

TEST_F(FusionGuardTest, CollidingNamesGetBlockSuffix) {
    auto a = block("price", "close", {1, 2, 3, 4, 5, 6});
    auto b = block("vix", "close", {7, 8, 9, 10, 11, 12});
    auto c = block("vix", "close", {0, 0, 0, 0, 0, 0});
    FusionReport report;
    auto m = FusionGuard(timeline_, FusionConfig{}).fuse("EUR_USD", {&a, &b, &c}, &report);

    ASSERT_EQ(m.column_count(), 3u);
    EXPECT_EQ(m.names[0], "close");
    EXPECT_EQ(m.names[1], "close_vix");
    EXPECT_EQ(m.names[2], "close_vix_2");
    EXPECT_DOUBLE_EQ(m.column("close_vix")[0], 7.0);
    ASSERT_EQ(report.renamed.size(), 2u);
    EXPECT_EQ(report.renamed[0], "close -> close_vix");
}

TEST_F(FusionGuardTest, BlockOrderPreserved) {
    auto a = block("a", "first", {1, 1, 1, 1, 1, 1});
    auto b = block("b", "second", {2, 2, 2, 2, 2, 2});
    auto m = FusionGuard(timeline_, FusionConfig{}).fuse("X", {&a, &b});
    EXPECT_EQ(m.names[0], "first");
    EXPECT_EQ(m.names[1], "second");
    EXPECT_EQ(m.timestamps, timeline_.timestamps());
}

TEST_F(FusionGuardTest, SparseColumnsReportedBeforeFill) {
    auto b = block("ext", "sparse", {UNDEFINED, UNDEFINED, UNDEFINED, UNDEFINED, 1.0, 2.0});
    FeatureBlock dense("ext2", timeline_);
    dense.add("dense", {1, 2, 3, 4, 5, 6});
    FusionReport report;
    FusionGuard(timeline_, FusionConfig{}).fuse("X", {&b, &dense}, &report);
    ASSERT_EQ(report.sparse_columns.size(), 1u);
    EXPECT_EQ(report.sparse_columns[0], "sparse");
}

TEST_F(FusionGuardTest, MismatchedBlockThrowsIncompatibleIndex) {
    auto other = test_helpers::make_timeline(5);
    FeatureBlock b("stale", other);
    b.add("x", {1, 2, 3, 4, 5});
    FusionGuard guard(timeline_, FusionConfig{});
    EXPECT_THROW(guard.fuse("X", {&b}), IncompatibleIndex);

    auto shifted = test_helpers::make_timeline(6, Granularity::HOUR,
                                               test_helpers::base_ts() + time_utils::NS_PER_HOUR);
    FeatureBlock c("shifted", shifted);
    c.add("x", {1, 2, 3, 4, 5, 6});
    EXPECT_THROW(guard.fuse("X", {&c}), IncompatibleIndex);

    auto daily = test_helpers::make_timeline(6, Granularity::DAY);
    FeatureBlock d("daily", daily);
    d.add("x", {1, 2, 3, 4, 5, 6});
    EXPECT_THROW(guard.fuse("X", {&d}), FusionError);
}

TEST_F(FusionGuardTest, MissingColumnLookupThrows) {
    auto b = block("a", "x", {1, 2, 3, 4, 5, 6});
    auto m = FusionGuard(timeline_, FusionConfig{}).fuse("X", {&b});
    EXPECT_TRUE(m.has_column("x"));
    EXPECT_THROW(m.column("y"), std::out_of_range);
}

TEST_F(FusionGuardTest, ConfigValidation) {
    FusionConfig bad;
    bad.max_undefined_fraction = 1.5;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    EXPECT_THROW(FusionGuard(timeline_, bad), std::invalid_argument);
    EXPECT_EQ(parse_fill_policy("ffill"), FillPolicy::FORWARD);
    EXPECT_EQ(parse_fill_policy("forward_backward"), FillPolicy::FORWARD_BACKWARD);
    EXPECT_THROW(parse_fill_policy("interpolate"), std::invalid_argument);
}
