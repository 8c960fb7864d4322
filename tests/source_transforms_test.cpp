// source_transforms_test.cpp — per-source transforms computed on an external
// series' own rows: definitions, causality over native rows, presets, and
// how the transformed columns land on a finer canonical timeline.

#include <gtest/gtest.h>

#include "alignment/alignment_adapter.hpp"
#include "features/source_transforms.hpp"
#include "test_series_helpers.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using test_helpers::make_column_series;

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// Linear index 100, 101, ... on native rows.
TimeSeries cpi_series(size_t n) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = 100.0 + static_cast<double>(i);
    return make_column_series("macro", "us_cpi", v, Granularity::DAY);
}

SourceTransform yoy() {
    return {"us_cpi_yoy", SourceTransformKind::PCT_CHANGE, "us_cpi", 12, 100.0, false};
}

}  // anonymous namespace

// ===========================================================================
// Definitions
// ===========================================================================

class SourceTransformTest : public ::testing::Test {};

TEST_F(SourceTransformTest, PctChangeCountsNativeRows) {
    auto out = apply_source_transforms(cpi_series(24), {yoy()});
    const auto& v = out.column("us_cpi_yoy");
    for (size_t i = 0; i < 12; ++i) EXPECT_TRUE(std::isnan(v[i])) << "row " << i;
    EXPECT_DOUBLE_EQ(v[12], (112.0 - 100.0) / 100.0 * 100.0);
    EXPECT_DOUBLE_EQ(v[23], (123.0 - 111.0) / 111.0 * 100.0);
    EXPECT_EQ(yoy().warmup(), 12u);
}

TEST_F(SourceTransformTest, DiffOfUnemployment) {
    auto s = make_column_series("macro", "us_unemployment", {3.7, 3.9, 3.8, 3.8}, Granularity::DAY);
    auto out = apply_source_transforms(
        s, {{"us_unemp_change", SourceTransformKind::DIFF, "us_unemployment", 1, 1.0, false}});
    const auto& v = out.column("us_unemp_change");
    EXPECT_TRUE(std::isnan(v[0]));
    EXPECT_NEAR(v[1], 0.2, 1e-12);
    EXPECT_NEAR(v[2], -0.1, 1e-12);
    EXPECT_DOUBLE_EQ(v[3], 0.0);
}

TEST_F(SourceTransformTest, VolatilityIsSampleStdOfReturns) {
    auto close = test_helpers::random_walk(40, 11, 42000.0, 0.03);
    auto s = make_column_series("crypto", "btc_close", close, Granularity::DAY);
    auto out = apply_source_transforms(s, market_source_transforms("btc"));
    const auto& ret = out.column("btc_return");
    const auto& vol = out.column("btc_volatility");

    EXPECT_TRUE(std::isnan(ret[0]));
    EXPECT_NEAR(ret[5], (close[5] - close[4]) / close[4], 1e-15);

    for (size_t i = 0; i < 20; ++i) EXPECT_TRUE(std::isnan(vol[i])) << "row " << i;
    const size_t row = 30;
    double mean = 0.0;
    for (size_t k = row - 19; k <= row; ++k) mean += ret[k];
    mean /= 20.0;
    double ss = 0.0;
    for (size_t k = row - 19; k <= row; ++k) ss += (ret[k] - mean) * (ret[k] - mean);
    EXPECT_NEAR(vol[row], std::sqrt(ss / 19.0), 1e-12);
}

TEST_F(SourceTransformTest, NativeRowReadsOnlyEarlierRows) {
    auto base = cpi_series(30);
    std::vector<SourceTransform> transforms = {
        yoy(),
        {"cpi_change", SourceTransformKind::DIFF, "us_cpi", 1, 1.0, false},
        {"cpi_vol", SourceTransformKind::VOLATILITY, "us_cpi", 5, 1.0, false},
    };
    auto before = apply_source_transforms(base, transforms);

    const size_t k = 20;
    auto values = base.column("us_cpi");
    values[k] = 500.0;
    auto changed = make_column_series("macro", "us_cpi", values, Granularity::DAY);
    auto after = apply_source_transforms(changed, transforms);

    for (const auto& t : transforms) {
        const auto& a = before.column(t.output);
        const auto& b = after.column(t.output);
        for (size_t i = 0; i < k; ++i) {
            EXPECT_TRUE(test_helpers::same_values({a[i]}, {b[i]})) << t.output << " row " << i;
        }
        EXPECT_FALSE(test_helpers::same_values({a[k]}, {b[k]})) << t.output;
    }
}

TEST_F(SourceTransformTest, LaterTransformReadsEarlierOutput) {
    auto out = apply_source_transforms(
        cpi_series(20),
        {yoy(), {"us_cpi_yoy_change", SourceTransformKind::DIFF, "us_cpi_yoy", 1, 1.0, false}});
    const auto& yoy_col = out.column("us_cpi_yoy");
    const auto& change = out.column("us_cpi_yoy_change");
    EXPECT_TRUE(std::isnan(change[12]));
    EXPECT_DOUBLE_EQ(change[15], yoy_col[15] - yoy_col[14]);
}

TEST_F(SourceTransformTest, InputSeriesUntouched) {
    auto s = cpi_series(15);
    auto out = apply_source_transforms(s, {yoy()});
    EXPECT_EQ(s.column_count(), 1u);
    EXPECT_EQ(out.column_count(), 2u);
    EXPECT_EQ(out.timestamps(), s.timestamps());
}

// ===========================================================================
// Presets and errors
// ===========================================================================

TEST_F(SourceTransformTest, MacroPresetUsesColumnsPresent) {
    auto out = apply_source_transforms(cpi_series(14), macro_source_transforms());
    EXPECT_TRUE(out.has_column("us_cpi_yoy"));
    EXPECT_FALSE(out.has_column("jp_cpi_yoy"));
    EXPECT_FALSE(out.has_column("us_unemp_change"));
    EXPECT_DOUBLE_EQ(out.column("us_cpi_yoy")[13], (113.0 - 101.0) / 101.0 * 100.0);
}

TEST_F(SourceTransformTest, MissingRequiredColumnThrows) {
    EXPECT_THROW(apply_source_transforms(cpi_series(5), market_source_transforms("btc")),
                 std::invalid_argument);
}

TEST_F(SourceTransformTest, OutputCollisionThrows) {
    SourceTransform t = yoy();
    t.output = "us_cpi";
    EXPECT_THROW(apply_source_transforms(cpi_series(20), {t}), std::invalid_argument);
}

TEST_F(SourceTransformTest, InvalidTransformsRejected) {
    SourceTransform zero = yoy();
    zero.periods = 0;
    EXPECT_THROW(zero.validate(), std::invalid_argument);

    SourceTransform vol{"v", SourceTransformKind::VOLATILITY, "us_cpi", 1, 1.0, false};
    EXPECT_THROW(vol.validate(), std::invalid_argument);

    SourceTransform scale = yoy();
    scale.scale = std::nan("");
    EXPECT_THROW(scale.validate(), std::invalid_argument);

    EXPECT_THROW(parse_source_transform_kind("yoy"), std::invalid_argument);
    EXPECT_EQ(parse_source_transform_kind("return"), SourceTransformKind::PCT_CHANGE);
    EXPECT_EQ(source_transform_kind_name(SourceTransformKind::VOLATILITY), "volatility");
}

// ===========================================================================
// Alignment of transformed columns
// ===========================================================================

class SourceTransformAlignmentTest : public ::testing::Test {
protected:
    // 20 days of hourly rows over a 20-row daily source.
    CanonicalTimeline timeline_ = test_helpers::make_timeline(20 * 24, Granularity::HOUR);
    AlignmentAdapter adapter_{timeline_};
};

TEST_F(SourceTransformAlignmentTest, DailyChangeHeldOverItsDay) {
    SourceTransform change{"cpi_change_2", SourceTransformKind::DIFF, "us_cpi", 2, 1.0, false};
    auto native = apply_source_transforms(cpi_series(20), {change});
    auto block = adapter_.align(native);
    const auto& v = block.column("cpi_change_2");
    const auto& nat = native.column("cpi_change_2");
    for (size_t t = 0; t < timeline_.size(); ++t) {
        size_t day = t / 24;
        if (day < 2) {
            EXPECT_TRUE(std::isnan(v[t])) << "row " << t;
        } else {
            ASSERT_DOUBLE_EQ(v[t], nat[day]) << "row " << t;
        }
    }
    // Two native rows, not two hourly rows.
    EXPECT_DOUBLE_EQ(v[48], 2.0);
}

TEST_F(SourceTransformAlignmentTest, ValueAppearsFromSourceTimestampOnward) {
    auto native = apply_source_transforms(cpi_series(20), {yoy()});
    auto block = adapter_.align(native);
    const auto& v = block.column("us_cpi_yoy");
    const size_t first = 12 * 24;  // day 12, 00:00
    EXPECT_TRUE(std::isnan(v[first - 1]));
    EXPECT_DOUBLE_EQ(v[first], native.column("us_cpi_yoy")[12]);
    EXPECT_DOUBLE_EQ(v[first + 23], native.column("us_cpi_yoy")[12]);
    EXPECT_DOUBLE_EQ(v[first + 24], native.column("us_cpi_yoy")[13]);
}

TEST_F(SourceTransformAlignmentTest, PublicationLagAppliesToTransformedColumns) {
    auto native = apply_source_transforms(cpi_series(20), {yoy()});
    AlignmentPolicy policy;
    policy.publication_lag_ns = 24 * time_utils::NS_PER_HOUR;
    auto block = adapter_.align(native, policy);
    const auto& v = block.column("us_cpi_yoy");
    EXPECT_TRUE(std::isnan(v[12 * 24]));
    EXPECT_DOUBLE_EQ(v[13 * 24], native.column("us_cpi_yoy")[12]);
}
