// calendar_features_test.cpp — CalendarFeatureGenerator: calendar fields,
// cyclical encodings, session and period-boundary flags.

#include <gtest/gtest.h>

#include "features/calendar_features.hpp"
#include "features/warmup.hpp"
#include "test_series_helpers.hpp"
#include "time_utils.hpp"

#include <cmath>

using time_utils::from_civil;

class CalendarFeaturesTest : public ::testing::Test {
protected:
    // 2024-01-01 (Monday) 00:00 .. 2024-01-07 23:00
    CanonicalTimeline week_ = test_helpers::make_timeline(24 * 7);
    CalendarFeatureGenerator gen_;
};

TEST_F(CalendarFeaturesTest, AllColumnsPresentWithZeroWarmup) {
    WarmupTracker warmup;
    auto block = gen_.generate(week_, &warmup);
    EXPECT_EQ(block.name(), "calendar");
    EXPECT_EQ(block.column_count(), CalendarFeatureGenerator::column_names().size());
    EXPECT_EQ(block.column_count(), 24u);
    EXPECT_EQ(warmup.max_warmup(), 0u);
    for (const auto& name : block.column_names()) {
        EXPECT_EQ(test_helpers::count_undefined(block.column(name)), 0u) << name;
    }
}

TEST_F(CalendarFeaturesTest, CalendarFields) {
    auto block = gen_.generate(week_);
    size_t row = 24 * 2 + 15;  // Wednesday 2024-01-03 15:00
    EXPECT_DOUBLE_EQ(block.column("hour")[row], 15.0);
    EXPECT_DOUBLE_EQ(block.column("day_of_week")[row], 2.0);
    EXPECT_DOUBLE_EQ(block.column("day_of_month")[row], 3.0);
    EXPECT_DOUBLE_EQ(block.column("month")[row], 1.0);
    EXPECT_DOUBLE_EQ(block.column("quarter")[row], 1.0);
    EXPECT_DOUBLE_EQ(block.column("year")[row], 2024.0);
    EXPECT_DOUBLE_EQ(block.column("week_of_year")[row], 1.0);
}

TEST_F(CalendarFeaturesTest, CyclicalEncodings) {
    auto block = gen_.generate(week_);
    EXPECT_NEAR(block.column("hour_sin")[6], 1.0, 1e-12);
    EXPECT_NEAR(block.column("hour_cos")[6], 0.0, 1e-12);
    EXPECT_NEAR(block.column("hour_cos")[0], 1.0, 1e-12);
    EXPECT_NEAR(block.column("day_sin")[0], 0.0, 1e-12);  // Monday
    const auto& s = block.column("hour_sin");
    const auto& c = block.column("hour_cos");
    for (size_t i = 0; i < s.size(); ++i) EXPECT_NEAR(s[i] * s[i] + c[i] * c[i], 1.0, 1e-12);
}

TEST_F(CalendarFeaturesTest, SessionFlags) {
    auto block = gen_.generate(week_);
    const auto& tokyo = block.column("is_tokyo_session");
    const auto& london = block.column("is_london_session");
    const auto& ny = block.column("is_ny_session");
    const auto& overlap = block.column("is_overlap_london_ny");

    EXPECT_DOUBLE_EQ(tokyo[0], 1.0);
    EXPECT_DOUBLE_EQ(tokyo[8], 1.0);
    EXPECT_DOUBLE_EQ(tokyo[9], 0.0);
    EXPECT_DOUBLE_EQ(london[7], 0.0);
    EXPECT_DOUBLE_EQ(london[8], 1.0);
    EXPECT_DOUBLE_EQ(london[16], 1.0);
    EXPECT_DOUBLE_EQ(london[17], 0.0);
    EXPECT_DOUBLE_EQ(ny[13], 1.0);
    EXPECT_DOUBLE_EQ(ny[21], 1.0);
    EXPECT_DOUBLE_EQ(ny[22], 0.0);
    EXPECT_DOUBLE_EQ(overlap[12], 0.0);
    EXPECT_DOUBLE_EQ(overlap[13], 1.0);
    EXPECT_DOUBLE_EQ(overlap[16], 1.0);
    EXPECT_DOUBLE_EQ(overlap[17], 0.0);
}

TEST_F(CalendarFeaturesTest, WeekdayFlags) {
    auto block = gen_.generate(week_);
    const auto& mon = block.column("is_monday");
    const auto& fri = block.column("is_friday");
    const auto& adj = block.column("is_weekend_adjacent");
    EXPECT_DOUBLE_EQ(mon[0], 1.0);
    EXPECT_DOUBLE_EQ(mon[24], 0.0);
    EXPECT_DOUBLE_EQ(fri[24 * 4], 1.0);
    EXPECT_DOUBLE_EQ(adj[24 * 4], 1.0);
    EXPECT_DOUBLE_EQ(adj[24 * 2], 0.0);
}

TEST_F(CalendarFeaturesTest, MonthBoundaryFlags) {
    CanonicalTimeline tl(from_civil(2024, 12, 26), from_civil(2025, 1, 4), Granularity::DAY);
    auto block = gen_.generate(tl);
    const auto& start = block.column("is_month_start");
    const auto& end = block.column("is_month_end");
    const auto& q_end = block.column("is_quarter_end");
    const auto& y_end = block.column("is_year_end");

    EXPECT_DOUBLE_EQ(end[1], 0.0);     // Dec 27
    EXPECT_DOUBLE_EQ(end[2], 1.0);     // Dec 28
    EXPECT_DOUBLE_EQ(q_end[5], 1.0);   // Dec 31
    EXPECT_DOUBLE_EQ(y_end[5], 1.0);
    EXPECT_DOUBLE_EQ(start[6], 1.0);   // Jan 1
    EXPECT_DOUBLE_EQ(start[8], 1.0);   // Jan 3
    EXPECT_DOUBLE_EQ(start[9], 0.0);   // Jan 4
    EXPECT_DOUBLE_EQ(block.column("week_of_year")[6], 1.0);  // 2025-W01
}

TEST_F(CalendarFeaturesTest, QuarterEndOnlyInQuarterMonths) {
    CanonicalTimeline tl(from_civil(2024, 2, 28), from_civil(2024, 3, 29), Granularity::DAY);
    auto block = gen_.generate(tl);
    const auto& q_end = block.column("is_quarter_end");
    EXPECT_DOUBLE_EQ(q_end[0], 0.0);           // Feb 28
    EXPECT_DOUBLE_EQ(q_end.back(), 1.0);       // Mar 29
    EXPECT_DOUBLE_EQ(block.column("quarter").back(), 1.0);
}
