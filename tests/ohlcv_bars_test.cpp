// ohlcv_bars_test.cpp — OhlcvBarCollector: fixed-point conversion, ordering,
// repeated timestamps and the one-instrument-per-file rule.

#include <gtest/gtest.h>

#include "io/ohlcv_bars.hpp"
#include "time_utils.hpp"

#include <stdexcept>
#include <string>

using time_utils::NS_PER_HOUR;

namespace {

constexpr uint32_t INSTRUMENT = 42005804;
constexpr int64_t SCALE = 1'000'000'000;

uint64_t hour(int h) {
    return time_utils::from_civil(2024, 3, 4) + static_cast<uint64_t>(h) * NS_PER_HOUR;
}

}  // anonymous namespace

class OhlcvBarCollectorTest : public ::testing::Test {
protected:
    series_io::OhlcvBarCollector collector_{"6E.ohlcv-1h.dbn.zst"};
};

TEST_F(OhlcvBarCollectorTest, FixedPointPricesConverted) {
    EXPECT_DOUBLE_EQ(series_io::dbn_fixed_to_double(1'085'250'000), 1.08525);
    EXPECT_DOUBLE_EQ(series_io::dbn_fixed_to_double(-2 * SCALE), -2.0);

    collector_.add_bar(hour(0), INSTRUMENT, 1'085'000'000, 1'086'000'000, 1'084'500'000,
                       1'085'500'000, 1200);
    auto s = collector_.to_series("6E", Granularity::HOUR);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s.name(), "6E");
    EXPECT_EQ(s.granularity(), Granularity::HOUR);
    EXPECT_DOUBLE_EQ(s.column("open")[0], 1.085);
    EXPECT_DOUBLE_EQ(s.column("high")[0], 1.086);
    EXPECT_DOUBLE_EQ(s.column("low")[0], 1.0845);
    EXPECT_DOUBLE_EQ(s.column("close")[0], 1.0855);
    EXPECT_DOUBLE_EQ(s.column("volume")[0], 1200.0);
}

TEST_F(OhlcvBarCollectorTest, OutOfOrderBarsSortedAndValid) {
    collector_.add_bar(hour(2), INSTRUMENT, 3 * SCALE, 3 * SCALE, 3 * SCALE, 3 * SCALE, 30);
    collector_.add_bar(hour(0), INSTRUMENT, 1 * SCALE, 1 * SCALE, 1 * SCALE, 1 * SCALE, 10);
    collector_.add_bar(hour(1), INSTRUMENT, 2 * SCALE, 2 * SCALE, 2 * SCALE, 2 * SCALE, 20);
    auto s = collector_.to_series("6E", Granularity::HOUR);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_NO_THROW(s.validate());
    EXPECT_EQ(s.timestamps()[0], hour(0));
    EXPECT_DOUBLE_EQ(s.column("close")[2], 3.0);
    EXPECT_DOUBLE_EQ(s.column("volume")[1], 20.0);
}

TEST_F(OhlcvBarCollectorTest, RepeatedTimestampKeepsLastBar) {
    collector_.add_bar(hour(0), INSTRUMENT, SCALE, SCALE, SCALE, SCALE, 10);
    collector_.add_bar(hour(0), INSTRUMENT, 5 * SCALE, 5 * SCALE, 5 * SCALE, 5 * SCALE, 50);
    EXPECT_EQ(collector_.size(), 1u);
    auto s = collector_.to_series("6E", Granularity::HOUR);
    EXPECT_DOUBLE_EQ(s.column("close")[0], 5.0);
    EXPECT_DOUBLE_EQ(s.column("volume")[0], 50.0);
}

TEST_F(OhlcvBarCollectorTest, SecondInstrumentRejected) {
    collector_.add_bar(hour(0), INSTRUMENT, SCALE, SCALE, SCALE, SCALE, 10);
    ASSERT_EQ(collector_.instrument_id().value(), INSTRUMENT);
    try {
        collector_.add_bar(hour(1), INSTRUMENT + 1, SCALE, SCALE, SCALE, SCALE, 10);
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("6E.ohlcv-1h.dbn.zst"), std::string::npos) << what;
        EXPECT_NE(what.find(std::to_string(INSTRUMENT + 1)), std::string::npos) << what;
    }
    EXPECT_EQ(collector_.size(), 1u);
}

TEST_F(OhlcvBarCollectorTest, EmptyCollectorGivesEmptySeriesWithColumns) {
    EXPECT_FALSE(collector_.instrument_id().has_value());
    auto s = collector_.to_series("6E", Granularity::DAY);
    EXPECT_TRUE(s.empty());
    EXPECT_TRUE(s.has_column("close"));
    EXPECT_TRUE(s.has_column("volume"));
}
