#pragma once

#include "features/warmup.hpp"
#include "series/feature_block.hpp"
#include "time_utils.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cmath>
#include <numbers>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CalendarFeatureGenerator — calendar fields, cyclical encodings and FX
// session flags derived from the timeline itself (UTC wall clock).
// Never undefined, so every column has warm-up 0.
// ---------------------------------------------------------------------------
class CalendarFeatureGenerator {
public:
    // Session windows in UTC hours, [open, close).
    static constexpr int TOKYO_OPEN = 0;
    static constexpr int TOKYO_CLOSE = 9;
    static constexpr int LONDON_OPEN = 8;
    static constexpr int LONDON_CLOSE = 17;
    static constexpr int NY_OPEN = 13;
    static constexpr int NY_CLOSE = 22;

    static constexpr int MONTH_START_LAST_DAY = 3;
    static constexpr int MONTH_END_FIRST_DAY = 28;

    FeatureBlock generate(const CanonicalTimeline& timeline, WarmupTracker* warmup = nullptr) const {
        const size_t n = timeline.size();
        std::vector<std::string> names = column_names();
        std::vector<std::vector<double>> cols(names.size(), std::vector<double>(n, 0.0));

        for (size_t i = 0; i < n; ++i) {
            uint64_t ts = timeline[i];
            auto ct = time_utils::to_civil(ts);
            int dow = time_utils::day_of_week(ts);
            int hour = ct.hour;
            int quarter = (ct.month - 1) / 3 + 1;

            size_t c = 0;
            cols[c++][i] = hour;
            cols[c++][i] = dow;
            cols[c++][i] = ct.day;
            cols[c++][i] = ct.month;
            cols[c++][i] = quarter;
            cols[c++][i] = ct.year;
            cols[c++][i] = time_utils::iso_week(ts);

            cols[c++][i] = std::sin(TWO_PI * hour / 24.0);
            cols[c++][i] = std::cos(TWO_PI * hour / 24.0);
            cols[c++][i] = std::sin(TWO_PI * dow / 7.0);
            cols[c++][i] = std::cos(TWO_PI * dow / 7.0);
            cols[c++][i] = std::sin(TWO_PI * ct.month / 12.0);
            cols[c++][i] = std::cos(TWO_PI * ct.month / 12.0);

            cols[c++][i] = flag(hour >= TOKYO_OPEN && hour < TOKYO_CLOSE);
            cols[c++][i] = flag(hour >= LONDON_OPEN && hour < LONDON_CLOSE);
            cols[c++][i] = flag(hour >= NY_OPEN && hour < NY_CLOSE);
            cols[c++][i] = flag(hour >= NY_OPEN && hour < LONDON_CLOSE);

            bool month_end = ct.day >= MONTH_END_FIRST_DAY;
            cols[c++][i] = flag(ct.day <= MONTH_START_LAST_DAY);
            cols[c++][i] = flag(month_end);
            cols[c++][i] = flag(month_end && ct.month % 3 == 0);
            cols[c++][i] = flag(month_end && ct.month == 12);
            cols[c++][i] = flag(dow == 0);
            cols[c++][i] = flag(dow == 4);
            cols[c++][i] = flag(dow == 0 || dow == 4);
        }

        FeatureBlock block("calendar", timeline);
        for (size_t c = 0; c < names.size(); ++c) {
            block.add(names[c], std::move(cols[c]));
            if (warmup) warmup->declare(names[c], 0);
        }
        return block;
    }

    static std::vector<std::string> column_names() {
        return {
            "hour", "day_of_week", "day_of_month", "month", "quarter", "year", "week_of_year",
            "hour_sin", "hour_cos", "day_sin", "day_cos", "month_sin", "month_cos",
            "is_tokyo_session", "is_london_session", "is_ny_session", "is_overlap_london_ny",
            "is_month_start", "is_month_end", "is_quarter_end", "is_year_end",
            "is_monday", "is_friday", "is_weekend_adjacent",
        };
    }

private:
    static constexpr double TWO_PI = 2.0 * std::numbers::pi;

    static double flag(bool b) { return b ? 1.0 : 0.0; }
};
