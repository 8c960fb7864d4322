#pragma once

#include "fusion_error.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "series/granularity.hpp"
#include "series/time_series.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AlignmentPolicy — how one source is projected onto the canonical timeline.
// The projection is always "hold last known value"; the policy only decides
// when an observation counts as known and how its columns are named.
// ---------------------------------------------------------------------------
struct AlignmentPolicy {
    std::string column_prefix;        // prepended to every source column
    uint64_t publication_lag_ns = 0;  // observation becomes usable at ts + lag
    bool allow_finer_sources = false; // sample an intraday source on a coarser timeline
};

// ---------------------------------------------------------------------------
// AlignmentAdapter — forward-fill-only reindexing
//
// value(t) = most recent observation with (ts + publication_lag) <= t;
// rows before the first usable observation stay undefined. A value observed
// after t never appears at t.
// ---------------------------------------------------------------------------
class AlignmentAdapter {
public:
    explicit AlignmentAdapter(const CanonicalTimeline& timeline) : timeline_(timeline) {}

    FeatureBlock align(const TimeSeries& source, const AlignmentPolicy& policy = {}) const {
        if (!policy.allow_finer_sources &&
            !is_finer_or_equal(timeline_.granularity(), source.granularity())) {
            throw GranularityMismatch("source '" + source.name() + "' at " +
                                      granularity_name(source.granularity()) +
                                      " is finer than the " +
                                      granularity_name(timeline_.granularity()) + " timeline");
        }

        FeatureBlock block(source.name(), timeline_);
        auto source_rows = usable_rows(source, policy.publication_lag_ns);

        for (const auto& col : source.column_names()) {
            const auto& values = source.column(col);
            std::vector<double> out(timeline_.size(), rolling::UNDEFINED);
            for (size_t i = 0; i < out.size(); ++i) {
                int64_t r = source_rows[i];
                if (r >= 0) out[i] = values[static_cast<size_t>(r)];
            }
            block.add(policy.column_prefix + col, std::move(out));
        }
        return block;
    }

    // For every timeline row, the index of the source row in effect (or -1).
    std::vector<int64_t> usable_rows(const TimeSeries& source, uint64_t lag_ns = 0) const {
        const auto& src_ts = source.timestamps();
        const auto& tgt_ts = timeline_.timestamps();
        std::vector<int64_t> rows(tgt_ts.size(), -1);

        size_t j = 0;
        for (size_t i = 0; i < tgt_ts.size(); ++i) {
            while (j < src_ts.size() && src_ts[j] + lag_ns <= tgt_ts[i]) ++j;
            rows[i] = static_cast<int64_t>(j) - 1;
        }
        return rows;
    }

private:
    const CanonicalTimeline& timeline_;
};
