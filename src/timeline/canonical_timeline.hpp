#pragma once

#include "fusion_error.hpp"
#include "series/granularity.hpp"
#include "series/time_series.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CanonicalTimeline — the single ordered index every block is aligned onto.
// Immutable once built.
// ---------------------------------------------------------------------------
class CanonicalTimeline {
public:
    // Inclusive range, both ends snapped down to the granularity grid.
    CanonicalTimeline(uint64_t start_ts, uint64_t end_ts, Granularity granularity)
        : granularity_(granularity) {
        if (end_ts < start_ts) {
            throw std::invalid_argument("Timeline end " + time_utils::format_timestamp(end_ts) +
                                        " precedes start " + time_utils::format_timestamp(start_ts));
        }
        uint64_t step = granularity_ns(granularity);
        uint64_t first = snap_to_grid(start_ts, granularity);
        uint64_t last = snap_to_grid(end_ts, granularity);
        timestamps_.reserve(static_cast<size_t>((last - first) / step + 1));
        for (uint64_t ts = first; ts <= last; ts += step) {
            timestamps_.push_back(ts);
        }
    }

    const std::vector<uint64_t>& timestamps() const { return timestamps_; }
    Granularity granularity() const { return granularity_; }
    size_t size() const { return timestamps_.size(); }
    uint64_t start_ts() const { return timestamps_.front(); }
    uint64_t end_ts() const { return timestamps_.back(); }
    uint64_t operator[](size_t i) const { return timestamps_[i]; }

    // Index of the last timeline row with timestamp <= ts, or -1.
    int64_t index_at_or_before(uint64_t ts) const {
        auto it = std::upper_bound(timestamps_.begin(), timestamps_.end(), ts);
        return static_cast<int64_t>(it - timestamps_.begin()) - 1;
    }

private:
    Granularity granularity_;
    std::vector<uint64_t> timestamps_;
};

// ---------------------------------------------------------------------------
// TimelineRequest — caller-supplied analysis window
// ---------------------------------------------------------------------------
struct TimelineRequest {
    uint64_t start_ts = 0;
    uint64_t end_ts = UINT64_MAX;
    Granularity granularity = Granularity::HOUR;
};

// ---------------------------------------------------------------------------
// TimelineBuilder — derives the canonical timeline from the series it hosts
// ---------------------------------------------------------------------------
class TimelineBuilder {
public:
    explicit TimelineBuilder(const TimelineRequest& request) : request_(request) {}

    // Throws GranularityMismatch when `native` is finer than the target.
    void check_hostable(const std::string& series_name, Granularity native) const {
        if (!is_finer_or_equal(request_.granularity, native)) {
            throw GranularityMismatch("series '" + series_name + "' at " +
                                      granularity_name(native) +
                                      " cannot be hosted on a " +
                                      granularity_name(request_.granularity) + " timeline");
        }
    }

    // Span = [min(start), max(end)] over non-empty series, clipped to the
    // requested window.
    CanonicalTimeline build(const std::vector<const TimeSeries*>& series) const {
        uint64_t lo = UINT64_MAX;
        uint64_t hi = 0;
        for (const auto* s : series) {
            check_hostable(s->name(), s->granularity());
            if (s->empty()) continue;
            lo = std::min(lo, s->start_ts());
            hi = std::max(hi, s->end_ts());
        }
        if (lo == UINT64_MAX) {
            throw std::invalid_argument("Cannot derive a timeline: every input series is empty");
        }
        lo = std::max(lo, request_.start_ts);
        hi = std::min(hi, request_.end_ts);
        if (hi < lo) {
            throw std::invalid_argument("Input series do not overlap the requested window [" +
                                        time_utils::format_timestamp(request_.start_ts) + ", " +
                                        time_utils::format_timestamp(request_.end_ts) + "]");
        }
        return CanonicalTimeline(lo, hi, request_.granularity);
    }

    // Timeline over the requested window only (both ends must be finite).
    CanonicalTimeline build_window() const {
        if (request_.end_ts == UINT64_MAX) {
            throw std::invalid_argument("build_window requires an explicit end timestamp");
        }
        return CanonicalTimeline(request_.start_ts, request_.end_ts, request_.granularity);
    }

private:
    TimelineRequest request_;
};
