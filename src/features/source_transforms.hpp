#pragma once

#include "indicators/rolling.hpp"
#include "series/time_series.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Per-source transforms, computed on an external series at its own native
// frequency before it is aligned. `periods` counts native observations, so
// pct_change over 12 rows of a monthly CPI release is a year-over-year change
// whatever the target timeline is. Row i of an output reads rows <= i only.
// ---------------------------------------------------------------------------
enum class SourceTransformKind {
    PCT_CHANGE,  // (x[i] - x[i-n]) / x[i-n] * scale
    DIFF,        // (x[i] - x[i-n]) * scale
    VOLATILITY,  // sample std of 1-row returns over n rows, * scale
};

inline std::string source_transform_kind_name(SourceTransformKind k) {
    switch (k) {
        case SourceTransformKind::PCT_CHANGE: return "pct_change";
        case SourceTransformKind::DIFF: return "diff";
        case SourceTransformKind::VOLATILITY: return "volatility";
    }
    return "unknown";
}

inline SourceTransformKind parse_source_transform_kind(const std::string& s) {
    if (s == "pct_change" || s == "return") return SourceTransformKind::PCT_CHANGE;
    if (s == "diff") return SourceTransformKind::DIFF;
    if (s == "volatility") return SourceTransformKind::VOLATILITY;
    throw std::invalid_argument("Unknown source transform: '" + s +
                                "' (expected pct_change, return, diff or volatility)");
}

struct SourceTransform {
    std::string output;
    SourceTransformKind kind = SourceTransformKind::PCT_CHANGE;
    std::string column;
    size_t periods = 1;
    double scale = 1.0;
    bool optional = false;  // skipped, not an error, when `column` is absent

    void validate() const {
        if (output.empty() || column.empty()) {
            throw std::invalid_argument("Source transform needs an output and an input column");
        }
        if (periods == 0) throw std::invalid_argument("Source transform '" + output + "': periods must be > 0");
        if (kind == SourceTransformKind::VOLATILITY && periods < 2) {
            throw std::invalid_argument("Source transform '" + output + "': volatility window must be >= 2");
        }
        if (!std::isfinite(scale)) {
            throw std::invalid_argument("Source transform '" + output + "': scale must be finite");
        }
    }

    // Leading native rows left undefined on clean input.
    size_t warmup() const { return periods; }
};

// Year-over-year CPI (12 monthly releases, in percent) and unemployment
// changes, for whichever of the columns a macro source carries.
inline std::vector<SourceTransform> macro_source_transforms() {
    std::vector<SourceTransform> out;
    for (const char* ccy : {"us", "jp"}) {
        std::string c(ccy);
        out.push_back({c + "_cpi_yoy", SourceTransformKind::PCT_CHANGE, c + "_cpi", 12, 100.0, true});
        out.push_back({c + "_unemp_change", SourceTransformKind::DIFF, c + "_unemployment", 1, 1.0, true});
    }
    return out;
}

// {name}_return and {name}_volatility (20 rows) from {name}_close.
inline std::vector<SourceTransform> market_source_transforms(const std::string& name) {
    return {
        {name + "_return", SourceTransformKind::PCT_CHANGE, name + "_close", 1, 1.0, false},
        {name + "_volatility", SourceTransformKind::VOLATILITY, name + "_close", 20, 1.0, false},
    };
}

inline rolling::Series compute_source_transform(const std::vector<double>& x, const SourceTransform& t) {
    rolling::Series out;
    switch (t.kind) {
        case SourceTransformKind::PCT_CHANGE: out = rolling::pct_change(x, t.periods); break;
        case SourceTransformKind::DIFF: out = rolling::diff(x, t.periods); break;
        case SourceTransformKind::VOLATILITY:
            out = rolling::stddev(rolling::pct_change(x, 1), t.periods);
            break;
    }
    if (t.scale != 1.0) {
        for (auto& v : out) v *= t.scale;
    }
    return out;
}

// Copy of `series` with every transform appended in order; a transform may
// read the output of an earlier one.
inline TimeSeries apply_source_transforms(const TimeSeries& series,
                                          const std::vector<SourceTransform>& transforms) {
    TimeSeries out = series;
    for (const auto& t : transforms) {
        t.validate();
        if (!out.has_column(t.column)) {
            if (t.optional) continue;
            throw std::invalid_argument("Source '" + series.name() + "' has no column '" + t.column +
                                        "' for transform '" + t.output + "'");
        }
        if (out.has_column(t.output)) {
            throw std::invalid_argument("Source '" + series.name() + "' already has a column '" +
                                        t.output + "'");
        }
        out.add_column(t.output, compute_source_transform(out.column(t.column), t));
    }
    return out;
}
