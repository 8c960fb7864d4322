#pragma once

#include "indicators/rolling.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace indicators {

using rolling::EPS;
using rolling::Series;
using rolling::UNDEFINED;
using rolling::is_defined;

// max(h - l, |h - c_prev|, |l - c_prev|); the first row (no previous close)
// uses h - l.
inline Series true_range(const Series& high, const Series& low, const Series& close) {
    Series tr(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(high[i]) || !is_defined(low[i])) continue;
        double range = high[i] - low[i];
        if (i > 0 && is_defined(close[i - 1])) {
            range = std::max({range,
                              std::abs(high[i] - close[i - 1]),
                              std::abs(low[i] - close[i - 1])});
        }
        tr[i] = range;
    }
    return tr;
}

// Average true range; warm-up period - 1.
inline Series atr(const Series& high, const Series& low, const Series& close, size_t period) {
    return rolling::mean(true_range(high, low, close), period);
}

struct Bollinger {
    Series upper;
    Series middle;
    Series lower;
    Series width;     // (upper - lower) / middle
    Series position;  // (close - lower) / (upper - lower)
};

// Bands at middle +- k * sample std over `window`; upper >= lower wherever
// defined.
inline Bollinger bollinger(const Series& close, size_t window, double k = 2.0) {
    Bollinger bb;
    bb.middle = rolling::mean(close, window);
    auto sd = rolling::stddev(close, window);
    size_t n = close.size();
    bb.upper.assign(n, UNDEFINED);
    bb.lower.assign(n, UNDEFINED);
    bb.width.assign(n, UNDEFINED);
    bb.position.assign(n, UNDEFINED);
    for (size_t i = 0; i < n; ++i) {
        if (!is_defined(bb.middle[i]) || !is_defined(sd[i])) continue;
        bb.upper[i] = bb.middle[i] + k * sd[i];
        bb.lower[i] = bb.middle[i] - k * sd[i];
        double band = bb.upper[i] - bb.lower[i];
        bb.width[i] = band / (bb.middle[i] + EPS);
        bb.position[i] = (close[i] - bb.lower[i]) / (band + EPS);
    }
    return bb;
}

}  // namespace indicators
