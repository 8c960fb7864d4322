#pragma once

#include "indicators/rolling.hpp"
#include "indicators/volatility.hpp"

#include <cmath>
#include <cstddef>

namespace indicators {

struct Adx {
    Series adx;       // warm-up 2 * period - 1
    Series plus_di;   // warm-up period
    Series minus_di;  // warm-up period
};

// Directional movement with the classical clamp: only the larger of the up
// and down moves counts, and only when positive. Smoothing is a simple
// rolling mean over `period`.
inline Adx adx(const Series& high, const Series& low, const Series& close, size_t period = 14) {
    size_t n = close.size();
    Series plus_dm(n, UNDEFINED);
    Series minus_dm(n, UNDEFINED);
    for (size_t i = 1; i < n; ++i) {
        if (!is_defined(high[i]) || !is_defined(high[i - 1]) ||
            !is_defined(low[i]) || !is_defined(low[i - 1])) continue;
        double up = high[i] - high[i - 1];
        double down = low[i - 1] - low[i];
        plus_dm[i] = (up > down && up > 0.0) ? up : 0.0;
        minus_dm[i] = (down > up && down > 0.0) ? down : 0.0;
    }

    auto avg_tr = atr(high, low, close, period);
    auto avg_plus = rolling::mean(plus_dm, period);
    auto avg_minus = rolling::mean(minus_dm, period);

    Adx out;
    out.plus_di.assign(n, UNDEFINED);
    out.minus_di.assign(n, UNDEFINED);
    Series dx(n, UNDEFINED);
    for (size_t i = 0; i < n; ++i) {
        if (!is_defined(avg_tr[i]) || !is_defined(avg_plus[i]) || !is_defined(avg_minus[i])) continue;
        out.plus_di[i] = 100.0 * avg_plus[i] / (avg_tr[i] + EPS);
        out.minus_di[i] = 100.0 * avg_minus[i] / (avg_tr[i] + EPS);
        dx[i] = 100.0 * std::abs(out.plus_di[i] - out.minus_di[i]) /
                (out.plus_di[i] + out.minus_di[i] + EPS);
    }
    out.adx = rolling::mean(dx, period);
    return out;
}

}  // namespace indicators
