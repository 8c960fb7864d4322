#pragma once

#include "indicators/rolling.hpp"

#include <cmath>
#include <cstddef>

// ---------------------------------------------------------------------------
// Ratio-based oscillators. Every denominator is guarded with rolling::EPS
// instead of letting a flat window produce an infinity.
// ---------------------------------------------------------------------------
namespace indicators {

using rolling::EPS;
using rolling::Series;
using rolling::UNDEFINED;
using rolling::is_defined;

// RSI with simple rolling averages of gains and losses.
// Warm-up = period (the first difference is undefined). Range [0, 100].
inline Series rsi(const Series& close, size_t period) {
    auto delta = rolling::diff(close);
    Series gain(delta.size(), UNDEFINED);
    Series loss(delta.size(), UNDEFINED);
    for (size_t i = 0; i < delta.size(); ++i) {
        if (!is_defined(delta[i])) continue;
        gain[i] = delta[i] > 0.0 ? delta[i] : 0.0;
        loss[i] = delta[i] < 0.0 ? -delta[i] : 0.0;
    }
    auto avg_gain = rolling::mean(gain, period);
    auto avg_loss = rolling::mean(loss, period);

    Series out(close.size(), UNDEFINED);
    for (size_t i = 0; i < out.size(); ++i) {
        if (!is_defined(avg_gain[i]) || !is_defined(avg_loss[i])) continue;
        double rs = avg_gain[i] / (avg_loss[i] + EPS);
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

struct Stochastic {
    Series k;  // warm-up period - 1
    Series d;  // SMA(k, smooth); warm-up period + smooth - 2
};

inline Stochastic stochastic(const Series& high, const Series& low, const Series& close,
                             size_t period, size_t smooth = 3) {
    auto lowest = rolling::min(low, period);
    auto highest = rolling::max(high, period);

    Stochastic st;
    st.k.assign(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(lowest[i]) || !is_defined(highest[i]) || !is_defined(close[i])) continue;
        st.k[i] = 100.0 * (close[i] - lowest[i]) / (highest[i] - lowest[i] + EPS);
    }
    st.d = rolling::mean(st.k, smooth);
    return st;
}

// Williams %R in [-100, 0]; warm-up period - 1.
inline Series williams_r(const Series& high, const Series& low, const Series& close,
                         size_t period) {
    auto lowest = rolling::min(low, period);
    auto highest = rolling::max(high, period);
    Series out(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(lowest[i]) || !is_defined(highest[i]) || !is_defined(close[i])) continue;
        out[i] = -100.0 * (highest[i] - close[i]) / (highest[i] - lowest[i] + EPS);
    }
    return out;
}

inline Series typical_price(const Series& high, const Series& low, const Series& close) {
    Series tp(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        tp[i] = (high[i] + low[i] + close[i]) / 3.0;
    }
    return tp;
}

// Commodity channel index with Lambert's 0.015 constant; warm-up period - 1.
inline Series cci(const Series& high, const Series& low, const Series& close, size_t period) {
    auto tp = typical_price(high, low, close);
    auto tp_mean = rolling::mean(tp, period);
    auto tp_mad = rolling::mad(tp, period);
    Series out(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(tp_mean[i]) || !is_defined(tp_mad[i])) continue;
        out[i] = (tp[i] - tp_mean[i]) / (0.015 * tp_mad[i] + EPS);
    }
    return out;
}

// Money flow index; warm-up = period (flow direction needs a previous price).
inline Series mfi(const Series& high, const Series& low, const Series& close,
                  const Series& volume, size_t period) {
    auto tp = typical_price(high, low, close);
    Series pos(close.size(), UNDEFINED);
    Series neg(close.size(), UNDEFINED);
    for (size_t i = 1; i < close.size(); ++i) {
        if (!is_defined(tp[i]) || !is_defined(tp[i - 1]) || !is_defined(volume[i])) continue;
        double flow = tp[i] * volume[i];
        pos[i] = tp[i] > tp[i - 1] ? flow : 0.0;
        neg[i] = tp[i] < tp[i - 1] ? flow : 0.0;
    }
    auto pos_sum = rolling::sum(pos, period);
    auto neg_sum = rolling::sum(neg, period);
    Series out(close.size(), UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        if (!is_defined(pos_sum[i]) || !is_defined(neg_sum[i])) continue;
        out[i] = 100.0 - 100.0 / (1.0 + pos_sum[i] / (neg_sum[i] + EPS));
    }
    return out;
}

}  // namespace indicators
