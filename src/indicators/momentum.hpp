#pragma once

#include "indicators/moving_averages.hpp"
#include "indicators/rolling.hpp"

#include <cstddef>

namespace indicators {

struct Macd {
    Series macd;
    Series signal;
    Series histogram;
};

inline Macd macd(const Series& close, size_t fast = 12, size_t slow = 26, size_t signal = 9) {
    auto ema_fast = ema(close, fast);
    auto ema_slow = ema(close, slow);
    Macd out;
    out.macd.assign(close.size(), rolling::UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        out.macd[i] = ema_fast[i] - ema_slow[i];
    }
    out.signal = ema(out.macd, signal);
    out.histogram.assign(close.size(), rolling::UNDEFINED);
    for (size_t i = 0; i < close.size(); ++i) {
        out.histogram[i] = out.macd[i] - out.signal[i];
    }
    return out;
}

}  // namespace indicators
