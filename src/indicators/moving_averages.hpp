#pragma once

#include "indicators/rolling.hpp"

#include <cstddef>

namespace indicators {

using rolling::Series;

// Simple moving average; first window-1 outputs undefined.
inline Series sma(const Series& x, size_t window) {
    return rolling::mean(x, window);
}

// Exponential moving average (alpha = 2/(span+1), bias-adjusted). Defined
// from the first input; early values carry less history than later ones.
inline Series ema(const Series& x, size_t span) {
    return rolling::ema(x, span);
}

}  // namespace indicators
