#pragma once

#include "indicators/rolling.hpp"

#include <cstddef>

namespace indicators {

using rolling::Series;
using rolling::UNDEFINED;
using rolling::is_defined;

// On-balance volume. Starts at 0 on the first defined close; a step whose
// close, previous close or volume is undefined adds nothing. Rows before the
// first defined close are undefined.
inline Series obv(const Series& close, const Series& volume) {
    Series out(close.size(), UNDEFINED);
    size_t first = rolling::leading_undefined(close);
    if (first >= close.size()) return out;

    double running = 0.0;
    out[first] = running;
    for (size_t i = first + 1; i < close.size(); ++i) {
        if (is_defined(close[i]) && is_defined(close[i - 1]) && is_defined(volume[i])) {
            double change = close[i] - close[i - 1];
            if (change > 0.0) running += volume[i];
            else if (change < 0.0) running -= volume[i];
        }
        out[i] = running;
    }
    return out;
}

}  // namespace indicators
