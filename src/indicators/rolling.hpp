#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// ---------------------------------------------------------------------------
// Rolling primitives over NaN-aware double columns.
//
// Window policy: an output at position i is defined only when all `window`
// inputs in [i - window + 1, i] are defined. Every function reads positions
// <= i only.
// ---------------------------------------------------------------------------
namespace rolling {

using Series = std::vector<double>;

constexpr double UNDEFINED = std::numeric_limits<double>::quiet_NaN();
constexpr double EPS = 1e-10;

inline bool is_defined(double v) { return !std::isnan(v); }

// count[i] = number of undefined values in x[0 .. i-1]
inline std::vector<size_t> undefined_prefix(const Series& x) {
    std::vector<size_t> count(x.size() + 1, 0);
    for (size_t i = 0; i < x.size(); ++i) {
        count[i + 1] = count[i] + (is_defined(x[i]) ? 0 : 1);
    }
    return count;
}

// Apply f(const double* window_begin, size_t window) over every complete window.
template <typename F>
Series rolling_apply(const Series& x, size_t window, F&& f) {
    Series out(x.size(), UNDEFINED);
    if (window == 0 || x.size() < window) return out;
    auto bad = undefined_prefix(x);
    for (size_t i = window - 1; i < x.size(); ++i) {
        if (bad[i + 1] - bad[i + 1 - window] != 0) continue;
        out[i] = f(&x[i + 1 - window], window);
    }
    return out;
}

inline double mean_of(const double* v, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) sum += v[i];
    return sum / static_cast<double>(n);
}

// Central moment sums around the window mean: {sum d^2, sum d^3, sum d^4}.
struct Moments {
    double mean = 0.0;
    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
};

inline Moments moments_of(const double* v, size_t n) {
    Moments m;
    m.mean = mean_of(v, n);
    for (size_t i = 0; i < n; ++i) {
        double d = v[i] - m.mean;
        double d2 = d * d;
        m.m2 += d2;
        m.m3 += d2 * d;
        m.m4 += d2 * d2;
    }
    return m;
}

// True when the window is numerically constant.
inline bool degenerate(const Moments& m, size_t n) {
    double var = m.m2 / static_cast<double>(n);
    return var <= 1e-20 * (1.0 + m.mean * m.mean);
}

inline Series mean(const Series& x, size_t window) {
    return rolling_apply(x, window, [](const double* v, size_t n) { return mean_of(v, n); });
}

inline Series sum(const Series& x, size_t window) {
    return rolling_apply(x, window, [](const double* v, size_t n) {
        double s = 0.0;
        for (size_t i = 0; i < n; ++i) s += v[i];
        return s;
    });
}

// Sample standard deviation (n - 1 denominator); undefined for window < 2.
inline Series stddev(const Series& x, size_t window) {
    if (window < 2) return Series(x.size(), UNDEFINED);
    return rolling_apply(x, window, [](const double* v, size_t n) {
        auto m = moments_of(v, n);
        return std::sqrt(m.m2 / static_cast<double>(n - 1));
    });
}

inline Series min(const Series& x, size_t window) {
    return rolling_apply(x, window, [](const double* v, size_t n) {
        return *std::min_element(v, v + n);
    });
}

inline Series max(const Series& x, size_t window) {
    return rolling_apply(x, window, [](const double* v, size_t n) {
        return *std::max_element(v, v + n);
    });
}

// Mean absolute deviation around the window mean.
inline Series mad(const Series& x, size_t window) {
    return rolling_apply(x, window, [](const double* v, size_t n) {
        double mu = mean_of(v, n);
        double s = 0.0;
        for (size_t i = 0; i < n; ++i) s += std::abs(v[i] - mu);
        return s / static_cast<double>(n);
    });
}

// Adjusted Fisher-Pearson skewness; needs window >= 3.
inline Series skew(const Series& x, size_t window) {
    if (window < 3) return Series(x.size(), UNDEFINED);
    return rolling_apply(x, window, [](const double* v, size_t n) {
        auto m = moments_of(v, n);
        if (degenerate(m, n)) return UNDEFINED;
        double nf = static_cast<double>(n);
        double b2 = m.m2 / nf;
        double b3 = m.m3 / nf;
        return std::sqrt(nf * (nf - 1.0)) / (nf - 2.0) * b3 / std::pow(b2, 1.5);
    });
}

// Bias-corrected excess kurtosis; needs window >= 4.
inline Series kurtosis(const Series& x, size_t window) {
    if (window < 4) return Series(x.size(), UNDEFINED);
    return rolling_apply(x, window, [](const double* v, size_t n) {
        auto m = moments_of(v, n);
        if (degenerate(m, n)) return UNDEFINED;
        double nf = static_cast<double>(n);
        double a = (nf + 1.0) * nf * (nf - 1.0) / ((nf - 2.0) * (nf - 3.0));
        double b = 3.0 * (nf - 1.0) * (nf - 1.0) / ((nf - 2.0) * (nf - 3.0));
        return a * m.m4 / (m.m2 * m.m2) - b;
    });
}

// Pearson correlation over windows where both inputs are fully defined.
// Undefined for constant windows; clamped to [-1, 1].
inline Series correlation(const Series& x, const Series& y, size_t window) {
    size_t n = std::min(x.size(), y.size());
    Series out(x.size(), UNDEFINED);
    if (window < 2 || n < window) return out;

    Series joint(n);
    for (size_t i = 0; i < n; ++i) {
        joint[i] = (is_defined(x[i]) && is_defined(y[i])) ? 0.0 : UNDEFINED;
    }
    auto bad = undefined_prefix(joint);

    for (size_t i = window - 1; i < n; ++i) {
        if (bad[i + 1] - bad[i + 1 - window] != 0) continue;
        const double* xs = &x[i + 1 - window];
        const double* ys = &y[i + 1 - window];
        double mx = mean_of(xs, window);
        double my = mean_of(ys, window);
        double sxy = 0.0, sxx = 0.0, syy = 0.0;
        for (size_t k = 0; k < window; ++k) {
            double dx = xs[k] - mx;
            double dy = ys[k] - my;
            sxy += dx * dy;
            sxx += dx * dx;
            syy += dy * dy;
        }
        double denom = std::sqrt(sxx * syy);
        if (!(denom > EPS * EPS)) continue;
        out[i] = std::max(-1.0, std::min(1.0, sxy / denom));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Element-wise helpers
// ---------------------------------------------------------------------------

inline Series shift(const Series& x, size_t lag) {
    Series out(x.size(), UNDEFINED);
    for (size_t i = lag; i < x.size(); ++i) out[i] = x[i - lag];
    return out;
}

inline Series diff(const Series& x, size_t lag = 1) {
    Series out(x.size(), UNDEFINED);
    for (size_t i = lag; i < x.size(); ++i) out[i] = x[i] - x[i - lag];
    return out;
}

// (x[i] - x[i-lag]) / x[i-lag]; undefined when the base is zero.
inline Series pct_change(const Series& x, size_t lag = 1) {
    Series out(x.size(), UNDEFINED);
    for (size_t i = lag; i < x.size(); ++i) {
        double base = x[i - lag];
        if (base == 0.0) continue;
        out[i] = (x[i] - base) / base;
    }
    return out;
}

// a / b, undefined when b is zero.
inline double safe_ratio(double a, double b) {
    if (b == 0.0) return UNDEFINED;
    return a / b;
}

// Exponentially weighted mean with alpha = 2 / (span + 1) and bias-adjusted
// weights. Defined from the first defined input; an undefined input yields
// an undefined output and restarts the recursion.
inline Series ema(const Series& x, size_t span) {
    Series out(x.size(), UNDEFINED);
    if (span == 0) return out;
    const double decay = 1.0 - 2.0 / (static_cast<double>(span) + 1.0);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        if (!is_defined(x[i])) {
            num = 0.0;
            den = 0.0;
            continue;
        }
        num = x[i] + decay * num;
        den = 1.0 + decay * den;
        out[i] = num / den;
    }
    return out;
}

// Leading undefined positions of a column.
inline size_t leading_undefined(const Series& x) {
    size_t n = 0;
    while (n < x.size() && !is_defined(x[n])) ++n;
    return n;
}

}  // namespace rolling
