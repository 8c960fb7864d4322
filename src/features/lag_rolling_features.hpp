#pragma once

#include "features/price_frame.hpp"
#include "features/warmup.hpp"
#include "indicators/moving_averages.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "series/granularity.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// LagRollingConfig — horizons and windows for the lag/rolling block
// ---------------------------------------------------------------------------
struct LagRollingConfig {
    std::vector<size_t> lags = {1, 2, 3, 4, 6, 8, 12, 24, 48, 72, 96, 120, 168};
    std::vector<size_t> windows = {5, 10, 20, 50, 100, 200};
    double annualization_periods = 0.0;  // 0 = 252 trading days * periods per day, 52 weekly

    void validate() const {
        for (auto l : lags) {
            if (l == 0) throw std::invalid_argument("Lag horizons must be > 0");
        }
        for (auto w : windows) {
            if (w < 2) throw std::invalid_argument("Rolling windows must be >= 2");
        }
        if (annualization_periods < 0.0) {
            throw std::invalid_argument("annualization_periods must be >= 0");
        }
    }
};

// ---------------------------------------------------------------------------
// LagRollingFeatureGenerator — lagged closes/returns and rolling statistics
// of close and of 1-period returns. Every output at row t reads rows <= t.
//
// Warm-up: lag L -> L; statistics on close -> W - 1; statistics on returns
// -> W; momentum/roc over W -> W.
// ---------------------------------------------------------------------------
class LagRollingFeatureGenerator {
public:
    static constexpr double TRADING_DAYS = 252.0;
    static constexpr double WEEKS_PER_YEAR = 52.0;

    explicit LagRollingFeatureGenerator(const LagRollingConfig& config) : config_(config) {}

    FeatureBlock generate(const PriceFrame& frame, const CanonicalTimeline& timeline,
                          WarmupTracker* warmup = nullptr) const {
        FeatureBlock block("lag_rolling", timeline);
        const std::string unit = lag_unit(timeline.granularity());
        const auto& close = frame.close;
        auto returns = rolling::pct_change(close, 1);

        for (size_t lag : config_.lags) {
            std::string tag = std::to_string(lag) + unit;
            emit(block, warmup, "close_lag_" + tag, rolling::shift(close, lag), lag);
            emit(block, warmup, "return_lag_" + tag, rolling::pct_change(close, lag), lag);
        }

        double annual = annualization(timeline.granularity());
        for (size_t window : config_.windows) {
            compute_window(block, warmup, frame, returns, window, annual);
        }
        return block;
    }

    double annualization(Granularity g) const {
        if (config_.annualization_periods > 0.0) return config_.annualization_periods;
        if (g == Granularity::WEEK) return WEEKS_PER_YEAR;
        return TRADING_DAYS * periods_per_day(g);
    }

    // Hourly lag columns carry an "h" suffix (close_lag_24h).
    static std::string lag_unit(Granularity g) {
        return g == Granularity::HOUR ? "h" : "";
    }

private:
    LagRollingConfig config_;

    static void emit(FeatureBlock& block, WarmupTracker* warmup, const std::string& name,
                     rolling::Series values, size_t declared) {
        block.add(name, std::move(values));
        if (warmup) warmup->declare(name, declared);
    }

    void compute_window(FeatureBlock& block, WarmupTracker* warmup, const PriceFrame& frame,
                        const rolling::Series& returns, size_t window, double annual) const {
        const auto& close = frame.close;
        const size_t n = close.size();
        const std::string w = std::to_string(window);
        const size_t on_close = window - 1;
        const size_t on_returns = window;

        auto sma = indicators::sma(close, window);
        auto sd = rolling::stddev(close, window);
        auto hi = rolling::max(frame.high, window);
        auto lo = rolling::min(frame.low, window);
        auto ret_sd = rolling::stddev(returns, window);

        rolling::Series vol(n, rolling::UNDEFINED);
        rolling::Series range(n, rolling::UNDEFINED);
        rolling::Series position(n, rolling::UNDEFINED);
        rolling::Series zscore(n, rolling::UNDEFINED);
        const double scale = std::sqrt(annual);
        for (size_t i = 0; i < n; ++i) {
            vol[i] = ret_sd[i] * scale;
            range[i] = hi[i] - lo[i];
            position[i] = (close[i] - lo[i]) / (range[i] + rolling::EPS);
            zscore[i] = (close[i] - sma[i]) / (sd[i] + rolling::EPS);
        }

        emit(block, warmup, "sma_" + w, std::move(sma), on_close);
        emit(block, warmup, "ema_" + w, indicators::ema(close, window), 0);
        emit(block, warmup, "std_" + w, std::move(sd), on_close);
        emit(block, warmup, "volatility_" + w, std::move(vol), on_returns);
        emit(block, warmup, "high_" + w, std::move(hi), on_close);
        emit(block, warmup, "low_" + w, std::move(lo), on_close);
        emit(block, warmup, "range_" + w, std::move(range), on_close);
        emit(block, warmup, "price_position_" + w, std::move(position), on_close);
        emit(block, warmup, "momentum_" + w, rolling::diff(close, window), window);
        emit(block, warmup, "roc_" + w, rolling::pct_change(close, window), window);
        emit(block, warmup, "skew_" + w, rolling::skew(returns, window), on_returns);
        emit(block, warmup, "kurtosis_" + w, rolling::kurtosis(returns, window), on_returns);
        emit(block, warmup, "zscore_" + w, std::move(zscore), on_close);
    }
};
